// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/json_codec.hpp"
#include "client/cli_options.hpp"
#include "client/client.hpp"
#include "client/error.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

void PrintUsage(const char *program_name) {
  std::cout
      << "Tangle CLI - Talk to a set of ledger nodes\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --node=<url>           Node URL, http://host[:port][/base] (repeatable)\n"
      << "  --conf=<path>          JSON config file (flags override it)\n"
      << "  --sync-interval=<sec>  Seconds between node health sweeps (default: 60)\n"
      << "  --no-sync              Probe nodes once at startup only\n"
      << "  --remote-pow           Leave proof of work to the node\n"
      << "  --pow-workers=<n>      Local proof-of-work threads (default: all cores)\n"
      << "  --timeout=<sec>        Per-request timeout (default: 30)\n"
      << "  --loglevel=<level>     trace, debug, info, warn, error, off (default: info)\n"
      << "  --debug=<component>    Debug logging for network, pool, pow, wallet or client\n"
      << "  --version              Show version information\n"
      << "  --help                 Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Nodes:\n"
      << "  nodes                        List currently healthy nodes\n"
      << "  health                       Health of the selected node\n"
      << "  info                         Node information\n"
      << "  network-id                   Numeric network id\n"
      << "  tips                         Two tips to attach to\n"
      << "  milestone <index>            Milestone by index\n"
      << "\n"
      << "Messages:\n"
      << "  message <id>                 Message by id\n"
      << "  metadata <id>                Message metadata by id\n"
      << "  messages-by-index <key>      Message ids filed under an index key\n"
      << "  send-data <key> <data>       Post an indexation message\n"
      << "  retry <id>                   Promote or reattach as needed\n"
      << "  promote <id>                 Post an empty message approving <id>\n"
      << "  reattach <id>                Repost the payload of <id> on fresh tips\n"
      << "\n"
      << "Ledger:\n"
      << "  balance <address>            Balance of an address\n"
      << "  outputs <address>            Output ids of an address\n"
      << "  output <outputid>            Output metadata\n"
      << "\n"
      << "Wallet:\n"
      << "  find-addresses <seed> <path> [start] [end]   Derive addresses\n"
      << "  unspent-address <seed> <path> [start]        First address with zero balance\n"
      << "  seed-balance <seed> <path> [start]           Total balance of a seed\n"
      << "  send <seed> <path> <address> <amount> [start]  Transfer tokens\n"
      << std::endl;
}

namespace {

uint64_t ParseNumber(const std::string& what, const std::string& value) {
  uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    throw tangle::Error(tangle::ErrorKind::InvalidParameter, what + " must be a non-negative integer");
  }
  return n;
}

void RequireParams(const std::vector<std::string> &params, size_t count, const std::string &usage) {
  if (params.size() < count) {
    throw tangle::Error(tangle::ErrorKind::MissingParameter, "usage: " + usage);
  }
}

std::vector<uint8_t> Bytes(const std::string &s) { return std::vector<uint8_t>(s.begin(), s.end()); }

json PostedToJson(const tangle::PostedMessage &posted) {
  return json{{"messageId", tangle::message::ToHex(posted.first)},
              {"message", tangle::api::MessageToJson(posted.second)}};
}

json NodeInfoToJson(const tangle::message::NodeInfo &info) {
  return json{{"name", info.name},
              {"version", info.version},
              {"isHealthy", info.is_healthy},
              {"networkId", info.network_id},
              {"minPowScore", info.min_pow_score},
              {"latestMilestoneIndex", info.latest_milestone_index},
              {"solidMilestoneIndex", info.solid_milestone_index},
              {"pruningIndex", info.pruning_index},
              {"features", info.features}};
}

json MetadataToJson(const tangle::message::MessageMetadata &m) {
  json parents = json::array();
  for (const auto &p : m.parents) {
    parents.push_back(tangle::message::ToHex(p));
  }
  json out{{"messageId", tangle::message::ToHex(m.message_id)}, {"parents", parents}, {"isSolid", m.is_solid}};
  if (m.referenced_by_milestone_index) {
    out["referencedByMilestoneIndex"] = *m.referenced_by_milestone_index;
  }
  if (m.ledger_inclusion_state) {
    out["ledgerInclusionState"] = *m.ledger_inclusion_state;
  }
  if (m.should_promote) {
    out["shouldPromote"] = *m.should_promote;
  }
  if (m.should_reattach) {
    out["shouldReattach"] = *m.should_reattach;
  }
  return out;
}

json RunCommand(tangle::Client &client, const std::string &command, const std::vector<std::string> &params) {
  using namespace tangle;

  if (command == "nodes") {
    json out = json::array();
    for (const auto &url : *client.pool().Snapshot()) {
      out.push_back(url.str());
    }
    return out;
  }
  if (command == "health") {
    return json{{"node", client.GetNode().str()}, {"healthy", client.GetHealth()}};
  }
  if (command == "info") {
    return NodeInfoToJson(client.GetInfo());
  }
  if (command == "network-id") {
    return std::to_string(client.GetNetworkId());
  }
  if (command == "tips") {
    auto tips = client.GetTips();
    return json{{"tip1MessageId", message::ToHex(tips.tip1)}, {"tip2MessageId", message::ToHex(tips.tip2)}};
  }
  if (command == "milestone") {
    RequireParams(params, 1, "milestone <index>");
    const uint64_t index = ParseNumber("index", params[0]);
    if (index > UINT32_MAX) {
      throw Error(ErrorKind::InvalidParameter, "milestone index out of range");
    }
    auto ms = client.GetMilestone(static_cast<uint32_t>(index));
    return json{{"milestoneIndex", ms.index},
                {"messageId", message::ToHex(ms.message_id)},
                {"timestamp", ms.timestamp},
                {"time", util::FormatTime(static_cast<int64_t>(ms.timestamp))}};
  }
  if (command == "message") {
    RequireParams(params, 1, "message <id>");
    return api::MessageToJson(client.GetMessage(message::MessageIdFromHex(params[0])));
  }
  if (command == "metadata") {
    RequireParams(params, 1, "metadata <id>");
    return MetadataToJson(client.GetMessageMetadata(message::MessageIdFromHex(params[0])));
  }
  if (command == "messages-by-index") {
    RequireParams(params, 1, "messages-by-index <key>");
    json out = json::array();
    for (const auto &id : client.GetMessageIdsByIndex(Bytes(params[0]))) {
      out.push_back(message::ToHex(id));
    }
    return out;
  }
  if (command == "send-data") {
    RequireParams(params, 2, "send-data <key> <data>");
    SendOptions options;
    options.indexation = IndexationOptions{Bytes(params[0]), Bytes(params[1])};
    return PostedToJson(client.Send(options));
  }
  if (command == "retry" || command == "promote" || command == "reattach") {
    RequireParams(params, 1, command + " <id>");
    const auto id = message::MessageIdFromHex(params[0]);
    if (command == "retry") {
      return PostedToJson(client.Retry(id));
    }
    if (command == "promote") {
      return PostedToJson(client.Promote(id));
    }
    return PostedToJson(client.Reattach(id));
  }
  if (command == "balance") {
    RequireParams(params, 1, "balance <address>");
    auto balances = client.GetAddressBalances({message::Address::FromHex(params[0])});
    return json{{"address", params[0]}, {"balance", balances.at(0).balance}};
  }
  if (command == "outputs") {
    RequireParams(params, 1, "outputs <address>");
    json out = json::array();
    for (const auto &id : client.GetAddressOutputs(message::Address::FromHex(params[0]))) {
      out.push_back(id.ToHex());
    }
    return out;
  }
  if (command == "output") {
    RequireParams(params, 1, "output <outputid>");
    auto o = client.GetOutput(message::OutputId::FromHex(params[0]));
    return json{{"messageId", message::ToHex(o.message_id)},
                {"transactionId", util::HexStr(o.transaction_id)},
                {"outputIndex", o.output_index},
                {"isSpent", o.is_spent},
                {"address", o.address.ToHex()},
                {"amount", o.amount}};
  }
  if (command == "find-addresses") {
    RequireParams(params, 2, "find-addresses <seed> <path> [start] [end]");
    AddressRangeOptions options;
    options.path = wallet::DerivationPath::Parse(params[1]);
    if (params.size() > 2) {
      options.start = ParseNumber("start", params[2]);
      options.end = options.start + 20;
    }
    if (params.size() > 3) {
      options.end = ParseNumber("end", params[3]);
    }
    json out = json::array();
    for (const auto &a : client.FindAddresses(wallet::Seed::FromHex(params[0]), options)) {
      out.push_back(a.ToHex());
    }
    return out;
  }
  if (command == "unspent-address") {
    RequireParams(params, 2, "unspent-address <seed> <path> [start]");
    UnspentAddressOptions options;
    options.path = wallet::DerivationPath::Parse(params[1]);
    if (params.size() > 2) {
      options.start_index = ParseNumber("start", params[2]);
    }
    auto found = client.GetUnspentAddress(wallet::Seed::FromHex(params[0]), options);
    return json{{"address", found.address.ToHex()}, {"index", found.index}};
  }
  if (command == "seed-balance") {
    RequireParams(params, 2, "seed-balance <seed> <path> [start]");
    BalanceOptions options;
    options.path = wallet::DerivationPath::Parse(params[1]);
    if (params.size() > 2) {
      options.start_index = ParseNumber("start", params[2]);
    }
    return json{{"balance", client.GetBalance(wallet::Seed::FromHex(params[0]), options)}};
  }
  if (command == "send") {
    RequireParams(params, 4, "send <seed> <path> <address> <amount> [start]");
    SendOptions options;
    options.seed = wallet::Seed::FromHex(params[0]);
    options.path = wallet::DerivationPath::Parse(params[1]);
    options.outputs.push_back(TransferOutput{message::Address::FromHex(params[2]), ParseNumber("amount", params[3])});
    if (params.size() > 4) {
      options.start_index = ParseNumber("start", params[4]);
    }
    return PostedToJson(client.Send(options));
  }

  throw Error(ErrorKind::InvalidParameter, "unknown command '" + command + "'");
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    tangle::CliOptions options = tangle::ParseCliArgs(args);

    if (options.help) {
      PrintUsage(argv[0]);
      return 0;
    }
    if (options.version) {
      std::cout << tangle::GetFullVersionString() << std::endl;
      std::cout << tangle::GetCopyrightString() << std::endl;
      return 0;
    }
    if (options.command.empty()) {
      PrintUsage(argv[0]);
      return 1;
    }

    tangle::util::LogManager::Initialize(options.log_level);
    for (const auto &component : options.debug_components) {
      tangle::util::LogManager::SetComponentLevel(component, "debug");
    }

    json result;
    {
      tangle::Client client(options.config);
      result = RunCommand(client, options.command, options.params);
      client.Shutdown();
    }
    std::cout << result.dump(2) << std::endl;

    tangle::util::LogManager::Shutdown();
    return 0;

  } catch (const tangle::Error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
