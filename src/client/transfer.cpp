// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/transfer.hpp"

#include "client/error.hpp"
#include "message/payload.hpp"
#include "util/blake2b.hpp"
#include "util/logging.hpp"
#include "wallet/address_generator.hpp"

#include <algorithm>
#include <limits>
#include <map>

namespace tangle {

namespace {

constexpr size_t MAX_TRANSACTION_INPUTS = 127;

}  // namespace

Transfer::Transfer(api::NodeApi& api, const NodePool& pool, const AddressScanner& scanner,
                   MessageLifecycle& lifecycle)
    : api_(api), pool_(pool), scanner_(scanner), lifecycle_(lifecycle) {}

std::vector<Transfer::SelectedInput> Transfer::CollectInputs(const wallet::Seed& seed,
                                                             const wallet::DerivationPath& path, uint64_t start_index,
                                                             uint64_t needed, uint64_t& scan_end) const {
  std::vector<SelectedInput> inputs;
  uint64_t collected = 0;
  uint64_t cursor = start_index;

  while (true) {
    const auto batch = wallet::DeriveAddresses(seed, path, cursor, cursor + scanner_.batch_size());
    for (uint64_t offset = 0; offset < batch.size(); ++offset) {
      const uint64_t index = cursor + offset;
      const auto& address = batch[offset];

      if (api_.GetAddressBalance(pool_.GetNode(), address) == 0) {
        scan_end = index;
        throw Error(ErrorKind::NotEnoughBalance,
                    "found " + std::to_string(collected) + " of " + std::to_string(needed) + " required");
      }

      for (const auto& output_id : api_.GetAddressOutputs(pool_.GetNode(), address)) {
        const auto output = api_.GetOutput(pool_.GetNode(), output_id);
        if (output.is_spent || output.amount == 0) {
          continue;
        }
        if (collected > std::numeric_limits<uint64_t>::max() - output.amount) {
          throw Error(ErrorKind::InvalidResponse, "output amounts overflow");
        }
        inputs.push_back(SelectedInput{output_id, index, output.amount});
        collected += output.amount;
        if (inputs.size() > MAX_TRANSACTION_INPUTS) {
          throw Error(ErrorKind::TransactionError,
                      "more than " + std::to_string(MAX_TRANSACTION_INPUTS) + " inputs needed");
        }
        if (collected >= needed) {
          scan_end = index + 1;
          LOG_WALLET_DEBUG("selected {} inputs worth {} (needed {})", inputs.size(), collected, needed);
          return inputs;
        }
      }
    }
    cursor += scanner_.batch_size();
  }
}

PostedMessage Transfer::Send(const SendOptions& options) {
  if (options.outputs.empty() && !options.indexation) {
    throw Error(ErrorKind::MissingParameter, "outputs or indexation");
  }

  std::shared_ptr<const message::IndexationPayload> indexation;
  if (options.indexation) {
    indexation = std::make_shared<message::IndexationPayload>(options.indexation->index, options.indexation->data);
  }

  // Data-only message
  if (options.outputs.empty()) {
    return lifecycle_.Submit(indexation);
  }

  if (!options.seed) {
    throw Error(ErrorKind::MissingParameter, "seed");
  }
  const wallet::DerivationPath& path = RequirePath(options.path);

  uint64_t needed = 0;
  for (const auto& out : options.outputs) {
    if (out.amount == 0) {
      throw Error(ErrorKind::InvalidParameter, "output amount must be positive");
    }
    if (needed > std::numeric_limits<uint64_t>::max() - out.amount) {
      throw Error(ErrorKind::InvalidParameter, "output amounts overflow");
    }
    needed += out.amount;
  }

  const wallet::Seed& seed = *options.seed;
  uint64_t scan_end = options.start_index;
  auto inputs = CollectInputs(seed, path, options.start_index, needed, scan_end);

  uint64_t collected = 0;
  for (const auto& in : inputs) {
    collected += in.amount;
  }

  message::TransactionEssence essence;
  for (const auto& out : options.outputs) {
    essence.outputs.push_back(message::SignatureLockedSingleOutput{out.address, out.amount});
  }
  if (collected > needed) {
    const auto remainder = scanner_.FindUnspentAddress(seed, UnspentAddressOptions{path, scan_end});
    LOG_WALLET_DEBUG("remainder {} to index {}", collected - needed, remainder.index);
    essence.outputs.push_back(message::SignatureLockedSingleOutput{remainder.address, collected - needed});
  }
  essence.payload = indexation;

  // Deterministic order: inputs by output id, outputs by address then amount
  std::sort(inputs.begin(), inputs.end(),
            [](const SelectedInput& a, const SelectedInput& b) { return a.output < b.output; });
  std::sort(essence.outputs.begin(), essence.outputs.end());
  for (const auto& in : inputs) {
    essence.inputs.push_back(in.output);
  }

  const auto signing_hash = util::Blake2b256(essence.signing_bytes());

  auto tx = std::make_shared<message::TransactionPayload>();
  tx->essence = essence;
  std::map<uint64_t, uint16_t> signature_block_for_index;
  for (const auto& in : inputs) {
    auto it = signature_block_for_index.find(in.address_index);
    if (it != signature_block_for_index.end()) {
      tx->unlock_blocks.push_back(message::UnlockBlock::FromReference(it->second));
      continue;
    }
    const auto keys = wallet::DeriveKeyPair(seed, path, in.address_index);
    message::Ed25519Signature sig;
    sig.public_key = keys.public_key;
    sig.signature = wallet::Ed25519Sign(keys.private_key, signing_hash);
    signature_block_for_index.emplace(in.address_index, static_cast<uint16_t>(tx->unlock_blocks.size()));
    tx->unlock_blocks.push_back(message::UnlockBlock::FromSignature(sig));
  }

  LOG_CLIENT_INFO("sending {} to {} outputs from {} inputs", needed, options.outputs.size(), inputs.size());
  return lifecycle_.Submit(tx);
}

}  // namespace tangle
