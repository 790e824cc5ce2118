// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/node_pool.hpp"

#include "client/error.hpp"
#include "util/logging.hpp"

namespace tangle {

NodePool::NodePool(api::NodeApi& api, std::vector<util::NodeUrl> nodes,
                   std::shared_ptr<asio::io_context> external_io_context)
    : api_(api),
      nodes_(std::move(nodes)),
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      snapshot_(std::make_shared<const HealthySet>()) {
  LOG_POOL_TRACE("NodePool initialized with {} nodes (external_io_context: {})", nodes_.size(),
                 external_io_context_ ? "yes" : "no");
}

NodePool::~NodePool() {
  Stop();
}

bool NodePool::Start(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  interval_ = interval;
  running_.store(true, std::memory_order_release);
  sync_timer_ = std::make_unique<asio::steady_timer>(*io_context_);

  if (!external_io_context_) {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));
    io_thread_ = std::thread([this]() { io_context_->run(); });
  }

  schedule_next_sync();
  LOG_POOL_DEBUG("node sync started, interval {}ms", interval_.count());
  return true;
}

void NodePool::Stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // Clear running_ first: a cycle in progress checks it between probes
  running_.store(false, std::memory_order_release);

  if (sync_timer_) {
    sync_timer_->cancel();
  }

  if (!external_io_context_) {
    if (work_guard_) {
      work_guard_.reset();
    }
    io_context_->stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    io_context_->restart();
  }
  LOG_POOL_DEBUG("node sync stopped after {} cycles", completed_cycles_.load());
}

void NodePool::schedule_next_sync() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  sync_timer_->expires_after(interval_);
  sync_timer_->async_wait([this](const asio::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      run_background_cycle();
      schedule_next_sync();
    }
  });
}

void NodePool::run_background_cycle() {
  auto snapshot = probe_all([this]() { return running_.load(std::memory_order_acquire); });
  if (!snapshot) {
    LOG_POOL_DEBUG("node sync cycle abandoned: pool stopping");
    return;
  }
  replace_snapshot(std::move(snapshot));
  completed_cycles_.fetch_add(1, std::memory_order_acq_rel);
}

void NodePool::SyncNow() {
  replace_snapshot(probe_all([]() { return true; }));
}

template <typename KeepGoing>
NodePool::SnapshotPtr NodePool::probe_all(KeepGoing&& keep_going) {
  auto healthy = std::make_shared<HealthySet>();
  for (const auto& node : nodes_) {
    if (!keep_going()) {
      return nullptr;
    }
    try {
      if (api_.GetHealth(node)) {
        healthy->insert(node);
      } else {
        LOG_POOL_DEBUG_RL("node {} reported unhealthy", node.str());
      }
    } catch (const std::exception& e) {
      LOG_POOL_DEBUG_RL("health probe of {} failed: {}", node.str(), e.what());
    }
  }
  LOG_POOL_TRACE("probe cycle: {}/{} nodes healthy", healthy->size(), nodes_.size());
  return healthy;
}

void NodePool::replace_snapshot(SnapshotPtr snapshot) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (snapshot->empty() && !snapshot_->empty()) {
    LOG_POOL_WARN_RL("no healthy nodes left out of {}", nodes_.size());
  }
  snapshot_ = std::move(snapshot);
}

util::NodeUrl NodePool::GetNode() const {
  SnapshotPtr snapshot = Snapshot();
  if (snapshot->empty()) {
    throw Error(ErrorKind::NodePoolEmpty, "no healthy node available");
  }
  return *snapshot->begin();
}

NodePool::SnapshotPtr NodePool::Snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

}  // namespace tangle
