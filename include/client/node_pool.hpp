// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/node_api.hpp"
#include "util/node_url.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace tangle {

/**
 * NodePool - tracks which configured nodes currently answer health checks
 *
 * The healthy set is an immutable snapshot behind a shared_ptr. A sync
 * cycle probes every configured node in order and then swaps in a new
 * snapshot holding exactly the nodes that answered healthy, so readers see
 * either the old set or the new one, never a mix. The mutex only guards
 * the pointer copy and swap; no lock is held across network I/O.
 *
 * Background sync runs on an asio steady_timer. With an owned io_context
 * (the default) Start() spawns one thread to run it and Stop() joins it.
 * With an external io_context the caller drives event processing, which is
 * how tests step the loop deterministically.
 *
 * Probe failures only exclude the failing node from the next snapshot.
 */
class NodePool {
public:
  using HealthySet = std::set<util::NodeUrl>;
  using SnapshotPtr = std::shared_ptr<const HealthySet>;

  NodePool(api::NodeApi& api, std::vector<util::NodeUrl> nodes,
           std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~NodePool();

  NodePool(const NodePool&) = delete;
  NodePool& operator=(const NodePool&) = delete;

  // Begin periodic sync: first probe after one interval, then every
  // interval until Stop(). Returns false if already running.
  bool Start(std::chrono::milliseconds interval);

  // Cancel the pending wait and join the owned thread. A wait in progress
  // ends without probing; a cycle in progress skips its remaining probes
  // and leaves the snapshot untouched. Idempotent.
  void Stop();

  // One probe-and-replace cycle on the calling thread
  void SyncNow();

  // First node of the current snapshot; throws Error(NodePoolEmpty)
  util::NodeUrl GetNode() const;

  SnapshotPtr Snapshot() const;

  const std::vector<util::NodeUrl>& nodes() const { return nodes_; }
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Number of completed background cycles (each one replaced the snapshot)
  uint64_t completed_cycles() const { return completed_cycles_.load(std::memory_order_acquire); }

private:
  void schedule_next_sync();
  void run_background_cycle();

  // Probe every node; returns nullptr if keep_going() turned false midway
  template <typename KeepGoing>
  SnapshotPtr probe_all(KeepGoing&& keep_going);

  void replace_snapshot(SnapshotPtr snapshot);

  api::NodeApi& api_;
  const std::vector<util::NodeUrl> nodes_;

  std::shared_ptr<asio::io_context> io_context_;
  const bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<asio::steady_timer> sync_timer_;
  std::thread io_thread_;

  std::chrono::milliseconds interval_{0};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> completed_cycles_{0};
  std::mutex start_stop_mutex_;

  mutable std::mutex snapshot_mutex_;
  SnapshotPtr snapshot_;  // guarded by snapshot_mutex_
};

}  // namespace tangle
