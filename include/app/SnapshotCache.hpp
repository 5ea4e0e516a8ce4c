#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include "model/Telemetry.hpp"

namespace devtel::app {

// Single-writer, multi-reader holder for a backend's published snapshot.
// The writer builds a complete snapshot off to the side and swaps it in;
// readers copy the pointer out. The lock is only held for the swap/copy.
class SnapshotCache {
public:
  SnapshotCache();
  SnapshotCache(const SnapshotCache&) = delete;
  SnapshotCache& operator=(const SnapshotCache&) = delete;

  // Stamp next seq on snap and make it current.
  void publish(std::shared_ptr<devtel::model::BackendSnapshot> snap);

  std::shared_ptr<const devtel::model::BackendSnapshot> current() const;
  uint64_t seq() const { return current()->seq; }

private:
  mutable std::mutex mu_;
  std::shared_ptr<const devtel::model::BackendSnapshot> front_;
};

} // namespace devtel::app
