#include "app/SnapshotCache.hpp"

namespace devtel::app {

SnapshotCache::SnapshotCache()
    : front_(std::make_shared<const devtel::model::BackendSnapshot>()) {}

void SnapshotCache::publish(std::shared_ptr<devtel::model::BackendSnapshot> snap) {
  std::shared_ptr<const devtel::model::BackendSnapshot> old;
  {
    std::lock_guard<std::mutex> lk(mu_);
    // increment sequence before publish
    snap->seq = front_->seq + 1;
    old = std::move(front_);
    front_ = std::move(snap);
  }
  // old snapshot (if no reader holds it) is freed outside the lock
}

std::shared_ptr<const devtel::model::BackendSnapshot> SnapshotCache::current() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace devtel::app
