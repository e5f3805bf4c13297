#pragma once
#include <cstdint>
#include <mutex>
#include <kartsim/snap.hpp>

namespace kartsim {

// Single-producer single-consumer latest-only handoff. Intermediate values
// are overwritten; the consumer tracks what it has seen with a cursor.
template <class T>
class LatestMailbox {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lock(mu_);
    data_ = v;
    ++seq_;
  }

  // True and fills `out` if something newer than `cursor` was published.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (seq_ == cursor) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seq_;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::uint64_t seq_ = 0;
};

using SnapshotMailbox = LatestMailbox<SimSnapshot>;

} // namespace kartsim
