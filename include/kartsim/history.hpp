#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <kartsim/world.hpp>

namespace kartsim {

// Fixed-capacity ring of world copies keyed by tick, for rollback.
// Entries are kept in ascending tick order; the oldest is overwritten.
class StateHistory {
public:
  explicit StateHistory(std::size_t cap = 120) : cap_(cap > 0 ? cap : 1) {
    ring_.reserve(cap_);
  }

  // Newer than or equal to the latest entry drops those entries first.
  void push(const KartWorld& w) {
    discard_from(w.tick());
    if (ring_.size() < cap_) {
      // Not wrapped yet, head_ is 0.
      if (count_ < ring_.size()) ring_[count_] = w;
      else ring_.push_back(w);
      ++count_;
      return;
    }
    if (count_ < cap_) {
      ring_[(head_ + count_) % cap_] = w;
      ++count_;
    } else {
      ring_[head_] = w;
      head_ = (head_ + 1) % cap_;
    }
  }

  const KartWorld* find(std::uint64_t tick) const {
    for (std::size_t i = 0; i < count_; ++i) {
      const KartWorld& w = ring_[index(i)];
      if (w.tick() == tick) return &w;
    }
    return nullptr;
  }

  // Copies the entry for `tick` into `out` and forgets everything after it.
  bool restore(std::uint64_t tick, KartWorld& out) {
    const KartWorld* w = find(tick);
    if (!w) return false;
    out = *w;
    discard_from(tick + 1);
    return true;
  }

  // Removes entries whose tick is >= `tick`.
  void discard_from(std::uint64_t tick) {
    while (count_ > 0 && ring_[index(count_ - 1)].tick() >= tick) --count_;
  }

  std::optional<std::uint64_t> latest_tick() const {
    if (count_ == 0) return std::nullopt;
    return ring_[index(count_ - 1)].tick();
  }
  std::optional<std::uint64_t> oldest_tick() const {
    if (count_ == 0) return std::nullopt;
    return ring_[index(0)].tick();
  }

  std::size_t size() const { return count_; }
  std::size_t capacity() const { return cap_; }
  void clear() { count_ = 0; head_ = 0; }

private:
  std::size_t index(std::size_t logical) const { return (head_ + logical) % cap_; }

  std::size_t cap_;
  std::vector<KartWorld> ring_;  // grows to cap_, then reused in place
  std::size_t head_ = 0;         // oldest
  std::size_t count_ = 0;
};

} // namespace kartsim
