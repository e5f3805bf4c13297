#pragma once
#include <vector>

namespace kartsim {

struct CurveKey {
  double x{};
  double y{};
};

// Piecewise-linear tuning curve sampled by normalized speed.
// Clamps to the end keys outside [front.x, back.x]; one key is a constant.
class ResponseCurve {
public:
  ResponseCurve() = default;
  explicit ResponseCurve(std::vector<CurveKey> keys) { set_keys(std::move(keys)); }

  static ResponseCurve constant(double y) {
    return ResponseCurve(std::vector<CurveKey>{CurveKey{0.0, y}});
  }

  void set_keys(std::vector<CurveKey> keys); // sorts by x
  const std::vector<CurveKey>& keys() const { return keys_; }
  bool empty() const { return keys_.empty(); }

  double evaluate(double x) const; // 0 when empty

private:
  std::vector<CurveKey> keys_;
};

} // namespace kartsim
