#include <kartsim/curve.hpp>
#include <algorithm>
#include <iterator>

namespace kartsim {

void ResponseCurve::set_keys(std::vector<CurveKey> keys) {
  keys_ = std::move(keys);
  std::stable_sort(keys_.begin(), keys_.end(),
                   [](const CurveKey& a, const CurveKey& b){ return a.x < b.x; });
}

double ResponseCurve::evaluate(double x) const {
  if (keys_.empty()) return 0.0;
  if (x <= keys_.front().x) return keys_.front().y;
  if (x >= keys_.back().x)  return keys_.back().y;

  // First key strictly greater than x; x lies in [k0.x, k1.x)
  auto it = std::upper_bound(keys_.begin(), keys_.end(), x,
                             [](double v, const CurveKey& k){ return v < k.x; });
  const std::size_t i1 = static_cast<std::size_t>(std::distance(keys_.begin(), it));
  const CurveKey& k0 = keys_[i1 - 1];
  const CurveKey& k1 = keys_[i1];

  const double span = k1.x - k0.x;
  const double t = span > 0.0 ? (x - k0.x) / span : 0.0;
  return k0.y + (k1.y - k0.y) * t;
}

} // namespace kartsim
