#include <kartsim/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kartsim {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// No quoted fields.
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream ss(s);
  std::string tok;
  while (ss >> tok) out.push_back(tok);
  return out;
}

static std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  const char* begin = s.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (end != begin + s.size()) return std::nullopt;
  return v;
}

static std::optional<bool> parse_bool(const std::string& s) {
  const auto v = lower(s);
  if (v == "1" || v == "true" || v == "yes")  return true;
  if (v == "0" || v == "false" || v == "no")  return false;
  return std::nullopt;
}

static std::optional<ResponseCurve> parse_curve(const std::string& s) {
  std::vector<CurveKey> keys;
  for (const auto& tok : split_ws(s)) {
    const auto colon = tok.find(':');
    if (colon == std::string::npos) return std::nullopt;
    auto x = parse_double(tok.substr(0, colon));
    auto y = parse_double(tok.substr(colon + 1));
    if (!x || !y) return std::nullopt;
    keys.push_back(CurveKey{*x, *y});
  }
  if (keys.empty()) return std::nullopt;
  return ResponseCurve{std::move(keys)};
}

static std::optional<Vec3> parse_vec3(const std::string& s) {
  const auto toks = split_ws(s);
  if (toks.size() != 3) return std::nullopt;
  auto x = parse_double(toks[0]);
  auto y = parse_double(toks[1]);
  auto z = parse_double(toks[2]);
  if (!x || !y || !z) return std::nullopt;
  return Vec3{*x, *y, *z};
}

// Iterates meaningful rows: trimmed, non-empty, not a comment, header skipped.
template <class Fn>
static void for_each_row(std::istream& in, std::size_t min_cols, Fn&& fn) {
  std::string line;
  bool first = true;
  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = split_csv_line(raw);
    const bool header = first && !cols.empty() && lower(cols[0]) == "key";
    first = false;
    if (header || cols.size() < min_cols) continue;
    fn(cols);
  }
}

// ---- Built-in catalogs ----

static std::vector<SurfaceDefinition> make_surfaces_builtin() {
  return {
    {"asphalt", 1.00, 1.00, 1.00, false},
    {"dirt",    0.80, 0.85, 0.90, false},
    {"grass",   0.60, 0.60, 0.80, true},
    {"ice",     0.15, 1.00, 0.60, false},
  };
}

static std::vector<BoostConfig> make_boosts_builtin() {
  return {
    {"mini",  0.6, 8.0,  4.0},
    {"super", 1.0, 12.0, 6.0},
    {"ultra", 1.4, 16.0, 8.0},
    {"pad",   1.5, 20.0, 10.0},
  };
}

static KartStats make_default_stats() {
  KartStats s;
  s.key = "standard";
  s.acceleration = ResponseCurve(std::vector<CurveKey>{{0.0, 18.0}, {0.5, 12.0}, {1.0, 4.0}});
  s.turning      = ResponseCurve(std::vector<CurveKey>{{0.0, 60.0}, {0.3, 110.0}, {1.0, 80.0}});
  s.friction     = ResponseCurve(std::vector<CurveKey>{{0.0, 0.9}, {1.0, 0.6}});

  s.max_speed = 30.0;
  s.min_throttle = -0.5;
  s.gravity = 30.0;
  s.drag = 0.3;
  s.rotation_correction_rate = 2.0;
  s.rotation_smoothing_threshold = 15.0;
  s.max_tilt_angle = 35.0;
  s.ground_distance = 0.45;
  s.soft_clamp_step = 0.25;

  s.collision_radius = 0.9;
  s.collision_offset = Vec3{0.0, 0.2, 0.0};

  s.wheel_offsets = {Vec3{-0.6, -0.2,  0.8}, Vec3{0.6, -0.2,  0.8},
                     Vec3{-0.6, -0.2, -0.8}, Vec3{0.6, -0.2, -0.8}};
  s.suspension_travel = 0.3;
  s.suspension_length = 0.5;

  s.drift.side_acceleration = 10.0;
  s.drift.forward_factor = 0.3;
  s.drift.max_steering_offset = 0.4;
  s.drift.min_speed = 8.0;
  s.drift.min_sideways_speed = 1.0;
  s.drift.max_air_time = 0.6;
  s.drift.max_no_steer_time = 0.4;
  s.drift.max_opposite_steer_time = 0.3;

  const auto& boosts = boost_catalog();
  s.drift_boost.thresholds_s = {0.8, 1.6, 2.6};
  s.drift_boost.boosts = {boosts[0], boosts[1], boosts[2]};
  s.drift_boost.feedback_decay = 3.0;
  return s;
}

const std::vector<SurfaceDefinition>& surface_catalog() {
  static const std::vector<SurfaceDefinition> cat = make_surfaces_builtin();
  return cat;
}

const std::vector<BoostConfig>& boost_catalog() {
  static const std::vector<BoostConfig> cat = make_boosts_builtin();
  return cat;
}

const KartStats& default_kart_stats() {
  static const KartStats stats = make_default_stats();
  return stats;
}

std::optional<SurfaceDefinition> surface_by_key_in(const std::vector<SurfaceDefinition>& cat,
                                                   const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const SurfaceDefinition& s){ return s.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<BoostConfig> boost_by_key_in(const std::vector<BoostConfig>& cat,
                                           const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const BoostConfig& b){ return b.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<SurfaceDefinition> surface_by_key(const std::string& key) {
  return surface_by_key_in(surface_catalog(), key);
}

std::optional<BoostConfig> boost_by_key(const std::string& key) {
  return boost_by_key_in(boost_catalog(), key);
}

// ---- CSV catalogs ----

std::vector<SurfaceDefinition> surfaces_from_csv_stream(std::istream& in) {
  std::vector<SurfaceDefinition> out;
  for_each_row(in, 5, [&](const std::vector<std::string>& cols) {
    auto friction = parse_double(cols[1]);
    auto speed    = parse_double(cols[2]);
    auto handling = parse_double(cols[3]);
    auto offroad  = parse_bool(cols[4]);
    if (!friction || !speed || !handling || !offroad) return;
    SurfaceDefinition s{cols[0], *friction, *speed, *handling, *offroad};
    if (validate_surface(s)) return;
    out.push_back(std::move(s));
  });
  return out;
}

std::vector<BoostConfig> boosts_from_csv_stream(std::istream& in) {
  std::vector<BoostConfig> out;
  for_each_row(in, 4, [&](const std::vector<std::string>& cols) {
    auto duration = parse_double(cols[1]);
    auto accel    = parse_double(cols[2]);
    auto speed    = parse_double(cols[3]);
    if (!duration || !accel || !speed) return;
    BoostConfig b{cols[0], *duration, *accel, *speed};
    if (validate_boost(b)) return;
    out.push_back(std::move(b));
  });
  return out;
}

std::optional<std::vector<SurfaceDefinition>> load_surfaces_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return surfaces_from_csv_stream(f);
}

std::optional<std::vector<BoostConfig>> load_boosts_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return boosts_from_csv_stream(f);
}

// ---- Kart stats ----

namespace {

struct ScalarField {
  const char* name;
  double* (*get)(KartStats&);
};

const ScalarField kScalarFields[] = {
  {"max_speed",                    [](KartStats& s){ return &s.max_speed; }},
  {"min_throttle",                 [](KartStats& s){ return &s.min_throttle; }},
  {"gravity",                      [](KartStats& s){ return &s.gravity; }},
  {"drag",                         [](KartStats& s){ return &s.drag; }},
  {"rotation_correction_rate",     [](KartStats& s){ return &s.rotation_correction_rate; }},
  {"rotation_smoothing_threshold", [](KartStats& s){ return &s.rotation_smoothing_threshold; }},
  {"max_tilt_angle",               [](KartStats& s){ return &s.max_tilt_angle; }},
  {"ground_distance",              [](KartStats& s){ return &s.ground_distance; }},
  {"soft_clamp_step",              [](KartStats& s){ return &s.soft_clamp_step; }},
  {"collision_radius",             [](KartStats& s){ return &s.collision_radius; }},
  {"suspension_travel",            [](KartStats& s){ return &s.suspension_travel; }},
  {"suspension_length",            [](KartStats& s){ return &s.suspension_length; }},
  {"drift_side_acceleration",      [](KartStats& s){ return &s.drift.side_acceleration; }},
  {"drift_forward_factor",         [](KartStats& s){ return &s.drift.forward_factor; }},
  {"drift_max_steering_offset",    [](KartStats& s){ return &s.drift.max_steering_offset; }},
  {"drift_min_speed",              [](KartStats& s){ return &s.drift.min_speed; }},
  {"drift_min_sideways_speed",     [](KartStats& s){ return &s.drift.min_sideways_speed; }},
  {"drift_max_air_time",           [](KartStats& s){ return &s.drift.max_air_time; }},
  {"drift_max_no_steer_time",      [](KartStats& s){ return &s.drift.max_no_steer_time; }},
  {"drift_max_opposite_steer_time",[](KartStats& s){ return &s.drift.max_opposite_steer_time; }},
  {"drift_threshold_1",            [](KartStats& s){ return &s.drift_boost.thresholds_s[0]; }},
  {"drift_threshold_2",            [](KartStats& s){ return &s.drift_boost.thresholds_s[1]; }},
  {"drift_threshold_3",            [](KartStats& s){ return &s.drift_boost.thresholds_s[2]; }},
  {"drift_feedback_decay",         [](KartStats& s){ return &s.drift_boost.feedback_decay; }},
};

struct CurveField {
  const char* name;
  ResponseCurve* (*get)(KartStats&);
};

const CurveField kCurveFields[] = {
  {"acceleration", [](KartStats& s){ return &s.acceleration; }},
  {"turning",      [](KartStats& s){ return &s.turning; }},
  {"friction",     [](KartStats& s){ return &s.friction; }},
};

struct VecField {
  const char* name;
  Vec3* (*get)(KartStats&);
};

const VecField kVecFields[] = {
  {"collision_offset", [](KartStats& s){ return &s.collision_offset; }},
  {"wheel_fl",         [](KartStats& s){ return &s.wheel_offsets[0]; }},
  {"wheel_fr",         [](KartStats& s){ return &s.wheel_offsets[1]; }},
  {"wheel_rl",         [](KartStats& s){ return &s.wheel_offsets[2]; }},
  {"wheel_rr",         [](KartStats& s){ return &s.wheel_offsets[3]; }},
};

// Applies one row; returns an error description on failure.
std::optional<std::string> apply_stat(KartStats& s, const std::string& name,
                                      const std::string& value,
                                      const std::vector<BoostConfig>& boosts) {
  if (name == "key") {
    if (value.empty()) return std::string("empty key");
    s.key = value;
    return std::nullopt;
  }
  for (const auto& f : kScalarFields) {
    if (name != f.name) continue;
    auto v = parse_double(value);
    if (!v) return "bad number for " + name + ": '" + value + "'";
    *f.get(s) = *v;
    return std::nullopt;
  }
  for (const auto& f : kCurveFields) {
    if (name != f.name) continue;
    auto c = parse_curve(value);
    if (!c) return "bad curve for " + name + ": '" + value + "'";
    *f.get(s) = std::move(*c);
    return std::nullopt;
  }
  for (const auto& f : kVecFields) {
    if (name != f.name) continue;
    auto v = parse_vec3(value);
    if (!v) return "bad vector for " + name + ": '" + value + "'";
    *f.get(s) = *v;
    return std::nullopt;
  }
  static const char* kBoostSlots[kDriftBoostLevels] = {"drift_boost_1", "drift_boost_2", "drift_boost_3"};
  for (std::size_t i = 0; i < kDriftBoostLevels; ++i) {
    if (name != kBoostSlots[i]) continue;
    auto b = boost_by_key_in(boosts, value);
    if (!b) return "unknown boost '" + value + "' for " + name;
    s.drift_boost.boosts[i] = *b;
    return std::nullopt;
  }
  return "unknown field '" + name + "'";
}

} // namespace

std::optional<KartStats> kart_stats_from_stream(std::istream& in,
                                                const std::vector<BoostConfig>& boosts,
                                                const KartStats& base,
                                                std::string* error) {
  KartStats s = base;
  std::string line;
  int line_no = 0;
  bool first = true;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    // Split on the first comma only; values may contain spaces.
    const auto comma = raw.find(',');
    const std::string name  = lower(trim(raw.substr(0, comma)));
    const std::string value = comma == std::string::npos ? std::string{} : trim(raw.substr(comma + 1));
    // Optional header row: "name,value" or "key,value"
    if (first && (name == "name" || name == "key") && lower(value) == "value") {
      first = false;
      continue;
    }
    first = false;

    if (auto e = apply_stat(s, name, value, boosts)) {
      if (error) *error = "line " + std::to_string(line_no) + ": " + *e;
      return std::nullopt;
    }
  }
  if (auto e = validate_stats(s)) {
    if (error) *error = *e;
    return std::nullopt;
  }
  return s;
}

std::optional<KartStats> load_kart_stats(const std::string& path,
                                         const std::vector<BoostConfig>& boosts,
                                         std::string* error) {
  std::ifstream f(path);
  if (!f) {
    if (error) *error = "cannot open " + path;
    return std::nullopt;
  }
  return kart_stats_from_stream(f, boosts, default_kart_stats(), error);
}

} // namespace kartsim
