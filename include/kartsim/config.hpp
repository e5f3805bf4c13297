#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <kartsim/tuning.hpp>

namespace kartsim {

// Built-in catalogs (default/fallback).
const std::vector<SurfaceDefinition>& surface_catalog();
const std::vector<BoostConfig>& boost_catalog();
const KartStats& default_kart_stats();

// Lookup helpers
std::optional<SurfaceDefinition> surface_by_key(const std::string& key);
std::optional<BoostConfig> boost_by_key(const std::string& key);
std::optional<SurfaceDefinition> surface_by_key_in(const std::vector<SurfaceDefinition>& cat,
                                                   const std::string& key);
std::optional<BoostConfig> boost_by_key_in(const std::vector<BoostConfig>& cat,
                                           const std::string& key);

// Stream-based CSV loaders (test-friendly; no filesystem required).
// Accept an optional header row; ignore '#' comments and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
//   surfaces: key,friction,speed,handling,offroad(0/1/true/false)
//   boosts:   key,duration_s,accel_bonus,max_speed_bonus
std::vector<SurfaceDefinition> surfaces_from_csv_stream(std::istream& in);
std::vector<BoostConfig> boosts_from_csv_stream(std::istream& in);

// Filesystem wrappers; nullopt if the file cannot be opened.
std::optional<std::vector<SurfaceDefinition>> load_surfaces_csv(const std::string& path);
std::optional<std::vector<BoostConfig>> load_boosts_csv(const std::string& path);

// Kart stats as "name,value" rows applied over `base`. Unlike the catalogs
// this is strict: an unknown name, a malformed value or a result that fails
// validate_stats() rejects the whole file (reason written to *error).
//   curves:  acceleration,0:18 0.5:12 1:4
//   vectors: wheel_fl,-0.6 -0.2 0.8
//   drift boosts reference `boosts` by key: drift_boost_2,super
std::optional<KartStats> kart_stats_from_stream(std::istream& in,
                                                const std::vector<BoostConfig>& boosts,
                                                const KartStats& base,
                                                std::string* error = nullptr);

std::optional<KartStats> load_kart_stats(const std::string& path,
                                         const std::vector<BoostConfig>& boosts,
                                         std::string* error = nullptr);

} // namespace kartsim
