#pragma once

#include <nlohmann/json.hpp>

namespace b2h5
{

/**
 * @brief Global switch forcing every read through the generic path.
 *
 * Initialized from the BLOSC2_FILTER environment variable: a non-zero
 * base-10 integer forces the generic path, anything unparsable counts as
 * zero. Checked on every read.
 */
bool forceGenericPath() noexcept;
void setForceGenericPath(bool force) noexcept;

/** @brief Re-read BLOSC2_FILTER and update the global switch */
void reloadFromEnvironment();

/** @brief Interpret a BLOSC2_FILTER value; null means unset */
bool parseForceFilter(const char* value) noexcept;

/**
 * @brief Options of a SliceReadEngine.
 *
 * JSON form:
 * {
 *   "num_threads": 4,
 *   "force_generic_path": false
 * }
 * "force_generic_path", when present, sets the global switch.
 */
struct EngineConfig {
    int numThreads = 1;

    static EngineConfig fromJson(const nlohmann::json& config);
    nlohmann::json toJson() const;
};

}  // namespace b2h5
