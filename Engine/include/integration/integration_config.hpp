/**
 * @file integration_config.hpp
 * @brief Tunables for the integration run
 */

#pragma once

#include <geometry/geodesic.hpp>
#include <cstddef>

namespace Broadsheet {

struct IntegrationConfig {
    double similarity_threshold = 0.8;           // min text ratio for a fallback match
    double geo_match_km = 1.0;                   // locations closer than this are the same place
    double earth_radius_km = geo::EARTH_RADIUS_KM;
    size_t loader_threads = 0;                   // 0 = hardware concurrency
    bool debug = false;                          // per-entity decision trace

    /**
     * @brief Defaults overridden by the environment.
     *
     * Reads BROADSHEET_SIMILARITY_THRESHOLD, BROADSHEET_GEO_MATCH_KM,
     * BROADSHEET_LOADER_THREADS and BROADSHEET_DEBUG.
     * @throws std::invalid_argument on a malformed or out-of-range value
     */
    static IntegrationConfig from_env();

    /**
     * @brief Worker count for the loader, resolving 0 to the hardware concurrency.
     */
    size_t effective_loader_threads() const;

    /**
     * @brief Set the process-wide Logger threshold: Debug when debug is on, Info otherwise.
     *
     * Called once by the entry point before any loading starts.
     */
    void apply_log_threshold() const;
};

} // namespace Broadsheet
