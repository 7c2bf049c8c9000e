#include <integration/integration_config.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace Broadsheet {

static double env_double(const char* name, double fallback, double lo, double hi) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return fallback;

    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: '" + raw + "'");
    }
    if (raw[used] != '\0') {
        throw std::invalid_argument(std::string(name) + " has trailing characters: '" + raw + "'");
    }
    if (value < lo || value > hi) {
        throw std::invalid_argument(std::string(name) + " out of range [" + std::to_string(lo) +
                                    ", " + std::to_string(hi) + "]: " + raw);
    }
    return value;
}

static size_t env_count(const char* name, size_t fallback, size_t hi) {
    double value = env_double(name, static_cast<double>(fallback), 0.0, static_cast<double>(hi));
    if (value != std::floor(value)) {
        throw std::invalid_argument(std::string(name) + " is not a whole number: '" + std::getenv(name) + "'");
    }
    return static_cast<size_t>(value);
}

static bool env_flag(const char* name, bool fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    std::string v(raw);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw std::invalid_argument(std::string(name) + " is not a boolean: '" + raw + "'");
}

IntegrationConfig IntegrationConfig::from_env() {
    IntegrationConfig config;
    config.similarity_threshold = env_double("BROADSHEET_SIMILARITY_THRESHOLD", config.similarity_threshold, 0.0, 1.0);
    config.geo_match_km = env_double("BROADSHEET_GEO_MATCH_KM", config.geo_match_km, 0.0, 20037.5);
    config.loader_threads = env_count("BROADSHEET_LOADER_THREADS", config.loader_threads, 1024);
    config.debug = env_flag("BROADSHEET_DEBUG", config.debug);
    return config;
}

size_t IntegrationConfig::effective_loader_threads() const {
    if (loader_threads > 0) return loader_threads;
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

void IntegrationConfig::apply_log_threshold() const {
    Logger::set_threshold(debug ? Logger::Level::Debug : Logger::Level::Info);
}

} // namespace Broadsheet
