/**
 * @file similarity_matcher.hpp
 * @brief Same-referent test between two entities of the same type
 *
 * Rules, in order:
 * - different types never match
 * - LOCATION, both with coordinates: haversine distance < geo_match_km
 * - TIME, both with start_date: equal start dates; else both normalized: equal
 * - otherwise: lowercase best text (normalized, else text), ratio >= threshold
 */

#pragma once

#include <integration/integration_config.hpp>
#include <model/entity.hpp>
#include <export.hpp>
#include <optional>

namespace Broadsheet {

class GraphStore;

class BROADSHEET_API SimilarityMatcher {
public:
    explicit SimilarityMatcher(const IntegrationConfig& config = IntegrationConfig());
    SimilarityMatcher(double threshold, double geo_match_km);

    bool similar(const EntityView& a, const EntityView& b) const;

    /**
     * @brief Lowercased sequence ratio of the two best texts.
     *
     * Evaluated with the lexicographically smaller string first so the result
     * does not depend on argument order.
     */
    static double text_ratio(const EntityView& a, const EntityView& b);

    /**
     * @brief Position of the first stored entity (creation order) similar to the candidate.
     */
    std::optional<size_t> find_match(const GraphStore& store, const EntityView& candidate) const;

    double threshold() const { return threshold_; }
    double geo_match_km() const { return geo_match_km_; }

private:
    double threshold_;
    double geo_match_km_;
    double earth_radius_km_;
};

} // namespace Broadsheet
