#include <integration/similarity_matcher.hpp>
#include <geometry/geodesic.hpp>
#include <storage/graph_store.hpp>
#include <text/sequence_matcher.hpp>
#include <utils/unicode.hpp>
#include <utility>

namespace Broadsheet {

SimilarityMatcher::SimilarityMatcher(const IntegrationConfig& config)
    : threshold_(config.similarity_threshold),
      geo_match_km_(config.geo_match_km),
      earth_radius_km_(config.earth_radius_km) {}

SimilarityMatcher::SimilarityMatcher(double threshold, double geo_match_km)
    : threshold_(threshold), geo_match_km_(geo_match_km), earth_radius_km_(geo::EARTH_RADIUS_KM) {}

bool SimilarityMatcher::similar(const EntityView& a, const EntityView& b) const {
    if (a.type != b.type || a.type_name() != b.type_name()) return false;

    if (a.type == EntityType::Location) {
        if (a.location && b.location && a.location->has_coordinates() && b.location->has_coordinates()) {
            double km = geo::haversine_km({*a.location->latitude, *a.location->longitude},
                                          {*b.location->latitude, *b.location->longitude},
                                          earth_radius_km_);
            return km < geo_match_km_;
        }
    } else if (a.type == EntityType::Time) {
        if (a.time && b.time && a.time->start_date && b.time->start_date) {
            return *a.time->start_date == *b.time->start_date;
        }
        if (a.normalized && b.normalized) {
            return *a.normalized == *b.normalized;
        }
    }

    return text_ratio(a, b) >= threshold_;
}

double SimilarityMatcher::text_ratio(const EntityView& a, const EntityView& b) {
    std::u32string x = to_lower(utf8_to_utf32(a.best_text()));
    std::u32string y = to_lower(utf8_to_utf32(b.best_text()));
    if (y < x) std::swap(x, y);
    return SequenceMatcher(std::move(x), std::move(y)).ratio();
}

std::optional<size_t> SimilarityMatcher::find_match(const GraphStore& store, const EntityView& candidate) const {
    const auto& entities = store.entities();
    for (size_t i = 0; i < entities.size(); ++i) {
        if (similar(entities[i].view(), candidate)) return i;
    }
    return std::nullopt;
}

} // namespace Broadsheet
