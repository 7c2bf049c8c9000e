/**
 * @file entity.hpp
 * @brief Local and global entity records with typed attribute bags
 *
 * Location and time attributes are explicit optional fields rather than free-form maps,
 * so the merge rules in AttributeMerger operate on known keys only.
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Broadsheet {

enum class EntityType : uint8_t {
    Person,
    Organization,
    Location,
    Event,
    Concept,
    Time,
    Artifact,
    Sentiment,
    Other       // any type name outside the list above, kept verbatim alongside the record
};

inline constexpr EntityType k_all_entity_types[] = {
    EntityType::Person, EntityType::Organization, EntityType::Location, EntityType::Event,
    EntityType::Concept, EntityType::Time, EntityType::Artifact, EntityType::Sentiment
};

BROADSHEET_API const char* to_string(EntityType type) noexcept;
// Only the named types parse; callers fall back to Other with the raw name
BROADSHEET_API std::optional<EntityType> parse_entity_type(std::string_view name) noexcept;

inline std::string_view type_name(EntityType type, std::string_view other_type) noexcept {
    return type == EntityType::Other ? other_type : std::string_view(to_string(type));
}

/**
 * @brief Temporal precision, ordered from coarsest to finest
 */
enum class TimePrecision : uint8_t {
    Unknown = 0,
    Year,
    Month,
    Day,
    Hour,
    Minute
};

enum class TimeKind : uint8_t {
    Unknown,
    Point,
    Period
};

BROADSHEET_API const char* to_string(TimePrecision precision) noexcept;
BROADSHEET_API const char* to_string(TimeKind kind) noexcept;
// Unrecognised names map to Unknown
BROADSHEET_API TimePrecision parse_time_precision(std::string_view name) noexcept;
BROADSHEET_API TimeKind parse_time_kind(std::string_view name) noexcept;

/**
 * @brief Geocoding result attached to a LOCATION entity. All fields optional.
 */
struct LocationAttributes {
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<std::string> display_name;
    std::optional<std::string> location_type;
    std::optional<double> importance;
    std::optional<std::string> osm_id;
    std::optional<double> bbox_south;
    std::optional<double> bbox_north;
    std::optional<double> bbox_west;
    std::optional<double> bbox_east;

    bool has_coordinates() const { return latitude.has_value() && longitude.has_value(); }
    bool empty() const;
};

/**
 * @brief Parsed temporal information attached to a TIME entity. All fields optional.
 */
struct TimeAttributes {
    std::optional<TimePrecision> precision;
    std::optional<TimeKind> kind;
    std::optional<std::string> start_date;   // ISO-8601
    std::optional<std::string> end_date;     // ISO-8601
    std::optional<double> date_reliability;  // 0..1

    bool has_start_date() const { return start_date.has_value() && !start_date->empty(); }
    bool empty() const;
};

/**
 * @brief Non-owning view over whatever an entity carries, global or incoming.
 *
 * SimilarityMatcher compares two views, which keeps the predicate symmetric.
 */
struct EntityView {
    EntityType type = EntityType::Concept;
    std::string_view text;
    const std::string* normalized = nullptr;
    const LocationAttributes* location = nullptr;
    const TimeAttributes* time = nullptr;
    std::string_view other_type;

    std::string_view type_name() const { return Broadsheet::type_name(type, other_type); }

    // normalized when present, otherwise text
    std::string_view best_text() const {
        return normalized ? std::string_view(*normalized) : text;
    }
};

/**
 * @brief Entity as extracted from a single document (document-scoped id)
 */
struct LocalEntity {
    std::string id;
    EntityType type = EntityType::Concept;
    std::string text;
    std::optional<std::string> normalized;
    double confidence = 0.0;
    std::string other_type;  // raw type name, set only for Other

    std::string_view type_name() const { return Broadsheet::type_name(type, other_type); }
};

/**
 * @brief Incoming entity paired with its own document's attribute rows
 */
struct CandidateEntity {
    const LocalEntity& entity;
    const LocationAttributes* location = nullptr;
    const TimeAttributes* time = nullptr;

    EntityView view() const {
        return {entity.type, entity.text, entity.normalized ? &*entity.normalized : nullptr, location, time,
                entity.other_type};
    }
};

/**
 * @brief Deduplicated cross-document entity
 */
struct GlobalEntity {
    std::string id;
    EntityType type = EntityType::Concept;
    std::string text;
    std::optional<std::string> normalized;
    double confidence = 0.0;
    std::vector<std::string> sources;  // document ids, first-seen order, no repeats
    LocationAttributes location;       // populated for LOCATION only
    TimeAttributes time;               // populated for TIME only
    std::string other_type;

    std::string_view type_name() const { return Broadsheet::type_name(type, other_type); }

    EntityView view() const {
        return {type, text, normalized ? &*normalized : nullptr,
                type == EntityType::Location ? &location : nullptr,
                type == EntityType::Time ? &time : nullptr,
                other_type};
    }
};

/**
 * @brief Append a document id to a provenance list unless already present.
 * @return true if the id was added
 */
BROADSHEET_API bool add_source(std::vector<std::string>& sources, const std::string& document_id);

} // namespace Broadsheet
