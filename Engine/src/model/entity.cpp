#include <model/entity.hpp>
#include <algorithm>

namespace Broadsheet {

const char* to_string(EntityType type) noexcept {
    switch (type) {
        case EntityType::Person:       return "PERSON";
        case EntityType::Organization: return "ORGANIZATION";
        case EntityType::Location:     return "LOCATION";
        case EntityType::Event:        return "EVENT";
        case EntityType::Concept:      return "CONCEPT";
        case EntityType::Time:         return "TIME";
        case EntityType::Artifact:     return "ARTIFACT";
        case EntityType::Sentiment:    return "SENTIMENT";
        case EntityType::Other:        return "OTHER";
    }
    return "CONCEPT";
}

std::optional<EntityType> parse_entity_type(std::string_view name) noexcept {
    for (EntityType t : k_all_entity_types) {
        if (name == to_string(t)) return t;
    }
    return std::nullopt;
}

const char* to_string(TimePrecision precision) noexcept {
    switch (precision) {
        case TimePrecision::Unknown: return "UNKNOWN";
        case TimePrecision::Year:    return "YEAR";
        case TimePrecision::Month:   return "MONTH";
        case TimePrecision::Day:     return "DAY";
        case TimePrecision::Hour:    return "HOUR";
        case TimePrecision::Minute:  return "MINUTE";
    }
    return "UNKNOWN";
}

const char* to_string(TimeKind kind) noexcept {
    switch (kind) {
        case TimeKind::Unknown: return "UNKNOWN";
        case TimeKind::Point:   return "POINT";
        case TimeKind::Period:  return "PERIOD";
    }
    return "UNKNOWN";
}

TimePrecision parse_time_precision(std::string_view name) noexcept {
    if (name == "YEAR")   return TimePrecision::Year;
    if (name == "MONTH")  return TimePrecision::Month;
    if (name == "DAY")    return TimePrecision::Day;
    if (name == "HOUR")   return TimePrecision::Hour;
    if (name == "MINUTE") return TimePrecision::Minute;
    return TimePrecision::Unknown;
}

TimeKind parse_time_kind(std::string_view name) noexcept {
    if (name == "POINT")  return TimeKind::Point;
    if (name == "PERIOD") return TimeKind::Period;
    return TimeKind::Unknown;
}

bool LocationAttributes::empty() const {
    return !latitude && !longitude && !display_name && !location_type && !importance &&
           !osm_id && !bbox_south && !bbox_north && !bbox_west && !bbox_east;
}

bool TimeAttributes::empty() const {
    return !precision && !kind && !start_date && !end_date && !date_reliability;
}

bool add_source(std::vector<std::string>& sources, const std::string& document_id) {
    if (std::find(sources.begin(), sources.end(), document_id) != sources.end()) return false;
    sources.push_back(document_id);
    return true;
}

} // namespace Broadsheet
