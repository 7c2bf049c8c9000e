#include <integration/attribute_merger.hpp>
#include <storage/format_utils.hpp>
#include <utils/unicode.hpp>

namespace Broadsheet {

namespace {

// Empty strings and zero numbers count as missing.
bool is_missing(const std::optional<std::string>& v) { return !v || v->empty(); }
bool is_missing(const std::optional<double>& v) { return !v || *v == 0.0; }
template <typename Enum>
bool is_missing(const std::optional<Enum>& v) { return !v.has_value(); }

template <typename T>
void fill_missing(std::optional<T>& dst, const std::optional<T>& src, const char* key,
                  AttributeMerger::ChangedKeys* changed) {
    if (src && is_missing(dst)) {
        dst = src;
        if (changed) changed->emplace_back(key);
    }
}

template <typename T>
void replace_if_present(std::optional<T>& dst, const std::optional<T>& src, const char* key,
                        AttributeMerger::ChangedKeys* changed) {
    if (src) {
        dst = src;
        if (changed) changed->emplace_back(key);
    }
}

} // namespace

void AttributeMerger::merge_location(LocationAttributes& global, const LocationAttributes& incoming,
                                     ChangedKeys* changed) {
    fill_missing(global.latitude, incoming.latitude, "latitude", changed);
    fill_missing(global.longitude, incoming.longitude, "longitude", changed);
    fill_missing(global.display_name, incoming.display_name, "display_name", changed);
    fill_missing(global.location_type, incoming.location_type, "location_type", changed);
    fill_missing(global.importance, incoming.importance, "importance", changed);
    fill_missing(global.osm_id, incoming.osm_id, "osm_id", changed);
    fill_missing(global.bbox_south, incoming.bbox_south, "bbox_south", changed);
    fill_missing(global.bbox_north, incoming.bbox_north, "bbox_north", changed);
    fill_missing(global.bbox_west, incoming.bbox_west, "bbox_west", changed);
    fill_missing(global.bbox_east, incoming.bbox_east, "bbox_east", changed);

    if (incoming.display_name && global.display_name &&
        utf8_length(*incoming.display_name) > utf8_length(*global.display_name)) {
        global.display_name = incoming.display_name;
        if (changed) changed->emplace_back("display_name");
    }

    if (incoming.has_coordinates() && global.has_coordinates()) {
        const bool finer_lat = decimal_places(*incoming.latitude) > decimal_places(*global.latitude);
        const bool finer_lon = decimal_places(*incoming.longitude) > decimal_places(*global.longitude);
        if (finer_lat || finer_lon) {
            replace_if_present(global.latitude, incoming.latitude, "latitude", changed);
            replace_if_present(global.longitude, incoming.longitude, "longitude", changed);
            replace_if_present(global.bbox_south, incoming.bbox_south, "bbox_south", changed);
            replace_if_present(global.bbox_north, incoming.bbox_north, "bbox_north", changed);
            replace_if_present(global.bbox_west, incoming.bbox_west, "bbox_west", changed);
            replace_if_present(global.bbox_east, incoming.bbox_east, "bbox_east", changed);
        }
    }
}

void AttributeMerger::merge_time(TimeAttributes& global, const TimeAttributes& incoming,
                                 ChangedKeys* changed) {
    fill_missing(global.precision, incoming.precision, "precision", changed);
    fill_missing(global.start_date, incoming.start_date, "start_date", changed);
    fill_missing(global.end_date, incoming.end_date, "end_date", changed);
    fill_missing(global.date_reliability, incoming.date_reliability, "date_reliability", changed);

    if (incoming.precision && global.precision &&
        precision_rank(*incoming.precision) > precision_rank(*global.precision)) {
        replace_if_present(global.precision, incoming.precision, "precision", changed);
        replace_if_present(global.kind, incoming.kind, "type", changed);
        replace_if_present(global.start_date, incoming.start_date, "start_date", changed);
        replace_if_present(global.end_date, incoming.end_date, "end_date", changed);
        replace_if_present(global.date_reliability, incoming.date_reliability, "date_reliability", changed);
    }
}

bool AttributeMerger::merge_core(GlobalEntity& global, const LocalEntity& incoming) {
    if (!(incoming.confidence > global.confidence)) return false;

    global.text = incoming.text;
    global.confidence = incoming.confidence;
    if (incoming.normalized) {
        global.normalized = incoming.normalized;
    }
    return true;
}

} // namespace Broadsheet
