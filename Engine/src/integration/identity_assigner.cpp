#include <integration/identity_assigner.hpp>
#include <hashing/signature_hash.hpp>
#include <storage/format_utils.hpp>
#include <utils/unicode.hpp>
#include <algorithm>

namespace Broadsheet {

std::string IdentityAssigner::signature(EntityType type, std::string_view normalized_text,
                                        const LocationAttributes* location,
                                        const TimeAttributes* time) {
    EntityView view;
    view.type = type;
    view.text = normalized_text;
    view.location = location;
    view.time = time;
    return signature(view);
}

std::string IdentityAssigner::signature(const EntityView& view) {
    const LocationAttributes* location = view.location;
    const TimeAttributes* time = view.time;
    if (view.type == EntityType::Location && location && location->has_coordinates()) {
        return "LOC_" + format_double(round_to(*location->latitude, COORDINATE_PLACES)) + "_" +
               format_double(round_to(*location->longitude, COORDINATE_PLACES));
    }
    if (view.type == EntityType::Time && time && time->start_date) {
        return "TIME_" + *time->start_date;
    }

    std::string text = to_lower_utf8(view.best_text());
    std::replace(text.begin(), text.end(), ' ', '_');
    return std::string(view.type_name()) + "_" + text;
}

std::string IdentityAssigner::assign(EntityType type, std::string_view normalized_text,
                                     const LocationAttributes* location,
                                     const TimeAttributes* time) {
    return SignatureHash::hex_prefix(signature(type, normalized_text, location, time), ENTITY_ID_HEX);
}

std::string IdentityAssigner::assign(const EntityView& view) {
    return SignatureHash::hex_prefix(signature(view), ENTITY_ID_HEX);
}

std::string IdentityAssigner::relation_id(std::string_view relation_signature) {
    return "R" + SignatureHash::hex_prefix(relation_signature, RELATION_ID_HEX);
}

} // namespace Broadsheet
