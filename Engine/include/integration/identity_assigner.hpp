/**
 * @file identity_assigner.hpp
 * @brief Deterministic global ids from an entity's best-available signature
 *
 * Signature precedence:
 *   LOCATION with coordinates -> "LOC_<lat>_<lon>"   (5 decimal places)
 *   TIME with start_date      -> "TIME_<start_date>"
 *   anything else             -> "<TYPE>_<lowercased text, spaces as underscores>"
 *
 * <TYPE> is the entity's type name, so an unlisted type such as "DATE" keys as "DATE_...".
 *
 * The id is a prefix of the BLAKE3 digest of the signature. Identical signatures
 * always collide on purpose; distinct signatures colliding is accepted as negligible.
 */

#pragma once

#include <model/entity.hpp>
#include <export.hpp>
#include <string>
#include <string_view>

namespace Broadsheet {

class BROADSHEET_API IdentityAssigner {
public:
    static constexpr size_t ENTITY_ID_HEX = 12;
    static constexpr size_t RELATION_ID_HEX = 11;
    static constexpr int COORDINATE_PLACES = 5;

    static std::string signature(EntityType type, std::string_view normalized_text,
                                 const LocationAttributes* location = nullptr,
                                 const TimeAttributes* time = nullptr);

    static std::string assign(EntityType type, std::string_view normalized_text,
                              const LocationAttributes* location = nullptr,
                              const TimeAttributes* time = nullptr);

    // Uses the view's best text, type name and attribute rows
    static std::string signature(const EntityView& view);
    static std::string assign(const EntityView& view);

    // "R" + 11 hex characters
    static std::string relation_id(std::string_view relation_signature);
};

} // namespace Broadsheet
