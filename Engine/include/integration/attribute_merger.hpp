/**
 * @file attribute_merger.hpp
 * @brief Folds an incoming record's attributes into a matched global entity
 *
 * Merges are in place and monotone: a key present before a merge is present after it.
 *
 * Location:
 *   1. fill every key the global entity lacks (or holds as empty/zero)
 *   2. strictly longer display_name replaces the stored one
 *   3. more decimal places in incoming latitude or longitude replaces
 *      {latitude, longitude, bbox_*} together
 *
 * Time:
 *   1. fill missing precision/start_date/end_date/date_reliability (never kind)
 *   2. a finer incoming precision replaces
 *      {precision, kind, start_date, end_date, date_reliability} together
 *
 * Core fields (text, confidence, normalized) follow strictly higher confidence.
 */

#pragma once

#include <model/entity.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Broadsheet {

class BROADSHEET_API AttributeMerger {
public:
    // Names of keys filled or replaced by the last call, for the debug trace
    using ChangedKeys = std::vector<std::string>;

    static void merge_location(LocationAttributes& global, const LocationAttributes& incoming,
                               ChangedKeys* changed = nullptr);

    static void merge_time(TimeAttributes& global, const TimeAttributes& incoming,
                           ChangedKeys* changed = nullptr);

    /**
     * @brief Replace text/confidence/normalized when the incoming confidence is strictly higher.
     * @return true if the core fields were replaced
     */
    static bool merge_core(GlobalEntity& global, const LocalEntity& incoming);

    // UNKNOWN=0 < YEAR < MONTH < DAY < HOUR < MINUTE=5
    static constexpr int precision_rank(TimePrecision p) noexcept {
        return static_cast<int>(p);
    }
};

} // namespace Broadsheet
