/**
 * @file sequence_matcher.hpp
 * @brief Ratcliff/Obershelp "gestalt" similarity over codepoint sequences
 *
 * Longest-common-block decomposition as used by classic diff tools:
 * - find the longest matching block, recurse on both sides
 * - ratio = 2*M / T, M = total matched codepoints, T = combined length
 * - for b of 200+ codepoints, codepoints occurring in more than 1% of b are
 *   "popular" and cannot seed a match (they may still extend one)
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Broadsheet {

class SequenceMatcher {
public:
    struct Match {
        size_t a;     // start in a
        size_t b;     // start in b
        size_t size;  // block length

        bool operator==(const Match& o) const { return a == o.a && b == o.b && size == o.size; }
    };

    SequenceMatcher(std::u32string a, std::u32string b);

    /**
     * @brief Longest matching block within a[alo:ahi) and b[blo:bhi).
     *
     * Ties resolve to the block starting earliest in a, then earliest in b.
     */
    Match find_longest_match(size_t alo, size_t ahi, size_t blo, size_t bhi) const;

    /**
     * @brief Non-overlapping matching blocks in ascending order, adjacent blocks merged,
     * terminated by a zero-size sentinel {len(a), len(b), 0}.
     */
    std::vector<Match> matching_blocks() const;

    /**
     * @brief Similarity in [0, 1]. Two empty sequences give 1.0.
     */
    double ratio() const;

    static double ratio(std::u32string_view a, std::u32string_view b) {
        return SequenceMatcher(std::u32string(a), std::u32string(b)).ratio();
    }

private:
    static constexpr size_t AUTOJUNK_MIN_LENGTH = 200;

    void index_b();

    std::u32string a_;
    std::u32string b_;
    std::unordered_map<char32_t, std::vector<size_t>> b2j_;  // codepoint -> ascending positions in b
};

} // namespace Broadsheet
