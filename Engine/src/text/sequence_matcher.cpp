#include <text/sequence_matcher.hpp>
#include <algorithm>
#include <tuple>
#include <utility>

namespace Broadsheet {

SequenceMatcher::SequenceMatcher(std::u32string a, std::u32string b)
    : a_(std::move(a)), b_(std::move(b)) {
    index_b();
}

void SequenceMatcher::index_b() {
    for (size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }

    const size_t n = b_.size();
    if (n >= AUTOJUNK_MIN_LENGTH) {
        const size_t ntest = n / 100 + 1;
        for (auto it = b2j_.begin(); it != b2j_.end(); ) {
            if (it->second.size() > ntest) it = b2j_.erase(it);
            else ++it;
        }
    }
}

SequenceMatcher::Match SequenceMatcher::find_longest_match(size_t alo, size_t ahi,
                                                           size_t blo, size_t bhi) const {
    size_t besti = alo, bestj = blo, bestsize = 0;

    // j2len[j] = length of the match ending at a[i-1], b[j]
    std::unordered_map<size_t, size_t> j2len;
    std::unordered_map<size_t, size_t> newj2len;

    for (size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto found = b2j_.find(a_[i]);
        if (found != b2j_.end()) {
            for (size_t j : found->second) {
                if (j < blo) continue;
                if (j >= bhi) break;
                size_t prev = 0;
                if (j > 0) {
                    auto p = j2len.find(j - 1);
                    if (p != j2len.end()) prev = p->second;
                }
                size_t k = prev + 1;
                newj2len[j] = k;
                if (k > bestsize) {
                    besti = i + 1 - k;
                    bestj = j + 1 - k;
                    bestsize = k;
                }
            }
        }
        std::swap(j2len, newj2len);
    }

    // Popular codepoints never seed a block; grow the block over equal neighbours.
    while (besti > alo && bestj > blo && a_[besti - 1] == b_[bestj - 1]) {
        --besti;
        --bestj;
        ++bestsize;
    }
    while (besti + bestsize < ahi && bestj + bestsize < bhi &&
           a_[besti + bestsize] == b_[bestj + bestsize]) {
        ++bestsize;
    }

    return {besti, bestj, bestsize};
}

std::vector<SequenceMatcher::Match> SequenceMatcher::matching_blocks() const {
    const size_t la = a_.size();
    const size_t lb = b_.size();

    std::vector<std::tuple<size_t, size_t, size_t, size_t>> queue;
    queue.emplace_back(0, la, 0, lb);
    std::vector<Match> blocks;

    while (!queue.empty()) {
        auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();

        Match m = find_longest_match(alo, ahi, blo, bhi);
        if (m.size == 0) continue;

        blocks.push_back(m);
        if (alo < m.a && blo < m.b) {
            queue.emplace_back(alo, m.a, blo, m.b);
        }
        if (m.a + m.size < ahi && m.b + m.size < bhi) {
            queue.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
        }
    }

    std::sort(blocks.begin(), blocks.end(), [](const Match& x, const Match& y) {
        return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
    });

    std::vector<Match> merged;
    for (const auto& m : blocks) {
        if (!merged.empty()) {
            Match& last = merged.back();
            if (last.a + last.size == m.a && last.b + last.size == m.b) {
                last.size += m.size;
                continue;
            }
        }
        merged.push_back(m);
    }

    merged.push_back({la, lb, 0});
    return merged;
}

double SequenceMatcher::ratio() const {
    const size_t total = a_.size() + b_.size();
    if (total == 0) return 1.0;

    size_t matches = 0;
    for (const auto& m : matching_blocks()) {
        matches += m.size;
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

} // namespace Broadsheet
