//
//  track_matcher.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_matcher.hpp"

#include <algorithm>

#include "logging.hpp"

namespace {

// Signed so that widening a span near 0 cannot wrap.
struct ExpandedSpan {
    int64_t start;
    int64_t end;
};

// Times and tolerance saturate at kMaxMatchToleranceMs, so the widened bounds and their
// differences stay inside int64_t for any input.
int64_t to_signed_ms(uint64_t ms) {
    return static_cast<int64_t>(std::min(ms, kMaxMatchToleranceMs));
}

ExpandedSpan expand(const TimeSpan &span, uint64_t tolerance_ms) {
    const int64_t tol = to_signed_ms(tolerance_ms);
    return ExpandedSpan{to_signed_ms(span.start_ms) - tol, to_signed_ms(span.end_ms) + tol};
}

}  // namespace

bool spans_close(const TimeSpan &a, const TimeSpan &b, uint64_t tolerance_ms) {
    const ExpandedSpan ea = expand(a, tolerance_ms);
    const ExpandedSpan eb = expand(b, tolerance_ms);
    return !(ea.end < eb.start || eb.end < ea.start);
}

double expanded_overlap_score(const TimeSpan &a, const TimeSpan &b, uint64_t tolerance_ms) {
    const ExpandedSpan ea = expand(a, tolerance_ms);
    const ExpandedSpan eb = expand(b, tolerance_ms);
    const int64_t overlap = std::max<int64_t>(0, std::min(ea.end, eb.end) -
                                                     std::max(ea.start, eb.start));
    const int64_t union_ms = std::max(ea.end, eb.end) - std::min(ea.start, eb.start);
    if (union_ms <= 0) {
        return 0.0;
    }
    return static_cast<double>(overlap) / static_cast<double>(union_ms);
}

MatchStep match_one(const Caption &primary, const CaptionTrack &secondary, size_t cursor,
                    uint64_t tolerance_ms) {
    const ExpandedSpan p = expand(primary.span, tolerance_ms);
    while (cursor < secondary.size() && expand(secondary[cursor].span, tolerance_ms).end < p.start) {
        ++cursor;
    }

    MatchStep step;
    step.next_cursor = cursor;
    double best_score = -1.0;
    for (size_t j = cursor; j < secondary.size(); ++j) {
        const TimeSpan &candidate = secondary[j].span;
        if (expand(candidate, tolerance_ms).start > p.end) {
            break;
        }
        if (!spans_close(primary.span, candidate, tolerance_ms)) {
            continue;
        }
        const double score = expanded_overlap_score(primary.span, candidate, tolerance_ms);
        if (score > best_score) {
            best_score = score;
            step.best = j;
        }
    }
    if (step.best) {
        step.score = best_score;
    }
    return step;
}

std::vector<MatchedPair> match_tracks(const CaptionTrack &primary, const CaptionTrack &secondary,
                                      uint64_t tolerance_ms) {
    std::vector<MatchedPair> pairs;
    pairs.reserve(primary.size());
    size_t cursor = 0;
    size_t matched = 0;
    for (const Caption &caption : primary) {
        const MatchStep step = match_one(caption, secondary, cursor, tolerance_ms);
        cursor = step.next_cursor;

        MatchedPair pair;
        pair.primary = caption;
        if (step.best) {
            pair.secondary = secondary[*step.best];
            pair.score = step.score;
            ++matched;
        }
        pairs.push_back(std::move(pair));
    }
    SP_LOG("match", "matched " << matched << "/" << primary.size()
                               << " primary captions against " << secondary.size()
                               << " secondary captions (tolerance " << tolerance_ms << "ms)");
    return pairs;
}
