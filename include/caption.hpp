//
//  caption.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// @ingroup api
/// Half-open caption interval in integer milliseconds; start_ms <= end_ms.
struct TimeSpan {
    uint64_t start_ms = 0;  ///< Absolute start time in ms
    uint64_t end_ms = 0;    ///< Absolute end time in ms

    uint64_t duration_ms() const { return end_ms - start_ms; }

    // True when `other` lies fully inside this span (boundaries included).
    bool contains(const TimeSpan &other) const {
        return start_ms <= other.start_ms && other.end_ms <= end_ms;
    }

    bool operator==(const TimeSpan &other) const {
        return start_ms == other.start_ms && end_ms == other.end_ms;
    }
    bool operator!=(const TimeSpan &other) const { return !(*this == other); }
};

/// @ingroup api
/// One timed text unit of a subtitle track.
struct Caption {
    uint32_t ordinal = 0;  ///< Display sequence number, recomputed on every emission
    TimeSpan span;         ///< Timing
    std::string text;      ///< UTF-8 text, normalized when emitted
};

/// Captions in file order (never re-sorted).
using CaptionTrack = std::vector<Caption>;

/// @ingroup api
/// Result row of the cross-track matcher; one per primary caption.
struct MatchedPair {
    Caption primary;
    std::optional<Caption> secondary;  ///< Empty when no candidate was close enough
    double score = 0.0;                ///< Overlap-over-union of the tolerance-expanded spans
};

// Rewrite ordinals as 1..N in track order.
inline void renumber(CaptionTrack &track) {
    uint32_t ordinal = 1;
    for (auto &caption : track) {
        caption.ordinal = ordinal++;
    }
}
