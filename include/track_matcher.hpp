//
//  track_matcher.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "caption.hpp"

// Default tolerance used when pairing two language tracks.
inline constexpr uint64_t kDefaultMatchToleranceMs = 1000;
// Larger tolerances (and caption times) behave like this one; matching saturates here.
inline constexpr uint64_t kMaxMatchToleranceMs = uint64_t{1} << 60;

// Outcome of matching one primary caption against the secondary track.
struct MatchStep {
    std::optional<size_t> best;  // index into the secondary track
    double score = 0.0;
    size_t next_cursor = 0;      // cursor to hand to the following primary caption
};

// Both spans widened by `tolerance_ms` on each side, then tested for any contact.
bool spans_close(const TimeSpan &a, const TimeSpan &b, uint64_t tolerance_ms);

// Overlap-over-union of the tolerance-expanded spans; 0 when the union is empty.
double expanded_overlap_score(const TimeSpan &a, const TimeSpan &b, uint64_t tolerance_ms);

/**
 * @brief Pick the best secondary counterpart for a single primary caption.
 *
 * Starts at `cursor`, first advancing it past secondary captions that end (expanded) before
 * the primary starts (expanded), then scores candidates until one starts past the primary's
 * expanded end. Only a strictly higher score replaces the current best, so the earliest
 * candidate wins a tie.
 */
MatchStep match_one(const Caption &primary, const CaptionTrack &secondary, size_t cursor,
                    uint64_t tolerance_ms);

/**
 * @brief Primary-driven join of two tracks by temporal overlap.
 *
 * Returns exactly one MatchedPair per primary caption, in primary order. Secondary captions
 * that are nobody's best match do not appear. One forward pass; the cursor never moves back.
 */
std::vector<MatchedPair> match_tracks(const CaptionTrack &primary, const CaptionTrack &secondary,
                                      uint64_t tolerance_ms = kDefaultMatchToleranceMs);
