//
//  track_synchronizer.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>

#include "caption.hpp"

// Safety valve against alternating containment; not a proven termination bound.
inline constexpr uint32_t kDefaultMaxSyncRounds = 10;

/**
 * @brief Two tracks rewritten to a congruent segmentation.
 *
 * `converged` is true when the last round changed nothing. `remaining_violations` is counted
 * on the final tracks and is not assumed to be zero: it is the number of adjacent caption
 * pairs (either track) that sit inside one caption of the other track.
 */
struct SynchronizedTracks {
    CaptionTrack a;
    CaptionTrack b;
    uint32_t rounds = 0;
    bool converged = false;
    size_t remaining_violations = 0;
};

/**
 * @brief Fold captions of `target` into the caption of `reference` that contains them.
 *
 * Walks `target` in order. For a caption contained in some reference caption (the first one
 * found), the run of immediately following captions contained in the same reference caption
 * is replaced by one caption carrying the reference span and the run's texts joined by a
 * space. Captions without a containing reference caption pass through unchanged.
 *
 * @return true if a run of two or more was folded or a span was widened.
 */
bool absorb_contained(CaptionTrack &target, const CaptionTrack &reference);

// Adjacent pairs of `track` that both lie inside a single caption of `other`.
size_t count_containment_violations(const CaptionTrack &track, const CaptionTrack &other);

/**
 * @brief Merge captions on either side until neither track splits a caption of the other.
 *
 * Each round folds `b` against `a`, then `a` against the updated `b`. Rounds repeat until one
 * changes nothing or `max_rounds` have run. Both tracks are renumbered 1..N. Running it again
 * on converged output is a no-op.
 */
SynchronizedTracks synchronize_tracks(CaptionTrack a, CaptionTrack b,
                                      uint32_t max_rounds = kDefaultMaxSyncRounds);
