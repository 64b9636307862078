//
//  track_synchronizer.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_synchronizer.hpp"

#include <optional>
#include <string>
#include <utility>

#include "logging.hpp"

namespace {

// Linear scan; per-file tracks are small.
std::optional<size_t> find_container(const CaptionTrack &reference, const TimeSpan &span) {
    for (size_t r = 0; r < reference.size(); ++r) {
        if (reference[r].span.contains(span)) {
            return r;
        }
    }
    return std::nullopt;
}

void append_text(std::string &dst, const std::string &text) {
    if (text.empty()) {
        return;
    }
    if (!dst.empty()) {
        dst.push_back(' ');
    }
    dst += text;
}

}  // namespace

bool absorb_contained(CaptionTrack &target, const CaptionTrack &reference) {
    CaptionTrack out;
    out.reserve(target.size());
    bool changed = false;

    size_t i = 0;
    while (i < target.size()) {
        const auto container = find_container(reference, target[i].span);
        if (!container) {
            out.push_back(std::move(target[i]));
            ++i;
            continue;
        }
        const TimeSpan &outer = reference[*container].span;
        size_t run_end = i + 1;
        while (run_end < target.size() && outer.contains(target[run_end].span)) {
            ++run_end;
        }

        Caption folded;
        folded.ordinal = target[i].ordinal;
        folded.span = outer;
        for (size_t k = i; k < run_end; ++k) {
            append_text(folded.text, target[k].text);
        }
        if (run_end - i >= 2 || target[i].span != outer) {
            changed = true;
            SP_LOG("sync", "folded " << (run_end - i) << " caption(s) into "
                                     << outer.start_ms << "-" << outer.end_ms << "ms: '"
                                     << subpair::text_preview(folded.text) << "'");
        }
        out.push_back(std::move(folded));
        i = run_end;
    }

    target = std::move(out);
    return changed;
}

size_t count_containment_violations(const CaptionTrack &track, const CaptionTrack &other) {
    size_t violations = 0;
    for (size_t k = 0; k + 1 < track.size(); ++k) {
        for (const Caption &outer : other) {
            if (outer.span.contains(track[k].span) && outer.span.contains(track[k + 1].span)) {
                ++violations;
                break;
            }
        }
    }
    return violations;
}

SynchronizedTracks synchronize_tracks(CaptionTrack a, CaptionTrack b, uint32_t max_rounds) {
    SynchronizedTracks result;
    const size_t a_in = a.size();
    const size_t b_in = b.size();

    while (result.rounds < max_rounds) {
        ++result.rounds;
        const bool b_changed = absorb_contained(b, a);
        const bool a_changed = absorb_contained(a, b);
        SP_LOG("sync", "round " << result.rounds << ": a=" << a.size() << " b=" << b.size()
                                << (b_changed || a_changed ? " (changed)" : " (stable)"));
        if (!b_changed && !a_changed) {
            result.converged = true;
            break;
        }
    }

    renumber(a);
    renumber(b);
    result.remaining_violations =
        count_containment_violations(a, b) + count_containment_violations(b, a);
    if (!result.converged) {
        SP_LOG("warn", "synchronization stopped after " << result.rounds
                                                        << " rounds without reaching a fixed point; "
                                                        << result.remaining_violations
                                                        << " containment violations remain");
    } else if (result.remaining_violations != 0) {
        SP_LOG("warn", "synchronization converged with " << result.remaining_violations
                                                         << " containment violations left");
    }
    SP_LOG("sync", "a: " << a_in << " -> " << a.size() << ", b: " << b_in << " -> " << b.size()
                         << " after " << result.rounds << " rounds");
    result.a = std::move(a);
    result.b = std::move(b);
    return result;
}
