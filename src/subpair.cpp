//
//  subpair.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "subpair.hpp"
#include "subpair_version.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "logging.hpp"
#include "srt_writer.hpp"
#include "text_normalizer.hpp"
#include "track_matcher.hpp"

namespace subpair {

std::string version_string() { return SUBPAIR_VERSION_DISPLAY; }

LoadedTrack load_track(const std::string &path, const AlignConfig &cfg) {
    LoadedTrack track;
    track.parse = parse_srt_file(path);
    switch (track.parse.status) {
        case ParseStatus::IoError:
            track.status = make_status(false, "Failed to read " + path);
            return track;
        case ParseStatus::DecodeFailed:
            track.status = make_status(false, "Could not decode " + path);
            return track;
        case ParseStatus::Empty:
            SP_LOG("warn", path << " contains no usable captions");
            break;
        case ParseStatus::Ok:
            break;
    }
    track.captions = std::move(track.parse.captions);
    track.parse.captions.clear();
    if (cfg.merge_duplicates) {
        track.captions = merge_consecutive_duplicates(track.captions);
    }
    SP_LOG("debug", "loaded " << path << " (" << encoding_name(track.parse.encoding) << "): "
                              << track.captions.size() << " captions");
    track.status = make_status(true);
    return track;
}

MatchFilesResult match_files(const std::string &primary_path, const std::string &secondary_path,
                             const AlignConfig &cfg) {
    MatchFilesResult result;
    const auto t0 = std::chrono::steady_clock::now();
    LoadedTrack primary = load_track(primary_path, cfg);
    if (!primary.status.ok) {
        result.status = primary.status;
        return result;
    }
    LoadedTrack secondary = load_track(secondary_path, cfg);
    if (!secondary.status.ok) {
        result.status = secondary.status;
        return result;
    }
    result.primary_stats = primary.parse.stats;
    result.secondary_stats = secondary.parse.stats;
    result.pairs = match_tracks(primary.captions, secondary.captions, cfg.tolerance_ms);
    const auto t1 = std::chrono::steady_clock::now();
    SP_LOG("debug", "match_files timings ms: total="
                        << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());
    result.status = make_status(true);
    return result;
}

SyncFilesResult synchronize_files(const std::string &a_path, const std::string &b_path,
                                  const std::string &out_a, const std::string &out_b,
                                  const AlignConfig &cfg) {
    SyncFilesResult result;
    LoadedTrack a = load_track(a_path, cfg);
    if (!a.status.ok) {
        result.status = a.status;
        return result;
    }
    LoadedTrack b = load_track(b_path, cfg);
    if (!b.status.ok) {
        result.status = b.status;
        return result;
    }

    SynchronizedTracks synced =
        synchronize_tracks(std::move(a.captions), std::move(b.captions), cfg.max_sync_rounds);
    result.rounds = synced.rounds;
    result.converged = synced.converged;
    result.remaining_violations = synced.remaining_violations;
    result.a_captions = synced.a.size();
    result.b_captions = synced.b.size();

    if (!write_srt_file(out_a, synced.a)) {
        result.status = make_status(false, "Failed to write " + out_a);
        return result;
    }
    if (!write_srt_file(out_b, synced.b)) {
        result.status = make_status(false, "Failed to write " + out_b);
        return result;
    }
    result.status = make_status(true);
    return result;
}

CleanFileResult clean_file(const std::string &input_path, const std::string &output_path) {
    CleanFileResult result;
    AlignConfig cfg;
    cfg.merge_duplicates = false;
    LoadedTrack track = load_track(input_path, cfg);
    if (!track.status.ok) {
        result.status = track.status;
        return result;
    }
    if (track.captions.empty()) {
        result.status = make_status(false, "No valid entries found in " + input_path);
        return result;
    }
    result.original_count = track.captions.size();
    const CaptionTrack merged = merge_consecutive_duplicates(track.captions);
    result.final_count = static_cast<size_t>(std::count_if(
        merged.begin(), merged.end(), [](const Caption &c) { return !c.text.empty(); }));
    if (!write_srt_file(output_path, merged)) {
        result.status = make_status(false, "Failed to write " + output_path);
        return result;
    }
    SP_LOG("info", input_path << ": " << result.original_count << " -> " << result.final_count
                              << " entries");
    result.status = make_status(true);
    return result;
}

}  // namespace subpair
