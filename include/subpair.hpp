//
//  subpair.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "align_config.hpp"
#include "caption.hpp"
#include "srt_parser.hpp"
#include "status.hpp"
#include "track_synchronizer.hpp"

namespace subpair {

/// @defgroup api SubPair Public API
/// Public, supported C++ interfaces for aligning bilingual subtitle tracks.
/// @{

/**
 * @brief Return the SubPair library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// A parsed (and, if configured, duplicate-merged) track plus what the parser saw.
struct LoadedTrack {
    Status status;
    CaptionTrack captions;
    ParseResult parse;  ///< `captions` moved out; status/encoding/stats kept
};

/**
 * @brief Parse one `.srt` file and apply duplicate merging per `cfg`.
 *
 * Fails for unreadable or undecodable files. A decodable file without captions is not an
 * error; it yields an empty track with `parse.status == ParseStatus::Empty`.
 */
LoadedTrack load_track(const std::string &path, const AlignConfig &cfg);

struct MatchFilesResult {
    Status status;
    std::vector<MatchedPair> pairs;  ///< One per primary caption
    ParseStats primary_stats;
    ParseStats secondary_stats;
};

/// Parse both files and join the secondary track onto the primary one.
MatchFilesResult match_files(const std::string &primary_path, const std::string &secondary_path,
                             const AlignConfig &cfg);  ///< @ingroup api

struct SyncFilesResult {
    Status status;
    uint32_t rounds = 0;
    bool converged = false;
    size_t remaining_violations = 0;
    size_t a_captions = 0;  ///< Caption count written for track A
    size_t b_captions = 0;  ///< Caption count written for track B
};

/**
 * @brief Synchronize two files and write both rewritten tracks as `.srt`.
 *
 * @param a_path Input track A.
 * @param b_path Input track B.
 * @param out_a Destination for rewritten track A.
 * @param out_b Destination for rewritten track B.
 * @param cfg Round cap and duplicate merging.
 */
SyncFilesResult synchronize_files(const std::string &a_path, const std::string &b_path,
                                  const std::string &out_a, const std::string &out_b,
                                  const AlignConfig &cfg);  ///< @ingroup api

struct CleanFileResult {
    Status status;
    size_t original_count = 0;  ///< Captions surviving the parser's filters
    size_t final_count = 0;     ///< Captions written after merging (empty texts left out)
};

/// Parse, merge duplicates and rewrite one `.srt` file with fresh numbering.
CleanFileResult clean_file(const std::string &input_path,
                           const std::string &output_path);  ///< @ingroup api

/// @}

}  // namespace subpair
