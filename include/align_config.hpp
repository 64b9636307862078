//
//  align_config.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "status.hpp"
#include "track_matcher.hpp"
#include "track_synchronizer.hpp"

namespace subpair {

/// @ingroup api
/// Knobs shared by the CLI, the batch runner and the file-level API.
struct AlignConfig {
    uint64_t tolerance_ms = kDefaultMatchToleranceMs;  ///< Matcher tolerance expansion
    uint32_t max_sync_rounds = kDefaultMaxSyncRounds;  ///< Synchronizer round cap
    std::string primary_lang = "en";                   ///< File suffix / NDJSON key of track A
    std::string secondary_lang = "ru";                 ///< File suffix / NDJSON key of track B
    bool merge_duplicates = true;                      ///< Fold repeated captions after parsing
    uint32_t jobs = 8;                                 ///< Concurrent file pairs in batch mode
};

/**
 * @brief Overlay values from a JSON document onto `cfg`.
 *
 * Recognized keys: `tolerance_ms`, `max_sync_rounds`, `merge_duplicates`, `jobs` and
 * `languages` (`{"primary": "en", "secondary": "ru"}`). Missing keys keep their current
 * value; unknown keys are ignored (logged at debug). On failure `cfg` is left untouched.
 */
Status apply_config_json(std::string_view json_text, AlignConfig &cfg);

/// Read a JSON config file and apply it via apply_config_json().
Status load_config_file(const std::string &path, AlignConfig &cfg);

// Reject configurations the pipeline cannot run with.
Status validate_config(const AlignConfig &cfg);

}  // namespace subpair
