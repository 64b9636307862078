//
//  batch_runner.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "align_config.hpp"
#include "subpair.hpp"

namespace subpair {

// Two tracks of the same video, e.g. `movie_en.srt` + `movie_ru.srt` -> base `movie`.
struct FilePair {
    std::string base;
    std::string primary_path;
    std::string secondary_path;
};

struct PairDiscovery {
    Status status;
    std::vector<FilePair> pairs;          ///< Sorted by base name
    std::vector<std::string> unpaired;    ///< File names lacking their counterpart, sorted
};

/**
 * @brief Find `<base>_<lang>.srt` pairs directly inside `dir` (not recursive).
 *
 * Suffix matching is case-insensitive and uses `cfg.primary_lang` / `cfg.secondary_lang`.
 * Other files are ignored.
 */
PairDiscovery discover_pairs(const std::string &dir, const AlignConfig &cfg);

struct BatchItem {
    FilePair pair;
    MatchFilesResult result;
};

/**
 * @brief Match every pair as an independent unit of work.
 *
 * Up to `cfg.jobs` pairs run concurrently. Results come back in input order once all units
 * have finished; one unit's failure is reported in its own item and does not stop the others.
 */
std::vector<BatchItem> run_batch(const std::vector<FilePair> &pairs, const AlignConfig &cfg);

}  // namespace subpair
