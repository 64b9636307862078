//
//  pair_export.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "caption.hpp"

/// @ingroup api
/// Storable row for the ingestion side: both texts, both time ranges, a sequence number.
struct PairRecord {
    std::string primary_text;
    std::string secondary_text;               ///< Empty when unmatched
    std::string primary_file;
    std::string secondary_file;
    std::string primary_time;                 ///< `HH:MM:SS,mmm --> HH:MM:SS,mmm`
    std::optional<std::string> secondary_time;  ///< Absent when unmatched
    int64_t rating = 0;
    uint64_t seq_id = 0;
};

// JSON key prefixes, e.g. {"en", "ru"} -> `en`, `file_en`, `time_en`, ...
struct RecordLanguages {
    std::string primary = "en";
    std::string secondary = "ru";
};

// One record per matched pair, seq_id counting up from `first_seq_id`.
std::vector<PairRecord> to_pair_records(const std::vector<MatchedPair> &matches,
                                        const std::string &primary_file,
                                        const std::string &secondary_file,
                                        uint64_t first_seq_id = 1);

nlohmann::json pair_record_to_json(const PairRecord &record, const RecordLanguages &langs);

// One compact JSON object per line; returns false if the stream failed.
bool write_ndjson(const std::vector<PairRecord> &records, const RecordLanguages &langs,
                  std::ostream &out);
