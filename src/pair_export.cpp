//
//  pair_export.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pair_export.hpp"

#include "logging.hpp"
#include "srt_time.hpp"

using json = nlohmann::json;

std::vector<PairRecord> to_pair_records(const std::vector<MatchedPair> &matches,
                                        const std::string &primary_file,
                                        const std::string &secondary_file,
                                        uint64_t first_seq_id) {
    std::vector<PairRecord> records;
    records.reserve(matches.size());
    uint64_t seq_id = first_seq_id;
    for (const auto &match : matches) {
        PairRecord r;
        r.primary_text = match.primary.text;
        r.primary_file = primary_file;
        r.secondary_file = secondary_file;
        r.primary_time = format_time_range(match.primary.span);
        if (match.secondary) {
            r.secondary_text = match.secondary->text;
            r.secondary_time = format_time_range(match.secondary->span);
        }
        r.seq_id = seq_id++;
        records.push_back(std::move(r));
    }
    return records;
}

json pair_record_to_json(const PairRecord &record, const RecordLanguages &langs) {
    json j;
    j[langs.primary] = record.primary_text;
    j[langs.secondary] = record.secondary_text;
    j["file_" + langs.primary] = record.primary_file;
    j["file_" + langs.secondary] = record.secondary_file;
    j["time_" + langs.primary] = record.primary_time;
    if (record.secondary_time) {
        j["time_" + langs.secondary] = *record.secondary_time;
    } else {
        j["time_" + langs.secondary] = nullptr;
    }
    j["rating"] = record.rating;
    j["seq_id"] = record.seq_id;
    return j;
}

bool write_ndjson(const std::vector<PairRecord> &records, const RecordLanguages &langs,
                  std::ostream &out) {
    for (const auto &record : records) {
        // Replace rather than throw on text that slipped through as invalid UTF-8.
        out << pair_record_to_json(record, langs)
                   .dump(-1, ' ', false, json::error_handler_t::replace)
            << "\n";
    }
    out.flush();
    if (!out.good()) {
        SP_LOG("error", "failed writing " << records.size() << " NDJSON records");
        return false;
    }
    return true;
}
