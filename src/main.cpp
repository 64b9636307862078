//
//  main.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "align_config.hpp"
#include "batch_runner.hpp"
#include "logging.hpp"
#include "pair_export.hpp"
#include "subpair.hpp"
#include "subpair_version.hpp"

subpair::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return subpair::LogVerbosity::Debug;
    if (s == "info") return subpair::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return subpair::LogVerbosity::Warn;
    return subpair::LogVerbosity::Error;
}

std::optional<uint64_t> parse_number(const std::string &s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    errno = 0;
    char *end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(v);
}

void print_usage() {
    std::cerr << "SubPair " << SUBPAIR_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  subpair match <primary.srt> <secondary.srt>      NDJSON pairs to stdout\n"
              << "  subpair sync <a.srt> <b.srt> <out_a.srt> <out_b.srt>\n"
              << "  subpair clean <input.srt> <output.srt>\n"
              << "  subpair batch <dir>                              NDJSON pairs to stdout\n"
              << "Options:\n"
              << "  --config FILE       JSON config (tolerance_ms, max_sync_rounds, languages,\n"
              << "                      merge_duplicates, jobs); flags below override it.\n"
              << "  --tolerance MS      Matching tolerance in ms (default: 1000).\n"
              << "  --max-rounds N      Synchronizer round cap (default: 10).\n"
              << "  --jobs N            Concurrent file pairs in batch mode (default: 8).\n"
              << "  --no-merge          Keep consecutive duplicate captions.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --log-stages LIST   Debug output only for these stages, e.g. decode,sync\n"
              << "                      (decode, parser, merge, match, sync, batch, config, io).\n";
}

int run_match(const std::vector<std::string> &args, const subpair::AlignConfig &cfg) {
    if (args.size() != 2) {
        std::cerr << "match expects <primary.srt> <secondary.srt>\n";
        return 2;
    }
    auto res = subpair::match_files(args[0], args[1], cfg);
    if (!res.status.ok) {
        SP_LOG("error", "subpair: failed to match: " << res.status.message);
        return 1;
    }
    const RecordLanguages langs{cfg.primary_lang, cfg.secondary_lang};
    const auto records = to_pair_records(res.pairs, args[0], args[1]);
    return write_ndjson(records, langs, std::cout) ? 0 : 1;
}

int run_sync(const std::vector<std::string> &args, const subpair::AlignConfig &cfg) {
    if (args.size() != 4) {
        std::cerr << "sync expects <a.srt> <b.srt> <out_a.srt> <out_b.srt>\n";
        return 2;
    }
    auto res = subpair::synchronize_files(args[0], args[1], args[2], args[3], cfg);
    if (!res.status.ok) {
        SP_LOG("error", "subpair: failed to synchronize: " << res.status.message);
        return 1;
    }
    std::cout << "Wrote: " << args[2] << " (" << res.a_captions << " captions), " << args[3]
              << " (" << res.b_captions << " captions) after " << res.rounds << " rounds\n";
    if (!res.converged || res.remaining_violations != 0) {
        std::cout << "Not fully synchronized: " << res.remaining_violations
                  << " containment violations remain\n";
    }
    return 0;
}

int run_clean(const std::vector<std::string> &args) {
    if (args.size() != 2) {
        std::cerr << "clean expects <input.srt> <output.srt>\n";
        return 2;
    }
    auto res = subpair::clean_file(args[0], args[1]);
    if (!res.status.ok) {
        SP_LOG("error", "subpair: failed to clean: " << res.status.message);
        return 1;
    }
    std::cout << "Wrote: " << args[1] << " (" << res.original_count << " -> "
              << res.final_count << " entries)\n";
    return 0;
}

int run_batch_mode(const std::vector<std::string> &args, const subpair::AlignConfig &cfg) {
    if (args.size() != 1) {
        std::cerr << "batch expects <dir>\n";
        return 2;
    }
    auto discovery = subpair::discover_pairs(args[0], cfg);
    if (!discovery.status.ok) {
        SP_LOG("error", "subpair: " << discovery.status.message);
        return 1;
    }
    for (const auto &name : discovery.unpaired) {
        SP_LOG("warn", "skipping unpaired file " << name);
    }

    const RecordLanguages langs{cfg.primary_lang, cfg.secondary_lang};
    auto items = subpair::run_batch(discovery.pairs, cfg);
    uint64_t next_seq = 1;
    size_t failed = 0;
    for (const auto &item : items) {
        if (!item.result.status.ok) {
            SP_LOG("error", "subpair: " << item.pair.base << ": " << item.result.status.message);
            ++failed;
            continue;
        }
        const auto records = to_pair_records(item.result.pairs, item.pair.primary_path,
                                             item.pair.secondary_path, next_seq);
        next_seq += records.size();
        if (!write_ndjson(records, langs, std::cout)) {
            return 1;
        }
    }
    SP_LOG("info", "batch: " << (items.size() - failed) << "/" << items.size()
                             << " pairs processed, " << (next_seq - 1) << " records");
    return failed == 0 ? 0 : 1;
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SubPair " << SUBPAIR_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option). Config file first, flags override it.
    std::vector<std::string> positional;
    std::string config_path;
    std::optional<uint64_t> tolerance;
    std::optional<uint64_t> max_rounds;
    std::optional<uint64_t> jobs;
    bool no_merge = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-merge") {
            no_merge = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            subpair::set_log_verbosity(parse_level(argv[++i]));
        } else if (arg == "--log-stages" && i + 1 < argc) {
            if (!subpair::set_log_stages(argv[++i])) {
                std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--tolerance" || arg == "--max-rounds" || arg == "--jobs") &&
                   i + 1 < argc) {
            auto value = parse_number(argv[++i]);
            if (!value || (arg != "--tolerance" &&
                           *value > std::numeric_limits<uint32_t>::max())) {
                std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
                return 2;
            }
            if (arg == "--tolerance") {
                tolerance = value;
            } else if (arg == "--jobs") {
                jobs = value;
            } else {
                max_rounds = value;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    subpair::AlignConfig cfg;
    if (!config_path.empty()) {
        auto status = subpair::load_config_file(config_path, cfg);
        if (!status.ok) {
            return 2;
        }
    }
    if (tolerance) cfg.tolerance_ms = *tolerance;
    if (max_rounds) cfg.max_sync_rounds = static_cast<uint32_t>(*max_rounds);
    if (jobs) cfg.jobs = static_cast<uint32_t>(*jobs);
    if (no_merge) cfg.merge_duplicates = false;
    auto valid = subpair::validate_config(cfg);
    if (!valid.ok) {
        std::cerr << "Invalid configuration: " << valid.message << "\n";
        return 2;
    }

    const std::string mode = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());
    if (mode == "match") return run_match(args, cfg);
    if (mode == "sync") return run_sync(args, cfg);
    if (mode == "clean") return run_clean(args);
    if (mode == "batch") return run_batch_mode(args, cfg);

    std::cerr << "Unknown mode: " << mode << "\n";
    print_usage();
    return 2;
}
