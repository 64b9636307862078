//
//  batch_runner.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "batch_runner.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <filesystem>
#include <future>
#include <map>
#include <utility>

#include "logging.hpp"

namespace {

std::string to_lower(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

// `movie_EN.srt` with lang `en` -> `movie`; empty when the suffix does not match.
std::string base_for_lang(const std::string &filename, const std::string &lang) {
    const std::string suffix = "_" + to_lower(lang) + ".srt";
    const std::string lower = to_lower(filename);
    if (lower.size() <= suffix.size() ||
        lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return {};
    }
    return filename.substr(0, filename.size() - suffix.size());
}

subpair::MatchFilesResult run_unit(const subpair::FilePair &pair,
                                   const subpair::AlignConfig &cfg) {
    subpair::ScopedLogContext log_label(pair.base);
    try {
        return subpair::match_files(pair.primary_path, pair.secondary_path, cfg);
    } catch (const std::exception &e) {
        SP_LOG("error", e.what());
        subpair::MatchFilesResult failed;
        failed.status = subpair::make_status(false, pair.base + ": " + e.what());
        return failed;
    }
}

}  // namespace

namespace subpair {

PairDiscovery discover_pairs(const std::string &dir, const AlignConfig &cfg) {
    PairDiscovery discovery;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        discovery.status = make_status(false, "Cannot list " + dir + ": " + ec.message());
        SP_LOG("error", discovery.status.message);
        return discovery;
    }

    struct Sides {
        std::string primary;
        std::string secondary;
    };
    std::map<std::string, Sides> by_base;
    const std::filesystem::directory_iterator end;
    while (it != end) {
        const std::filesystem::path path = it->path();
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            const std::string name = path.filename().string();
            std::string base = base_for_lang(name, cfg.primary_lang);
            if (!base.empty()) {
                by_base[base].primary = path.string();
            } else if (!(base = base_for_lang(name, cfg.secondary_lang)).empty()) {
                by_base[base].secondary = path.string();
            }
        }
        it.increment(ec);
        if (ec) {
            discovery.status = make_status(false, "Cannot list " + dir + ": " + ec.message());
            SP_LOG("error", discovery.status.message);
            return discovery;
        }
    }

    for (const auto &entry : by_base) {
        const Sides &sides = entry.second;
        if (!sides.primary.empty() && !sides.secondary.empty()) {
            discovery.pairs.push_back(FilePair{entry.first, sides.primary, sides.secondary});
            continue;
        }
        const std::string &lone = sides.primary.empty() ? sides.secondary : sides.primary;
        discovery.unpaired.push_back(std::filesystem::path(lone).filename().string());
    }
    std::sort(discovery.unpaired.begin(), discovery.unpaired.end());
    SP_LOG("batch", dir << ": " << discovery.pairs.size() << " pairs, "
                        << discovery.unpaired.size() << " unpaired files");
    discovery.status = make_status(true);
    return discovery;
}

std::vector<BatchItem> run_batch(const std::vector<FilePair> &pairs, const AlignConfig &cfg) {
    std::vector<BatchItem> items(pairs.size());
    if (pairs.empty()) {
        return items;
    }
    const size_t workers = std::min<size_t>(std::max<uint32_t>(cfg.jobs, 1), pairs.size());
    SP_LOG("batch", "processing " << pairs.size() << " pairs on " << workers << " workers");

    // Workers only share the claim counter; each returns its own (index, result) list.
    std::atomic<size_t> next{0};
    using Finished = std::vector<std::pair<size_t, MatchFilesResult>>;
    std::vector<std::future<Finished>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&pairs, &cfg, &next]() {
            Finished done;
            for (size_t i = next.fetch_add(1); i < pairs.size(); i = next.fetch_add(1)) {
                done.emplace_back(i, run_unit(pairs[i], cfg));
            }
            return done;
        }));
    }

    for (auto &future : futures) {
        for (auto &finished : future.get()) {
            items[finished.first].result = std::move(finished.second);
        }
    }
    size_t failures = 0;
    for (size_t i = 0; i < pairs.size(); ++i) {
        items[i].pair = pairs[i];
        if (!items[i].result.status.ok) {
            ++failures;
        }
    }
    if (failures != 0) {
        SP_LOG("warn", failures << " of " << pairs.size() << " pairs failed");
    }
    return items;
}

}  // namespace subpair
