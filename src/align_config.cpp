//
//  align_config.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "align_config.hpp"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace {

bool is_language_code(const std::string &lang) {
    if (lang.empty()) {
        return false;
    }
    for (char c : lang) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
    }
    return true;
}

template <typename T>
bool read_unsigned(const json &j, const char *key, T &out, std::string &error) {
    if (!j.contains(key)) {
        return true;
    }
    const auto &v = j.at(key);
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<T>(v.get<uint64_t>());
    return true;
}

bool read_string(const json &j, const char *key, std::string &out, std::string &error) {
    if (!j.contains(key)) {
        return true;
    }
    const auto &v = j.at(key);
    if (!v.is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.get<std::string>();
    return true;
}

}  // namespace

namespace subpair {

Status validate_config(const AlignConfig &cfg) {
    if (cfg.tolerance_ms > kMaxMatchToleranceMs) {
        return make_status(false, "tolerance_ms must be at most " +
                                      std::to_string(kMaxMatchToleranceMs));
    }
    if (cfg.max_sync_rounds == 0) {
        return make_status(false, "max_sync_rounds must be at least 1");
    }
    if (cfg.jobs == 0) {
        return make_status(false, "jobs must be at least 1");
    }
    if (!is_language_code(cfg.primary_lang) || !is_language_code(cfg.secondary_lang)) {
        return make_status(false, "language codes must be non-empty and alphanumeric");
    }
    if (cfg.primary_lang == cfg.secondary_lang) {
        return make_status(false, "primary and secondary language must differ");
    }
    return make_status(true);
}

Status apply_config_json(std::string_view json_text, AlignConfig &cfg) {
    const json j = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (j.is_discarded()) {
        return make_status(false, "config is not valid JSON");
    }
    if (!j.is_object()) {
        return make_status(false, "config must be a JSON object");
    }

    AlignConfig next = cfg;
    std::string error;
    bool ok = read_unsigned(j, "tolerance_ms", next.tolerance_ms, error) &&
              read_unsigned(j, "max_sync_rounds", next.max_sync_rounds, error) &&
              read_unsigned(j, "jobs", next.jobs, error);
    if (ok && j.contains("merge_duplicates")) {
        if (j["merge_duplicates"].is_boolean()) {
            next.merge_duplicates = j["merge_duplicates"].get<bool>();
        } else {
            error = "'merge_duplicates' must be a boolean";
            ok = false;
        }
    }
    if (ok && j.contains("languages")) {
        const auto &langs = j["languages"];
        if (!langs.is_object()) {
            error = "'languages' must be an object";
            ok = false;
        } else {
            ok = read_string(langs, "primary", next.primary_lang, error) &&
                 read_string(langs, "secondary", next.secondary_lang, error);
        }
    }
    if (!ok) {
        return make_status(false, error);
    }
    for (const auto &item : j.items()) {
        const auto &key = item.key();
        if (key != "tolerance_ms" && key != "max_sync_rounds" && key != "jobs" &&
            key != "merge_duplicates" && key != "languages") {
            SP_LOG("config", "ignoring unknown config key '" << key << "'");
        }
    }

    Status valid = validate_config(next);
    if (!valid.ok) {
        return valid;
    }
    cfg = std::move(next);
    return make_status(true);
}

Status load_config_file(const std::string &path, AlignConfig &cfg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        SP_LOG("error", msg);
        return make_status(false, msg);
    }
    const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    Status status = apply_config_json(text, cfg);
    if (!status.ok) {
        status.message = path + ": " + status.message;
        SP_LOG("error", status.message);
        return status;
    }
    SP_LOG("config", "loaded " << path << ": tolerance_ms=" << cfg.tolerance_ms
                               << " max_sync_rounds=" << cfg.max_sync_rounds
                               << " languages=" << cfg.primary_lang << "/" << cfg.secondary_lang
                               << " merge_duplicates=" << cfg.merge_duplicates
                               << " jobs=" << cfg.jobs);
    return status;
}

}  // namespace subpair
