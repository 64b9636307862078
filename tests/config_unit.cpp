// Unit coverage for JSON configuration loading and validation.
#include <filesystem>
#include <iostream>
#include <string>

#include "align_config.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

using subpair::AlignConfig;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[config_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_defaults() {
    AlignConfig cfg;
    bool ok = check(cfg.tolerance_ms == 1000, "default tolerance 1000ms");
    ok &= check(cfg.max_sync_rounds == 10, "default round cap 10");
    ok &= check(cfg.primary_lang == "en" && cfg.secondary_lang == "ru", "default languages");
    ok &= check(cfg.merge_duplicates, "merging on by default");
    ok &= check(subpair::validate_config(cfg).ok, "defaults validate");
    return ok;
}

bool test_apply() {
    AlignConfig cfg;
    auto status = subpair::apply_config_json(R"({
        "tolerance_ms": 250,
        "max_sync_rounds": 4,
        "jobs": 2,
        "merge_duplicates": false,
        "languages": {"primary": "de", "secondary": "fr"},
        "comment": "unknown keys are ignored"
    })",
                                             cfg);
    bool ok = check(status.ok, "valid config accepted: " + status.message);
    ok &= check(cfg.tolerance_ms == 250 && cfg.max_sync_rounds == 4 && cfg.jobs == 2,
                "numbers applied");
    ok &= check(!cfg.merge_duplicates, "boolean applied");
    ok &= check(cfg.primary_lang == "de" && cfg.secondary_lang == "fr", "languages applied");

    AlignConfig partial;
    status = subpair::apply_config_json(R"({"languages": {"secondary": "uk"}})", partial);
    ok &= check(status.ok && partial.primary_lang == "en" && partial.secondary_lang == "uk",
                "missing keys keep their values");
    return ok;
}

bool test_rejects() {
    const char *bad[] = {
        "{not json",
        "[1, 2]",
        R"({"tolerance_ms": -5})",
        R"({"tolerance_ms": "1000"})",
        R"({"tolerance_ms": 18446744073709551615})",
        R"({"max_sync_rounds": 0})",
        R"({"jobs": 4294967296})",
        R"({"merge_duplicates": 1})",
        R"({"languages": "en"})",
        R"({"languages": {"primary": 7}})",
        R"({"languages": {"primary": "ru"}})",
        R"({"languages": {"primary": "e n"}})",
    };
    bool ok = true;
    for (const char *text : bad) {
        AlignConfig cfg;
        cfg.tolerance_ms = 42;
        auto status = subpair::apply_config_json(text, cfg);
        ok &= check(!status.ok && !status.message.empty(),
                    std::string("rejected with a message: ") + text);
        ok &= check(cfg.tolerance_ms == 42 && cfg.primary_lang == "en",
                    std::string("config untouched on error: ") + text);
    }
    return ok;
}

bool test_file() {
    auto dir = test_utils::make_temp_dir("config_unit");
    auto path = test_utils::write_temp_file(std::string(R"({"tolerance_ms": 500})"),
                                            dir / "subpair.json");
    AlignConfig cfg;
    bool ok = check(subpair::load_config_file(path.string(), cfg).ok, "config file loaded");
    ok &= check(cfg.tolerance_ms == 500, "file value applied");

    auto status = subpair::load_config_file((dir / "missing.json").string(), cfg);
    ok &= check(!status.ok && status.message.find("missing.json") != std::string::npos,
                "missing file names the path");

    path = test_utils::write_temp_file(std::string("{"), dir / "broken.json");
    status = subpair::load_config_file(path.string(), cfg);
    ok &= check(!status.ok && status.message.find("broken.json") != std::string::npos,
                "parse error names the path");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return ok;
}

}  // namespace

int main() {
    subpair::set_log_verbosity(subpair::LogVerbosity::Error);
    bool ok = true;
    ok &= test_defaults();
    ok &= test_apply();
    ok &= test_rejects();
    // Load failures are logged at error level.
    const std::string log_text = test_utils::capture_stderr([&]() { ok &= test_file(); });
    ok &= check(log_text.find("broken.json") != std::string::npos, "load failure logged");
    if (ok) {
        std::cout << "config_unit OK\n";
    }
    return ok ? 0 : 1;
}
