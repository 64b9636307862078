// Exercises directory pairing and the concurrent batch runner: ordering, unpaired files and
// failure isolation between units.
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "batch_runner.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[batch_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string one_caption(const std::string &text, int second) {
    const std::string ts = "00:00:0" + std::to_string(second);
    return "1\n" + ts + ",000 --> " + ts + ",900\n" + text + "\n";
}

void populate(const fs::path &dir) {
    test_utils::write_temp_file(one_caption("Alpha", 1), dir / "alpha_en.srt");
    test_utils::write_temp_file(one_caption("Альфа", 1), dir / "alpha_ru.srt");
    test_utils::write_temp_file(one_caption("Bravo", 2), dir / "bravo_EN.srt");
    test_utils::write_temp_file(one_caption("Браво", 2), dir / "bravo_ru.SRT");
    test_utils::write_temp_file(one_caption("Charlie", 3), dir / "charlie_en.srt");
    test_utils::write_temp_file(one_caption("Delta", 4), dir / "delta_en.srt");
    test_utils::write_temp_file(std::vector<uint8_t>{0x00, 0x10, 0x00}, dir / "delta_ru.srt");
    test_utils::write_temp_file(std::string("notes"), dir / "notes.txt");
    std::error_code ec;
    fs::create_directories(dir / "echo_en.srt", ec);
}

bool test_discover(const fs::path &dir) {
    subpair::AlignConfig cfg;
    auto d = subpair::discover_pairs(dir.string(), cfg);
    bool ok = check(d.status.ok, "discovery ok");
    ok &= check(d.pairs.size() == 3, "three complete pairs");
    if (d.pairs.size() == 3) {
        ok &= check(d.pairs[0].base == "alpha" && d.pairs[1].base == "bravo" &&
                        d.pairs[2].base == "delta",
                    "pairs sorted by base name");
        ok &= check(fs::path(d.pairs[1].primary_path).filename() == "bravo_EN.srt" &&
                        fs::path(d.pairs[1].secondary_path).filename() == "bravo_ru.SRT",
                    "suffix match ignores case");
    }
    ok &= check(d.unpaired.size() == 1 && d.unpaired[0] == "charlie_en.srt",
                "lone file reported, directories and other files ignored");

    cfg.primary_lang = "ru";
    cfg.secondary_lang = "en";
    d = subpair::discover_pairs(dir.string(), cfg);
    ok &= check(d.pairs.size() == 3 && !d.pairs.empty() &&
                    fs::path(d.pairs[0].primary_path).filename() == "alpha_ru.srt",
                "languages can be swapped");

    d = subpair::discover_pairs((dir / "does_not_exist").string(), subpair::AlignConfig{});
    ok &= check(!d.status.ok && d.pairs.empty(), "missing directory fails");
    return ok;
}

bool test_run(const fs::path &dir) {
    subpair::AlignConfig cfg;
    auto d = subpair::discover_pairs(dir.string(), cfg);
    bool ok = true;
    for (uint32_t jobs : {1u, 2u, 16u}) {
        cfg.jobs = jobs;
        auto items = subpair::run_batch(d.pairs, cfg);
        const std::string tag = " (jobs=" + std::to_string(jobs) + ")";
        ok &= check(items.size() == 3, "one item per pair" + tag);
        if (items.size() != 3) {
            continue;
        }
        ok &= check(items[0].pair.base == "alpha" && items[1].pair.base == "bravo" &&
                        items[2].pair.base == "delta",
                    "results in input order" + tag);
        ok &= check(items[0].result.status.ok && items[1].result.status.ok,
                    "good pairs succeed" + tag);
        ok &= check(!items[2].result.status.ok &&
                        items[2].result.status.message.find("Could not decode") == 0,
                    "bad pair fails alone" + tag);
        ok &= check(items[0].result.pairs.size() == 1 && items[0].result.pairs[0].secondary &&
                        items[0].result.pairs[0].secondary->text == "Альфа",
                    "pair content matched" + tag);
        ok &= check(items[1].result.pairs.size() == 1 &&
                        items[1].result.pairs[0].primary.text == "Bravo",
                    "second pair content" + tag);
    }
    ok &= check(subpair::run_batch({}, cfg).empty(), "no pairs, no items");
    return ok;
}

}  // namespace

int main() {
    subpair::set_log_verbosity(subpair::LogVerbosity::Error);
    const fs::path dir = test_utils::make_temp_dir("batch_unit");
    populate(dir);

    bool ok = true;
    // The missing-directory case logs an error; keep it out of the test output.
    const std::string log_text = test_utils::capture_stderr([&]() { ok &= test_discover(dir); });
    ok &= check(log_text.find("does_not_exist") != std::string::npos, "listing failure logged");
    if (!ok) {
        std::cerr << log_text;
    }
    ok &= test_run(dir);

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ok) {
        std::cout << "batch_unit OK\n";
    }
    return ok ? 0 : 1;
}
