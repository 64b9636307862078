// Exercises the file-level public API: load, match, synchronize and clean.
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "subpair.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[file_api_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const char *kEnglish =
    "1\n00:00:01,000 --> 00:00:03,000\nHello there\n\n"
    "2\n00:00:04,000 --> 00:00:06,000\nGeneral Kenobi\n\n"
    "3\n00:00:30,000 --> 00:00:31,000\nNobody answers\n";

const char *kRussian =
    "1\n00:00:01,050 --> 00:00:02,950\nПривет\n\n"
    "2\n00:00:04,100 --> 00:00:05,000\nГенерал\n\n"
    "3\n00:00:05,000 --> 00:00:06,000\nГенерал\n";

bool test_version() {
    const std::string v = subpair::version_string();
    return check(!v.empty() && v[0] == 'v', "version string looks like v<semver>");
}

bool test_load(const fs::path &dir) {
    subpair::AlignConfig cfg;
    auto path = test_utils::write_temp_file(std::string(kRussian), dir / "load_ru.srt");
    auto track = subpair::load_track(path.string(), cfg);
    bool ok = check(track.status.ok, "load ok");
    ok &= check(track.captions.size() == 2, "duplicates merged on load");
    ok &= check(track.parse.captions.empty(), "captions moved out of the parse result");
    ok &= check(track.parse.encoding == TextEncoding::Utf8, "encoding reported");

    cfg.merge_duplicates = false;
    track = subpair::load_track(path.string(), cfg);
    ok &= check(track.captions.size() == 3, "merging can be switched off");

    path = test_utils::write_temp_file(std::string("no captions here\n"), dir / "empty_ru.srt");
    track = subpair::load_track(path.string(), cfg);
    ok &= check(track.status.ok && track.captions.empty() &&
                    track.parse.status == ParseStatus::Empty,
                "file without captions is an empty track, not an error");

    track = subpair::load_track((dir / "missing_ru.srt").string(), cfg);
    ok &= check(!track.status.ok && track.status.message.find("Failed to read") == 0,
                "missing file fails");

    path = test_utils::write_temp_file(std::vector<uint8_t>{0x00, 0x00, 0xFF}, dir / "bin_ru.srt");
    track = subpair::load_track(path.string(), cfg);
    ok &= check(!track.status.ok && track.status.message.find("Could not decode") == 0,
                "undecodable file fails");
    return ok;
}

bool test_match(const fs::path &dir) {
    auto en = test_utils::write_temp_file(std::string(kEnglish), dir / "m_en.srt");
    auto ru = test_utils::write_temp_file(std::string(kRussian), dir / "m_ru.srt");
    subpair::AlignConfig cfg;
    auto res = subpair::match_files(en.string(), ru.string(), cfg);
    bool ok = check(res.status.ok, "match ok: " + res.status.message);
    ok &= check(res.pairs.size() == 3, "one row per English caption");
    if (res.pairs.size() == 3) {
        ok &= check(res.pairs[0].secondary && res.pairs[0].secondary->text == "Привет",
                    "first row matched");
        ok &= check(res.pairs[1].secondary && res.pairs[1].secondary->span == (TimeSpan{4100, 6000}),
                    "second row matched against the merged caption");
        ok &= check(!res.pairs[2].secondary, "late caption unmatched");
    }
    ok &= check(res.primary_stats.blocks_seen == 3 && res.secondary_stats.blocks_seen == 3,
                "parse stats returned");

    auto bad = test_utils::write_temp_file(std::vector<uint8_t>{0x00, 0x01}, dir / "bad_ru.srt");
    res = subpair::match_files(en.string(), bad.string(), cfg);
    ok &= check(!res.status.ok && res.pairs.empty(), "undecodable secondary fails the match");
    return ok;
}

bool test_sync(const fs::path &dir) {
    auto a = test_utils::write_temp_file(
        std::string("1\n00:00:00,000 --> 00:00:05,000\nOne long line\n"), dir / "s_en.srt");
    auto b = test_utils::write_temp_file(
        std::string("1\n00:00:00,000 --> 00:00:02,000\nOne\n\n"
                    "2\n00:00:02,000 --> 00:00:05,000\nlong line\n"),
        dir / "s_ru.srt");
    const fs::path out_a = dir / "s_en.synced.srt";
    const fs::path out_b = dir / "s_ru.synced.srt";
    subpair::AlignConfig cfg;
    auto res = subpair::synchronize_files(a.string(), b.string(), out_a.string(), out_b.string(),
                                          cfg);
    bool ok = check(res.status.ok, "sync ok: " + res.status.message);
    ok &= check(res.converged && res.remaining_violations == 0, "converged cleanly");
    ok &= check(res.a_captions == 1 && res.b_captions == 1, "caption counts reported");
    ok &= check(test_utils::read_text_file(out_b) ==
                    "1\n00:00:00,000 --> 00:00:05,000\nOne long line\n",
                "folded track written");
    ok &= check(test_utils::read_text_file(out_a) ==
                    "1\n00:00:00,000 --> 00:00:05,000\nOne long line\n",
                "outer track written unchanged");

    res = subpair::synchronize_files(a.string(), b.string(), (dir / "nope" / "a.srt").string(),
                                     out_b.string(), cfg);
    ok &= check(!res.status.ok && res.status.message.find("Failed to write") == 0,
                "unwritable output fails");
    return ok;
}

bool test_clean(const fs::path &dir) {
    auto in = test_utils::write_temp_file(
        std::string("1\n00:00:00,000 --> 00:00:02,000\nHi\n\n"
                    "2\n00:00:02,000 --> 00:00:04,000\n<i>Hi</i>\n\n"
                    "3\n00:00:04,000 --> 00:00:05,000\n\xE2\x99\xAA la \xE2\x99\xAA\n\n"
                    "4\n00:00:05,000 --> 00:00:06,000\n[noise]\n\n"
                    "5\n00:00:06,000 --> 00:00:07,000\nBye\n"),
        dir / "c_en.srt");
    const fs::path out = dir / "c_en.clean.srt";
    auto res = subpair::clean_file(in.string(), out.string());
    bool ok = check(res.status.ok, "clean ok: " + res.status.message);
    ok &= check(res.original_count == 4, "music block dropped by the parser");
    ok &= check(res.final_count == 2, "duplicates merged, empty caption not counted");
    ok &= check(test_utils::read_text_file(out) ==
                    "1\n00:00:00,000 --> 00:00:04,000\nHi\n\n"
                    "2\n00:00:06,000 --> 00:00:07,000\nBye\n",
                "clean output renumbered");

    auto empty = test_utils::write_temp_file(std::string("1\nnot timed\nText\n"), dir / "e_en.srt");
    res = subpair::clean_file(empty.string(), (dir / "e_en.clean.srt").string());
    ok &= check(!res.status.ok && res.status.message.find("No valid entries") == 0,
                "file without entries rejected");
    ok &= check(!fs::exists(dir / "e_en.clean.srt"), "nothing written on rejection");
    return ok;
}

}  // namespace

int main() {
    subpair::set_log_verbosity(subpair::LogVerbosity::Error);
    const fs::path dir = test_utils::make_temp_dir("file_api_unit");
    assert(fs::is_directory(dir));

    bool ok = true;
    const std::string log_text = test_utils::capture_stderr([&]() {
        ok &= test_version();
        ok &= test_load(dir);
        ok &= test_match(dir);
        ok &= test_sync(dir);
        ok &= test_clean(dir);
    });
    // Failures above print through check(); forward them so CTest shows them.
    if (!ok) {
        std::cerr << log_text;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ok) {
        std::cout << "file_api_unit OK\n";
    }
    return ok ? 0 : 1;
}
