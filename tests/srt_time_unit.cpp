// Unit coverage for SRT timestamp parsing and formatting.
#include <iostream>
#include <string>

#include "srt_time.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[srt_time_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_timestamp() {
    auto ts = parse_srt_timestamp("01:02:03,456");
    bool ok = check(ts && *ts == 3723456, "parse 01:02:03,456");
    ok &= check(parse_srt_timestamp("00:00:00,000") == uint64_t{0}, "parse zero");
    ok &= check(parse_srt_timestamp("99:59:59,999") == uint64_t{359999999}, "parse max two-digit hour");
    ok &= check(!parse_srt_timestamp("00:60:00,000"), "minutes must be < 60");
    ok &= check(!parse_srt_timestamp("00:00:60,000"), "seconds must be < 60");
    ok &= check(!parse_srt_timestamp("00:00:01.000"), "dot separator rejected");
    ok &= check(!parse_srt_timestamp("0:00:01,000"), "short hour field rejected");
    ok &= check(!parse_srt_timestamp("00:00:01,0a0"), "non-digit rejected");
    ok &= check(!parse_srt_timestamp(""), "empty rejected");
    return ok;
}

bool test_time_line() {
    auto span = parse_srt_time_line("00:00:01,000 --> 00:00:02,500");
    bool ok = check(span && span->start_ms == 1000 && span->end_ms == 2500, "plain time line");
    span = parse_srt_time_line("  00:00:01,000-->00:00:02,500 \r");
    ok &= check(span && span->start_ms == 1000 && span->end_ms == 2500,
                "tight arrow and surrounding blanks");
    span = parse_srt_time_line("00:00:02,000 --> 00:00:02,000");
    ok &= check(span && span->duration_ms() == 0, "zero-length span accepted");
    ok &= check(!parse_srt_time_line("00:00:03,000 --> 00:00:02,000"), "end before start rejected");
    ok &= check(!parse_srt_time_line("00:00:01,000 00:00:02,000"), "missing arrow rejected");
    ok &= check(!parse_srt_time_line("Hello --> world"), "text around arrow rejected");
    return ok;
}

bool test_format() {
    bool ok = check(format_srt_time(0) == "00:00:00,000", "format zero");
    ok &= check(format_srt_time(3723456) == "01:02:03,456", "format h/m/s/ms");
    ok &= check(format_srt_time(59999) == "00:00:59,999", "format below a minute");
    ok &= check(format_srt_time(360000000) == "100:00:00,000", "hours beyond two digits widen");
    ok &= check(format_time_range(TimeSpan{1000, 2500}) == "00:00:01,000 --> 00:00:02,500",
                "format range");
    // Every formatted value parses back to itself.
    for (uint64_t ms : {0ull, 1ull, 999ull, 61001ull, 3599999ull, 86399999ull}) {
        auto back = parse_srt_timestamp(format_srt_time(ms));
        ok &= check(back && *back == ms, "format/parse agree for " + std::to_string(ms));
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_timestamp();
    ok &= test_time_line();
    ok &= test_format();
    if (ok) {
        std::cout << "srt_time_unit OK\n";
    }
    return ok ? 0 : 1;
}
