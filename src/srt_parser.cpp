//
//  srt_parser.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_parser.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

#include "logging.hpp"
#include "srt_time.hpp"
#include "text_normalizer.hpp"

namespace {

bool is_blank_line(std::string_view line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

bool is_index_line(std::string_view line) {
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return false;
    }
    for (char c : line) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

// Split into lines, accepting LF, CRLF and bare CR endings.
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t begin = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' || text[i] == '\r') {
            lines.push_back(text.substr(begin, i - begin));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            begin = i + 1;
        }
    }
    if (begin < text.size()) {
        lines.push_back(text.substr(begin));
    }
    return lines;
}

// Group runs of non-blank lines; any number of blank lines separates blocks.
std::vector<std::vector<std::string_view>> split_blocks(std::string_view text) {
    std::vector<std::vector<std::string_view>> blocks;
    std::vector<std::string_view> current;
    for (auto line : split_lines(text)) {
        if (is_blank_line(line)) {
            if (!current.empty()) {
                blocks.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

enum class BlockOutcome { Accepted, Skipped, Music, SingleGlyph };

BlockOutcome parse_block(const std::vector<std::string_view> &lines, Caption &out) {
    size_t pos = 0;
    if (is_index_line(lines[pos])) {
        ++pos;  // author numbering is discarded
    }
    if (pos >= lines.size()) {
        return BlockOutcome::Skipped;
    }
    auto span = parse_srt_time_line(lines[pos]);
    if (!span) {
        SP_LOG("parser", "skipping block without valid time line: '"
                             << subpair::text_preview(lines[pos]) << "'");
        return BlockOutcome::Skipped;
    }
    ++pos;
    if (pos >= lines.size()) {
        SP_LOG("parser", "skipping block without text at " << format_time_range(*span));
        return BlockOutcome::Skipped;
    }

    std::string joined;
    for (size_t i = pos; i < lines.size(); ++i) {
        if (i != pos) {
            joined.push_back('\n');
        }
        joined.append(lines[i].data(), lines[i].size());
    }

    // Filters look at the raw text; normalization would hide both conditions.
    if (contains_music_marker(joined)) {
        return BlockOutcome::Music;
    }
    if (is_single_glyph_after_tag_strip(joined)) {
        return BlockOutcome::SingleGlyph;
    }
    out.span = *span;
    out.text = normalize_caption_text(joined);
    return BlockOutcome::Accepted;
}

}  // namespace

const char *parse_status_name(ParseStatus status) {
    switch (status) {
        case ParseStatus::Ok:
            return "ok";
        case ParseStatus::Empty:
            return "empty";
        case ParseStatus::DecodeFailed:
            return "decode-failed";
        case ParseStatus::IoError:
            return "io-error";
    }
    return "unknown";
}

ParseResult parse_srt_text(std::string_view text) {
    ParseResult result;
    result.encoding = TextEncoding::Utf8;

    for (const auto &block : split_blocks(text)) {
        ++result.stats.blocks_seen;
        Caption caption;
        switch (parse_block(block, caption)) {
            case BlockOutcome::Accepted:
                caption.ordinal = static_cast<uint32_t>(result.captions.size() + 1);
                result.captions.push_back(std::move(caption));
                break;
            case BlockOutcome::Skipped:
                ++result.stats.blocks_skipped;
                break;
            case BlockOutcome::Music:
                ++result.stats.filtered_music;
                break;
            case BlockOutcome::SingleGlyph:
                ++result.stats.filtered_single_glyph;
                break;
        }
    }

    result.status = result.captions.empty() ? ParseStatus::Empty : ParseStatus::Ok;
    SP_LOG("parser", "blocks=" << result.stats.blocks_seen
                               << " captions=" << result.captions.size()
                               << " skipped=" << result.stats.blocks_skipped
                               << " music=" << result.stats.filtered_music
                               << " single_glyph=" << result.stats.filtered_single_glyph);
    return result;
}

ParseResult parse_srt(const std::vector<uint8_t> &bytes) {
    auto decoded = decode_subtitle_bytes(bytes);
    if (!decoded) {
        SP_LOG("warn", "could not decode " << bytes.size()
                                           << " bytes of subtitle data; not single-byte text");
        ParseResult failed;
        failed.status = ParseStatus::DecodeFailed;
        return failed;
    }
    ParseResult result = parse_srt_text(decoded->utf8);
    result.encoding = decoded->encoding;
    return result;
}

ParseResult parse_srt_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        SP_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        ParseResult failed;
        failed.status = ParseStatus::IoError;
        return failed;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) {
        SP_LOG("error", "read failed for " << path);
        ParseResult failed;
        failed.status = ParseStatus::IoError;
        return failed;
    }
    SP_LOG("parser", "read " << bytes.size() << " bytes from " << path);
    return parse_srt(bytes);
}
