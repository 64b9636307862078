//
//  srt_parser.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "caption.hpp"
#include "text_decoder.hpp"

enum class ParseStatus {
    Ok,            // at least one caption survived
    Empty,         // decoded fine, nothing usable in it
    DecodeFailed,  // bytes are not single-byte text (UTF-16, binary)
    IoError,       // file could not be read
};

const char *parse_status_name(ParseStatus status);

// Diagnostics; skips and filtered blocks are never errors.
struct ParseStats {
    size_t blocks_seen = 0;
    size_t blocks_skipped = 0;         // no time line, bad timestamps or no text
    size_t filtered_music = 0;         // contained a music marker
    size_t filtered_single_glyph = 0;  // a lone character after tag stripping
};

struct ParseResult {
    CaptionTrack captions;  // file order, provisional ordinals 1..N
    ParseStatus status = ParseStatus::Empty;
    TextEncoding encoding = TextEncoding::Unknown;
    ParseStats stats;
};

// Parse raw `.srt` bytes. Never throws; malformed blocks are skipped.
ParseResult parse_srt(const std::vector<uint8_t> &bytes);

// Parse already decoded UTF-8 text (encoding is reported as utf-8).
ParseResult parse_srt_text(std::string_view text);

// Read and parse a file; unreadable files yield ParseStatus::IoError.
ParseResult parse_srt_file(const std::string &path);
