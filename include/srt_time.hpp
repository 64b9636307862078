//
//  srt_time.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "caption.hpp"

// Parse a fixed-width `HH:MM:SS,mmm` timestamp into milliseconds.
// Minutes and seconds must be below 60; anything else yields nullopt.
std::optional<uint64_t> parse_srt_timestamp(std::string_view text);

// Parse a `HH:MM:SS,mmm --> HH:MM:SS,mmm` line (surrounding whitespace allowed).
// Returns nullopt for malformed lines and for ranges that end before they start.
std::optional<TimeSpan> parse_srt_time_line(std::string_view line);

// Format milliseconds as zero-padded `HH:MM:SS,mmm`; hours widen beyond two digits.
std::string format_srt_time(uint64_t ms);

// Format a span as `HH:MM:SS,mmm --> HH:MM:SS,mmm`.
std::string format_time_range(const TimeSpan &span);
