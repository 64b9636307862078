//
//  text_decoder.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TextEncoding { Unknown, Utf8, Latin1, Windows1252, Iso8859_1 };

const char *encoding_name(TextEncoding encoding);

struct DecodedText {
    std::string utf8;                               ///< Decoded text, BOM removed
    TextEncoding encoding = TextEncoding::Unknown;  ///< Encoding that was accepted
};

// Fallbacks tried, in order, after strict UTF-8 failed.
const std::vector<TextEncoding> &default_fallback_encodings();

/**
 * @brief Decode subtitle file bytes into UTF-8.
 *
 * Valid UTF-8 is always accepted (a leading BOM is dropped); otherwise each fallback is
 * tried in order and undefined bytes become U+FFFD. Latin-1 and ISO-8859-1 pass on input
 * with C1 bytes while a later fallback remains, so Windows-1252 punctuation reaches its own
 * decoder. Stray C0 controls other than tab/LF/CR/FF are removed from the result.
 *
 * @return nullopt for input that is not single-byte text (UTF-16/UTF-32 byte order mark,
 *         NUL-dense data), or when invalid UTF-8 meets an empty fallback list.
 */
std::optional<DecodedText> decode_subtitle_bytes(
    const std::vector<uint8_t> &bytes,
    const std::vector<TextEncoding> &fallbacks = default_fallback_encodings());

// Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF).
bool is_valid_utf8(const uint8_t *data, size_t size);
