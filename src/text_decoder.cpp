//
//  text_decoder.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_decoder.hpp"

#include <algorithm>

#include "logging.hpp"

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

// Windows-1252 0x80..0x9F; 0 marks the five undefined positions.
constexpr uint16_t kCp1252High[32] = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178,
};

void append_utf8(std::string &out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// More than one NUL in this many bytes marks UTF-16/32 or binary data.
constexpr size_t kNulDensityDivisor = 8;

// C0 controls never appear in subtitle text apart from line structure.
bool is_disallowed_c0(uint8_t b) {
    return b < 0x20 && b != '\t' && b != '\n' && b != '\r' && b != '\f';
}

bool is_c1(uint8_t b) { return b >= 0x80 && b <= 0x9F; }

bool has_utf16_or_utf32_bom(const uint8_t *data, size_t size) {
    return size >= 2 &&
           ((data[0] == 0xFF && data[1] == 0xFE) || (data[0] == 0xFE && data[1] == 0xFF) ||
            (size >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE &&
             data[3] == 0xFF));
}

bool is_nul_dense(const uint8_t *data, size_t size) {
    const auto nuls = static_cast<size_t>(std::count(data, data + size, uint8_t{0}));
    return nuls > 0 && nuls * kNulDensityDivisor > size;
}

// Control bytes are single ASCII bytes in every supported encoding, so they can be
// removed from the decoded UTF-8 without touching multi-byte sequences.
size_t strip_control_bytes(std::string &text) {
    const auto before = text.size();
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) { return is_disallowed_c0(static_cast<uint8_t>(c)); }),
               text.end());
    return before - text.size();
}

// Latin-1 reads C1 bytes as invisible controls. While a later fallback can still give them
// meaning (Windows-1252 punctuation) the candidate declines; as the last resort it maps
// them to U+FFFD.
std::optional<std::string> decode_latin1(const uint8_t *data, size_t size, bool last_resort) {
    std::string out;
    out.reserve(size + size / 4);
    for (size_t i = 0; i < size; ++i) {
        const uint8_t b = data[i];
        if (is_c1(b)) {
            if (!last_resort) {
                return std::nullopt;
            }
            append_utf8(out, kReplacementChar);
            continue;
        }
        append_utf8(out, b);
    }
    return out;
}

std::string decode_cp1252(const uint8_t *data, size_t size) {
    std::string out;
    out.reserve(size + size / 4);
    for (size_t i = 0; i < size; ++i) {
        const uint8_t b = data[i];
        if (is_c1(b)) {
            const uint16_t cp = kCp1252High[b - 0x80];
            append_utf8(out, cp != 0 ? cp : kReplacementChar);
        } else {
            append_utf8(out, b);
        }
    }
    return out;
}

std::optional<DecodedText> finish(std::string text, TextEncoding encoding) {
    if (const size_t dropped = strip_control_bytes(text)) {
        SP_LOG("decode", "dropped " << dropped << " control byte(s) from "
                                    << encoding_name(encoding) << " text");
    }
    return DecodedText{std::move(text), encoding};
}

}  // namespace

const char *encoding_name(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            return "utf-8";
        case TextEncoding::Latin1:
            return "latin-1";
        case TextEncoding::Windows1252:
            return "windows-1252";
        case TextEncoding::Iso8859_1:
            return "iso-8859-1";
        case TextEncoding::Unknown:
            break;
    }
    return "unknown";
}

const std::vector<TextEncoding> &default_fallback_encodings() {
    static const std::vector<TextEncoding> kFallbacks = {
        TextEncoding::Latin1, TextEncoding::Windows1252, TextEncoding::Iso8859_1};
    return kFallbacks;
}

bool is_valid_utf8(const uint8_t *data, size_t size) {
    size_t i = 0;
    while (i < size) {
        const uint8_t b = data[i];
        if (b < 0x80) {
            ++i;
            continue;
        }
        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((b & 0xE0) == 0xC0) {
            len = 2;
            cp = b & 0x1F;
            min_cp = 0x80;
        } else if ((b & 0xF0) == 0xE0) {
            len = 3;
            cp = b & 0x0F;
            min_cp = 0x800;
        } else if ((b & 0xF8) == 0xF0) {
            len = 4;
            cp = b & 0x07;
            min_cp = 0x10000;
        } else {
            return false;
        }
        if (i + len > size) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            const uint8_t c = data[i + k];
            if ((c & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::optional<DecodedText> decode_subtitle_bytes(const std::vector<uint8_t> &bytes,
                                                 const std::vector<TextEncoding> &fallbacks) {
    const uint8_t *data = bytes.data();
    const size_t size = bytes.size();

    if (has_utf16_or_utf32_bom(data, size)) {
        SP_LOG("decode", "utf-16/utf-32 byte order mark; not single-byte text");
        return std::nullopt;
    }
    if (is_nul_dense(data, size)) {
        SP_LOG("decode", "nul-dense input; not single-byte text");
        return std::nullopt;
    }

    if (size >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF &&
        is_valid_utf8(data + 3, size - 3)) {
        return finish(std::string(reinterpret_cast<const char *>(data + 3), size - 3),
                      TextEncoding::Utf8);
    }
    // A BOM followed by invalid UTF-8 stays part of the payload for the fallbacks.
    if (is_valid_utf8(data, size)) {
        return finish(std::string(reinterpret_cast<const char *>(data), size), TextEncoding::Utf8);
    }

    // The last single-byte candidate in the list never declines.
    size_t last = fallbacks.size();
    for (size_t k = fallbacks.size(); k > 0; --k) {
        if (fallbacks[k - 1] != TextEncoding::Utf8 && fallbacks[k - 1] != TextEncoding::Unknown) {
            last = k - 1;
            break;
        }
    }

    for (size_t k = 0; k < fallbacks.size(); ++k) {
        const TextEncoding encoding = fallbacks[k];
        std::optional<std::string> text;
        switch (encoding) {
            case TextEncoding::Latin1:
            case TextEncoding::Iso8859_1:
                text = decode_latin1(data, size, k == last);
                break;
            case TextEncoding::Windows1252:
                text = decode_cp1252(data, size);
                break;
            case TextEncoding::Utf8:
            case TextEncoding::Unknown:
                continue;
        }
        if (text) {
            SP_LOG("decode", "not valid utf-8; decoded as " << encoding_name(encoding));
            return finish(std::move(*text), encoding);
        }
        SP_LOG("decode", encoding_name(encoding) << " declined c1 bytes");
    }
    return std::nullopt;
}
