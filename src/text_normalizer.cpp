//
//  text_normalizer.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_normalizer.hpp"

#include <algorithm>
#include <cstddef>

#include "logging.hpp"

namespace {

// U+266A / U+266B and the bytes they turn into when UTF-8 is read back as Windows-1252.
constexpr std::string_view kMusicMarkers[] = {
    "\xE2\x99\xAA",                      // ♪
    "\xE2\x99\xAB",                      // ♫
    "\xC3\xA2\xE2\x84\xA2\xC2\xAA",      // â™ª
    "\xC3\xA2\xE2\x84\xA2\xC2\xAB",      // â™«
};

// Longest first so a mojibake sequence is consumed as one unit.
constexpr std::string_view kDashTokens[] = {
    "\xC3\xA2\xE2\x82\xAC\xE2\x80\x9C",  // â€“ (en dash mojibake)
    "\xC3\xA2\xE2\x82\xAC\xE2\x80\x9D",  // â€” (em dash mojibake)
    "\xE2\x80\x93",                      // –
    "\xE2\x80\x94",                      // —
    "-",
};

constexpr std::string_view kNbsp = "\xC2\xA0";

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Length of the whitespace sequence starting at `pos`, 0 if none.
size_t space_len_at(std::string_view s, size_t pos) {
    if (pos >= s.size()) {
        return 0;
    }
    if (is_ascii_space(s[pos])) {
        return 1;
    }
    if (s.compare(pos, kNbsp.size(), kNbsp) == 0) {
        return kNbsp.size();
    }
    return 0;
}

// Length of the whitespace sequence ending right before `end`, 0 if none.
size_t space_len_before(std::string_view s, size_t end) {
    if (end == 0) {
        return 0;
    }
    if (is_ascii_space(s[end - 1])) {
        return 1;
    }
    if (end >= kNbsp.size() && s.compare(end - kNbsp.size(), kNbsp.size(), kNbsp) == 0) {
        return kNbsp.size();
    }
    return 0;
}

std::string_view trim_view(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (size_t n = space_len_at(s, begin)) {
        begin += n;
    }
    while (end > begin) {
        size_t n = space_len_before(s, end);
        if (n == 0) {
            break;
        }
        end -= n;
    }
    return s.substr(begin, end - begin);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Strip `dash+ space*` from the front; returns true if anything was removed.
bool strip_leading_dashes(std::string_view &s) {
    bool stripped = false;
    for (bool matched = true; matched;) {
        matched = false;
        for (auto token : kDashTokens) {
            if (starts_with(s, token)) {
                s.remove_prefix(token.size());
                matched = stripped = true;
                break;
            }
        }
    }
    if (stripped) {
        while (size_t n = space_len_at(s, 0)) {
            s.remove_prefix(n);
        }
    }
    return stripped;
}

// Strip `space* dash+` from the back; returns true if anything was removed.
bool strip_trailing_dashes(std::string_view &s) {
    bool stripped = false;
    for (bool matched = true; matched;) {
        matched = false;
        for (auto token : kDashTokens) {
            if (ends_with(s, token)) {
                s.remove_suffix(token.size());
                matched = stripped = true;
                break;
            }
        }
    }
    if (stripped) {
        while (size_t n = space_len_before(s, s.size())) {
            s.remove_suffix(n);
        }
    }
    return stripped;
}

size_t count_code_points(std::string_view s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace

std::string strip_markup_tags(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '<') {
            const size_t close = text.find('>', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string remove_bracketed(std::string_view text, char open, char close) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == open) {
            const size_t end = text.find(close, i + 1);
            if (end != std::string_view::npos) {
                i = end + 1;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string collapse_whitespace(std::string_view text) {
    const std::string_view trimmed = trim_view(text);
    std::string out;
    out.reserve(trimmed.size());
    size_t i = 0;
    while (i < trimmed.size()) {
        size_t n = space_len_at(trimmed, i);
        if (n == 0) {
            out.push_back(trimmed[i++]);
            continue;
        }
        while (n != 0) {
            i += n;
            n = space_len_at(trimmed, i);
        }
        out.push_back(' ');
    }
    return out;
}

std::string normalize_caption_text(std::string_view raw) {
    // Tags first: markup may wrap bracketed text.
    std::string text = strip_markup_tags(raw);
    text = remove_bracketed(text, '(', ')');
    text = remove_bracketed(text, '[', ']');
    text = remove_bracketed(text, '{', '}');
    text = collapse_whitespace(text);

    std::string_view view(text);
    bool changed = true;
    while (changed) {
        const bool lead = strip_leading_dashes(view);
        const bool trail = strip_trailing_dashes(view);
        changed = lead || trail;
    }
    return std::string(trim_view(view));
}

bool contains_music_marker(std::string_view text) {
    for (auto marker : kMusicMarkers) {
        if (text.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

bool is_single_glyph_after_tag_strip(std::string_view text) {
    const std::string stripped = strip_markup_tags(text);
    return count_code_points(trim_view(stripped)) == 1;
}

CaptionTrack merge_consecutive_duplicates(const CaptionTrack &captions) {
    CaptionTrack merged;
    if (captions.empty()) {
        return merged;
    }
    merged.reserve(captions.size());

    Caption current = captions.front();
    std::string current_key = normalize_caption_text(current.text);
    for (size_t i = 1; i < captions.size(); ++i) {
        const Caption &next = captions[i];
        std::string key = normalize_caption_text(next.text);
        if (key == current_key) {
            current.span.end_ms = std::max(current.span.end_ms, next.span.end_ms);
            continue;
        }
        merged.push_back(std::move(current));
        current = next;
        current_key = std::move(key);
    }
    merged.push_back(std::move(current));
    renumber(merged);

    if (merged.size() != captions.size()) {
        SP_LOG("merge", "folded " << (captions.size() - merged.size())
                                  << " duplicate captions, " << merged.size() << " remain");
    }
    return merged;
}
