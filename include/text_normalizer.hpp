//
//  text_normalizer.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "caption.hpp"

/**
 * @brief Clean raw caption text for display and comparison.
 *
 * Strips markup tags, removes (), [] and {} spans, collapses whitespace (newlines included)
 * into single spaces, and trims leading/trailing dashes (ASCII, en/em dash and their
 * latin1-as-utf8 mojibake). Pure, total and idempotent.
 */
std::string normalize_caption_text(std::string_view raw);

// Remove `<...>` markup tags (at least one character between the brackets).
std::string strip_markup_tags(std::string_view text);

// Remove every non-nested `open ... close` span, leftmost first; unpaired openers stay.
std::string remove_bracketed(std::string_view text, char open, char close);

// Collapse whitespace runs (ASCII whitespace and NBSP) into a single space and trim.
std::string collapse_whitespace(std::string_view text);

// True when the text carries a musical-note glyph, either as UTF-8 or as mojibake.
bool contains_music_marker(std::string_view text);

// True when, after removing markup tags and trimming, exactly one code point remains.
bool is_single_glyph_after_tag_strip(std::string_view text);

/**
 * @brief Fold runs of adjacent captions whose normalized text is identical.
 *
 * The surviving caption keeps its start and text and takes over the end of each folded
 * caption (the end never shrinks). Ordinals of the result are rewritten as 1..N.
 */
CaptionTrack merge_consecutive_duplicates(const CaptionTrack &captions);
