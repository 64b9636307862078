//
//  logging.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subpair {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Debug tags of the pipeline stages, in pipeline order.
inline constexpr std::array<std::string_view, 8> kStageTags = {
    "decode", "parser", "merge", "match", "sync", "batch", "config", "io"};

// Bit for a stage tag in the stage mask; 0 for any other tag.
inline constexpr uint32_t stage_bit(std::string_view tag) {
    for (size_t i = 0; i < kStageTags.size(); ++i) {
        if (kStageTags[i] == tag) {
            return uint32_t{1} << i;
        }
    }
    return 0;
}

inline constexpr uint32_t kAllStages = (uint32_t{1} << kStageTags.size()) - 1;

/**
 * @brief Restrict debug output to some pipeline stages.
 *
 * @param stages comma-separated stage tags ("decode,sync"); empty or "all" enables every
 *               stage. Debug tags outside kStageTags are not affected.
 * @return false (mask unchanged) when a name is not a stage tag.
 */
bool set_log_stages(std::string_view stages);
uint32_t get_log_stage_mask();

/**
 * @brief Label the log lines of the current thread for the lifetime of this object.
 *
 * Batch workers label their lines with the pair they are processing, so interleaved output
 * of concurrent units stays attributable: `[SubPair][parser][movie] ...`. Contexts nest; the
 * previous label comes back on destruction.
 */
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string label);
    ~ScopedLogContext();
    ScopedLogContext(const ScopedLogContext &) = delete;
    ScopedLogContext &operator=(const ScopedLogContext &) = delete;

private:
    std::string previous_;
};

// Label of the calling thread; empty outside any ScopedLogContext.
const std::string &log_context();

// Preview helper used in debug logs to show the head of a caption text on a single line.
inline constexpr size_t kTextPreviewChars = 32;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    std::string out;
    out.reserve(std::min(max_len, text.size()) + 3);
    size_t i = 0;
    for (; i < text.size() && out.size() < max_len; ++i) {
        const char c = text[i];
        out.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }
    // Do not cut a UTF-8 sequence in half.
    while (i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
        out.push_back(text[i++]);
    }
    if (i < text.size()) {
        out += "...";
    }
    return out;
}

}  // namespace subpair

inline constexpr subpair::LogVerbosity sp_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return subpair::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return subpair::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return subpair::LogVerbosity::Info;
    }
    // Stage tags (decode/parser/match/sync/etc.) and anything else are debug-level.
    return subpair::LogVerbosity::Debug;
}

inline bool sp_should_log(const char* level) {
    const std::string_view tag = level ? level : "";
    const auto sev = sp_severity_for_tag(tag);
    if (static_cast<int>(sev) > static_cast<int>(subpair::get_log_verbosity())) {
        return false;
    }
    const uint32_t bit = subpair::stage_bit(tag);
    return bit == 0 || (subpair::get_log_stage_mask() & bit) != 0;
}

// Formats one line and writes it to stderr in a single locked write, so lines from
// concurrent batch workers never interleave.
void sp_log_impl(const char* level, const std::string& msg, const char* file, int line,
                 const char* func);

#define SP_LOG(level, message)                                              \
    do {                                                                    \
        if (sp_should_log(level)) {                                         \
            std::ostringstream _sp_log_ss;                                  \
            _sp_log_ss << message;                                          \
            sp_log_impl(level, _sp_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
