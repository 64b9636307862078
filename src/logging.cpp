//
//  logging.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace subpair {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};
static std::atomic<uint32_t> g_stage_mask{kAllStages};
static thread_local std::string t_log_context;

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

bool set_log_stages(std::string_view stages) {
    if (stages.empty() || stages == "all") {
        g_stage_mask.store(kAllStages, std::memory_order_relaxed);
        return true;
    }
    uint32_t mask = 0;
    while (!stages.empty()) {
        const size_t comma = stages.find(',');
        const std::string_view name = stages.substr(0, comma);
        const uint32_t bit = stage_bit(name);
        if (bit == 0) {
            return false;
        }
        mask |= bit;
        if (comma == std::string_view::npos) {
            break;
        }
        stages.remove_prefix(comma + 1);
    }
    g_stage_mask.store(mask, std::memory_order_relaxed);
    return true;
}

uint32_t get_log_stage_mask() { return g_stage_mask.load(std::memory_order_relaxed); }

ScopedLogContext::ScopedLogContext(std::string label)
    : previous_(std::exchange(t_log_context, std::move(label))) {}

ScopedLogContext::~ScopedLogContext() { t_log_context = std::move(previous_); }

const std::string &log_context() { return t_log_context; }

}  // namespace subpair

void sp_log_impl(const char* level, const std::string& msg, const char* file, int line,
                 const char* func) {
    static std::mutex output_mutex;

    const std::string_view lvl = level ? level : "";
    std::string out = "[SubPair][";
    out.append(lvl);
    out += "]";
    if (lvl == "error") {
        out += "[";
        out += file;
        out += ":" + std::to_string(line) + " " + func + "]";
    }
    const std::string &context = subpair::log_context();
    if (!context.empty()) {
        out += "[" + context + "]";
    }
    out += " " + msg + "\n";

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr.write(out.data(), static_cast<std::streamsize>(out.size()));
    std::cerr.flush();
}
