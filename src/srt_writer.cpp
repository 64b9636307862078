//
//  srt_writer.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_writer.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "logging.hpp"
#include "srt_time.hpp"

std::string serialize_srt(const CaptionTrack &track) {
    std::string out;
    uint32_t index = 0;
    for (const Caption &caption : track) {
        if (caption.text.empty()) {
            continue;
        }
        if (index != 0) {
            out.push_back('\n');
        }
        ++index;
        out += std::to_string(index);
        out.push_back('\n');
        out += format_time_range(caption.span);
        out.push_back('\n');
        out += caption.text;
        out.push_back('\n');
    }
    return out;
}

bool write_srt_file(const std::string &path, const CaptionTrack &track) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        SP_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    const std::string data = serialize_srt(track);
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!f.good()) {
        SP_LOG("error", "write failed for " << path);
        return false;
    }
    SP_LOG("io", "wrote " << data.size() << " bytes to " << path);
    return true;
}
