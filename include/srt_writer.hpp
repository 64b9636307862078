//
//  srt_writer.hpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "caption.hpp"

// Serialize to the SubRip dialect: `N`, time line, text, blank line between blocks and no
// blank line after the last one. Captions with empty text are left out and not numbered.
std::string serialize_srt(const CaptionTrack &track);

// Write serialize_srt() output to `path`; false on open/write failure (logged).
bool write_srt_file(const std::string &path, const CaptionTrack &track);
