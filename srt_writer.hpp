//
//  srt_writer.hpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#ifndef _SRT_WRITER_HPP_
#define _SRT_WRITER_HPP_

#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "word.hpp"

struct SubtitleEntry {
  int index{0}; // 1-based
  double start{0};
  double end{0};
  std::string text;
};

/* one entry per group, timecode offset applied, text wrapped */
std::vector<SubtitleEntry> make_entries(const std::vector<Group> &groups,
                                        const Config &config);

std::string format_srt_entry(const SubtitleEntry &entry);

/* entries separated by a blank line, none after the last one */
void write_srt(std::ostream &os, const std::vector<SubtitleEntry> &entries);

/* UTF-8, an existing file is overwritten, throws std::runtime_error */
void write_srt_file(const std::string &path,
                    const std::vector<SubtitleEntry> &entries);

#endif
