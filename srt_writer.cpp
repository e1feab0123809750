//
//  srt_writer.cpp
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

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "line_wrapper.hpp"
#include "log.hpp"
#include "srt_writer.hpp"
#include "timecode.hpp"

std::vector<SubtitleEntry> make_entries(const std::vector<Group> &groups,
                                        const Config &config) {
  std::vector<SubtitleEntry> entries;
  entries.reserve(groups.size());
  int index = 1;
  for (const auto &group : groups) {
    SubtitleEntry entry;
    entry.index = index++;
    entry.start = group_start(group) + config.get_timecode_offset();
    entry.end = group_end(group) + config.get_timecode_offset();
    entry.text = join_text(group, config.get_max_chars_per_line(),
                           config.get_inclusive_suffix());
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string format_srt_entry(const SubtitleEntry &entry) {
  std::stringstream ss;
  ss << entry.index << '\n'
     << to_timecode(entry.start) << " --> " << to_timecode(entry.end) << '\n'
     << entry.text;
  return ss.str();
}

void write_srt(std::ostream &os, const std::vector<SubtitleEntry> &entries) {
  for (size_t i = 0; i < entries.size(); i++) {
    if (i > 0) {
      os << "\n\n";
    }
    os << format_srt_entry(entries[i]);
  }
}

void write_srt_file(const std::string &path,
                    const std::vector<SubtitleEntry> &entries) {
  // binary keeps \n line endings and the UTF-8 bytes untouched
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("srt:: cannot open " + path + " for writing");
  }
  write_srt(file, entries);
  file.flush();
  if (!file) {
    throw std::runtime_error("srt:: error writing " + path);
  }
  BOOST_LOG_TRIVIAL(debug) << "srt:: " << entries.size() << " entries written to "
                           << path;
}
