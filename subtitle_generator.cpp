//
//  subtitle_generator.cpp
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

#include <filesystem>

#include "log.hpp"
#include "overlap.hpp"
#include "subtitle_generator.hpp"
#include "utils.hpp"
#include "word_reader.hpp"

std::shared_ptr<SubtitleGenerator>
SubtitleGenerator::create(const Config &config) {
  return std::shared_ptr<SubtitleGenerator>(new SubtitleGenerator(config));
}

std::vector<SubtitleEntry>
SubtitleGenerator::generate(const std::vector<Segment> &segments) const {
  auto words = flatten_words(segments);
  validate_words(words);
  BOOST_LOG_TRIVIAL(debug) << "generator:: " << segments.size()
                           << " segments with " << words.size() << " words";

  auto sentences = segmenter_.segment(words);
  auto groups = splitter_.split_all(sentences);
  insert_frame(groups, config_.get_frame_interval());

  auto entries = make_entries(groups, config_);
  BOOST_LOG_TRIVIAL(info) << "generator:: " << entries.size()
                          << " subtitles from " << words.size() << " words";
  return entries;
}

void SubtitleGenerator::generate_file(const std::string &input_path,
                                      const std::string &srt_path) const {
  auto name = std::filesystem::path(input_path).filename().string();
  BOOST_LOG_TRIVIAL(info) << "generator:: extracting subtitles for '" << name
                          << "' ...";
  TimeElapsed elapsed("generator:: " + name);

  auto segments = read_segments_file(input_path);
  write_srt_file(srt_path, generate(segments));
}
