//
//  subtitle_generator.hpp
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

#ifndef _SUBTITLE_GENERATOR_HPP_
#define _SUBTITLE_GENERATOR_HPP_

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "segment_splitter.hpp"
#include "sentence_segmenter.hpp"
#include "srt_writer.hpp"
#include "word.hpp"

/*
 * Recognized words to subtitle entries:
 * sentences -> display sized groups -> frame gaps -> wrapped entries.
 * Holds no state between runs, one instance can serve several files
 * concurrently.
 */
class SubtitleGenerator {
public:
  static std::shared_ptr<SubtitleGenerator> create(const Config &config);
  SubtitleGenerator() = delete;
  SubtitleGenerator(const SubtitleGenerator &) = delete;

  /* throws std::invalid_argument if there are no words or a word has
   * invalid timing */
  std::vector<SubtitleEntry>
  generate(const std::vector<Segment> &segments) const;

  /* reads a word timestamp JSON file and writes the .srt file */
  void generate_file(const std::string &input_path,
                     const std::string &srt_path) const;

protected:
  explicit SubtitleGenerator(const Config &config)
      : config_(config), segmenter_(config), splitter_(config){};

private:
  const Config &config_;
  SentenceSegmenter segmenter_;
  SegmentSplitter splitter_;
};

#endif
