//
//  sentence_segmenter.hpp
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

#ifndef _SENTENCE_SEGMENTER_HPP_
#define _SENTENCE_SEGMENTER_HPP_

#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "word.hpp"

class SentenceSegmenter {
public:
  explicit SentenceSegmenter(const Config &config);
  SentenceSegmenter(const SentenceSegmenter &) = delete;

  /* a word ending with . ! or ? once closing quotes and brackets are
   * stripped, unless it is a known abbreviation */
  bool is_sentence_end(const std::string &word) const;

  /* a trailing group without terminal punctuation is kept as well */
  std::vector<Group> segment(const std::vector<Word> &words) const;

private:
  std::set<std::string> abbreviations_;
};

#endif
