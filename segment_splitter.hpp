//
//  segment_splitter.hpp
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

#ifndef _SEGMENT_SPLITTER_HPP_
#define _SEGMENT_SPLITTER_HPP_

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "word.hpp"

/* punctuation that allows a cut after a word or keeps a word on the
 * first subtitle line */
bool has_punctuation(const std::string &text);

class SegmentSplitter {
public:
  explicit SegmentSplitter(const Config &config);
  SegmentSplitter(const SegmentSplitter &) = delete;

  /* too long to display AND too many characters AND more than one word */
  bool is_splittable(const Group &group) const;

  /*
   * Greedy scan for the first cut point, checked per word in this order:
   * punctuation, conjunction ahead, character budget reached, duration
   * budget reached, remainder getting too short, single word remainder.
   * Throws std::invalid_argument for groups of less than two words.
   */
  std::pair<Group, Group> split(const Group &group) const;

  /* splits every group until none is splittable, order is preserved */
  std::vector<Group> split_all(const std::vector<Group> &groups) const;

private:
  bool is_conjunction(const std::string &word) const;
  size_t max_chars() const;

  const Config &config_;
  std::set<std::string> conjunctions_;
};

#endif
