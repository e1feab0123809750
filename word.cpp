//
//  word.cpp
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

#include <sstream>
#include <stdexcept>

#include "utils.hpp"
#include "word.hpp"

std::vector<Word> flatten_words(const std::vector<Segment> &segments) {
  std::vector<Word> words;
  for (const auto &segment : segments) {
    words.insert(words.end(), segment.words.begin(), segment.words.end());
  }
  return words;
}

void validate_words(const std::vector<Word> &words) {
  if (words.empty()) {
    throw std::invalid_argument("word list is empty");
  }
  for (size_t i = 0; i < words.size(); i++) {
    const auto &word = words[i];
    if (word.start < 0 || word.end < word.start) {
      std::stringstream ss;
      ss << "word " << i << " '" << word.text << "' has invalid timing "
         << word.start << " -> " << word.end;
      throw std::invalid_argument(ss.str());
    }
  }
}

double group_start(const Group &group) { return group.front().start; }

double group_end(const Group &group) { return group.back().end; }

double group_duration(const Group &group) {
  return group.back().end - group.front().start;
}

size_t number_of_chars(const Group &group) {
  size_t chars = 0;
  for (const auto &word : group) {
    chars += utf8_length(word.text);
  }
  return chars;
}
