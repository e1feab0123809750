//
//  word.hpp
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

#ifndef _WORD_HPP_
#define _WORD_HPP_

#include <cstddef>
#include <string>
#include <vector>

/* recognized word, text usually carries the leading space */
struct Word {
  std::string text;
  double start{0};
  double end{0};
};

/* one sentence fragment or one subtitle entry, never empty */
using Group = std::vector<Word>;

/* segment as delivered by the recognizer */
struct Segment {
  double start{0};
  double end{0};
  std::string text;
  std::vector<Word> words;
};

std::vector<Word> flatten_words(const std::vector<Segment> &segments);

/* throws std::invalid_argument on an empty list or a word ending
 * before it starts */
void validate_words(const std::vector<Word> &words);

double group_start(const Group &group);
double group_end(const Group &group);
double group_duration(const Group &group);
size_t number_of_chars(const Group &group);

#endif
