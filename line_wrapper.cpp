//
//  line_wrapper.cpp
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

#include <boost/algorithm/string.hpp>

#include "line_wrapper.hpp"
#include "segment_splitter.hpp"
#include "utils.hpp"

static const std::string inclusive_suffix_from("Innen");
static const std::string inclusive_suffix_to("*innen");

std::string split_subtitle_text(const std::string &text,
                                int max_chars_per_line) {
  auto u32_text = to_u32(text);
  if (u32_text.size() <= static_cast<size_t>(max_chars_per_line)) {
    return text;
  }

  auto half = u32_text.size() / 2;
  auto first_part = u32_text.substr(0, half);
  auto second_part = u32_text.substr(half);

  // word starting in the first half and ending in the second
  std::u32string second_before_space(second_part);
  std::u32string second_after_space;
  auto space = second_part.find(U' ');
  if (space != std::u32string::npos) {
    second_before_space = second_part.substr(0, space);
    second_after_space = second_part.substr(space + 1);
  }

  std::u32string first_before_space;
  std::u32string first_after_space(first_part);
  space = first_part.rfind(U' ');
  if (space != std::u32string::npos) {
    first_before_space = first_part.substr(0, space);
    first_after_space = first_part.substr(space + 1);
  }

  auto middle_word = first_after_space + second_before_space;

  std::u32string first_line, second_line;
  if (first_before_space.size() < second_after_space.size() ||
      has_punctuation(to_utf8(middle_word))) {
    first_line = first_before_space + U" " + middle_word;
    second_line = second_after_space;
  } else {
    first_line = first_before_space;
    second_line = middle_word + U" " + second_after_space;
  }

  return to_utf8(first_line + U"\n" + second_line);
}

std::string join_text(const Group &group, int max_chars_per_line,
                      bool inclusive_suffix) {
  std::string text;
  for (const auto &word : group) {
    if (inclusive_suffix &&
        boost::algorithm::ends_with(word.text, inclusive_suffix_from)) {
      text += word.text.substr(0, word.text.size() -
                                      inclusive_suffix_from.size()) +
              inclusive_suffix_to;
    } else {
      text += word.text;
    }
  }
  return split_subtitle_text(text, max_chars_per_line);
}
