//
//  overlap.cpp
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

#include "log.hpp"
#include "overlap.hpp"

size_t insert_frame(std::vector<Group> &groups, double frame_interval) {
  size_t shifted = 0;
  for (size_t i = 0; i + 1 < groups.size(); i++) {
    auto &first_word = groups[i + 1].front();
    if (groups[i].back().end != first_word.start) {
      continue;
    }
    first_word.start += frame_interval;
    if (groups[i + 1].size() == 1 && first_word.start > first_word.end) {
      // a lone word shorter than a frame keeps start <= end by moving its end
      BOOST_LOG_TRIVIAL(debug) << "overlap:: word '" << first_word.text
                               << "' shorter than a frame, end extended";
      first_word.end = first_word.start;
    }
    shifted++;
  }
  BOOST_LOG_TRIVIAL(debug) << "overlap:: " << shifted << " of "
                           << groups.size() << " groups shifted";
  return shifted;
}
