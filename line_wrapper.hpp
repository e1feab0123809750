//
//  line_wrapper.hpp
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

#ifndef _LINE_WRAPPER_HPP_
#define _LINE_WRAPPER_HPP_

#include <string>

#include "word.hpp"

/*
 * Breaks text longer than max_chars_per_line into two lines around its
 * middle. The word crossing the middle goes to the first line when that
 * line is the shorter one or when the word carries punctuation, to the
 * second line otherwise. Line lengths are not checked afterwards.
 */
std::string split_subtitle_text(const std::string &text,
                                int max_chars_per_line);

/* concatenates the words, with inclusive_suffix "Innen" becomes "*innen" */
std::string join_text(const Group &group, int max_chars_per_line,
                      bool inclusive_suffix = true);

#endif
