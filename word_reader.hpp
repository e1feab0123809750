//
//  word_reader.hpp
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

#ifndef _WORD_READER_HPP_
#define _WORD_READER_HPP_

#include <istream>
#include <string>
#include <vector>

#include "word.hpp"

/*
 * Reads recognizer output with word timestamps:
 *   { "segments": [ { "start": 0.0, "end": 1.2, "text": " Hi there.",
 *                     "words": [ { "word": " Hi", "start": 0.0,
 *                                  "end": 0.4 }, ... ] }, ... ] }
 * "text" is accepted in place of "word". Throws std::runtime_error.
 */
std::vector<Segment> read_segments(std::istream &is,
                                   const std::string &source = "<stream>");

std::vector<Segment> read_segments_file(const std::string &path);

#endif
