//
//  word_reader.cpp
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

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <stdexcept>

#include "log.hpp"
#include "word_reader.hpp"

namespace pt = boost::property_tree;

static Word parse_word(const pt::ptree &node) {
  Word word;
  auto text = node.get_optional<std::string>("word");
  if (!text) {
    text = node.get_optional<std::string>("text");
  }
  word.text = text.value_or("");
  word.start = node.get<double>("start");
  word.end = node.get<double>("end");
  return word;
}

static Segment parse_segment(const pt::ptree &node) {
  Segment segment;
  segment.start = node.get<double>("start", 0.0);
  segment.end = node.get<double>("end", 0.0);
  segment.text = node.get<std::string>("text", "");
  auto words = node.get_child_optional("words");
  if (words) {
    for (const auto &child : *words) {
      segment.words.push_back(parse_word(child.second));
    }
  }
  return segment;
}

std::vector<Segment> read_segments(std::istream &is,
                                   const std::string &source) {
  std::vector<Segment> segments;
  try {
    pt::ptree root;
    pt::read_json(is, root);
    for (const auto &child : root.get_child("segments")) {
      segments.push_back(parse_segment(child.second));
    }
  } catch (const pt::json_parser_error &e) {
    throw std::runtime_error("reader:: " + source +
                             ": malformed JSON: " + e.message() + " at line " +
                             std::to_string(e.line()));
  } catch (const pt::ptree_error &e) {
    throw std::runtime_error("reader:: " + source + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "reader:: " << source << " has "
                           << segments.size() << " segments";
  return segments;
}

std::vector<Segment> read_segments_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("reader:: cannot open " + path);
  }
  return read_segments(file, path);
}
