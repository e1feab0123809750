//
//  sentence_segmenter.cpp
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

#include "sentence_segmenter.hpp"
#include "language.hpp"
#include "log.hpp"
#include "utils.hpp"

static const std::u32string closing_chars(U"”\"'»›)]");
static const std::u32string terminal_chars(U".!?");

SentenceSegmenter::SentenceSegmenter(const Config &config) {
  auto rules = get_language_rules(config);
  abbreviations_.insert(rules.abbreviations.begin(), rules.abbreviations.end());
}

bool SentenceSegmenter::is_sentence_end(const std::string &word) const {
  if (abbreviations_.count(word)) {
    return false;
  }
  auto cleaned = to_u32(word);
  auto last = cleaned.find_last_not_of(closing_chars);
  if (last == std::u32string::npos) {
    return false;
  }
  return terminal_chars.find(cleaned[last]) != std::u32string::npos;
}

std::vector<Group>
SentenceSegmenter::segment(const std::vector<Word> &words) const {
  std::vector<Group> groups;
  Group current;
  for (const auto &word : words) {
    current.push_back(word);
    if (is_sentence_end(word.text)) {
      groups.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "segmenter:: last sentence of "
                             << current.size()
                             << " words has no terminal punctuation";
    groups.push_back(std::move(current));
  }
  BOOST_LOG_TRIVIAL(debug) << "segmenter:: " << words.size() << " words in "
                           << groups.size() << " sentences";
  return groups;
}
