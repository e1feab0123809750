//
//  segment_splitter.cpp
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

#include <stdexcept>

#include "language.hpp"
#include "log.hpp"
#include "segment_splitter.hpp"
#include "utils.hpp"

static const std::vector<std::string> punctuation = {
    ".", "。", ",", "，", "!", "！", "?", "？", ":", "：", "”", ")", "]", "}", ";"};

bool has_punctuation(const std::string &text) {
  for (const auto &mark : punctuation) {
    if (text.find(mark) != std::string::npos) {
      return true;
    }
  }
  return false;
}

SegmentSplitter::SegmentSplitter(const Config &config) : config_(config) {
  auto rules = get_language_rules(config);
  conjunctions_.insert(rules.conjunctions.begin(), rules.conjunctions.end());
}

size_t SegmentSplitter::max_chars() const {
  return static_cast<size_t>(config_.get_max_lines()) *
         config_.get_max_chars_per_line();
}

bool SegmentSplitter::is_conjunction(const std::string &word) const {
  return conjunctions_.count(word) > 0;
}

bool SegmentSplitter::is_splittable(const Group &group) const {
  return group.size() > 1 &&
         group_duration(group) > config_.get_max_duration() &&
         number_of_chars(group) > max_chars();
}

std::pair<Group, Group> SegmentSplitter::split(const Group &group) const {
  if (group.size() < 2) {
    throw std::invalid_argument("splitter:: cannot split a group of " +
                                std::to_string(group.size()) + " words");
  }

  const double min_duration = config_.get_min_duration();
  const double max_duration = config_.get_max_duration();

  Group first;
  size_t first_chars = 0;
  for (size_t i = 0; i < group.size(); i++) {
    first.push_back(group[i]);
    first_chars += utf8_length(group[i].text);
    // the second part is group[i + 1, size)
    size_t second_size = group.size() - i - 1;
    double first_duration = group_duration(first);
    bool long_enough = first_duration >= min_duration;

    bool cut = false;
    if (has_punctuation(group[i].text) && long_enough) {
      BOOST_LOG_TRIVIAL(trace) << "splitter:: cut at punctuation, word " << i;
      cut = true;
    } else if (i + 1 < group.size() && is_conjunction(group[i + 1].text) &&
               long_enough) {
      BOOST_LOG_TRIVIAL(trace) << "splitter:: cut before conjunction, word "
                               << i;
      cut = true;
    } else if (first_chars >= max_chars() && long_enough) {
      BOOST_LOG_TRIVIAL(trace) << "splitter:: cut at character budget, word "
                               << i;
      cut = true;
    } else if (first_duration >= max_duration) {
      BOOST_LOG_TRIVIAL(trace) << "splitter:: cut at duration budget, word "
                               << i;
      cut = true;
    } else if (second_size > 1 &&
               group.back().end - group[i + 1].start <= min_duration) {
      BOOST_LOG_TRIVIAL(trace) << "splitter:: cut before short remainder, word "
                               << i;
      cut = true;
    } else if (second_size == 1) {
      cut = true;
    }

    if (cut) {
      return {first, Group(group.begin() + i + 1, group.end())};
    }
  }
  // unreachable, the single word remainder rule fires at size - 2
  throw std::logic_error("splitter:: no split point found");
}

std::vector<Group>
SegmentSplitter::split_all(const std::vector<Group> &groups) const {
  std::vector<Group> result;
  for (const auto &group : groups) {
    Group remainder = group;
    while (is_splittable(remainder)) {
      auto parts = split(remainder);
      result.push_back(std::move(parts.first));
      remainder = std::move(parts.second);
    }
    result.push_back(std::move(remainder));
  }
  BOOST_LOG_TRIVIAL(debug) << "splitter:: " << groups.size()
                           << " sentences in " << result.size() << " groups";
  return result;
}
