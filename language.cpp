//
//  language.cpp
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

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <map>
#include <stdexcept>

#include "config.hpp"
#include "language.hpp"

static const std::map<std::string, LanguageRules> language_rules = {
    {"de",
     {{" z.B.", " u.a.", " d.h.", " bzw.", " etc.", " usw.", " z. B.",
       " u. a.", " d. h."},
      {" oder", " und", " sowie", " als auch", " sondern", " aber", " denn",
       " doch", " bzw."}}},
    {"en",
     {{" e.g.", " i.e.", " etc.", " vs.", " Mr.", " Mrs.", " Ms.", " Dr.",
       " e. g.", " i. e."},
      {" and", " or", " but", " nor", " yet", " as well as"}}},
};

std::optional<LanguageRules> find_language_rules(const std::string &language) {
  auto it = language_rules.find(boost::algorithm::to_lower_copy(language));
  if (it == language_rules.end()) {
    return std::nullopt;
  }
  return it->second;
}

void add_word_variants(std::vector<std::string> &list,
                       const std::string &entry) {
  if (entry.empty()) {
    return;
  }
  if (std::find(list.begin(), list.end(), entry) == list.end()) {
    list.push_back(entry);
  }
  if (entry.front() != ' ') {
    add_word_variants(list, " " + entry);
  }
}

LanguageRules get_language_rules(const Config &config) {
  auto rules = find_language_rules(config.get_language());
  if (!rules) {
    throw std::invalid_argument("language:: unsupported language '" +
                                config.get_language() + "'");
  }
  for (const auto &abbreviation : config.get_abbreviations()) {
    add_word_variants(rules->abbreviations, abbreviation);
  }
  for (const auto &conjunction : config.get_conjunctions()) {
    add_word_variants(rules->conjunctions, conjunction);
  }
  return *rules;
}
