//
//  language.hpp
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

#ifndef _LANGUAGE_HPP_
#define _LANGUAGE_HPP_

#include <optional>
#include <string>
#include <vector>

class Config;

/*
 * Words as the recognizer emits them, leading space included.
 * Matching is exact, " z.B." and "z.B." are different entries.
 */
struct LanguageRules {
  std::vector<std::string> abbreviations;
  std::vector<std::string> conjunctions;
};

std::optional<LanguageRules> find_language_rules(const std::string &language);

/* language tables of the configured language plus the configured extras,
 * throws std::invalid_argument on an unknown language */
LanguageRules get_language_rules(const Config &config);

/* adds the entry and, if missing, its space prefixed variant */
void add_word_variants(std::vector<std::string> &list,
                       const std::string &entry);

#endif
