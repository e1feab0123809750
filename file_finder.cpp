//
//  file_finder.cpp
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
#include <filesystem>

#include "file_finder.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

std::vector<std::string> find_all_files(const std::string &folder_path,
                                        const std::string &ending) {
  std::vector<std::string> all_files;

  std::error_code ec;
  if (!fs::is_directory(folder_path, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "finder:: folder '" << folder_path
                               << "' does not exist";
    return all_files;
  }

  for (const auto &entry : fs::directory_iterator(folder_path)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto name = entry.path().filename().string();
    if (boost::algorithm::iends_with(name, ending)) {
      all_files.push_back(name);
    }
  }
  std::sort(all_files.begin(), all_files.end());

  BOOST_LOG_TRIVIAL(debug) << "finder:: " << all_files.size() << " '" << ending
                           << "' files in " << folder_path;
  return all_files;
}
