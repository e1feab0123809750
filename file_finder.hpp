//
//  file_finder.hpp
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

#ifndef _FILE_FINDER_HPP_
#define _FILE_FINDER_HPP_

#include <string>
#include <vector>

/* regular files in folder_path ending with ending (case insensitive),
 * sorted by name, empty if the folder does not exist */
std::vector<std::string> find_all_files(const std::string &folder_path,
                                        const std::string &ending);

#endif
