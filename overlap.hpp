//
//  overlap.hpp
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

#ifndef _OVERLAP_HPP_
#define _OVERLAP_HPP_

#include <cstddef>
#include <vector>

#include "word.hpp"

/*
 * Moves the start of a group forward by one frame when it exactly equals
 * the end of the previous group. Returns the number of moved groups.
 * A single word group whose word would end before its new start has its
 * end moved to that start.
 */
size_t insert_frame(std::vector<Group> &groups, double frame_interval);

#endif
