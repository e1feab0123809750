//
//  timecode.hpp
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

#ifndef _TIMECODE_HPP_
#define _TIMECODE_HPP_

#include <string>

/* seconds to HH:MM:SS,mmm, milliseconds truncated */
std::string to_timecode(double seconds);

#endif
