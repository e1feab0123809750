//
//  timecode.cpp
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

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "timecode.hpp"

std::string to_timecode(double seconds) {
  if (!(seconds >= 0)) {
    throw std::invalid_argument("timecode:: negative offset " +
                                std::to_string(seconds));
  }
  // all fields derive from the same integer so the digits always agree,
  // the epsilon absorbs binary error (10.042 * 1000 = 10041.999...)
  int64_t ms = static_cast<int64_t>(std::floor(seconds * 1000.0 + 1e-6));

  std::stringstream ss;
  ss << std::setfill('0') << std::setw(2) << ms / 3600000 << ':'
     << std::setw(2) << (ms / 60000) % 60 << ':' << std::setw(2)
     << (ms / 1000) % 60 << ',' << std::setw(3) << ms % 1000;
  return ss.str();
}
