//
//  utils.hpp
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

#ifndef _UTILS_HPP_
#define _UTILS_HPP_

#include <boost/locale/encoding_utf.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "log.hpp"

class TimeElapsed {
public:
  TimeElapsed() = delete;
  TimeElapsed(const std::string &desc) {
    desc_ = desc;
    start_ = std::chrono::steady_clock::now();
  }

  uint32_t elapsed() {
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start_;
    return elapsed.count();
  }

  ~TimeElapsed() {
    BOOST_LOG_TRIVIAL(info) << desc_ << " returned in " << elapsed() << " ms";
  }

private:
  std::chrono::steady_clock::time_point start_;
  std::string desc_;
};

/*
 * subtitle lengths are counted in code points, not bytes; invalid UTF-8
 * throws boost::locale::conv::conversion_error
 */
inline std::u32string to_u32(const std::string &utf8) {
  return boost::locale::conv::utf_to_utf<char32_t>(utf8,
                                                   boost::locale::conv::stop);
}

inline std::string to_utf8(const std::u32string &text) {
  return boost::locale::conv::utf_to_utf<char>(text, boost::locale::conv::stop);
}

inline size_t utf8_length(const std::string &utf8) {
  return to_u32(utf8).size();
}

#endif
