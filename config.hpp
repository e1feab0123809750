//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

class Config {
 public:
  int get_max_lines() const { return max_lines_; }
  int get_max_chars_per_line() const { return max_chars_per_line_; }
  double get_min_duration() const { return min_duration_; }
  double get_max_duration() const { return max_duration_; }
  double get_frame_interval() const { return frame_interval_; }
  double get_timecode_offset() const { return timecode_offset_; }
  const std::string& get_language() const { return language_; }
  const std::vector<std::string>& get_abbreviations() const {
    return abbreviations_;
  }
  const std::vector<std::string>& get_conjunctions() const {
    return conjunctions_;
  }
  bool get_inclusive_suffix() const { return inclusive_suffix_; }
  int get_log_severity() const { return log_severity_; };
  const std::string& get_input_path() const { return input_path_; };
  const std::string& get_output_path() const { return output_path_; };
  const std::string& get_input_extension() const { return input_extension_; };
  uint16_t get_jobs() const { return jobs_; };

  void set_max_lines(int max_lines) { max_lines_ = max_lines; }
  void set_max_chars_per_line(int max_chars_per_line) {
    max_chars_per_line_ = max_chars_per_line;
  }
  void set_min_duration(double min_duration) { min_duration_ = min_duration; }
  void set_max_duration(double max_duration) { max_duration_ = max_duration; }
  void set_frame_interval(double frame_interval) {
    frame_interval_ = frame_interval;
  }
  void set_timecode_offset(double timecode_offset) {
    timecode_offset_ = timecode_offset;
  }
  void set_language(const std::string& language) { language_ = language; }
  void set_abbreviations(const std::vector<std::string>& abbreviations) {
    abbreviations_ = abbreviations;
  }
  void set_conjunctions(const std::vector<std::string>& conjunctions) {
    conjunctions_ = conjunctions;
  }
  void set_inclusive_suffix(bool inclusive_suffix) {
    inclusive_suffix_ = inclusive_suffix;
  }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_input_path(const std::string& input_path) {
    input_path_ = input_path;
  };
  void set_output_path(const std::string& output_path) {
    output_path_ = output_path;
  };
  void set_input_extension(const std::string& input_extension) {
    input_extension_ = input_extension;
  };
  void set_jobs(uint16_t jobs) { jobs_ = jobs; };

 private:
  int max_lines_{2};
  int max_chars_per_line_{40};
  double min_duration_{2.0};
  double max_duration_{5.0};
  /* one video frame at 24 fps */
  double frame_interval_{0.042};
  double timecode_offset_{0.0};
  std::string language_{"de"};
  /* extra entries on top of the language tables */
  std::vector<std::string> abbreviations_;
  std::vector<std::string> conjunctions_;
  bool inclusive_suffix_{true};
  int log_severity_{2};
  std::string input_path_;
  std::string output_path_{"subtitles"};
  std::string input_extension_{".json"};
  uint16_t jobs_{1};
};

#endif
