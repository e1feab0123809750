//
//  main.cpp
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
#include <atomic>
#include <boost/program_options.hpp>
#include <filesystem>
#include <future>
#include <iostream>
#include <signal.h>

#include "config.hpp"
#include "file_finder.hpp"
#include "language.hpp"
#include "log.hpp"
#include "subtitle_generator.hpp"
#include "utils.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;
namespace fs = std::filesystem;

static const std::string version("srtgen-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int signum) {
  BOOST_LOG_TRIVIAL(info) << "main:: got signal " << signum;
  // no new files are started, running ones complete
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

static std::string check_config(const Config &config) {
  if (config.get_max_lines() < 1)
    return "max_lines must be at least 1";
  if (config.get_max_chars_per_line() < 1)
    return "max_chars_line must be at least 1";
  if (config.get_min_duration() < 0)
    return "min_std_time must not be negative";
  if (config.get_max_duration() <= 0)
    return "max_std_time must be positive";
  if (config.get_frame_interval() < 0)
    return "frame_time must not be negative";
  if (config.get_timecode_offset() < 0)
    return "timecode_offset must not be negative";
  if (config.get_jobs() < 1)
    return "jobs must be at least 1";
  if (!find_language_rules(config.get_language()))
    return "unsupported language " + config.get_language();
  return {};
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("input,i", po::value<std::string>()->required(), "Word timestamp file (.json) or a folder containing multiple files")
      ("output,o", po::value<std::string>()->default_value("subtitles"), "Output folder where subtitles (.srt) will be saved")
      ("extension,e", po::value<std::string>()->default_value(".json"), "Input file extension when input is a folder")
      ("language,l", po::value<std::string>()->default_value("de"), "Abbreviations and conjunctions to use (de, en)")
      ("abbreviation,a", po::value<std::vector<std::string>>()->multitoken(), "Additional abbreviation that never ends a sentence")
      ("conjunction,c", po::value<std::vector<std::string>>()->multitoken(), "Additional conjunction to split subtitles before")
      ("max_lines", po::value<int>()->default_value(2), "Max number of lines per subtitle")
      ("max_chars_line", po::value<int>()->default_value(40), "Max characters per subtitle line")
      ("min_std_time", po::value<double>()->default_value(2.0, "2"), "Minimum subtitle duration in seconds")
      ("max_std_time", po::value<double>()->default_value(5.0, "5"), "Maximum subtitle duration in seconds")
      ("frame_time", po::value<double>()->default_value(0.042, "0.042"), "Gap in seconds inserted between touching subtitles")
      ("timecode_offset", po::value<double>()->default_value(0.0, "0"), "Seconds added to every timecode")
      ("inclusive_suffix,g", po::value<bool>()->default_value(true), "Rewrite the ending Innen to *innen")
      ("jobs,j", po::value<int>()->default_value(1), "Number of files processed concurrently")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }

    po::notify(vm);

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);

  Config config;
  config.set_input_path(vm["input"].as<std::string>());
  config.set_output_path(vm["output"].as<std::string>());
  config.set_input_extension(vm["extension"].as<std::string>());
  config.set_language(vm["language"].as<std::string>());
  if (vm.count("abbreviation")) {
    config.set_abbreviations(vm["abbreviation"].as<std::vector<std::string>>());
  }
  if (vm.count("conjunction")) {
    config.set_conjunctions(vm["conjunction"].as<std::vector<std::string>>());
  }
  config.set_max_lines(vm["max_lines"].as<int>());
  config.set_max_chars_per_line(vm["max_chars_line"].as<int>());
  config.set_min_duration(vm["min_std_time"].as<double>());
  config.set_max_duration(vm["max_std_time"].as<double>());
  config.set_frame_interval(vm["frame_time"].as<double>());
  config.set_timecode_offset(vm["timecode_offset"].as<double>());
  config.set_inclusive_suffix(vm["inclusive_suffix"].as<bool>());
  config.set_jobs(std::max(0, std::min(vm["jobs"].as<int>(), 64)));
  config.set_log_severity(vm["log_level"].as<int>());

  auto error = check_config(config);
  if (!error.empty()) {
    std::cerr << error << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  /* init logging */
  log_init(config);

  fs::path input_path(config.get_input_path());
  fs::path output_path(config.get_output_path());

  BOOST_LOG_TRIVIAL(info) << "main:: " << version;
  BOOST_LOG_TRIVIAL(info) << "main:: input path:  " << input_path.string();
  BOOST_LOG_TRIVIAL(info) << "main:: output path: " << output_path.string();
  BOOST_LOG_TRIVIAL(info) << "main:: language:    " << config.get_language();

  std::vector<fs::path> input_files;
  if (fs::is_regular_file(input_path)) {
    input_files.push_back(input_path);
  } else if (fs::is_directory(input_path)) {
    for (const auto &name :
         find_all_files(input_path.string(), config.get_input_extension())) {
      input_files.push_back(input_path / name);
    }
    if (input_files.empty()) {
      std::cout << "No " << config.get_input_extension()
                << " files found in this folder." << std::endl;
      return EXIT_SUCCESS;
    }
    BOOST_LOG_TRIVIAL(info) << "main:: found " << input_files.size()
                            << " file(s)";
  } else {
    std::cerr << "Invalid input path " << input_path
              << ". Please provide a valid file or folder." << std::endl;
    return EXIT_FAILURE;
  }

  try {
    TimeElapsed elapsed("main:: subtitle generation");
    fs::create_directories(output_path);
    auto generator = SubtitleGenerator::create(config);

    size_t next = 0;
    while (next < input_files.size() && !is_terminated()) {
      /* at most jobs files in flight, each file is independent */
      std::vector<std::pair<fs::path, std::future<void>>> batch;
      for (; next < input_files.size() && batch.size() < config.get_jobs();
           next++) {
        auto input_file = input_files[next];
        auto srt_file = output_path / input_file.stem();
        srt_file += ".srt";
        BOOST_LOG_TRIVIAL(info) << "main:: [" << next + 1 << "/"
                                << input_files.size()
                                << "] processing: " << input_file.filename();
        batch.emplace_back(srt_file,
                           std::async(std::launch::async, [=]() {
                             generator->generate_file(input_file.string(),
                                                      srt_file.string());
                           }));
      }
      for (auto &job : batch) {
        job.second.get();
        std::cout << "Saved to " << job.first.string() << std::endl;
      }
    }

    if (is_terminated()) {
      BOOST_LOG_TRIVIAL(warning) << "main:: interrupted after " << next
                                 << " of " << input_files.size() << " files";
    }
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  return rc;
}
