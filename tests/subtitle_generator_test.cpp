//
//  subtitle_generator_test.cpp
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

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "subtitle_generator.hpp"
#include "test_utils.hpp"

static Segment make_segment(const Group &words) {
  Segment segment;
  segment.start = group_start(words);
  segment.end = group_end(words);
  for (const auto &word : words) {
    segment.text += word.text;
  }
  segment.words = words;
  return segment;
}

TEST(SubtitleGenerator, SentencesBecomeEntries) {
  Config config;
  auto generator = SubtitleGenerator::create(config);

  // the recognizer segments do not follow the sentences
  std::vector<Segment> segments = {
      make_segment(make_uniform_group({" Guten", " Morgen.", " Heute"}, 0.5)),
      make_segment(make_uniform_group({" geht", " es", " los."}, 0.5, 1.5))};

  auto entries = generator->generate(segments);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].index, 1);
  EXPECT_EQ(entries[0].text, " Guten Morgen.");
  EXPECT_DOUBLE_EQ(entries[0].start, 0.0);
  EXPECT_DOUBLE_EQ(entries[0].end, 1.0);
  EXPECT_EQ(entries[1].index, 2);
  EXPECT_EQ(entries[1].text, " Heute geht es los.");
  // both sentences touched at 1.0
  EXPECT_DOUBLE_EQ(entries[1].start, 1.0 + 0.042);
  EXPECT_DOUBLE_EQ(entries[1].end, 3.0);
}

TEST(SubtitleGenerator, LongSentenceIsSplitAndTimecodesIncrease) {
  Config config;
  auto generator = SubtitleGenerator::create(config);

  std::vector<std::string> texts;
  for (int i = 0; i < 30; i++) {
    texts.push_back(i == 12 ? " und" : " Wortteil" + std::to_string(i));
  }
  texts.back() += ".";
  auto entries =
      generator->generate({make_segment(make_uniform_group(texts, 0.6))});

  ASSERT_GT(entries.size(), 2u);
  for (size_t i = 0; i < entries.size(); i++) {
    EXPECT_EQ(entries[i].index, static_cast<int>(i + 1));
    EXPECT_LE(entries[i].start, entries[i].end);
    EXPECT_LE(std::count(entries[i].text.begin(), entries[i].text.end(), '\n'),
              1);
    if (i + 1 < entries.size()) {
      EXPECT_LT(entries[i].end, entries[i + 1].start);
    }
  }
}

TEST(SubtitleGenerator, ConfiguredLimitsAreUsed) {
  Config config;
  config.set_max_chars_per_line(10);
  config.set_max_lines(1);
  config.set_max_duration(1.0);
  config.set_min_duration(0.5);
  auto generator = SubtitleGenerator::create(config);

  auto entries = generator->generate({make_segment(make_uniform_group(
      {" Eins", " zwei", " drei", " vier", " fünf", " sechs."}, 0.5))});
  EXPECT_EQ(entries.size(), 3u);
}

TEST(SubtitleGenerator, RejectsEmptyInput) {
  Config config;
  auto generator = SubtitleGenerator::create(config);
  EXPECT_THROW(generator->generate({}), std::invalid_argument);
  EXPECT_THROW(generator->generate({Segment{}}), std::invalid_argument);
}

TEST(SubtitleGenerator, RejectsInvalidTiming) {
  Config config;
  auto generator = SubtitleGenerator::create(config);
  EXPECT_THROW(generator->generate({make_segment(make_group(
                   {{" Hallo", 0.0, 0.5}, {" Welt.", 1.0, 0.8}}))}),
               std::invalid_argument);
}

TEST(SubtitleGenerator, UnknownLanguage) {
  Config config;
  config.set_language("tlh");
  EXPECT_THROW(SubtitleGenerator::create(config), std::invalid_argument);
}

TEST(SubtitleGenerator, GenerateFile) {
  TempDir dir("subtitle_generator");
  auto input = dir.path() / "vortrag.json";
  auto output = dir.path() / "vortrag.srt";
  write_file(input, R"({ "segments": [ { "words": [
      { "word": " Liebe", "start": 0.0, "end": 0.5 },
      { "word": " KollegInnen,", "start": 0.5, "end": 1.5 },
      { "word": " willkommen!", "start": 1.5, "end": 2.5 },
      { "word": " Los", "start": 2.5, "end": 3.0 },
      { "word": " geht's.", "start": 3.0, "end": 3.5 } ] } ] })");

  Config config;
  auto generator = SubtitleGenerator::create(config);
  generator->generate_file(input.string(), output.string());

  EXPECT_EQ(read_file(output),
            "1\n00:00:00,000 --> 00:00:02,500\n"
            " Liebe KollegInnen, willkommen!\n\n"
            "2\n00:00:02,542 --> 00:00:03,500\n Los geht's.");
}
