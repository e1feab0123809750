//
//  line_wrapper_test.cpp
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

#include "line_wrapper.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

TEST(SplitSubtitleText, ShortTextUnchanged) {
  EXPECT_EQ(split_subtitle_text(" Hallo Welt.", 40), " Hallo Welt.");
  EXPECT_EQ(split_subtitle_text("", 40), "");

  std::string exact = word_of_length(40);
  EXPECT_EQ(split_subtitle_text(exact, 40), exact);
}

TEST(SplitSubtitleText, LengthCountsCodePoints) {
  // 30 characters, 38 bytes
  std::string umlauts = " Größere Übungen für Ärzte äöü";
  ASSERT_GT(umlauts.size(), 30u);
  EXPECT_EQ(split_subtitle_text(umlauts, 30), umlauts);
}

TEST(SplitSubtitleText, InvalidUtf8IsRejected) {
  // a lone continuation byte and a truncated sequence
  std::string stray = " Hallo \x80 Welt";
  std::string truncated = " Sch\xC3";
  EXPECT_THROW(split_subtitle_text(stray, 40),
               boost::locale::conv::conversion_error);
  EXPECT_THROW(split_subtitle_text(truncated + std::string(50, 'x'), 40),
               boost::locale::conv::conversion_error);
  EXPECT_THROW(utf8_length(truncated), boost::locale::conv::conversion_error);
}

TEST(SplitSubtitleText, PunctuatedMiddleWordStaysOnFirstLine) {
  EXPECT_EQ(split_subtitle_text(
                " Das ist ein ziemlich langer Satz, der umgebrochen werden "
                "muss.",
                40),
            " Das ist ein ziemlich langer Satz,\nder umgebrochen werden muss.");
}

TEST(SplitSubtitleText, MiddleWordMovesToShorterSide) {
  EXPECT_EQ(
      split_subtitle_text(
          " Heute gehen wir gemeinsam in den großen Park spazieren", 40),
      " Heute gehen wir gemeinsam\nin den großen Park spazieren");
  EXPECT_EQ(
      split_subtitle_text(
          " Wir treffen uns morgen früh am Bahnhof und fahren dann los", 40),
      " Wir treffen uns morgen früh\nam Bahnhof und fahren dann los");
}

TEST(SplitSubtitleText, NoSpaces) {
  std::string text(50, 'x');
  // the whole text is the middle word, the first line is empty
  EXPECT_EQ(split_subtitle_text(text, 40), "\n" + text + " ");
}

TEST(SplitSubtitleText, NeverMoreThanTwoLines) {
  std::string text;
  for (int i = 0; i < 40; i++) {
    text += " Wort" + std::to_string(i) + (i % 7 == 0 ? "," : "");
  }
  for (int max_chars : {1, 10, 40, 80}) {
    auto wrapped = split_subtitle_text(text, max_chars);
    EXPECT_LE(std::count(wrapped.begin(), wrapped.end(), '\n'), 1);
  }
}

TEST(SplitSubtitleText, RewrapOfShortTextIsIdempotent) {
  std::string text = " Kurzer Satz.";
  EXPECT_EQ(split_subtitle_text(split_subtitle_text(text, 40), 40), text);
}

TEST(JoinText, ConcatenatesWords) {
  auto group = make_uniform_group({" Guten", " Morgen", " zusammen."}, 0.5);
  EXPECT_EQ(join_text(group, 40), " Guten Morgen zusammen.");
}

TEST(JoinText, InclusiveSuffix) {
  auto group = make_uniform_group({" Liebe", " StudentInnen", " und",
                                   " LehrerInnen."},
                                  0.5);
  // only a word ending in Innen is rewritten
  EXPECT_EQ(join_text(group, 80), " Liebe Student*innen und LehrerInnen.");
  EXPECT_EQ(join_text(group, 80, false),
            " Liebe StudentInnen und LehrerInnen.");
}

TEST(JoinText, WrapsLongText) {
  auto group = make_uniform_group({" Das", " ist", " ein", " ziemlich",
                                   " langer", " Satz,", " der",
                                   " umgebrochen", " werden", " muss."},
                                  0.3);
  EXPECT_EQ(join_text(group, 40),
            " Das ist ein ziemlich langer Satz,\nder umgebrochen werden muss.");
}
