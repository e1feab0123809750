//
//  overlap_test.cpp
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

#include "overlap.hpp"
#include "test_utils.hpp"

TEST(InsertFrame, TouchingGroupsAreSeparated) {
  std::vector<Group> groups = {
      make_group({{" Erster", 8.0, 9.0}, {" Satz.", 9.0, 10.0}}),
      make_group({{" Zweiter", 10.0, 11.0}, {" Satz.", 11.0, 12.0}})};

  EXPECT_EQ(insert_frame(groups, 0.042), 1u);
  EXPECT_DOUBLE_EQ(groups[1][0].start, 10.0 + 0.042);
  EXPECT_DOUBLE_EQ(groups[1][0].end, 11.0);
  // earlier group untouched
  EXPECT_DOUBLE_EQ(groups[0][0].start, 8.0);
  EXPECT_DOUBLE_EQ(groups[0][1].end, 10.0);
  EXPECT_LT(group_end(groups[0]), group_start(groups[1]));
}

TEST(InsertFrame, OnlyExactEqualityShifts) {
  std::vector<Group> groups = {make_group({{" Eins.", 0.0, 1.0}}),
                               make_group({{" Zwei.", 1.0001, 2.0}}),
                               make_group({{" Drei.", 3.0, 4.0}})};

  EXPECT_EQ(insert_frame(groups, 0.042), 0u);
  EXPECT_DOUBLE_EQ(groups[1][0].start, 1.0001);
  EXPECT_DOUBLE_EQ(groups[2][0].start, 3.0);
}

TEST(InsertFrame, ChainOfTouchingGroups) {
  std::vector<Group> groups = {make_group({{" a", 0.0, 1.0}}),
                               make_group({{" b", 1.0, 2.0}}),
                               make_group({{" c", 2.0, 3.0}})};

  EXPECT_EQ(insert_frame(groups, 0.04), 2u);
  EXPECT_DOUBLE_EQ(groups[1][0].start, 1.04);
  EXPECT_DOUBLE_EQ(groups[2][0].start, 2.04);
}

TEST(InsertFrame, ZeroLengthFirstWordStillGetsFullGap) {
  std::vector<Group> groups = {
      make_group({{" Ja", 4.0, 5.0}}),
      make_group({{" äh", 5.0, 5.0}, {" nein.", 5.0, 6.0}})};

  EXPECT_EQ(insert_frame(groups, 0.042), 1u);
  EXPECT_GE(group_start(groups[1]) - group_end(groups[0]), 0.042 - 1e-9);
  EXPECT_DOUBLE_EQ(groups[1][0].start, 5.042);
  // the group still ends with its last word
  EXPECT_DOUBLE_EQ(group_end(groups[1]), 6.0);
}

TEST(InsertFrame, SingleWordShorterThanFrameIsExtended) {
  std::vector<Group> groups = {make_group({{" Ja", 4.0, 5.0}}),
                               make_group({{" ne", 5.0, 5.02}})};

  EXPECT_EQ(insert_frame(groups, 0.042), 1u);
  EXPECT_DOUBLE_EQ(groups[1][0].start, 5.042);
  EXPECT_DOUBLE_EQ(groups[1][0].end, 5.042);
  EXPECT_GE(group_start(groups[1]) - group_end(groups[0]), 0.042 - 1e-9);
}

TEST(InsertFrame, ExtendedEndSeparatesFollowingGroup) {
  std::vector<Group> groups = {make_group({{" a", 0.0, 1.0}}),
                               make_group({{" b", 1.0, 1.0}}),
                               make_group({{" c", 1.0 + 0.042, 2.0}})};

  EXPECT_EQ(insert_frame(groups, 0.042), 2u);
  EXPECT_DOUBLE_EQ(groups[1][0].end, 1.042);
  EXPECT_LT(group_end(groups[1]), group_start(groups[2]));
}

TEST(InsertFrame, NothingToCompare) {
  std::vector<Group> groups;
  EXPECT_EQ(insert_frame(groups, 0.042), 0u);

  groups.push_back(make_group({{" allein", 0.0, 1.0}}));
  EXPECT_EQ(insert_frame(groups, 0.042), 0u);
  EXPECT_DOUBLE_EQ(groups[0][0].start, 0.0);
}
