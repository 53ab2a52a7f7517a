/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of parentage and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include <gtest/gtest.h>

#include "utility.hpp"

TEST(Utility, SplitDropsOnlyTrailingEmptyField) {
    EXPECT_EQ(util::split("a,b,", ','), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(util::split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(util::split("", ',').empty());
}

TEST(Utility, JoinWithSeparator) {
    EXPECT_EQ(util::join({"geneA", "geneB"}, ","), "geneA,geneB");
    EXPECT_EQ(util::join({}, ","), "");
}

TEST(Utility, IsDigitsAcceptsOnlyAsciiDigits) {
    EXPECT_TRUE(util::is_digits("0"));
    EXPECT_TRUE(util::is_digits("1234567890"));
    EXPECT_FALSE(util::is_digits(""));
    EXPECT_FALSE(util::is_digits("-1"));
    EXPECT_FALSE(util::is_digits("12a"));

    // Latin-1 superscript digits and UTF-8 continuation bytes
    EXPECT_FALSE(util::is_digits("1\xB2"));
    EXPECT_FALSE(util::is_digits("\xB9\xB3"));
    EXPECT_FALSE(util::is_digits("\xEF\xBC\x91"));
}
