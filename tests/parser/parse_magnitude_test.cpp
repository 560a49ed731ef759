/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
#include <gtest/gtest.h>

#include <ValueParser.hpp>
#include <cmath>

TEST(ParseMagnitude, EmptyAndBlankInput)
{
  EXPECT_DOUBLE_EQ(parseMagnitude(""), 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("   "), 0.0);
  EXPECT_TRUE(std::isfinite(parseMagnitude("\t\n")));
}

TEST(ParseMagnitude, PlainDecimalsAndSigns)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("330"), 330.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("  12.5  "), 12.5);
  EXPECT_DOUBLE_EQ(parseMagnitude("-3"), -3.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("+0.5"), 0.5);
  EXPECT_DOUBLE_EQ(parseMagnitude(".5"), 0.5);
  EXPECT_DOUBLE_EQ(parseMagnitude("1e3"), 1000.0);
}

TEST(ParseMagnitude, NoLeadingNumeralGivesZero)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("abc"), 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("k10"), 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("Red"), 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("open"), 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("-"), 0.0);
}

TEST(ParseMagnitude, UnitTextWithoutMultiplier)
{
  // 'V' and the UTF-8 ohm sign carry no multiplier
  EXPECT_DOUBLE_EQ(parseMagnitude("9V"), 9.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("330Ω"), 330.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("12volts"), 12.0);
}

TEST(ParseMagnitude, KiloIsCaseInsensitive)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("10k"), 10.0 * 1e3);
  EXPECT_DOUBLE_EQ(parseMagnitude("4.7K"), 4.7 * 1e3);
  EXPECT_DOUBLE_EQ(parseMagnitude("10kΩ"), 10.0 * 1e3);
}

TEST(ParseMagnitude, LetterMMeansMega)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("2M"), 2.0 * 1e6);
  EXPECT_DOUBLE_EQ(parseMagnitude("1meg"), 1.0 * 1e6);
  EXPECT_DOUBLE_EQ(parseMagnitude("10 ohm"), 10.0 * 1e6);
}

TEST(ParseMagnitude, MillivoltAndMegahertzAreNotScaled)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("5mV"), 5.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("10MHz"), 10.0);
}

TEST(ParseMagnitude, MicroNanoPico)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("100uF"), 100.0 * 1e-6);
  EXPECT_DOUBLE_EQ(parseMagnitude("47nF"), 47.0 * 1e-9);
  EXPECT_DOUBLE_EQ(parseMagnitude("22pF"), 22.0 * 1e-12);
}

TEST(ParseMagnitude, FirstMatchingRuleWins)
{
  // 'k' is checked before 'm'
  EXPECT_DOUBLE_EQ(parseMagnitude("2 kohm"), 2.0 * 1e3);
  // 'u' is checked before 'n'
  EXPECT_DOUBLE_EQ(parseMagnitude("3un"), 3.0 * 1e-6);
}

TEST(ParseMagnitude, ExponentNeedsDigits)
{
  EXPECT_DOUBLE_EQ(parseMagnitude("5e"), 5.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("2e-3k"), 2e-3 * 1e3);
}

TEST(ParseLeadingNumber, StopsAtFirstNonNumericCharacter)
{
  double v = -1.0;
  EXPECT_TRUE(parseLeadingNumber("12abc", v));
  EXPECT_DOUBLE_EQ(v, 12.0);

  EXPECT_TRUE(parseLeadingNumber("1.2.3", v));
  EXPECT_DOUBLE_EQ(v, 1.2);
}

TEST(ParseLeadingNumber, RejectsMissingDigits)
{
  double v = -1.0;
  EXPECT_FALSE(parseLeadingNumber("abc", v));
  EXPECT_DOUBLE_EQ(v, 0.0);
  EXPECT_FALSE(parseLeadingNumber("-", v));
  EXPECT_FALSE(parseLeadingNumber(".", v));
  EXPECT_FALSE(parseLeadingNumber("", v));
}

TEST(ParseLeadingNumber, OverflowIsRejected)
{
  double v = -1.0;
  EXPECT_FALSE(parseLeadingNumber("1e400", v));
  EXPECT_DOUBLE_EQ(v, 0.0);
  EXPECT_DOUBLE_EQ(parseMagnitude("1e400k"), 0.0);
}

// No main(): test binary links with gtest_main which supplies main().
