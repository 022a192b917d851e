//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <DeskCalc/Engine/ResultFormatter.hpp>
#include <DeskCalc/Exception/ExpressionException.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

namespace DeskCalc
{
  TEST(ResultFormatter, Integer_HasNoDecimalPoint)
  {
    EXPECT_EQ(FormatResult(Number(2)), "2");
    EXPECT_EQ(FormatResult(Number(100)), "100");
    EXPECT_EQ(FormatResult(Number(-40)), "-40");
  }

  TEST(ResultFormatter, Decimal_HasNoTrailingZeros)
  {
    EXPECT_EQ(FormatResult(Number("0.25")), "0.25");
    EXPECT_EQ(FormatResult(Number("-1.50")), "-1.5");
    EXPECT_EQ(FormatResult(Number("10.0001")), "10.0001");
  }

  TEST(ResultFormatter, IntegralDecimal_HasNoDecimalPoint)
  {
    EXPECT_EQ(FormatResult(Number("2.0")), "2");
  }

  TEST(ResultFormatter, RoundsToTenDecimalPlaces)
  {
    EXPECT_EQ(FormatResult(Number("0.123456789049")), "0.123456789");
    EXPECT_EQ(FormatResult(Number("0.12345678906")), "0.1234567891");
  }

  TEST(ResultFormatter, RoundingToIntegral_HasNoDecimalPoint)
  {
    EXPECT_EQ(FormatResult(Number("2.99999999999")), "3");
  }

  TEST(ResultFormatter, TinyValues_RoundToZero)
  {
    EXPECT_EQ(FormatResult(Number("0.00000000001")), "0");
    EXPECT_EQ(FormatResult(Number("-0.00000000001")), "0");
  }

  TEST(ResultFormatter, SmallestRepresentableStep)
  {
    EXPECT_EQ(FormatResult(Number("0.0000000001")), "0.0000000001");
  }

  TEST(ResultFormatter, LargeValue_IsNotInScientificNotation)
  {
    EXPECT_EQ(FormatResult(Number("1e20")), "100000000000000000000");
  }

  TEST(ResultFormatter, CustomDecimalPlaces)
  {
    EXPECT_EQ(FormatResult(Number("3.14159"), 2), "3.14");
    EXPECT_EQ(FormatResult(Number("3.5"), 0), "4");
  }

  TEST(ResultFormatter, NegativeDecimalPlaces_Throws)
  {
    EXPECT_THROW((void)FormatResult(Number(1), -1), std::invalid_argument);
  }

  TEST(ResultFormatter, Infinity_Throws)
  {
    EXPECT_THROW((void)FormatResult(std::numeric_limits<Number>::infinity()), EvaluationException);
  }
}
