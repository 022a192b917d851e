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

#include <DeskCalc/Engine/Utf8.hpp>
#include <gtest/gtest.h>

namespace DeskCalc
{
  TEST(Utf8, GetCodePointLength)
  {
    EXPECT_EQ(Utf8::GetCodePointLength('7'), 1u);
    EXPECT_EQ(Utf8::GetCodePointLength(0xC3), 2u);
    EXPECT_EQ(Utf8::GetCodePointLength(0xE2), 3u);
    EXPECT_EQ(Utf8::GetCodePointLength(0xF0), 4u);
    // A continuation byte is not a lead byte
    EXPECT_EQ(Utf8::GetCodePointLength(0x97), 1u);
  }

  TEST(Utf8, GetLastCodePointOffset_Empty)
  {
    EXPECT_EQ(Utf8::GetLastCodePointOffset(""), 0u);
  }

  TEST(Utf8, GetLastCodePointOffset_Ascii)
  {
    EXPECT_EQ(Utf8::GetLastCodePointOffset("123"), 2u);
  }

  TEST(Utf8, GetLastCodePointOffset_MultiByte)
  {
    // "5×" and "5−"
    EXPECT_EQ(Utf8::GetLastCodePointOffset("5\xC3\x97"), 1u);
    EXPECT_EQ(Utf8::GetLastCodePointOffset("5\xE2\x88\x92"), 1u);
    EXPECT_EQ(Utf8::GetLastCodePointOffset("\xE2\x88\x92"), 0u);
  }

  TEST(Utf8, GetLastCodePointOffset_StrayContinuationBytes)
  {
    EXPECT_EQ(Utf8::GetLastCodePointOffset("5\x80\x80"), 2u);
    EXPECT_EQ(Utf8::GetLastCodePointOffset("\x80"), 0u);
    // Truncated "×" followed by a stray byte
    EXPECT_EQ(Utf8::GetLastCodePointOffset("5\xC3\x97\x97"), 3u);
    // More continuation bytes than a code point can hold
    EXPECT_EQ(Utf8::GetLastCodePointOffset("5\xE2\x80\x80\x80\x80"), 5u);
  }

  static_assert(Utf8::GetLastCodePointOffset("ab") == 1);
}
