#ifndef DESKCALC_ENGINE_UTF8_HPP
#define DESKCALC_ENGINE_UTF8_HPP
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

#include <cstddef>
#include <string_view>

namespace DeskCalc
{
  namespace Utf8
  {
    /// @brief Gets the length in bytes of the code point that starts with the given lead byte.
    /// @param leadByte The first byte of the encoded code point.
    /// @return 1-4, or 1 for bytes that are not a valid lead byte.
    [[nodiscard]] constexpr std::size_t GetCodePointLength(const unsigned char leadByte) noexcept
    {
      if ((leadByte & 0xE0u) == 0xC0u)
      {
        return 2;
      }
      if ((leadByte & 0xF0u) == 0xE0u)
      {
        return 3;
      }
      if ((leadByte & 0xF8u) == 0xF0u)
      {
        return 4;
      }
      return 1;
    }

    /// @brief Gets the byte offset of the last code point in the string.
    /// @param text UTF-8 encoded text.
    /// @return The offset, or 0 if the text is empty. Malformed trailing bytes are stepped over one at a time.
    [[nodiscard]] constexpr std::size_t GetLastCodePointOffset(const std::string_view text) noexcept
    {
      if (text.empty())
      {
        return 0;
      }
      const std::size_t lastOffset = text.size() - 1;
      std::size_t offset = lastOffset;
      // Step back over continuation bytes (10xxxxxx), a code point has at most three
      while (offset > 0 && (lastOffset - offset) < 3 && (static_cast<unsigned char>(text[offset]) & 0xC0u) == 0x80u)
      {
        --offset;
      }
      // Stray continuation bytes are treated as single characters
      if (GetCodePointLength(static_cast<unsigned char>(text[offset])) != (text.size() - offset))
      {
        return lastOffset;
      }
      return offset;
    }
  }
}

#endif
