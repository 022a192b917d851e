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

#include <DeskCalc/Engine/ExpressionTokenizer.hpp>
#include <DeskCalc/Engine/Utf8.hpp>
#include <DeskCalc/Exception/ExpressionException.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace DeskCalc
{
  namespace
  {
    struct OperatorSymbol
    {
      std::string_view Symbol;
      TokenType Type;
    };

    // Display symbols (UTF-8) and their ASCII aliases
    constexpr std::array<OperatorSymbol, 8> OperatorSymbols{{
      {"+", TokenType::Plus},
      {"\xE2\x88\x92", TokenType::Minus},    // U+2212 MINUS SIGN
      {"-", TokenType::Minus},
      {"\xC3\x97", TokenType::Multiply},    // U+00D7 MULTIPLICATION SIGN
      {"*", TokenType::Multiply},
      {"\xC3\xB7", TokenType::Divide},    // U+00F7 DIVISION SIGN
      {"/", TokenType::Divide},
      {"%", TokenType::Modulo},
    }};

    constexpr bool IsDigit(const char ch) noexcept
    {
      return ch >= '0' && ch <= '9';
    }

    const OperatorSymbol* TryMatchOperator(const std::string_view remaining) noexcept
    {
      for (const auto& entry : OperatorSymbols)
      {
        if (remaining.substr(0, entry.Symbol.size()) == entry.Symbol)
        {
          return &entry;
        }
      }
      return nullptr;
    }

    Token ReadNumber(const std::string_view expression, std::size_t& rPosition)
    {
      const std::size_t start = rPosition;
      std::size_t decimalPointCount = 0;
      bool hasDigits = false;
      while (rPosition < expression.size())
      {
        const char ch = expression[rPosition];
        if (IsDigit(ch))
        {
          hasDigits = true;
        }
        else if (ch == '.')
        {
          ++decimalPointCount;
        }
        else
        {
          break;
        }
        ++rPosition;
      }

      std::string text(expression.substr(start, rPosition - start));
      if (!hasDigits || decimalPointCount > 1)
      {
        throw InvalidExpressionException(fmt::format("Malformed number '{}'", text), start);
      }
      // An integer literal may not have leading zeros unless it is all zeros ("0", "00")
      if (decimalPointCount == 0 && text.size() > 1 && text.front() == '0' && text.find_first_not_of('0') != std::string::npos)
      {
        throw InvalidExpressionException(fmt::format("Leading zeros are not permitted in '{}'", text), start);
      }
      return Token{TokenType::Number, std::move(text), start};
    }
  }

  std::vector<Token> Tokenize(const std::string_view expression)
  {
    std::vector<Token> tokens;
    std::size_t position = 0;
    while (position < expression.size())
    {
      const char ch = expression[position];
      if (std::isspace(static_cast<unsigned char>(ch)) != 0)
      {
        ++position;
      }
      else if (IsDigit(ch) || ch == '.')
      {
        tokens.push_back(ReadNumber(expression, position));
      }
      else if (const OperatorSymbol* pOperator = TryMatchOperator(expression.substr(position)))
      {
        tokens.push_back(Token{pOperator->Type, std::string(pOperator->Symbol), position});
        position += pOperator->Symbol.size();
      }
      else
      {
        const std::size_t length = std::min(Utf8::GetCodePointLength(static_cast<unsigned char>(ch)), expression.size() - position);
        throw InvalidExpressionException(fmt::format("Unexpected character '{}'", expression.substr(position, length)), position);
      }
    }
    tokens.push_back(Token{TokenType::End, std::string(), expression.size()});
    return tokens;
  }
}
