#ifndef DESKCALC_ENGINE_EXPRESSIONTOKENIZER_HPP
#define DESKCALC_ENGINE_EXPRESSIONTOKENIZER_HPP
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

#include <DeskCalc/Engine/Token.hpp>
#include <string_view>
#include <vector>

namespace DeskCalc
{
  /// @brief Splits an arithmetic expression into tokens.
  ///
  /// Recognizes decimal numbers and the operators + − × ÷ % (the ASCII forms - * / are accepted as aliases).
  /// Whitespace is skipped. The returned sequence always ends with a TokenType::End token.
  /// @param expression UTF-8 encoded expression text.
  /// @return The tokens.
  /// @throws InvalidExpressionException on an unknown character or a malformed number.
  [[nodiscard]] std::vector<Token> Tokenize(std::string_view expression);
}

#endif
