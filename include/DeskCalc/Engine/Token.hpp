#ifndef DESKCALC_ENGINE_TOKEN_HPP
#define DESKCALC_ENGINE_TOKEN_HPP
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
#include <string>

namespace DeskCalc
{
  enum class TokenType
  {
    Number,
    Plus,
    Minus,
    Multiply,
    Divide,
    Modulo,
    End
  };

  /// @brief A lexical token of an arithmetic expression.
  struct Token
  {
    TokenType Type{TokenType::End};
    // The source text of the token (for Number the literal, for operators the symbol as written)
    std::string Text;
    // Byte offset of the token in the expression
    std::size_t Position{0};

    bool operator==(const Token& other) const = default;
  };
}

#endif
