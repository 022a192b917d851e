#ifndef DESKCALC_ENGINE_EXPRESSIONEVALUATOR_HPP
#define DESKCALC_ENGINE_EXPRESSIONEVALUATOR_HPP
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

#include <DeskCalc/Engine/Number.hpp>
#include <DeskCalc/Engine/Token.hpp>
#include <string_view>
#include <vector>

namespace DeskCalc
{
  /// @brief Evaluates arithmetic expressions with a recursive descent parser.
  ///
  /// Grammar:
  /// @code
  ///   expression := term (('+' | '−') term)*
  ///   term       := factor (('×' | '÷' | '%') factor)*
  ///   factor     := ('+' | '−') factor | number
  /// @endcode
  /// '%' is a floored modulo, the result takes the sign of the divisor.
  class ExpressionEvaluator
  {
  public:
    /// @brief Evaluates the expression.
    /// @param expression UTF-8 encoded expression text.
    /// @return The value of the expression.
    /// @throws DivisionByZeroException if a division or modulo has a zero right operand.
    /// @throws InvalidExpressionException if the expression is malformed.
    /// @throws EvaluationException if the result is not a finite number.
    [[nodiscard]] Number Evaluate(std::string_view expression) const;

    /// @brief Evaluates an already tokenized expression.
    /// @param tokens Tokens terminated by a TokenType::End token.
    [[nodiscard]] Number Evaluate(const std::vector<Token>& tokens) const;
  };
}

#endif
