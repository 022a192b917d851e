#ifndef DESKCALC_EXCEPTION_EXPRESSIONEXCEPTION_HPP
#define DESKCALC_EXCEPTION_EXPRESSIONEXCEPTION_HPP
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

#include <fmt/format.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace DeskCalc
{
  /// @brief Base class for all failures raised while evaluating an expression.
  class ExpressionException : public std::runtime_error
  {
  public:
    explicit ExpressionException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };

  /// @brief Exception thrown when a division or modulo has a zero right operand.
  class DivisionByZeroException : public ExpressionException
  {
  public:
    DivisionByZeroException()
      : ExpressionException("Division by zero")
    {
    }
  };

  /// @brief Exception thrown when the expression text does not match the arithmetic grammar.
  ///
  /// The position is the byte offset into the expression where the problem was detected.
  class InvalidExpressionException : public ExpressionException
  {
    std::size_t m_position;

  public:
    InvalidExpressionException(const std::string& reason, const std::size_t position)
      : ExpressionException(fmt::format("Invalid expression: {} at position {}", reason, position))
      , m_position(position)
    {
    }

    [[nodiscard]] std::size_t GetPosition() const noexcept
    {
      return m_position;
    }
  };

  /// @brief Exception thrown for evaluation failures that are neither a division by zero nor a syntax error.
  class EvaluationException : public ExpressionException
  {
  public:
    explicit EvaluationException(const std::string& message)
      : ExpressionException(message)
    {
    }
  };
}

#endif
