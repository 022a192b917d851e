#ifndef DESKCALC_ENGINE_EXPRESSIONENGINE_HPP
#define DESKCALC_ENGINE_EXPRESSIONENGINE_HPP
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

#include <DeskCalc/Engine/EvaluationResult.hpp>
#include <DeskCalc/Engine/ExpressionEvaluator.hpp>
#include <string>
#include <string_view>

namespace DeskCalc
{
  /// @brief Owns the expression being edited and applies the calculator operations to it.
  ///
  /// The expression is not validated while it is being built, errors surface when Evaluate is called.
  /// A successful evaluation replaces the expression with the formatted result so input can continue from it.
  /// A failed evaluation clears the expression.
  class ExpressionEngine
  {
    std::string m_expression;
    ExpressionEvaluator m_evaluator;

  public:
    ExpressionEngine() = default;

    /// @brief Constructs an engine with an initial expression.
    explicit ExpressionEngine(std::string expression);

    /// @brief Appends a digit, decimal point or operator symbol (or any other text) to the expression.
    void Append(std::string_view token);

    /// @brief Removes the last character. Does nothing if the expression is empty.
    void Backspace();

    /// @brief Resets the expression to empty.
    void Clear();

    /// @brief Evaluates the current expression.
    ///
    /// On success the expression becomes the formatted result, on failure it is cleared.
    /// @return The formatted value or the error classification.
    EvaluationResult Evaluate();

    [[nodiscard]] const std::string& GetExpression() const noexcept
    {
      return m_expression;
    }

    [[nodiscard]] bool IsEmpty() const noexcept
    {
      return m_expression.empty();
    }

    /// @brief Gets the text to display, the expression or "0" when it is empty.
    [[nodiscard]] std::string GetDisplayText() const;

  private:
    EvaluationResult Fail(EvaluationStatus status, const char* const pszDescription);
  };
}

#endif
