#ifndef DESKCALC_ENGINE_EVALUATIONSTATUS_HPP
#define DESKCALC_ENGINE_EVALUATIONSTATUS_HPP
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

#include <string_view>

namespace DeskCalc
{
  /// @brief Outcome classification of an expression evaluation.
  enum class EvaluationStatus
  {
    /// @brief The expression was evaluated.
    Success = 0,

    /// @brief A division or modulo had a zero right operand.
    DivisionByZero = 1,

    /// @brief The expression was syntactically malformed (trailing operator, empty expression, unknown characters).
    InvalidExpression = 2,

    /// @brief Any other evaluation failure.
    EvaluationError = 3
  };

  [[nodiscard]] constexpr std::string_view ToString(const EvaluationStatus status) noexcept
  {
    switch (status)
    {
    case EvaluationStatus::Success:
      return "Success";
    case EvaluationStatus::DivisionByZero:
      return "DivisionByZero";
    case EvaluationStatus::InvalidExpression:
      return "InvalidExpression";
    case EvaluationStatus::EvaluationError:
      return "EvaluationError";
    default:
      return "Unknown";
    }
  }
}

#endif
