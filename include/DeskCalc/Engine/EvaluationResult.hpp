#ifndef DESKCALC_ENGINE_EVALUATIONRESULT_HPP
#define DESKCALC_ENGINE_EVALUATIONRESULT_HPP
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

#include <DeskCalc/Engine/EvaluationStatus.hpp>
#include <string>
#include <utility>

namespace DeskCalc
{
  /// @brief Represents the result of an evaluation, either a formatted value or an error classification.
  struct EvaluationResult
  {
    EvaluationStatus Status{EvaluationStatus::Success};
    // The formatted value on success, otherwise a description of the failure
    std::string Text;

    EvaluationResult() = default;

    EvaluationResult(EvaluationStatus status, std::string text)
      : Status(status)
      , Text(std::move(text))
    {
    }

    [[nodiscard]] bool IsSuccess() const noexcept
    {
      return Status == EvaluationStatus::Success;
    }

    /// @brief Create a successful result.
    /// @param formattedValue The formatted value.
    [[nodiscard]] static EvaluationResult Success(std::string formattedValue)
    {
      return EvaluationResult(EvaluationStatus::Success, std::move(formattedValue));
    }

    /// @brief Create a failed result.
    /// @param status The error classification, must not be EvaluationStatus::Success.
    /// @param description Description of the failure.
    [[nodiscard]] static EvaluationResult Failure(EvaluationStatus status, std::string description)
    {
      return EvaluationResult(status, std::move(description));
    }

    bool operator==(const EvaluationResult& other) const = default;
  };
}

#endif
