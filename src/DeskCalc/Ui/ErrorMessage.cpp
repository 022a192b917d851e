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

#include <DeskCalc/Ui/ErrorMessage.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace DeskCalc
{
  std::string GetErrorMessage(const EvaluationResult& result)
  {
    switch (result.Status)
    {
    case EvaluationStatus::DivisionByZero:
      return "Cannot divide by zero!";
    case EvaluationStatus::InvalidExpression:
      return "Invalid expression! Please check your input.";
    case EvaluationStatus::EvaluationError:
      return fmt::format("An error occurred: {}", result.Text);
    case EvaluationStatus::Success:
    default:
      throw std::invalid_argument(fmt::format("No error message for evaluation status {}", ToString(result.Status)));
    }
  }
}
