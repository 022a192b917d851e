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
#include <gtest/gtest.h>
#include <stdexcept>

namespace DeskCalc
{
  TEST(ErrorMessage, DivisionByZero)
  {
    EXPECT_EQ(GetErrorMessage(EvaluationResult::Failure(EvaluationStatus::DivisionByZero, "Division by zero")), "Cannot divide by zero!");
  }

  TEST(ErrorMessage, InvalidExpression)
  {
    EXPECT_EQ(GetErrorMessage(EvaluationResult::Failure(EvaluationStatus::InvalidExpression, "Unexpected end of expression at position 2")),
              "Invalid expression! Please check your input.");
  }

  TEST(ErrorMessage, EvaluationError_IncludesDescription)
  {
    EXPECT_EQ(GetErrorMessage(EvaluationResult::Failure(EvaluationStatus::EvaluationError, "The result is not a finite number")),
              "An error occurred: The result is not a finite number");
  }

  TEST(ErrorMessage, Success_Throws)
  {
    EXPECT_THROW((void)GetErrorMessage(EvaluationResult::Success("1")), std::invalid_argument);
  }
}
