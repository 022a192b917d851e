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

#include <DeskCalc/Engine/ExpressionEngine.hpp>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>

namespace DeskCalc
{
  class ExpressionEngineTest : public ::testing::Test
  {
  protected:
    // Display symbols
    const std::string Minus = "\xE2\x88\x92";
    const std::string Times = "\xC3\x97";
    const std::string DividedBy = "\xC3\xB7";

    ExpressionEngine m_engine;

    // Appends each token, mirroring a sequence of button presses
    void Press(std::initializer_list<std::string> tokens)
    {
      for (const auto& token : tokens)
      {
        m_engine.Append(token);
      }
    }
  };

  // ============================================================================
  // Editing
  // ============================================================================

  TEST_F(ExpressionEngineTest, NewEngine_IsEmptyAndDisplaysZero)
  {
    EXPECT_TRUE(m_engine.IsEmpty());
    EXPECT_EQ(m_engine.GetExpression(), "");
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST_F(ExpressionEngineTest, Append_ConcatenatesTokens)
  {
    Press({"1", "2", "+", "3"});
    EXPECT_EQ(m_engine.GetExpression(), "12+3");
    EXPECT_EQ(m_engine.GetDisplayText(), "12+3");
  }

  TEST_F(ExpressionEngineTest, Append_DoesNotValidate)
  {
    Press({"5", "+", "+"});
    EXPECT_EQ(m_engine.GetExpression(), "5++");
  }

  TEST_F(ExpressionEngineTest, Backspace_RemovesLastCharacter)
  {
    Press({"1", "2", "3"});
    m_engine.Backspace();
    EXPECT_EQ(m_engine.GetExpression(), "12");
  }

  TEST_F(ExpressionEngineTest, Backspace_RemovesMultiByteOperatorWhole)
  {
    Press({"5", Times});
    m_engine.Backspace();
    EXPECT_EQ(m_engine.GetExpression(), "5");
  }

  TEST_F(ExpressionEngineTest, Backspace_StrayContinuationByte_RemovesOnlyThatByte)
  {
    m_engine.Append("5\x80\x80");
    m_engine.Backspace();
    EXPECT_EQ(m_engine.GetExpression(), "5\x80");
    m_engine.Backspace();
    EXPECT_EQ(m_engine.GetExpression(), "5");
  }

  TEST_F(ExpressionEngineTest, Backspace_OnEmpty_IsNoOp)
  {
    EXPECT_NO_THROW(m_engine.Backspace());
    EXPECT_TRUE(m_engine.IsEmpty());
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST_F(ExpressionEngineTest, Backspace_LastCharacter_DisplaysZero)
  {
    Press({"7"});
    m_engine.Backspace();
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST_F(ExpressionEngineTest, Clear_AlwaysYieldsEmpty)
  {
    m_engine.Clear();
    EXPECT_TRUE(m_engine.IsEmpty());

    Press({"9", Times, "9"});
    m_engine.Clear();
    EXPECT_TRUE(m_engine.IsEmpty());
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST(ExpressionEngine, InitialExpression)
  {
    ExpressionEngine engine("6" + std::string("\xC3\xB7") + "4");
    EXPECT_EQ(engine.GetExpression(), "6\xC3\xB7" "4");
    EXPECT_EQ(engine.Evaluate(), EvaluationResult::Success("1.5"));
  }

  // ============================================================================
  // Evaluation
  // ============================================================================

  TEST_F(ExpressionEngineTest, Evaluate_UsesStandardPrecedence)
  {
    Press({"2", "+", "3", Times, "4"});
    const auto result = m_engine.Evaluate();
    EXPECT_EQ(result, EvaluationResult::Success("14"));
    EXPECT_EQ(m_engine.GetExpression(), "14");
  }

  TEST_F(ExpressionEngineTest, Evaluate_QuarterIsDecimal)
  {
    Press({"1", DividedBy, "4"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("0.25"));
    EXPECT_EQ(m_engine.GetDisplayText(), "0.25");
  }

  TEST_F(ExpressionEngineTest, Evaluate_IntegralQuotientHasNoDecimalPoint)
  {
    Press({"4", DividedBy, "2"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("2"));
    EXPECT_EQ(m_engine.GetDisplayText(), "2");
  }

  TEST_F(ExpressionEngineTest, Evaluate_Chaining)
  {
    Press({"2", "+", "2"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("4"));
    EXPECT_EQ(m_engine.GetExpression(), "4");

    m_engine.Append("+1");
    EXPECT_EQ(m_engine.GetExpression(), "4+1");
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("5"));
    EXPECT_EQ(m_engine.GetExpression(), "5");
  }

  TEST_F(ExpressionEngineTest, Evaluate_ChainingFromNegativeResult)
  {
    Press({"2", Minus, "5"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("-3"));

    Press({Times, "2"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("-6"));
  }

  TEST_F(ExpressionEngineTest, Evaluate_ChainingFromDecimalResult)
  {
    Press({"1", DividedBy, "4"});
    ASSERT_TRUE(m_engine.Evaluate().IsSuccess());

    Press({Times, "8"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("2"));
  }

  TEST_F(ExpressionEngineTest, Evaluate_Percent)
  {
    Press({"1", "0", "%", "4"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("2"));
  }

  TEST_F(ExpressionEngineTest, Evaluate_IsRepeatableOnResult)
  {
    Press({"3", Times, "3"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("9"));
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("9"));
  }

  // ============================================================================
  // Evaluation failures
  // ============================================================================

  TEST_F(ExpressionEngineTest, Evaluate_DivisionByZero_ResetsExpression)
  {
    Press({"5", DividedBy, "0"});
    const auto result = m_engine.Evaluate();
    EXPECT_EQ(result.Status, EvaluationStatus::DivisionByZero);
    EXPECT_FALSE(result.Text.empty());
    EXPECT_TRUE(m_engine.IsEmpty());
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST_F(ExpressionEngineTest, Evaluate_ModuloByZero_IsDivisionByZero)
  {
    Press({"5", "%", "0"});
    EXPECT_EQ(m_engine.Evaluate().Status, EvaluationStatus::DivisionByZero);
    EXPECT_TRUE(m_engine.IsEmpty());
  }

  TEST_F(ExpressionEngineTest, Evaluate_ModuloBeyondPrecision_IsEvaluationError)
  {
    m_engine.Append("1" + std::string(100, '0'));
    Press({"%", "7"});
    const auto result = m_engine.Evaluate();
    EXPECT_EQ(result.Status, EvaluationStatus::EvaluationError);
    EXPECT_EQ(result.Text, "Operand is too large for %");
    EXPECT_TRUE(m_engine.IsEmpty());
    EXPECT_EQ(m_engine.GetDisplayText(), "0");
  }

  TEST_F(ExpressionEngineTest, Evaluate_TrailingOperator_ResetsExpression)
  {
    Press({"5", "+"});
    EXPECT_EQ(m_engine.Evaluate().Status, EvaluationStatus::InvalidExpression);
    EXPECT_TRUE(m_engine.IsEmpty());
  }

  TEST_F(ExpressionEngineTest, Evaluate_Empty_IsInvalidExpression)
  {
    EXPECT_EQ(m_engine.Evaluate().Status, EvaluationStatus::InvalidExpression);
    EXPECT_TRUE(m_engine.IsEmpty());
  }

  TEST_F(ExpressionEngineTest, Evaluate_UnknownText_IsInvalidExpression)
  {
    m_engine.Append("abc");
    EXPECT_EQ(m_engine.Evaluate().Status, EvaluationStatus::InvalidExpression);
    EXPECT_TRUE(m_engine.IsEmpty());
  }

  TEST_F(ExpressionEngineTest, Evaluate_AfterFailure_InputStartsOver)
  {
    Press({"5", "+"});
    ASSERT_FALSE(m_engine.Evaluate().IsSuccess());

    Press({"7", Times, "6"});
    EXPECT_EQ(m_engine.Evaluate(), EvaluationResult::Success("42"));
  }
}
