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

#include <DeskCalc/Config/CalculatorConfig.hpp>
#include <DeskCalc/Engine/ExpressionEngine.hpp>
#include <DeskCalc/Engine/ResultFormatter.hpp>
#include <DeskCalc/Engine/Utf8.hpp>
#include <DeskCalc/Exception/ExpressionException.hpp>
#include <DeskCalc/Log/SpdLogHelper.hpp>
#include <exception>
#include <utility>

namespace DeskCalc
{
  namespace
  {
    DESKCALC_LOGGER_NAME(ExpressionEngine);

    auto GetLog()
    {
      return SpdLogHelper::GetLogger<LoggerName_ExpressionEngine>();
    }
  }

  ExpressionEngine::ExpressionEngine(std::string expression)
    : m_expression(std::move(expression))
  {
  }

  void ExpressionEngine::Append(const std::string_view token)
  {
    m_expression.append(token);
    GetLog()->debug("Append '{}' -> '{}'", token, m_expression);
  }

  void ExpressionEngine::Backspace()
  {
    if (m_expression.empty())
    {
      return;
    }
    m_expression.erase(Utf8::GetLastCodePointOffset(m_expression));
    GetLog()->debug("Backspace -> '{}'", m_expression);
  }

  void ExpressionEngine::Clear()
  {
    m_expression.clear();
    GetLog()->debug("Clear");
  }

  EvaluationResult ExpressionEngine::Evaluate()
  {
    GetLog()->info("Evaluating: '{}'", m_expression);
    try
    {
      const Number value = m_evaluator.Evaluate(m_expression);
      std::string formatted = FormatResult(value);
      GetLog()->info("Result: {}", formatted);

      // Input continues from the result
      m_expression = formatted;
      return EvaluationResult::Success(std::move(formatted));
    }
    catch (const DivisionByZeroException& ex)
    {
      return Fail(EvaluationStatus::DivisionByZero, ex.what());
    }
    catch (const InvalidExpressionException& ex)
    {
      return Fail(EvaluationStatus::InvalidExpression, ex.what());
    }
    catch (const std::exception& ex)
    {
      return Fail(EvaluationStatus::EvaluationError, ex.what());
    }
  }

  std::string ExpressionEngine::GetDisplayText() const
  {
    return m_expression.empty() ? std::string(Config::EMPTY_DISPLAY_TEXT) : m_expression;
  }

  EvaluationResult ExpressionEngine::Fail(const EvaluationStatus status, const char* const pszDescription)
  {
    GetLog()->warn("Evaluation of '{}' failed ({}): {}", m_expression, ToString(status), pszDescription);
    m_expression.clear();
    return EvaluationResult::Failure(status, pszDescription);
  }
}
