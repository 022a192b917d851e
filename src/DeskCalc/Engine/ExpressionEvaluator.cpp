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

#include <DeskCalc/Engine/ExpressionEvaluator.hpp>
#include <DeskCalc/Engine/ExpressionTokenizer.hpp>
#include <DeskCalc/Exception/ExpressionException.hpp>
#include <DeskCalc/Log/SpdLogHelper.hpp>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>
#include <string>

namespace DeskCalc
{
  namespace
  {
    DESKCALC_LOGGER_NAME(ExpressionEvaluator);

    // Parser context - local to each evaluation
    class ParserContext
    {
      const std::vector<Token>& m_tokens;
      std::size_t m_index{0};

    public:
      explicit ParserContext(const std::vector<Token>& tokens)
        : m_tokens(tokens)
      {
      }

      const Token& Peek() const
      {
        return m_tokens[m_index];
      }

      const Token& Consume()
      {
        const Token& token = m_tokens[m_index];
        if (token.Type != TokenType::End)
        {
          ++m_index;
        }
        return token;
      }
    };

    Number ToNumber(const Token& token)
    {
      // "5." and ".5" are valid literals
      std::string literal = token.Text;
      if (literal.front() == '.')
      {
        literal.insert(literal.begin(), '0');
      }
      if (literal.back() == '.')
      {
        literal.push_back('0');
      }
      return Number(literal.c_str());
    }

    Number Divide(const Number& lhs, const Number& rhs)
    {
      if (rhs == 0)
      {
        throw DivisionByZeroException();
      }
      return Number(lhs / rhs);
    }

    // Floored modulo, the result takes the sign of the divisor
    Number Modulo(const Number& lhs, const Number& rhs)
    {
      if (rhs == 0)
      {
        throw DivisionByZeroException();
      }
      // The remainder is only meaningful while the quotient fits the available precision
      static const Number MaxQuotient = boost::multiprecision::pow(Number(10), std::numeric_limits<Number>::digits10);
      if (boost::multiprecision::abs(lhs / rhs) >= MaxQuotient)
      {
        throw EvaluationException("Operand is too large for %");
      }
      Number result = boost::multiprecision::fmod(lhs, rhs);
      if (result != 0 && ((result < 0) != (rhs < 0)))
      {
        result += rhs;
      }
      return result;
    }

    // factor := ('+' | '−') factor | number
    Number ParseFactor(ParserContext& ctx)
    {
      bool negate = false;
      while (ctx.Peek().Type == TokenType::Plus || ctx.Peek().Type == TokenType::Minus)
      {
        if (ctx.Consume().Type == TokenType::Minus)
        {
          negate = !negate;
        }
      }

      const Token& token = ctx.Consume();
      switch (token.Type)
      {
      case TokenType::Number:
      {
        const Number value = ToNumber(token);
        return negate ? Number(-value) : value;
      }
      case TokenType::End:
        throw InvalidExpressionException("Unexpected end of expression", token.Position);
      default:
        throw InvalidExpressionException(fmt::format("Unexpected operator '{}'", token.Text), token.Position);
      }
    }

    // term := factor (('×' | '÷' | '%') factor)*
    Number ParseTerm(ParserContext& ctx)
    {
      Number left = ParseFactor(ctx);
      while (true)
      {
        const TokenType op = ctx.Peek().Type;
        if (op == TokenType::Multiply)
        {
          ctx.Consume();
          const Number right = ParseFactor(ctx);
          left = Number(left * right);
        }
        else if (op == TokenType::Divide)
        {
          ctx.Consume();
          const Number right = ParseFactor(ctx);
          left = Divide(left, right);
        }
        else if (op == TokenType::Modulo)
        {
          ctx.Consume();
          const Number right = ParseFactor(ctx);
          left = Modulo(left, right);
        }
        else
        {
          break;
        }
      }
      return left;
    }

    // expression := term (('+' | '−') term)*
    Number ParseExpression(ParserContext& ctx)
    {
      Number left = ParseTerm(ctx);
      while (true)
      {
        const TokenType op = ctx.Peek().Type;
        if (op == TokenType::Plus)
        {
          ctx.Consume();
          const Number right = ParseTerm(ctx);
          left = Number(left + right);
        }
        else if (op == TokenType::Minus)
        {
          ctx.Consume();
          const Number right = ParseTerm(ctx);
          left = Number(left - right);
        }
        else
        {
          break;
        }
      }
      return left;
    }
  }

  Number ExpressionEvaluator::Evaluate(const std::string_view expression) const
  {
    SpdLogHelper::GetLogger<LoggerName_ExpressionEvaluator>()->trace("Tokenizing '{}'", expression);
    return Evaluate(Tokenize(expression));
  }

  Number ExpressionEvaluator::Evaluate(const std::vector<Token>& tokens) const
  {
    if (tokens.empty() || tokens.back().Type != TokenType::End)
    {
      throw std::invalid_argument("The token sequence must be terminated by an End token");
    }
    if (tokens.size() == 1)
    {
      throw InvalidExpressionException("Expression is empty", tokens.back().Position);
    }

    ParserContext ctx(tokens);
    const Number result = ParseExpression(ctx);

    // Check that the entire expression was consumed
    const Token& trailing = ctx.Peek();
    if (trailing.Type != TokenType::End)
    {
      throw InvalidExpressionException(fmt::format("Unexpected '{}'", trailing.Text), trailing.Position);
    }
    if (!boost::multiprecision::isfinite(result))
    {
      throw EvaluationException("The result is not a finite number");
    }

    SpdLogHelper::GetLogger<LoggerName_ExpressionEvaluator>()->trace("Evaluated {} tokens to {}", tokens.size() - 1, result.str());
    return result;
  }
}
