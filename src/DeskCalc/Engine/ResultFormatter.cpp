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

#include <DeskCalc/Engine/ResultFormatter.hpp>
#include <DeskCalc/Exception/ExpressionException.hpp>
#include <fmt/format.h>
#include <ios>
#include <stdexcept>

namespace DeskCalc
{
  std::string FormatResult(const Number& value, const int decimalPlaces)
  {
    if (decimalPlaces < 0)
    {
      throw std::invalid_argument(fmt::format("decimalPlaces must be non-negative, got {}", decimalPlaces));
    }
    if (!boost::multiprecision::isfinite(value))
    {
      throw EvaluationException("The result is not a finite number");
    }

    const Number scale = boost::multiprecision::pow(Number(10), decimalPlaces);
    const Number scaled = boost::multiprecision::round(Number(value * scale));
    const Number rounded = scaled / scale;
    if (rounded == 0)
    {
      // Also covers negative zero
      return "0";
    }

    std::string text = rounded.str(decimalPlaces, std::ios_base::fixed);
    const auto decimalPoint = text.find('.');
    if (decimalPoint != std::string::npos)
    {
      const auto lastSignificant = text.find_last_not_of('0');
      text.erase(lastSignificant == decimalPoint ? decimalPoint : lastSignificant + 1);
    }
    return text;
  }
}
