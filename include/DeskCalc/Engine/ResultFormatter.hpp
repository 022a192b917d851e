#ifndef DESKCALC_ENGINE_RESULTFORMATTER_HPP
#define DESKCALC_ENGINE_RESULTFORMATTER_HPP
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
#include <DeskCalc/Engine/Number.hpp>
#include <string>

namespace DeskCalc
{
  /// @brief Formats a computed value for the display.
  ///
  /// The value is rounded to the given number of decimal places. Integral values are rendered without a decimal point,
  /// other values as plain decimals without trailing zeros. Negative zero is rendered as "0".
  /// @param value The value to format.
  /// @param decimalPlaces Number of decimal places to round to.
  /// @return The formatted value.
  /// @throws EvaluationException if the value is not finite.
  [[nodiscard]] std::string FormatResult(const Number& value, int decimalPlaces = Config::RESULT_DECIMAL_PLACES);
}

#endif
