#ifndef DESKCALC_UI_BUTTONLAYOUT_HPP
#define DESKCALC_UI_BUTTONLAYOUT_HPP
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

#include <span>
#include <string_view>

namespace DeskCalc
{
  /// @brief Visual role of a button, selects its colors.
  enum class ButtonRole
  {
    Digit,
    Operator,
    Equals
  };

  /// @brief The engine operation a button triggers.
  enum class ButtonAction
  {
    Append,
    Backspace,
    Clear,
    Evaluate
  };

  /// @brief Describes one button of the calculator grid.
  struct ButtonSpec
  {
    // UTF-8 label, also the token appended for ButtonAction::Append
    std::string_view Label;
    int Row{0};
    int Column{0};
    int ColumnSpan{1};
    ButtonRole Role{ButtonRole::Digit};
    ButtonAction Action{ButtonAction::Append};
  };

  namespace ButtonLayout
  {
    constexpr int RowCount = 5;
    constexpr int ColumnCount = 4;

    /// @brief Gets all buttons of the grid in row major order.
    [[nodiscard]] std::span<const ButtonSpec> GetButtons() noexcept;

    /// @brief Finds the button with the given label.
    /// @return The button or nullptr if there is none.
    [[nodiscard]] const ButtonSpec* TryFindButton(std::string_view label) noexcept;

    /// @brief Maps the text produced by a key press to the button it stands for.
    ///
    /// Digits, '.', '+' and '%' map to themselves, '-' '*' '/' to − × ÷. Return and '=' map to "=",
    /// backspace to "←" and escape or delete to "C".
    /// @return The button or nullptr if the key has no button.
    [[nodiscard]] const ButtonSpec* TryMapKeyText(std::string_view keyText) noexcept;
  }
}

#endif
