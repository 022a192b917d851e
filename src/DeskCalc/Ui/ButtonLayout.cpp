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

#include <DeskCalc/Ui/ButtonLayout.hpp>
#include <array>
#include <utility>

namespace DeskCalc
{
  namespace ButtonLayout
  {
    namespace
    {
      constexpr std::string_view LabelBackspace = "\xE2\x86\x90";    // U+2190 LEFTWARDS ARROW
      constexpr std::string_view LabelDivide = "\xC3\xB7";    // U+00F7 DIVISION SIGN
      constexpr std::string_view LabelMultiply = "\xC3\x97";    // U+00D7 MULTIPLICATION SIGN
      constexpr std::string_view LabelMinus = "\xE2\x88\x92";    // U+2212 MINUS SIGN

      constexpr std::array<ButtonSpec, 19> Buttons{{
        {"C", 0, 0, 1, ButtonRole::Operator, ButtonAction::Clear},
        {LabelBackspace, 0, 1, 1, ButtonRole::Operator, ButtonAction::Backspace},
        {"%", 0, 2, 1, ButtonRole::Operator, ButtonAction::Append},
        {LabelDivide, 0, 3, 1, ButtonRole::Operator, ButtonAction::Append},
        {"7", 1, 0, 1, ButtonRole::Digit, ButtonAction::Append},
        {"8", 1, 1, 1, ButtonRole::Digit, ButtonAction::Append},
        {"9", 1, 2, 1, ButtonRole::Digit, ButtonAction::Append},
        {LabelMultiply, 1, 3, 1, ButtonRole::Operator, ButtonAction::Append},
        {"4", 2, 0, 1, ButtonRole::Digit, ButtonAction::Append},
        {"5", 2, 1, 1, ButtonRole::Digit, ButtonAction::Append},
        {"6", 2, 2, 1, ButtonRole::Digit, ButtonAction::Append},
        {LabelMinus, 2, 3, 1, ButtonRole::Operator, ButtonAction::Append},
        {"1", 3, 0, 1, ButtonRole::Digit, ButtonAction::Append},
        {"2", 3, 1, 1, ButtonRole::Digit, ButtonAction::Append},
        {"3", 3, 2, 1, ButtonRole::Digit, ButtonAction::Append},
        {"+", 3, 3, 1, ButtonRole::Operator, ButtonAction::Append},
        {"0", 4, 0, 1, ButtonRole::Digit, ButtonAction::Append},
        {".", 4, 1, 1, ButtonRole::Digit, ButtonAction::Append},
        {"=", 4, 2, 2, ButtonRole::Equals, ButtonAction::Evaluate},
      }};

      // Key text that differs from the label of the button it presses
      constexpr std::array<std::pair<std::string_view, std::string_view>, 8> KeyAliases{{
        {"-", LabelMinus},
        {"*", LabelMultiply},
        {"/", LabelDivide},
        {"\r", "="},
        {"\n", "="},
        {"\b", LabelBackspace},
        {"\x1b", "C"},
        {"\x7f", "C"},
      }};
    }

    std::span<const ButtonSpec> GetButtons() noexcept
    {
      return Buttons;
    }

    const ButtonSpec* TryFindButton(const std::string_view label) noexcept
    {
      for (const auto& button : Buttons)
      {
        if (button.Label == label)
        {
          return &button;
        }
      }
      return nullptr;
    }

    const ButtonSpec* TryMapKeyText(const std::string_view keyText) noexcept
    {
      if (keyText.empty())
      {
        return nullptr;
      }
      for (const auto& alias : KeyAliases)
      {
        if (alias.first == keyText)
        {
          return TryFindButton(alias.second);
        }
      }
      return TryFindButton(keyText);
    }
  }
}
