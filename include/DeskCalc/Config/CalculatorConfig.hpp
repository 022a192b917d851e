#ifndef DESKCALC_CONFIG_CALCULATORCONFIG_HPP
#define DESKCALC_CONFIG_CALCULATORCONFIG_HPP
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

#include <string_view>

namespace DeskCalc
{
  namespace Config
  {
    // Result formatting
    constexpr int RESULT_DECIMAL_PLACES = 10;

    // Text shown by the display when the expression is empty
    constexpr std::string_view EMPTY_DISPLAY_TEXT = "0";

    // Window
    constexpr std::string_view WINDOW_TITLE = "Simple Calculator";
    constexpr int WINDOW_WIDTH = 400;
    constexpr int WINDOW_HEIGHT = 500;
    constexpr int WINDOW_PADDING = 10;
    constexpr int BUTTON_SPACING = 5;

    // Theme colors
    constexpr std::string_view BACKGROUND_COLOR = "#2c3e50";
    constexpr std::string_view DISPLAY_COLOR = "#ecf0f1";
    constexpr std::string_view BUTTON_COLOR = "#34495e";
    constexpr std::string_view BUTTON_HOVER_COLOR = "#1a252f";
    constexpr std::string_view OPERATOR_COLOR = "#e74c3c";
    constexpr std::string_view EQUALS_COLOR = "#27ae60";
    constexpr std::string_view BUTTON_TEXT_COLOR = "white";

    // Fonts (point sizes)
    constexpr std::string_view FONT_FAMILY = "Arial";
    constexpr int DISPLAY_FONT_SIZE = 28;
    constexpr int BUTTON_FONT_SIZE = 18;
    constexpr int BUTTON_PADDING = 20;
    constexpr int DISPLAY_BORDER_WIDTH = 5;

    // Error dialog
    constexpr std::string_view ERROR_DIALOG_TITLE = "Error";
  }
}

#endif
