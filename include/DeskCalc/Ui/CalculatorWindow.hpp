#ifndef DESKCALC_UI_CALCULATORWINDOW_HPP
#define DESKCALC_UI_CALCULATORWINDOW_HPP
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
#include <DeskCalc/Ui/ButtonLayout.hpp>
#include <QWidget>

class QBoxLayout;
class QGridLayout;
class QKeyEvent;
class QLabel;

namespace DeskCalc
{
  /// @brief The calculator window: a display label above the button grid.
  ///
  /// The window only renders the engine state and forwards user input to the engine operations,
  /// it never edits the expression itself. Failed evaluations are reported with a modal message box.
  class CalculatorWindow : public QWidget
  {
    Q_OBJECT

  public:
    /// @brief Constructs the window.
    /// @param engine The engine to drive, must outlive the window.
    /// @param parent Optional parent widget.
    explicit CalculatorWindow(ExpressionEngine& engine, QWidget* parent = nullptr);

  signals:
    /// @brief Emitted after the display text changed.
    void DisplayChanged(const QString& text);

  protected:
    void keyPressEvent(QKeyEvent* event) override;

  private:
    void CreateDisplay(QBoxLayout* pRootLayout);
    void CreateButtons(QBoxLayout* pRootLayout);
    void CreateButton(QGridLayout* pLayout, const ButtonSpec& spec);
    void OnButtonPressed(const ButtonSpec& spec);
    void RefreshDisplay();
    void ShowError(const EvaluationResult& result);

    ExpressionEngine& m_engine;
    QLabel* m_display{nullptr};
  };
}

#endif
