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
#include <DeskCalc/Log/SpdLogHelper.hpp>
#include <DeskCalc/Ui/CalculatorWindow.hpp>
#include <DeskCalc/Ui/ErrorMessage.hpp>
#include <fmt/format.h>
#include <QByteArray>
#include <QColor>
#include <QFont>
#include <QFrame>
#include <QGridLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QMessageBox>
#include <QPalette>
#include <QPushButton>
#include <QSizePolicy>
#include <QVBoxLayout>
#include <string_view>

namespace DeskCalc
{
  namespace
  {
    DESKCALC_LOGGER_NAME(CalculatorWindow);

    QString ToQString(const std::string_view text)
    {
      return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    }

    QColor ToQColor(const std::string_view color)
    {
      return QColor(ToQString(color));
    }

    QFont CreateBoldFont(const int pointSize)
    {
      QFont font(ToQString(Config::FONT_FAMILY), pointSize);
      font.setBold(true);
      return font;
    }

    std::string_view GetBackgroundColor(const ButtonRole role) noexcept
    {
      switch (role)
      {
      case ButtonRole::Operator:
        return Config::OPERATOR_COLOR;
      case ButtonRole::Equals:
        return Config::EQUALS_COLOR;
      case ButtonRole::Digit:
      default:
        return Config::BUTTON_COLOR;
      }
    }

    std::string_view GetTextColor(const ButtonRole role) noexcept
    {
      return role == ButtonRole::Digit ? Config::DISPLAY_COLOR : Config::BUTTON_TEXT_COLOR;
    }

    QString BuildButtonStyleSheet(const ButtonRole role)
    {
      return ToQString(fmt::format("QPushButton {{ background-color: {}; color: {}; border: none; padding: {}px; }}"
                                   " QPushButton:hover, QPushButton:pressed {{ background-color: {}; color: {}; }}",
                                   GetBackgroundColor(role), GetTextColor(role), Config::BUTTON_PADDING, Config::BUTTON_HOVER_COLOR,
                                   Config::BUTTON_TEXT_COLOR));
    }
  }

  CalculatorWindow::CalculatorWindow(ExpressionEngine& engine, QWidget* parent)
    : QWidget(parent)
    , m_engine(engine)
  {
    setWindowTitle(ToQString(Config::WINDOW_TITLE));
    setFixedSize(Config::WINDOW_WIDTH, Config::WINDOW_HEIGHT);
    setFocusPolicy(Qt::StrongFocus);

    QPalette windowPalette = palette();
    windowPalette.setColor(QPalette::Window, ToQColor(Config::BACKGROUND_COLOR));
    setPalette(windowPalette);
    setAutoFillBackground(true);

    auto* pRootLayout = new QVBoxLayout(this);
    pRootLayout->setContentsMargins(Config::WINDOW_PADDING, Config::WINDOW_PADDING, Config::WINDOW_PADDING, Config::WINDOW_PADDING);
    pRootLayout->setSpacing(Config::WINDOW_PADDING * 2);

    CreateDisplay(pRootLayout);
    CreateButtons(pRootLayout);

    SpdLogHelper::GetLogger<LoggerName_CalculatorWindow>()->debug("Window created");
  }

  void CalculatorWindow::keyPressEvent(QKeyEvent* event)
  {
    const ButtonSpec* pSpec = nullptr;
    switch (event->key())
    {
    case Qt::Key_Enter:
    case Qt::Key_Return:
      pSpec = ButtonLayout::TryMapKeyText("\r");
      break;
    case Qt::Key_Backspace:
      pSpec = ButtonLayout::TryMapKeyText("\b");
      break;
    case Qt::Key_Escape:
    case Qt::Key_Delete:
      pSpec = ButtonLayout::TryMapKeyText("\x1b");
      break;
    default:
    {
      const QByteArray text = event->text().toUtf8();
      pSpec = ButtonLayout::TryMapKeyText(std::string_view(text.constData(), static_cast<std::size_t>(text.size())));
      break;
    }
    }

    if (pSpec == nullptr)
    {
      QWidget::keyPressEvent(event);
      return;
    }
    OnButtonPressed(*pSpec);
  }

  void CalculatorWindow::CreateDisplay(QBoxLayout* pRootLayout)
  {
    auto* pFrame = new QFrame(this);
    pFrame->setFrameStyle(QFrame::Panel | QFrame::Sunken);
    pFrame->setLineWidth(Config::DISPLAY_BORDER_WIDTH);
    pFrame->setAutoFillBackground(true);
    QPalette framePalette = pFrame->palette();
    framePalette.setColor(QPalette::Window, ToQColor(Config::DISPLAY_COLOR));
    pFrame->setPalette(framePalette);

    m_display = new QLabel(ToQString(m_engine.GetDisplayText()), pFrame);
    m_display->setFont(CreateBoldFont(Config::DISPLAY_FONT_SIZE));
    m_display->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    m_display->setContentsMargins(Config::WINDOW_PADDING, Config::WINDOW_PADDING, Config::WINDOW_PADDING, Config::WINDOW_PADDING);
    QPalette labelPalette = m_display->palette();
    labelPalette.setColor(QPalette::WindowText, ToQColor(Config::BACKGROUND_COLOR));
    m_display->setPalette(labelPalette);

    auto* pFrameLayout = new QVBoxLayout(pFrame);
    pFrameLayout->setContentsMargins(0, 0, 0, 0);
    pFrameLayout->addWidget(m_display);
    pRootLayout->addWidget(pFrame, 0);
  }

  void CalculatorWindow::CreateButtons(QBoxLayout* pRootLayout)
  {
    auto* pGrid = new QGridLayout();
    pGrid->setSpacing(Config::BUTTON_SPACING * 2);
    for (const ButtonSpec& spec : ButtonLayout::GetButtons())
    {
      CreateButton(pGrid, spec);
    }
    for (int row = 0; row < ButtonLayout::RowCount; ++row)
    {
      pGrid->setRowStretch(row, 1);
    }
    for (int column = 0; column < ButtonLayout::ColumnCount; ++column)
    {
      pGrid->setColumnStretch(column, 1);
    }
    pRootLayout->addLayout(pGrid, 1);
  }

  void CalculatorWindow::CreateButton(QGridLayout* pLayout, const ButtonSpec& spec)
  {
    auto* pButton = new QPushButton(ToQString(spec.Label), this);
    pButton->setFont(CreateBoldFont(Config::BUTTON_FONT_SIZE));
    pButton->setStyleSheet(BuildButtonStyleSheet(spec.Role));
    pButton->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    // Keyboard input is handled by the window
    pButton->setFocusPolicy(Qt::NoFocus);

    // ButtonSpec entries live in the static button table
    const ButtonSpec* pSpec = &spec;
    connect(pButton, &QPushButton::clicked, this, [this, pSpec]() { OnButtonPressed(*pSpec); });

    pLayout->addWidget(pButton, spec.Row, spec.Column, 1, spec.ColumnSpan);
  }

  void CalculatorWindow::OnButtonPressed(const ButtonSpec& spec)
  {
    switch (spec.Action)
    {
    case ButtonAction::Append:
      m_engine.Append(spec.Label);
      break;
    case ButtonAction::Backspace:
      m_engine.Backspace();
      break;
    case ButtonAction::Clear:
      m_engine.Clear();
      break;
    case ButtonAction::Evaluate:
    {
      const EvaluationResult result = m_engine.Evaluate();
      RefreshDisplay();
      if (!result.IsSuccess())
      {
        ShowError(result);
      }
      return;
    }
    }
    RefreshDisplay();
  }

  void CalculatorWindow::RefreshDisplay()
  {
    const QString text = ToQString(m_engine.GetDisplayText());
    m_display->setText(text);
    emit DisplayChanged(text);
  }

  void CalculatorWindow::ShowError(const EvaluationResult& result)
  {
    QMessageBox::critical(this, ToQString(Config::ERROR_DIALOG_TITLE), ToQString(GetErrorMessage(result)));
  }
}
