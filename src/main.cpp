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
#include <DeskCalc/Log/LogSetup.hpp>
#include <DeskCalc/Ui/CalculatorWindow.hpp>
#include <QApplication>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>

int main(int argc, char* argv[])
{
  int exitCode = EXIT_FAILURE;
  try
  {
    DeskCalc::Log::InitializeLogging(spdlog::level::info);

    QApplication app(argc, argv);

    DeskCalc::ExpressionEngine engine;
    DeskCalc::CalculatorWindow window(engine);
    window.show();

    spdlog::info("DeskCalc started");
    exitCode = app.exec();
    spdlog::info("DeskCalc exited with code {}", exitCode);
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Unhandled exception: {}", ex.what());
  }

  spdlog::shutdown();
  return exitCode;
}
