#ifndef DESKCALC_LOG_SPDLOGHELPER_HPP
#define DESKCALC_LOG_SPDLOGHELPER_HPP
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

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace DeskCalc
{
  namespace SpdLogHelper
  {
    /// @brief Gets or creates a logger with the specified name, inheriting the default logger's sinks.
    ///
    /// New loggers are initialized through the registry so they pick up the global level, pattern and any
    /// per-logger level loaded from SPDLOG_LEVEL.
    /// @param name The logger name.
    /// @return Shared pointer to the logger.
    inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
    {
      auto log = spdlog::get(name);
      if (!log)
      {
        const auto defaultLogger = spdlog::default_logger();
        const auto& sinks = defaultLogger->sinks();
        log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::initialize_logger(log);
      }
      return log;
    }

    /// @brief Gets or creates a logger named after a compile-time string, see DESKCALC_LOGGER_NAME.
    ///
    /// The logger is resolved once and cached, so call InitializeLogging before the first use.
    /// @tparam Name The compile-time string for the logger name.
    /// @return Shared pointer to the logger.
    template <typename Name>
    inline std::shared_ptr<spdlog::logger> GetLogger()
    {
      static const auto logger = []()
      {
        constexpr std::string_view name = Name::value;
        return GetLogger(std::string(name));
      }();
      return logger;
    }
  }
}

// Macro to define a compile-time string type for logger names
#define DESKCALC_LOGGER_NAME(name)                   \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
