/* SPDX-FileCopyrightText: 2025 Kinema Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace kinema::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Module detection from file path
    enum class LogModule : uint8_t {
        Core = 0,
        Animation = 1,
        Generators = 2,
        Driver = 3,
        Values = 4,
        Config = 5,
        Unknown = 6,
        Count = 7 // Total number of modules
    };

    inline constexpr std::array<std::string_view, static_cast<size_t>(LogModule::Count)> LOG_MODULE_TAGS{
        "core", "anim", "gen", "drv", "val", "cfg", "?"};

    // Console sink: [time] [level] module file:line  message
    template <typename Mutex>
    class module_color_sink : public spdlog::sinks::base_sink<Mutex> {
    public:
        module_color_sink() {
            colors_[spdlog::level::trace] = "\033[37m";
            colors_[spdlog::level::debug] = "\033[36m";
            colors_[spdlog::level::info] = "\033[32m";
            colors_[spdlog::level::warn] = "\033[33m";
            colors_[spdlog::level::err] = "\033[31m";
            colors_[spdlog::level::critical] = "\033[1;31m";
            colors_[spdlog::level::off] = "\033[0m";
        }

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
            const auto tm = *std::localtime(&time_t_val);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    msg.time.time_since_epoch())
                                    .count() %
                                1000;

            std::string_view full_path(msg.source.filename ? msg.source.filename : "");
            const auto last_slash = full_path.find_last_of("/\\");
            const std::string_view filename = (last_slash != std::string_view::npos)
                                                  ? full_path.substr(last_slash + 1)
                                                  : full_path;

            const auto level_index = static_cast<size_t>(msg.level);
            const auto level_str = spdlog::level::to_string_view(msg.level);
            const std::string& color = level_index < colors_.size() ? colors_[level_index]
                                                                    : colors_[spdlog::level::info];

            std::cout << fmt::format(
                             "[{:02d}:{:02d}:{:02d}.{:03d}] {}[{}]{} {}:{}  {}\n",
                             tm.tm_hour,
                             tm.tm_min,
                             tm.tm_sec,
                             static_cast<int>(millis),
                             color,
                             level_str,
                             colors_[spdlog::level::off],
                             filename,
                             msg.source.line,
                             std::string_view(msg.payload.data(), msg.payload.size()))
                      << std::flush;
        }

        void flush_() override {
            std::cout << std::flush;
        }

    private:
        std::array<std::string, 7> colors_;
    };

    using module_color_sink_mt = module_color_sink<std::mutex>;

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<module_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(console_level));
            sinks.push_back(console_sink);

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("kinema", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);

            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                module_enabled_[i] = true;
                module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          fmt::format_string<Args...> pattern, Args&&... args) {
            if (!logger_)
                return;

            const auto module = detect_module(loc.file_name());
            const auto module_idx = static_cast<size_t>(module);
            if (!module_enabled_[module_idx] ||
                static_cast<uint8_t>(level) < module_level_[module_idx]) {
                return;
            }
            if (static_cast<uint8_t>(level) < global_level_) {
                return;
            }

            auto msg = fmt::format(pattern, std::forward<Args>(args)...);
            msg.insert(0, fmt::format("{:<4} ", LOG_MODULE_TAGS[module_idx]));

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        void enable_module(LogModule module, bool enabled = true) {
            module_enabled_[static_cast<size_t>(module)] = enabled;
        }

        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        void set_level(LogLevel level) {
            global_level_ = static_cast<uint8_t>(level);
        }

        [[nodiscard]] LogLevel level() const {
            return static_cast<LogLevel>(global_level_.load());
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

        static LogModule detect_module(std::string_view path) {
            if (path.find("/animation/") != std::string_view::npos)
                return LogModule::Animation;
            if (path.find("/generators/") != std::string_view::npos)
                return LogModule::Generators;
            if (path.find("/driver/") != std::string_view::npos)
                return LogModule::Driver;
            if (path.find("/values/") != std::string_view::npos)
                return LogModule::Values;
            if (path.find("/config/") != std::string_view::npos)
                return LogModule::Config;
            if (path.find("/core/") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

    private:
        Logger() = default;

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    class ScopedTimer {
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;

    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Debug,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::steady_clock::now()),
              name_(std::move(name)),
              level_(level),
              loc_(loc) {}

        ~ScopedTimer() {
            const auto duration = std::chrono::steady_clock::now() - start_;
            const auto ms = std::chrono::duration<double, std::milli>(duration).count();

            Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
        }
    };

} // namespace kinema::core

// Global macros defined OUTSIDE namespace - accessible from anywhere
#define LOG_TRACE(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::kinema::core::Logger::get().log_internal(::kinema::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name)       ::kinema::core::ScopedTimer _timer##__LINE__(name)
#define LOG_TIMER_TRACE(name) ::kinema::core::ScopedTimer _timer##__LINE__(name, ::kinema::core::LogLevel::Trace)
