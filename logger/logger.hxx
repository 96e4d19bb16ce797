#pragma once

/**
 * @file logger.hxx
 * @brief Diagnostic logger for the benchmark engine (stderr / file, never stdout)
 * @version 2.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace rangebench {

// ── Internal clock ────────────────────────────────────────────────────────────

namespace logger_detail {
/// Seconds elapsed since the first call (program-relative).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}

inline auto stderr_is_tty() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stderr)) != 0);
    return val;
#endif
}
}  // namespace logger_detail

// ── ANSI color constants ──────────────────────────────────────────────────────

struct Colors {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *blue = "\033[34m";
    static constexpr const char *cyan = "\033[36m";
    static constexpr const char *white = "\033[37m";
    static constexpr const char *bright_red = "\033[91m";
    static constexpr const char *bright_green = "\033[92m";
    static constexpr const char *bright_yellow = "\033[93m";
    static constexpr const char *bright_blue = "\033[94m";
};

// ── Logger ───────────────────────────────────────────────────────────────────

/**
 * @brief Singleton diagnostic logger.
 *
 * Standard output is reserved for the CSV results, so every console line goes
 * to stderr. An optional log file receives the same lines without colors.
 *
 * The logger works before initialize() is called, with WARNING as minimum
 * level and colors only when stderr is a terminal. Drivers call initialize()
 * once to pick the level and the file sink.
 */
class Logger {
   public:
    enum class level : int { BASIC = 0, DEBUG = 1, INFO = 2, SUCCESS = 3, WARNING = 4, ERROR = 5 };

    // ── log_stream ────────────────────────────────────────────────────────────

    /**
     * @brief Accumulates tokens via `operator<<` and emits the full message
     *        on destruction.
     *
     * @code
     *   RB_LOG_INFO << "running " << name;
     * @endcode
     */
    class log_stream {
       public:
        log_stream(Logger &logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream &&logstr) noexcept : lg_(logstr.lg_), level_(logstr.level_), buf_(std::move(logstr.buf_)) { logstr.moved_ = true; }

        log_stream(const log_stream &) = delete;
        auto operator=(const log_stream &) -> log_stream & = delete;
        auto operator=(log_stream &&) -> log_stream & = delete;

        template <typename T>
        auto operator<<(const T &val) -> log_stream & {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (msg.empty()) {
                return;
            }
            lg_.emit(msg, level_);
        }

       private:
        Logger &lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    // ── Singleton access ──────────────────────────────────────────────────────

    static auto get_instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;

    // ── Initialization ────────────────────────────────────────────────────────

    /**
     * @brief Configure the logger. May be called once.
     *
     * @param min_level   Discard messages below this severity.
     * @param file_path   Also append plain-text lines to this file (empty = none).
     * @param use_colors  Emit ANSI escape codes on stderr if it is a terminal.
     *
     * @throws std::runtime_error if called more than once, or if the file
     *         cannot be opened.
     */
    void initialize(level min_level = level::WARNING, const std::string &file_path = "", bool use_colors = true) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }

        min_level_ = min_level;
        use_colors_ = use_colors && logger_detail::stderr_is_tty();

        if (!file_path.empty()) {
            file_.open(file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + file_path);
            }
        }

        initialized_ = true;
    }

    // ── Runtime controls ─────────────────────────────────────────────────────

    void set_min_level(level lvl) {
        std::lock_guard lock(mutex_);
        min_level_ = lvl;
    }

    [[nodiscard]] auto min_level() const -> level {
        std::lock_guard lock(mutex_);
        return min_level_;
    }

    /// True when a message at @p lvl would be written. Lets hot loops skip building it.
    [[nodiscard]] auto enabled(level lvl) const -> bool {
        std::lock_guard lock(mutex_);
        return lvl >= min_level_;
    }

    void set_colors(bool flag) {
        std::lock_guard lock(mutex_);
        use_colors_ = flag;
    }

    /// Redirect console lines (tests capture diagnostics through this).
    void set_sink(std::ostream &out) {
        std::lock_guard lock(mutex_);
        sink_ = &out;
    }

    void flush() {
        std::lock_guard lock(mutex_);
        sink_->flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

    /// Parses "debug", "info", "warning", "error" (case-sensitive).
    static auto parse_level(std::string_view name) -> level {
        if (name == "debug") {
            return level::DEBUG;
        }
        if (name == "info") {
            return level::INFO;
        }
        if (name == "warning" || name == "warn") {
            return level::WARNING;
        }
        if (name == "error") {
            return level::ERROR;
        }
        throw std::invalid_argument("unknown log level: " + std::string(name));
    }

    // ── String overloads ─────────────────────────────────────────────────────

    void debug(const std::string &msg) { emit(msg, level::DEBUG); }
    void info(const std::string &msg) { emit(msg, level::INFO); }
    void success(const std::string &msg) { emit(msg, level::SUCCESS); }
    void warning(const std::string &msg) { emit(msg, level::WARNING); }
    void error(const std::string &msg) { emit(msg, level::ERROR); }

    // ── Stream-style factory methods ─────────────────────────────────────────

    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream success() { return {*this, level::SUCCESS}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    ~Logger() {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    friend class log_stream;

   private:
    Logger() = default;

    struct level_meta {
        const char *label;  // fixed-width, 7 chars
        const char *color;
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        switch (lvl) {
            case level::BASIC:
                return {.label = "       ", .color = Colors::white};
            case level::DEBUG:
                return {.label = " DEBUG ", .color = Colors::blue};
            case level::INFO:
                return {.label = "  INFO ", .color = Colors::bright_blue};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = Colors::bright_green};
            case level::WARNING:
                return {.label = "WARNING", .color = Colors::bright_yellow};
            case level::ERROR:
                return {.label = " ERROR ", .color = Colors::bright_red};
        }
        return {.label = "       ", .color = Colors::white};
    }

    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;
        constexpr int TIME_BUFFER_SIZE = 32;

        int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        int hours = total_ms / MS_PER_HOUR;
        int minutes = (total_ms % MS_PER_HOUR) / MS_PER_MINUTE;
        int seconds = (total_ms % MS_PER_MINUTE) / MS_PER_SECOND;
        int millis = total_ms % MS_PER_SECOND;

        char buf[TIME_BUFFER_SIZE];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hours, minutes, seconds, millis);
        return buf;
    }

    void emit(const std::string &message, level lvl) {
        std::lock_guard lock(mutex_);
        if (lvl < min_level_) {
            return;
        }

        const auto [label, color] = meta_of(lvl);
        std::string time_tag = "[" + format_time(logger_detail::elapsed_seconds()) + "] ";
        std::string level_tag = lvl == level::BASIC ? "" : std::string("[") + label + "] ";

        if (use_colors_) {
            *sink_ << Colors::cyan << time_tag << Colors::reset << color << level_tag << Colors::reset << message << '\n';
        } else {
            *sink_ << time_tag << level_tag << message << '\n';
        }
        if (file_.is_open()) {
            file_ << time_tag << level_tag << message << '\n';
            file_.flush();
        }
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = logger_detail::stderr_is_tty();
    level min_level_ = level::WARNING;
    std::ostream *sink_ = &std::cerr;
    std::ofstream file_;
};

}  // namespace rangebench

// ── Convenience macros ────────────────────────────────────────────────────────

#define RB_LOG_DEBUG ::rangebench::Logger::get_instance().debug()
#define RB_LOG_INFO ::rangebench::Logger::get_instance().info()
#define RB_LOG_SUCCESS ::rangebench::Logger::get_instance().success()
#define RB_LOG_WARN ::rangebench::Logger::get_instance().warning()
#define RB_LOG_ERROR ::rangebench::Logger::get_instance().error()

/// Stamp the current source location then continue the stream.
#define RB_LOG_HERE RB_LOG_DEBUG << __FILE__ ":" << __LINE__ << " | "
