// BoostLogger.h
#pragma once

#include <string>
#include <sstream>
#include <utility>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <iostream>

namespace bl = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace attrs = boost::log::attributes;
using namespace boost::log::trivial;

class BoostLogger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        fatal = 5
    };

    struct Config {
        std::string name = "livestor";
        std::string file_path = "/tmp/livestor.log";
        Level console_level = Level::Warning;
        Level file_level = Level::Trace;
        std::size_t rotation_size = 10 * 1024 * 1024; // 10 MB
        int max_files = 5;
        bool enable_console = true;
        bool enable_file = true;
    };

    // Sets up sinks once; later calls are ignored.
    static void Init(const Config& config);

    // Every argument is streamed with <<, so callers can mix strings and numbers.
    template <typename... Args> static void Trace(const Args&... args) { log_impl(severity_level::trace, args...); }
    template <typename... Args> static void Debug(const Args&... args) { log_impl(severity_level::debug, args...); }
    template <typename... Args> static void Info(const Args&... args) { log_impl(severity_level::info, args...); }
    template <typename... Args> static void Warn(const Args&... args) { log_impl(severity_level::warning, args...); }
    template <typename... Args> static void Error(const Args&... args) { log_impl(severity_level::error, args...); }
    template <typename... Args> static void Critical(const Args&... args) { log_impl(severity_level::fatal, args...); }

    static Level parseLevel(const std::string& name, Level fallback);

private:
    inline static src::severity_logger_mt<severity_level> s_logger;
    inline static bool s_initialized = false;

    static severity_level to_boost_level(Level level);

    template <typename... Args>
    static void log_impl(severity_level lvl, const Args&... args);
};

inline severity_level BoostLogger::to_boost_level(Level level) {
    switch (level) {
        case Level::Trace:    return severity_level::trace;
        case Level::Debug:    return severity_level::debug;
        case Level::Info:     return severity_level::info;
        case Level::Warning:  return severity_level::warning;
        case Level::Error:    return severity_level::error;
        case Level::fatal:    return severity_level::fatal;
        default:              return severity_level::info;
    }
}

inline BoostLogger::Level BoostLogger::parseLevel(const std::string& name, Level fallback) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::fatal;
    return fallback;
}

inline void BoostLogger::Init(const Config& config = Config()) {
    if (s_initialized) return;

    bl::core::get()->remove_all_sinks();
    bl::add_common_attributes();

    if (config.enable_console) {
        auto console_sink = bl::add_console_log(
            std::clog,
            bl::keywords::format = "[%TimeStamp%] [%Severity%] %Message%"
        );
        console_sink->set_filter(severity >= to_boost_level(config.console_level));
    }

    if (config.enable_file) {
        auto file_sink = bl::add_file_log(
            bl::keywords::file_name = config.file_path,
            bl::keywords::open_mode = std::ios_base::app,
            bl::keywords::rotation_size = config.rotation_size,
            bl::keywords::max_size = config.rotation_size * config.max_files,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
            bl::keywords::auto_flush = true
        );
        file_sink->set_filter(severity >= to_boost_level(config.file_level));
    }

    bl::core::get()->set_filter(severity >= severity_level::trace);

    s_initialized = true;
}

template <typename... Args>
inline void BoostLogger::log_impl(severity_level lvl, const Args&... args) {
    if (!s_initialized) {
        Init();
    }
    std::ostringstream line;
    (line << ... << args);
    BOOST_LOG_SEV(s_logger, lvl) << line.str();
}
