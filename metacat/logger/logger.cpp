// logger.cpp
#include "logger.hpp"
#include <iostream>
#include <syncstream>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace metacat::logger {

    static const char* level_name(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    std::optional<LogLevel> parseLevel(std::string_view name) {
        if (name == "trace") return LogLevel::trace;
        if (name == "debug") return LogLevel::debug;
        if (name == "info")  return LogLevel::info;
        if (name == "warn")  return LogLevel::warn;
        if (name == "error") return LogLevel::error;
        if (name == "none")  return LogLevel::none;
        return std::nullopt;
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    static void format_line(std::ostream& out, const LogRecord& rec) {
        out << ts_iso8601(rec.ts) << " [" << level_name(rec.level) << "] "
            << (rec.logger.empty() ? "link" : rec.logger) << ": "
            << rec.msg;

        // Emit structured fields only when present
        if (!rec.input.empty()) out << " input="  << rec.input;
        if (!rec.token.empty()) out << " token="  << rec.token;
        if (!rec.kind.empty())  out << " kind="   << rec.kind;
        if (rec.offset >= 0)    out << " offset=" << rec.offset;
        if (rec.count >= 0)     out << " count="  << rec.count;

        out << '\n';
    }

    // -------- StdoutSink: atomic per-line emission --------
    void StdoutSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cout);  // per-call buffered; flushes on destruction
        format_line(out, rec);
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        if (!out_) return;
        std::scoped_lock lk(mu_);
        format_line(out_, rec);
        out_.flush();
    }

} // namespace metacat::logger
