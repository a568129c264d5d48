#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace metacat::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    // "debug" -> LogLevel::debug; std::nullopt for unknown names
    std::optional<LogLevel> parseLevel(std::string_view name);

    struct LogRecord 
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "LinkCodec", "cli"
        std::string msg;           // rendered text
        
        // Optional structured fields:
        std::string input;         // text handed to the codec (redacted)
        std::string token;         // canonical link, e.g. "<#E/table/db.t1>"
        std::string kind;          // "ENTITY|FIELD|ARRAY_FIELD"
        long        offset{-1};    // position of the token in input
        long        count{-1};     // number of links found
    };

    class ILoggerSink 
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    class StdoutSink : public ILoggerSink 
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink 
    {
    public:
        explicit FileSink(const std::string& path);
        bool good() const { return out_.good(); }
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    class Logger 
    {
    public:
        using RedactorFn = std::function<std::string(std::string_view)>;

        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        void setRedactor(RedactorFn r) { std::scoped_lock lk(mu_); redactor_ = std::move(r); }

        // Core log function (printf-free; build string up front)

        void log(LogRecord rec) {
            if (static_cast<unsigned>(rec.level) < static_cast<unsigned>(level())) return;
            rec.ts = std::chrono::system_clock::now();
            {
                std::scoped_lock lk(mu_);
                if (redactor_) {
                    rec.input = redactor_(rec.input);
                    rec.msg = redactor_(rec.msg);
                }
            }
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::mutex mu_;
        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
        RedactorFn redactor_;
    };

    // Compile-time floor for MC_LOG; the runtime level of the Logger still applies
    #ifndef MC_LINK_LOG_LEVEL
    #define MC_LINK_LOG_LEVEL metacat::logger::LogLevel::debug
    #endif

    #define MC_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(MC_LINK_LOG_LEVEL))

    // Usage: MC_LOG(loggerPtr, LogLevel::debug) << "message " << x;
    #define MC_LOG(LOGGER_PTR, LVL) \
        if (!(LOGGER_PTR) || !MC_LOG_ENABLED(LVL)) ; \
        else ::metacat::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), __LINE__, __func__).stream()

    namespace detail {
        class LogStreamHelper 
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, int line, const char* fn)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                rec_.logger = "link";
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
            LogRecord rec_;
        private:
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace metacat::logger
