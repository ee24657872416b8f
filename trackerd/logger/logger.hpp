#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace trackerd::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    const char* levelName(LogLevel l);

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "TrackerEngine", "TrackerServer"
        std::string msg;           // rendered text

        // Optional structured fields:
        std::string endpoint;      // ip:port of the datagram source
        std::string action;        // "connect|announce|scrape"
        std::string infoHash;      // hex
        std::string event;         // "started|completed|stopped|none"
        int         peers{-1};
        int         interval{-1};
    };

    /// Renders the payload part of a record (everything after the timestamp).
    std::string formatRecord(const LogRecord& rec);

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
        bool isOpen() const { return out_.is_open(); }
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    class Logger
    {
    public:
        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        bool enabled(LogLevel lvl) const {
            return lvl != LogLevel::none &&
                   static_cast<unsigned>(lvl) >= static_cast<unsigned>(level());
        }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            sink_->write(rec);
        }

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

        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
    };

    // Compile-time floor; records below it are never even formatted.
    #ifndef TRACKERD_LOG_LEVEL
    #define TRACKERD_LOG_LEVEL trackerd::logger::LogLevel::trace
    #endif

    #define TRACKERD_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(TRACKERD_LOG_LEVEL))

    // Usage: TRACKERD_LOG(loggerPtr, LogLevel::debug, "TrackerEngine") << "message " << x;
    #define TRACKERD_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !TRACKERD_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::trackerd::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __LINE__, __func__).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name, int line, const char* fn)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
        private:
            Logger& lg_;
            LogRecord rec_;
            std::ostringstream ss_;
        };
    }

} // namespace trackerd::logger
