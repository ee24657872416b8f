// logger.cpp
#include "logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <syncstream>

namespace trackerd::logger {

    const char* levelName(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string formatRecord(const LogRecord& rec) {
        std::ostringstream out;
        out << "[" << levelName(rec.level) << "] "
            << (rec.logger.empty() ? "trackerd" : rec.logger) << ": "
            << rec.msg;

        if (!rec.endpoint.empty()) out << " endpoint=" << rec.endpoint;
        if (!rec.action.empty())   out << " action="   << rec.action;
        if (!rec.infoHash.empty()) out << " info_hash=" << rec.infoHash;
        if (!rec.event.empty())    out << " event="    << rec.event;
        if (rec.peers >= 0)        out << " peers="    << rec.peers;
        if (rec.interval >= 0)     out << " interval=" << rec.interval;
        return out.str();
    }

    // -------- StdoutSink: atomic per-line emission --------
    void StdoutSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cout);  // per-call buffered; flushes on destruction
        out << ts_iso8601(rec.ts) << " " << formatRecord(rec) << '\n';
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        std::scoped_lock lk(mu_);
        if (!out_) return;
        out_ << ts_iso8601(rec.ts) << " " << formatRecord(rec) << '\n';
        out_.flush();
    }

} // namespace trackerd::logger
