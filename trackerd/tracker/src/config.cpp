#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/config.hpp"


namespace trackerd::tracker {


    static Expected<ServerConfig> configError(std::string msg) {
        return Expected<ServerConfig>::failure(Errc::config, std::move(msg));
    }


    static std::optional<uint16_t> parsePort(std::string_view sv) {
        if (sv.empty()) return std::nullopt;
        unsigned long p = 0;
        for (char ch : sv) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
            p = p * 10 + static_cast<unsigned long>(ch - '0');
            if (p > 65535) return std::nullopt;
        }
        return static_cast<uint16_t>(p);
    }


    static std::optional<uint32_t> parseU32(std::string_view sv) {
        uint32_t v = 0;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
        if (ec != std::errc{} || ptr != sv.data() + sv.size() || sv.empty()) return std::nullopt;
        return v;
    }


    Expected<SocketAddress> parseBindAddress(const std::string& text)
    {
        auto bad = [&](const char* why) {
            return Expected<SocketAddress>::failure(Errc::config,
                "invalid bind address '" + text + "': " + why);
        };

        std::string_view sv(text);
        std::string host;
        std::string_view portSv;
        bool v6 = false;

        if (!sv.empty() && sv.front() == '[') {
            size_t close = sv.find(']');
            if (close == std::string_view::npos) return bad("missing ']'");
            host = std::string(sv.substr(1, close - 1));
            v6 = true;
            std::string_view rest = sv.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') return bad("expected ':' after ']'");
                portSv = rest.substr(1);
                if (portSv.empty()) return bad("empty port");
            }
        } else {
            size_t colon = sv.rfind(':');
            if (colon != std::string_view::npos) {
                host = std::string(sv.substr(0, colon));
                portSv = sv.substr(colon + 1);
                if (portSv.empty()) return bad("empty port");
            } else {
                host = std::string(sv);
            }
        }

        if (host.empty()) return bad("empty host");

        uint16_t port = 6969; // common default for trackers
        if (!portSv.empty()) {
            auto p = parsePort(portSv);
            if (!p) return bad("port must be a number in 0..65535");
            port = *p;
        }

        if (host == "localhost") host = "127.0.0.1";

        if (v6) {
            std::array<uint8_t,16> ip{};
            if (::inet_pton(AF_INET6, host.c_str(), ip.data()) != 1) return bad("not an IPv6 literal");
            return Expected<SocketAddress>::success(SocketAddress::fromV6(ip, port));
        }

        std::array<uint8_t,4> ip{};
        if (::inet_pton(AF_INET, host.c_str(), ip.data()) != 1) return bad("not an IPv4 address");
        return Expected<SocketAddress>::success(SocketAddress::fromV4(ip, port));
    }


    std::optional<logger::LogLevel> parseLogLevel(const std::string& name)
    {
        using logger::LogLevel;
        if (name == "trace") return LogLevel::trace;
        if (name == "debug") return LogLevel::debug;
        if (name == "info")  return LogLevel::info;
        if (name == "warn")  return LogLevel::warn;
        if (name == "error") return LogLevel::error;
        if (name == "none")  return LogLevel::none;
        return std::nullopt;
    }


    Expected<ServerConfig> parseConfigJson(const std::string& text, ServerConfig base)
    {
        using nlohmann::json;

        const json j = json::parse(text, nullptr, /*allow_exceptions*/false);
        if (j.is_discarded()) return configError("config: not valid JSON");
        if (!j.is_object())   return configError("config: top level must be an object");

        auto getString = [&](const char* key, std::string& out) -> bool {
            auto it = j.find(key);
            if (it == j.end()) return true;
            if (!it->is_string()) return false;
            out = it->get<std::string>();
            return true;
        };
        auto getU32 = [&](const char* key, uint32_t& out) -> bool {
            auto it = j.find(key);
            if (it == j.end()) return true;
            if (!it->is_number_unsigned()) return false;
            const auto v = it->get<std::uint64_t>();
            if (v > 0xFFFFFFFFull) return false;
            out = static_cast<uint32_t>(v);
            return true;
        };

        if (!getString("bind", base.bindAddress))
            return configError("config: 'bind' must be a string");
        if (!getU32("interval", base.announceInterval))
            return configError("config: 'interval' must be an unsigned integer");
        if (!getU32("default_num_want", base.defaultNumWant))
            return configError("config: 'default_num_want' must be an unsigned integer");
        if (!getU32("max_peers", base.maxPeersPerReply))
            return configError("config: 'max_peers' must be an unsigned integer");

        std::string level;
        if (!getString("log_level", level))
            return configError("config: 'log_level' must be a string");
        if (!level.empty()) {
            auto lvl = parseLogLevel(level);
            if (!lvl) return configError("config: unknown log_level '" + level + "'");
            base.logLevel = *lvl;
        }

        std::string file;
        if (!getString("log_file", file))
            return configError("config: 'log_file' must be a string");
        if (!file.empty()) base.logFile = file;

        return Expected<ServerConfig>::success(std::move(base));
    }


    Expected<ServerConfig> loadConfigFile(const std::string& path, ServerConfig base)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f) return configError("config: cannot open " + path);
        std::ostringstream oss;
        oss << f.rdbuf();
        auto cfg = parseConfigJson(oss.str(), std::move(base));
        if (!cfg.has_value()) {
            cfg.error->message = path + ": " + cfg.error->message;
        }
        return cfg;
    }


    std::string usage(const std::string& argv0)
    {
        std::ostringstream oss;
        oss << "Usage: " << argv0 << " [options] [HOST:PORT]\n"
            << "  --bind HOST:PORT        address to listen on (default " << kDefaultBindAddress << ")\n"
            << "  --config FILE           JSON config file; flags override it\n"
            << "  --interval SECONDS      announce interval sent to peers (default 900)\n"
            << "  --default-num-want N    peers returned when num_want is negative (default 200)\n"
            << "  --max-peers N           cap on peers per announce reply (default " << kMaxPeersPerDatagram << ")\n"
            << "  --log-level LEVEL       trace|debug|info|warn|error|none (default info)\n"
            << "  --log-file PATH         append logs to PATH instead of stdout\n"
            << "  -h, --help              show this help\n";
        return oss.str();
    }


    Expected<CommandLine> parseCommandLine(int argc, const char* const* argv)
    {
        auto fail = [](std::string msg) {
            return Expected<CommandLine>::failure(Errc::config, std::move(msg));
        };

        CommandLine cl;
        std::optional<std::string> configPath;
        std::vector<std::pair<std::string, std::string>> overrides;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                cl.showHelp = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) return fail("missing value for " + arg);
                const std::string val = argv[++i];
                if (arg == "--config") configPath = val;
                else overrides.emplace_back(arg, val);
                continue;
            }
            overrides.emplace_back("--bind", arg);
        }

        if (configPath) {
            auto loaded = loadConfigFile(*configPath, cl.config);
            if (!loaded.has_value()) return Expected<CommandLine>::failure(*loaded.error);
            cl.config = std::move(loaded.get());
        }

        for (const auto& [flag, val] : overrides) {
            if (flag == "--bind") {
                cl.config.bindAddress = val;
            } else if (flag == "--interval" || flag == "--max-peers" || flag == "--default-num-want") {
                auto n = parseU32(val);
                if (!n) return fail(flag + " expects an unsigned integer, got '" + val + "'");
                if (flag == "--interval") cl.config.announceInterval = *n;
                else if (flag == "--max-peers") cl.config.maxPeersPerReply = *n;
                else cl.config.defaultNumWant = *n;
            } else if (flag == "--log-level") {
                auto lvl = parseLogLevel(val);
                if (!lvl) return fail("unknown log level '" + val + "'");
                cl.config.logLevel = *lvl;
            } else if (flag == "--log-file") {
                cl.config.logFile = val;
            } else {
                return fail("unknown option " + flag);
            }
        }

        if (!cl.showHelp) {
            auto addr = parseBindAddress(cl.config.bindAddress);
            if (!addr.has_value()) return Expected<CommandLine>::failure(*addr.error);
        }

        return Expected<CommandLine>::success(std::move(cl));
    }


} // namespace trackerd::tracker
