#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "../../logger/logger.hpp"
#include "engine.hpp"
#include "expected.hpp"
#include "types.hpp"


namespace trackerd::tracker {


    inline constexpr const char* kDefaultBindAddress = "127.0.0.1:8080";


    struct ServerConfig
    {
        std::string bindAddress{kDefaultBindAddress};
        std::uint32_t announceInterval{900};
        std::uint32_t defaultNumWant{200};
        std::uint32_t maxPeersPerReply{static_cast<std::uint32_t>(kMaxPeersPerDatagram)};
        logger::LogLevel logLevel{logger::LogLevel::info};
        std::optional<std::string> logFile;

        EngineConfig engineConfig() const {
            return EngineConfig{announceInterval, defaultNumWant, maxPeersPerReply};
        }
    };


    struct CommandLine
    {
        ServerConfig config;
        bool showHelp{false};
    };


    /**
     * @brief Parse "host:port" into a bindable address.
     *
     * Accepts dotted IPv4 ("0.0.0.0:6969"), bracketed IPv6 ("[::]:6969") and
     * "localhost". A missing port defaults to 6969. Host names are not
     * resolved.
     */
    Expected<SocketAddress> parseBindAddress(const std::string& text);

    std::optional<logger::LogLevel> parseLogLevel(const std::string& name);

    /**
     * @brief Overlay the keys of a JSON config file onto `base`.
     *
     * Keys: bind, interval, default_num_want, max_peers, log_level, log_file.
     * Unknown keys are ignored; a key with the wrong type is an error.
     */
    Expected<ServerConfig> loadConfigFile(const std::string& path, ServerConfig base = {});

    /// Same as loadConfigFile, from JSON text already in memory.
    Expected<ServerConfig> parseConfigJson(const std::string& text, ServerConfig base = {});

    /**
     * @brief Parse process arguments. `--config FILE` is applied first, then
     * every other flag overrides it regardless of order.
     */
    Expected<CommandLine> parseCommandLine(int argc, const char* const* argv);

    std::string usage(const std::string& argv0);


} // namespace trackerd::tracker
