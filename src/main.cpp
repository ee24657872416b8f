#include <iostream>
#include <memory>
#include <string>

#include "../trackerd/logger/logger.hpp"
#include "../trackerd/tracker/include/config.hpp"
#include "../trackerd/tracker/include/engine.hpp"
#include "../trackerd/tracker/include/random_source.hpp"
#include "../trackerd/tracker/include/server.hpp"
#include "../trackerd/tracker/include/udp_socket.hpp"

using namespace trackerd;


int main(int argc, char** argv)
{
    const std::string argv0 = argc > 0 ? argv[0] : "trackerd";

    auto cl = tracker::parseCommandLine(argc, argv);
    if (!cl.has_value()) {
        std::cerr << argv0 << ": " << cl.error->message << "\n\n" << tracker::usage(argv0);
        return 1;
    }
    if (cl.get().showHelp) {
        std::cout << tracker::usage(argv0);
        return 0;
    }
    const tracker::ServerConfig& cfg = cl.get().config;

    std::shared_ptr<logger::ILoggerSink> sink = std::make_shared<logger::StdoutSink>();
    if (cfg.logFile) {
        auto file = std::make_shared<logger::FileSink>(*cfg.logFile);
        if (!file->isOpen()) {
            std::cerr << argv0 << ": cannot open log file " << *cfg.logFile << "\n";
            return 1;
        }
        sink = file;
    }
    auto log = std::make_shared<logger::Logger>(sink);
    log->setLevel(cfg.logLevel);

    auto addr = tracker::parseBindAddress(cfg.bindAddress);
    if (!addr.has_value()) {
        log->error(addr.error->message, "main");
        return 1;
    }

    auto sock = tracker::UdpSocket::bind(addr.get());
    if (!sock.has_value()) {
        log->error(sock.error->message, "main");
        return 2;
    }

    tracker::TrackerEngine engine(cfg.engineConfig(),
                                  std::make_unique<tracker::Mt64RandomSource>(), log);
    tracker::TrackerServer server(std::move(sock.get()), engine, log);

    auto result = server.run();
    if (!result.has_value()) {
        log->error("fatal: " + result.error->message, "main");
        return 2;
    }
    return 0;
}
