#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "../../logger/logger.hpp"
#include "engine.hpp"
#include "expected.hpp"
#include "udp_socket.hpp"


namespace trackerd::tracker {


    /**
     * @brief Single-threaded receive/dispatch/send loop around a TrackerEngine.
     *
     * Requests are handled strictly in arrival order. Any socket error ends
     * the loop and is returned to the caller; malformed or unauthorized
     * datagrams never do.
     */
    class TrackerServer {
    public:
        TrackerServer(UdpSocket socket, TrackerEngine& engine,
                      std::shared_ptr<logger::Logger> log = nullptr);

        /// Receives one datagram and sends the engine's reply, if any.
        Expected<void> serveOne();

        /// Serves until the first I/O error, which is returned.
        Expected<void> run();

        const UdpSocket& socket() const { return socket_; }

    private:
        Expected<void> sendAll(const SocketAddress& dest);

        UdpSocket socket_;
        TrackerEngine& engine_;
        std::shared_ptr<logger::Logger> log_;
        std::vector<std::uint8_t> readBuf_;
        std::vector<std::uint8_t> writeBuf_;
    };


} // namespace trackerd::tracker
