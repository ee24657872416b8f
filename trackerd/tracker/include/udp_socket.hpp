#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <sys/socket.h>

#include "expected.hpp"
#include "types.hpp"


namespace trackerd::tracker {


    struct Datagram
    {
        std::size_t size{0};
        SocketAddress source;
    };


    /**
     * @brief Blocking POSIX UDP socket (IPv4 or IPv6, chosen by the bind address).
     *
     * Move-only; the descriptor is closed on destruction. Every failure is
     * returned as Errc::io with the errno text.
     */
    class UdpSocket {
    public:
        static Expected<UdpSocket> bind(const SocketAddress& local);

        UdpSocket(UdpSocket&& other) noexcept;
        UdpSocket& operator=(UdpSocket&& other) noexcept;
        UdpSocket(const UdpSocket&) = delete;
        UdpSocket& operator=(const UdpSocket&) = delete;
        ~UdpSocket();

        Expected<Datagram> receive(std::span<std::uint8_t> buffer);
        Expected<std::size_t> sendTo(std::span<const std::uint8_t> bytes, const SocketAddress& dest);

        Expected<SocketAddress> localAddress() const;

        int fd() const { return fd_; }
        AddressFamily family() const { return family_; }

    private:
        UdpSocket(int fd, AddressFamily family) : fd_(fd), family_(family) {}
        void close();

        int fd_{-1};
        AddressFamily family_{AddressFamily::v4};
    };


    /**
     * sockaddr conversions shared with tests. IPv4-mapped IPv6 sources
     * (::ffff:a.b.c.d, seen on a dual-stack socket) come back as IPv4, and an
     * IPv4 address headed for an IPv6 socket is mapped the other way.
     */
    socklen_t toSockaddr(const SocketAddress& addr, sockaddr_storage& out,
                         AddressFamily socketFamily);
    SocketAddress fromSockaddr(const sockaddr_storage& ss);


} // namespace trackerd::tracker
