#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <netinet/in.h>
#include <unistd.h>
#include "../include/udp_socket.hpp"


namespace trackerd::tracker {


    static Error ioError(const char* what) {
        return Error{Errc::io, std::string("udp: ") + what + " failed: " + std::strerror(errno)};
    }


    socklen_t toSockaddr(const SocketAddress& addr, sockaddr_storage& out, AddressFamily socketFamily) {
        std::memset(&out, 0, sizeof(out));
        if (addr.isV4() && socketFamily == AddressFamily::v4) {
            auto* sin = reinterpret_cast<sockaddr_in*>(&out);
            sin->sin_family = AF_INET;
            sin->sin_port = htons(addr.port);
            std::memcpy(&sin->sin_addr, addr.bytes.data(), 4);
            return sizeof(sockaddr_in);
        }
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(addr.port);
        if (addr.isV4()) {
            // ::ffff:a.b.c.d, so a dual-stack socket can reach an IPv4 peer.
            sin6->sin6_addr.s6_addr[10] = 0xff;
            sin6->sin6_addr.s6_addr[11] = 0xff;
            std::memcpy(&sin6->sin6_addr.s6_addr[12], addr.bytes.data(), 4);
        } else {
            std::memcpy(&sin6->sin6_addr, addr.bytes.data(), 16);
        }
        return sizeof(sockaddr_in6);
    }


    SocketAddress fromSockaddr(const sockaddr_storage& ss) {
        if (ss.ss_family == AF_INET6) {
            const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&ss);
            if (IN6_IS_ADDR_V4MAPPED(&sin6->sin6_addr)) {
                std::array<std::uint8_t,4> v4{};
                std::memcpy(v4.data(), &sin6->sin6_addr.s6_addr[12], 4);
                return SocketAddress::fromV4(v4, ntohs(sin6->sin6_port));
            }
            std::array<std::uint8_t,16> ip{};
            std::memcpy(ip.data(), &sin6->sin6_addr, 16);
            return SocketAddress::fromV6(ip, ntohs(sin6->sin6_port));
        }
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&ss);
        std::array<std::uint8_t,4> ip{};
        std::memcpy(ip.data(), &sin->sin_addr, 4);
        return SocketAddress::fromV4(ip, ntohs(sin->sin_port));
    }


    Expected<UdpSocket> UdpSocket::bind(const SocketAddress& local)
    {
        const int family = local.isV4() ? AF_INET : AF_INET6;
        int fd = ::socket(family, SOCK_DGRAM, 0);
        if (fd < 0) {
            return Expected<UdpSocket>::failure(ioError("socket()"));
        }
        UdpSocket sock(fd, local.family);

        int on = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
            return Expected<UdpSocket>::failure(ioError("setsockopt(SO_REUSEADDR)"));
        }

        // IPv6 sockets also accept IPv4 clients, whatever net.ipv6.bindv6only says.
        if (!local.isV4()) {
            int off = 0;
            if (::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off)) < 0) {
                return Expected<UdpSocket>::failure(ioError("setsockopt(IPV6_V6ONLY)"));
            }
        }

        sockaddr_storage ss{};
        const socklen_t len = toSockaddr(local, ss, local.family);
        if (::bind(fd, reinterpret_cast<const sockaddr*>(&ss), len) < 0) {
            return Expected<UdpSocket>::failure(ioError(("bind(" + local.toString() + ")").c_str()));
        }

        return Expected<UdpSocket>::success(std::move(sock));
    }


    UdpSocket::UdpSocket(UdpSocket&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), family_(other.family_) {}

    UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            family_ = other.family_;
        }
        return *this;
    }

    UdpSocket::~UdpSocket() { close(); }

    void UdpSocket::close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }


    Expected<Datagram> UdpSocket::receive(std::span<std::uint8_t> buffer)
    {
        for (;;) {
            sockaddr_storage src{};
            socklen_t slen = sizeof(src);
            const ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                         reinterpret_cast<sockaddr*>(&src), &slen);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Expected<Datagram>::failure(ioError("recvfrom()"));
            }
            return Expected<Datagram>::success(Datagram{static_cast<std::size_t>(n), fromSockaddr(src)});
        }
    }


    Expected<std::size_t> UdpSocket::sendTo(std::span<const std::uint8_t> bytes, const SocketAddress& dest)
    {
        sockaddr_storage ss{};
        const socklen_t len = toSockaddr(dest, ss, family_);
        for (;;) {
            const ssize_t n = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                                       reinterpret_cast<const sockaddr*>(&ss), len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Expected<std::size_t>::failure(ioError("sendto()"));
            }
            return Expected<std::size_t>::success(static_cast<std::size_t>(n));
        }
    }


    Expected<SocketAddress> UdpSocket::localAddress() const
    {
        sockaddr_storage ss{};
        socklen_t slen = sizeof(ss);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&ss), &slen) < 0) {
            return Expected<SocketAddress>::failure(ioError("getsockname()"));
        }
        return Expected<SocketAddress>::success(fromSockaddr(ss));
    }


} // namespace trackerd::tracker
