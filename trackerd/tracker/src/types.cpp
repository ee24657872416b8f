#include <algorithm>
#include <arpa/inet.h>
#include <iomanip>
#include <sstream>
#include "../include/expected.hpp"
#include "../include/types.hpp"


namespace trackerd::tracker {


    std::string InfoHash::toHex() const {
        std::ostringstream oss;
        for (auto b : bytes) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return oss.str();
    }


    const char* eventName(AnnounceEvent ev) {
        switch (ev) {
            case AnnounceEvent::none:      return "none";
            case AnnounceEvent::completed: return "completed";
            case AnnounceEvent::started:   return "started";
            case AnnounceEvent::stopped:   return "stopped";
        }
        return "unknown";
    }


    const char* errcName(Errc code) {
        switch (code) {
            case Errc::unknown_action:         return "unknown_action";
            case Errc::unknown_announce_event: return "unknown_announce_event";
            case Errc::insufficient_bytes:     return "insufficient_bytes";
            case Errc::io:                     return "io";
            case Errc::config:                 return "config";
        }
        return "unknown";
    }


    std::string PeerAddrV4::toString() const {
        char buf[INET_ADDRSTRLEN] = {0};
        if (!::inet_ntop(AF_INET, ip.data(), buf, sizeof(buf))) {
            return "?:" + std::to_string(port);
        }
        return std::string(buf) + ":" + std::to_string(port);
    }


    SocketAddress SocketAddress::fromV4(std::array<std::uint8_t,4> ip, std::uint16_t port) {
        SocketAddress sa;
        sa.family = AddressFamily::v4;
        std::copy(ip.begin(), ip.end(), sa.bytes.begin());
        sa.port = port;
        return sa;
    }


    SocketAddress SocketAddress::fromV6(std::array<std::uint8_t,16> ip, std::uint16_t port) {
        SocketAddress sa;
        sa.family = AddressFamily::v6;
        sa.bytes = ip;
        sa.port = port;
        return sa;
    }


    std::optional<PeerAddrV4> SocketAddress::toPeerV4() const {
        if (!isV4()) return std::nullopt;
        PeerAddrV4 p;
        std::copy(bytes.begin(), bytes.begin() + 4, p.ip.begin());
        p.port = port;
        return p;
    }


    std::string SocketAddress::toString() const {
        if (isV4()) return toPeerV4()->toString();

        char buf[INET6_ADDRSTRLEN] = {0};
        if (!::inet_ntop(AF_INET6, bytes.data(), buf, sizeof(buf))) {
            return "[?]:" + std::to_string(port);
        }
        return "[" + std::string(buf) + "]:" + std::to_string(port);
    }


} // namespace trackerd::tracker
