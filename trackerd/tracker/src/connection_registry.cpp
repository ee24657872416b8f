#include "../include/connection_registry.hpp"


namespace trackerd::tracker {


    ConnectionId ConnectionRegistry::issue(const SocketAddress& addr) {
        const ConnectionId id = rng_.nextU64();
        ids_[addr] = id;
        return id;
    }


    bool ConnectionRegistry::validate(const SocketAddress& addr, ConnectionId claimed) const {
        auto it = ids_.find(addr);
        return it != ids_.end() && it->second == claimed;
    }


} // namespace trackerd::tracker
