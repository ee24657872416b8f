#pragma once
#include <cstddef>
#include <map>

#include "random_source.hpp"
#include "types.hpp"


namespace trackerd::tracker {


    /**
     * @brief Gate for announce/scrape: remembers the last connection id issued
     * to each source address.
     *
     * Entries are overwritten on every connect and never expire or get removed;
     * an issued id stays valid for the lifetime of the process.
     */
    class ConnectionRegistry {
    public:
        explicit ConnectionRegistry(IRandomSource& rng) : rng_(rng) {}

        ConnectionId issue(const SocketAddress& addr);

        // Unknown address and wrong id are indistinguishable to the caller.
        bool validate(const SocketAddress& addr, ConnectionId claimed) const;

        std::size_t size() const { return ids_.size(); }

    private:
        IRandomSource& rng_;
        std::map<SocketAddress, ConnectionId> ids_;
    };


} // namespace trackerd::tracker
