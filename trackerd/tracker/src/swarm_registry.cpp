#include <algorithm>
#include "../include/swarm_registry.hpp"


namespace trackerd::tracker {


    void SwarmRegistry::apply(TorrentSwarm& swarm, const PeerAddrV4& peer, AnnounceEvent event) {
        switch (event) {
            case AnnounceEvent::started:
                if (swarm.peers.insert(peer).second) {
                    swarm.leechers = wrappingAdd(swarm.leechers, 1);
                }
                break;
            case AnnounceEvent::stopped:
                // The address stays in the peer set.
                swarm.leechers = wrappingAdd(swarm.leechers, -1);
                break;
            case AnnounceEvent::completed:
                swarm.leechers  = wrappingAdd(swarm.leechers, -1);
                swarm.seeders   = wrappingAdd(swarm.seeders, 1);
                swarm.completed = wrappingAdd(swarm.completed, 1);
                break;
            case AnnounceEvent::none:
                break;
        }
    }


    TorrentSwarm SwarmRegistry::getOrCreate(const InfoHash& hash, const SocketAddress& addr, AnnounceEvent event) {
        auto peer = addr.toPeerV4();
        auto it = swarms_.find(hash);

        if (!peer) {
            return it != swarms_.end() ? it->second : TorrentSwarm{};
        }

        if (it == swarms_.end()) {
            TorrentSwarm swarm;
            swarm.seeders = 1;
            swarm.peers.insert(*peer);
            it = swarms_.emplace(hash, std::move(swarm)).first;
        } else {
            apply(it->second, *peer, event);
        }
        return it->second;
    }


    bool SwarmRegistry::applyEvent(const InfoHash& hash, const SocketAddress& addr, AnnounceEvent event) {
        auto it = swarms_.find(hash);
        if (it == swarms_.end()) return false;

        if (auto peer = addr.toPeerV4()) {
            apply(it->second, *peer, event);
        }
        return true;
    }


    std::vector<PeerAddrV4> SwarmRegistry::samplePeers(const InfoHash& hash, std::size_t limit) const {
        std::vector<PeerAddrV4> out;
        auto it = swarms_.find(hash);
        if (it == swarms_.end()) return out;

        const auto& peers = it->second.peers;
        out.reserve(std::min(limit, peers.size()));
        for (const auto& p : peers) {
            if (out.size() >= limit) break;
            out.push_back(p);
        }
        return out;
    }


    ScrapeStats SwarmRegistry::scrape(const InfoHash& hash) const {
        auto it = swarms_.find(hash);
        if (it == swarms_.end()) return ScrapeStats{};
        const auto& s = it->second;
        return ScrapeStats{s.seeders, s.completed, s.leechers};
    }


    const TorrentSwarm* SwarmRegistry::find(const InfoHash& hash) const {
        auto it = swarms_.find(hash);
        return it == swarms_.end() ? nullptr : &it->second;
    }


} // namespace trackerd::tracker
