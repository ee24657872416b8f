#include <algorithm>
#include <string>
#include "../include/engine.hpp"


namespace trackerd::tracker {

    using logger::LogLevel;

    static constexpr const char* kLogName = "TrackerEngine";


    TrackerEngine::TrackerEngine(EngineConfig cfg,
                                 std::unique_ptr<IRandomSource> rng,
                                 std::shared_ptr<logger::Logger> log)
        : cfg_(cfg),
          rng_(rng ? std::move(rng) : std::make_unique<Mt64RandomSource>()),
          log_(std::move(log)),
          connections_(*rng_)
    {
        if (cfg_.maxPeersPerReply > kMaxPeersPerDatagram) {
            if (log_) {
                log_->warn("max peers per reply " + std::to_string(cfg_.maxPeersPerReply)
                           + " does not fit in one datagram, using " + std::to_string(kMaxPeersPerDatagram),
                           kLogName);
            }
            cfg_.maxPeersPerReply = static_cast<std::uint32_t>(kMaxPeersPerDatagram);
        }
        if (log_) {
            log_->debug("interval=" + std::to_string(cfg_.announceInterval)
                        + " default_num_want=" + std::to_string(cfg_.defaultNumWant)
                        + " max_peers=" + std::to_string(cfg_.maxPeersPerReply),
                        kLogName);
        }
    }


    bool TrackerEngine::handleDatagram(std::span<const std::uint8_t> bytes,
                                       const SocketAddress& source,
                                       std::vector<std::uint8_t>& out)
    {
        out.clear();

        auto req = WireCodec::decodeRequest(bytes);
        if (!req.has_value()) {
            ++stats_.droppedMalformed;
            TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
                << "drop malformed datagram from " << source.toString()
                << " (" << bytes.size() << " bytes): "
                << errcName(req.error->code) << ": " << req.error->message;
            return false;
        }

        auto resp = handleRequest(req.get(), source);
        if (!resp) return false;

        WireCodec::encodeResponseInto(*resp, out);
        TRACKERD_LOG(log_.get(), LogLevel::trace, kLogName)
            << "reply " << out.size() << " bytes to " << source.toString();
        return true;
    }


    std::optional<Response> TrackerEngine::handleRequest(const Request& req, const SocketAddress& source) {
        return std::visit([&](const auto& r) { return handle(r, source); }, req);
    }


    std::optional<Response> TrackerEngine::handle(const ConnectRequest& req, const SocketAddress& source) {
        if (req.connectionId != kProtocolMagic) {
            ++stats_.droppedUnauthorized;
            TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
                << "drop connect with bad protocol id from " << source.toString();
            return std::nullopt;
        }

        ++stats_.connects;
        const ConnectionId id = connections_.issue(source);
        TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
            << "connect from " << source.toString() << " tx=" << req.transactionId;
        return ConnectResponse{req.transactionId, id};
    }


    std::optional<Response> TrackerEngine::handle(const AnnounceRequest& req, const SocketAddress& source) {
        if (!connections_.validate(source, req.connectionId)) {
            ++stats_.droppedUnauthorized;
            TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
                << "drop announce with unknown connection id from " << source.toString();
            return std::nullopt;
        }

        ++stats_.announces;

        // The ip field of the request is ignored; peers are registered under
        // the address the datagram actually came from.
        const TorrentSwarm swarm = swarms_.getOrCreate(req.infoHash, source, req.event);

        AnnounceResponse out;
        out.transactionId = req.transactionId;
        out.interval = cfg_.announceInterval;
        out.leechers = swarm.leechers;
        out.seeders  = swarm.seeders;
        out.peers    = swarms_.samplePeers(req.infoHash, peerLimit(req.numWant));

        if (log_ && log_->enabled(LogLevel::debug)) {
            logger::LogRecord rec;
            rec.level = LogLevel::debug;
            rec.logger = kLogName;
            rec.msg = "announce";
            rec.endpoint = source.toString();
            rec.action = actionName(Action::announce);
            rec.infoHash = req.infoHash.toHex();
            rec.event = eventName(req.event);
            rec.peers = static_cast<int>(out.peers.size());
            rec.interval = static_cast<int>(out.interval);
            log_->log(std::move(rec));
        }
        return out;
    }


    std::optional<Response> TrackerEngine::handle(const ScrapeRequest& req, const SocketAddress& source) {
        if (!connections_.validate(source, req.connectionId)) {
            ++stats_.droppedUnauthorized;
            TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
                << "drop scrape with unknown connection id from " << source.toString();
            return std::nullopt;
        }

        ++stats_.scrapes;

        ScrapeResponse out;
        out.transactionId = req.transactionId;
        out.stats.reserve(req.infoHashes.size());
        for (const auto& h : req.infoHashes) {
            out.stats.push_back(swarms_.scrape(h));
        }

        TRACKERD_LOG(log_.get(), LogLevel::debug, kLogName)
            << "scrape of " << req.infoHashes.size() << " hashes from " << source.toString();
        return out;
    }


    std::size_t TrackerEngine::peerLimit(std::int32_t numWant) const {
        const std::uint32_t wanted = numWant < 0 ? cfg_.defaultNumWant
                                                 : static_cast<std::uint32_t>(numWant);
        return std::min(wanted, cfg_.maxPeersPerReply);
    }


} // namespace trackerd::tracker
