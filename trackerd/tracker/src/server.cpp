#include "../include/server.hpp"


namespace trackerd::tracker {

    using logger::LogLevel;

    static constexpr const char* kLogName = "TrackerServer";


    TrackerServer::TrackerServer(UdpSocket socket, TrackerEngine& engine,
                                 std::shared_ptr<logger::Logger> log)
        : socket_(std::move(socket)), engine_(engine), log_(std::move(log)),
          readBuf_(kMaxDatagramSize)
    {
        writeBuf_.reserve(kMaxDatagramSize);
    }


    Expected<void> TrackerServer::serveOne()
    {
        auto dg = socket_.receive(readBuf_);
        if (!dg.has_value()) {
            return Expected<void>::failure(*dg.error);
        }

        const auto& d = dg.get();
        const std::span<const std::uint8_t> bytes(readBuf_.data(), d.size);
        if (!engine_.handleDatagram(bytes, d.source, writeBuf_)) {
            return Expected<void>::success();
        }
        return sendAll(d.source);
    }


    Expected<void> TrackerServer::sendAll(const SocketAddress& dest)
    {
        std::size_t start = 0;
        while (start < writeBuf_.size()) {
            std::span<const std::uint8_t> rest(writeBuf_.data() + start, writeBuf_.size() - start);
            auto sent = socket_.sendTo(rest, dest);
            if (!sent.has_value()) {
                return Expected<void>::failure(*sent.error);
            }
            start += sent.get();
        }
        return Expected<void>::success();
    }


    Expected<void> TrackerServer::run()
    {
        if (log_) {
            auto local = socket_.localAddress();
            TRACKERD_LOG(log_.get(), LogLevel::info, kLogName)
                << "serving on " << (local.has_value() ? local.get().toString() : std::string("?"));
        }

        for (;;) {
            auto r = serveOne();
            if (!r.has_value()) {
                const auto& st = engine_.stats();
                TRACKERD_LOG(log_.get(), LogLevel::error, kLogName)
                    << "stopping on I/O error: " << r.error->message
                    << " (connects=" << st.connects << " announces=" << st.announces
                    << " scrapes=" << st.scrapes << " malformed=" << st.droppedMalformed
                    << " unauthorized=" << st.droppedUnauthorized << ")";
                return r;
            }
        }
    }


} // namespace trackerd::tracker
