#pragma once

#include <ingest/frame_packet.hpp>

#include <functional>
#include <memory>
#include <string>

namespace sg {
    enum class ReadStatus {
        Ok,
        Timeout, // nothing arrived in time, source still alive
        Lost     // end of stream or pipeline error, reopen required
    };

    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool open() = 0;
        virtual void close() = 0;
        virtual ReadStatus read(FramePacket& out, int timeout_ms) = 0;
        virtual const std::string& id() const = 0;
    };

    // Builds a source for (session id, locator).
    using SourceFactory =
        std::function<std::unique_ptr<IFrameSource>(const std::string& session_id, const std::string& locator)>;
}
