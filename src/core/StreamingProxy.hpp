#pragma once
#include <memory>
#include <optional>
#include <string>
#include "../interfaces/IHttpTransport.hpp"
#include "../model/Entities.hpp"

namespace Anime1Relay {

    class UpstreamClient;

    // Open passthrough of a backing video. `body` is single-pass; dropping the
    // VideoStream closes the backing connection.
    struct VideoStream {
        long status = 0;
        HeaderList headers; // allow-listed response headers, canonical names
        std::string media_type;
        std::unique_ptr<IHttpStream> body;
    };

    class StreamingProxy {
    public:
        StreamingProxy(IHttpTransport& transport, const UpstreamClient& upstream);

        VideoStream OpenStream(const ResolvedVideo& video,
                               const std::optional<std::string>& range,
                               const std::optional<std::string>& if_range);

        // Upstream response headers relayed to the client; everything else is dropped.
        static HeaderList FilterHeaders(const HeaderMap& upstream_headers);

    private:
        IHttpTransport& transport_;
        const UpstreamClient& upstream_;
    };

}
