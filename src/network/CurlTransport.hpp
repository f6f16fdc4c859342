#pragma once
#include <memory>
#include <mutex>
#include "../../config/Config.hpp"
#include "../interfaces/IHttpTransport.hpp"

namespace Anime1Relay {

// libcurl transport. All requests share one cookie jar, DNS cache and
// connection pool (a CURLSH context) until Reset() swaps it for a fresh one.
class CurlTransport : public IHttpTransport {
public:
    explicit CurlTransport(const Config& config);
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse Perform(const HttpRequest& request) override;
    std::unique_ptr<IHttpStream> OpenStream(const HttpRequest& request) override;
    void Preheat() override;
    void Reset() override;

    struct SessionContext;

private:
    std::shared_ptr<SessionContext> AcquireContext();

    const Config& config_;
    std::mutex context_mutex_;
    std::shared_ptr<SessionContext> context_;
};

}
