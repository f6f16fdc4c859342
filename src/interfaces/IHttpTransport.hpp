#pragma once
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../model/Entities.hpp"

namespace Anime1Relay {

using HeaderList = std::vector<std::pair<std::string, std::string>>;
// Response headers keyed by lower-cased name.
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string url;
    HeaderList headers;
    std::string form_body; // non-empty turns the request into a POST
    CookieMap cookies;      // sent in addition to the session jar, or alone without it
    bool use_cookie_jar = true;  // read and update the shared session cookies
    bool decode_content = false; // let the transport inflate gzip/deflate
};

struct HttpResponse {
    long status_code = 0;
    HeaderMap headers;
    CookieMap cookies; // parsed from this response's Set-Cookie headers
    std::string body;
};

// Forward-only body of an open response. Not restartable; the connection is
// released when the object is destroyed.
class IHttpStream {
public:
    virtual ~IHttpStream() = default;
    virtual long StatusCode() const = 0;
    virtual const HeaderMap& Headers() const = 0;
    // Replaces chunk with the next piece of the body. Returns false at the end.
    virtual bool ReadChunk(std::string& chunk) = 0;
};

// Status >= 400 raises UpstreamError, transport failures raise UpstreamUnavailable,
// a buffered body over the configured size raises MalformedPage.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse Perform(const HttpRequest& request) = 0;
    virtual std::unique_ptr<IHttpStream> OpenStream(const HttpRequest& request) = 0;
    // Creates the cookie/connection context ahead of the first request.
    virtual void Preheat() = 0;
    // Drops the cookie/connection context; in-flight requests finish on the old one.
    virtual void Reset() = 0;
};

}
