#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <functional>
#include <list>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace Anime1Relay {
namespace Testing {

using BackingRequest = boost::beast::http::request<boost::beast::http::string_body>;
using BackingResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Plain HTTP server on 127.0.0.1 with an ephemeral port. Every request is
// answered by handler on the connection's own thread.
class BackingServer {
public:
    using Handler = std::function<BackingResponse(const BackingRequest&)>;

    explicit BackingServer(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(ioc_, { boost::asio::ip::make_address("127.0.0.1"), 0 }) {
        port_ = acceptor_.local_endpoint().port();
        accept_thread_ = std::thread([this] { AcceptLoop(); });
    }

    ~BackingServer() {
        boost::beast::error_code ec;
        stopping_ = true;
        {
            // Unblocks accept().
            boost::asio::ip::tcp::socket wake(ioc_);
            wake.connect(acceptor_.local_endpoint(), ec);
        }
        accept_thread_.join();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto* socket : sockets_) socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
        for (auto& t : connections_) t.join();
    }

    BackingServer(const BackingServer&) = delete;
    BackingServer& operator=(const BackingServer&) = delete;

    unsigned short Port() const { return port_; }
    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<BackingRequest> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void AcceptLoop() {
        for (;;) {
            boost::asio::ip::tcp::socket socket(ioc_);
            boost::beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (stopping_) return;
            if (ec) continue;
            connections_.emplace_back([this, s = std::move(socket)]() mutable { Serve(s); });
        }
    }

    void Serve(boost::asio::ip::tcp::socket& socket) {
        namespace http = boost::beast::http;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            sockets_.insert(&socket);
        }
        boost::beast::flat_buffer buffer;
        boost::beast::error_code ec;
        for (;;) {
            BackingRequest req;
            http::read(socket, buffer, req, ec);
            if (ec) break;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
            }
            BackingResponse res = handler_(req);
            res.version(req.version());
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            http::write(socket, res, ec);
            if (ec || !res.keep_alive()) break;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sockets_.erase(&socket);
        }
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    }

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;
    std::list<std::thread> connections_;

    std::mutex mutex_;
    std::set<boost::asio::ip::tcp::socket*> sockets_;
    std::vector<BackingRequest> requests_;
};

inline BackingResponse TextResponse(unsigned status, const std::string& body,
                                    const std::string& content_type = "text/plain") {
    BackingResponse res;
    res.result(status);
    res.set(boost::beast::http::field::content_type, content_type);
    res.body() = body;
    return res;
}

// Answers Range requests of the form "bytes=N-" or "bytes=N-M" over content.
inline BackingResponse RangedResponse(const BackingRequest& req, const std::string& content,
                                      const std::string& content_type = "video/mp4") {
    auto range = req.find(boost::beast::http::field::range);
    if (range == req.end()) {
        BackingResponse res = TextResponse(200, content, content_type);
        res.set(boost::beast::http::field::etag, "\"v1\"");
        return res;
    }
    std::string spec(range->value());
    spec = spec.substr(spec.find('=') + 1);
    auto dash = spec.find('-');
    size_t first = std::stoul(spec.substr(0, dash));
    size_t last = dash + 1 < spec.size() ? std::stoul(spec.substr(dash + 1)) : content.size() - 1;
    BackingResponse res = TextResponse(206, content.substr(first, last - first + 1), content_type);
    res.set(boost::beast::http::field::content_range,
            "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" + std::to_string(content.size()));
    res.set(boost::beast::http::field::etag, "\"v1\"");
    return res;
}

}
}
