#include "HttpServer.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <thread>

#include "../core/Errors.hpp"
#include "../core/RelayService.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
using     tcp = boost::asio::ip::tcp;

namespace Anime1Relay {

namespace {

unsigned StatusFor(const RelayError& e) {
    switch (e.Kind()) {
        case ErrorKind::InvalidUrl:
        case ErrorKind::UnsupportedPlaylistFormat:
            return 400;
        case ErrorKind::UnknownUrlType:
        case ErrorKind::UnknownCategory:
        case ErrorKind::UnknownVideo:
            return 404;
        case ErrorKind::UpstreamError: {
            long status = static_cast<const UpstreamError&>(e).Status();
            return (status >= 400 && status < 600) ? static_cast<unsigned>(status) : 502;
        }
        case ErrorKind::UpstreamUnavailable:
            return 503;
        case ErrorKind::MalformedPage:
            return 502;
    }
    return 500;
}

std::optional<std::string> HeaderValue(const http::request<http::string_body>& req, http::field field) {
    auto it = req.find(field);
    if (it == req.end()) return std::nullopt;
    return std::string(it->value());
}

class Session {
public:
    Session(tcp::socket sock, RelayService& service, std::shared_ptr<HttpServer::Connections> connections)
        : socket_(std::move(sock)), service_(service), connections_(std::move(connections)) {}

    void run() {
        if (!enter()) return;
        beast::error_code ec;
        beast::flat_buffer buffer;
        for (;;) {
            http::request<http::string_body> req;
            http::read(socket_, buffer, req, ec);
            if (ec == http::error::end_of_stream) break;
            if (ec) {
                Logger::Log(LogLevel::Debug, "[session] read: " + ec.message());
                break;
            }
            if (!handle(req)) break;
        }
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        leave();
        socket_.close(ec);
    }

private:
    bool enter() {
        std::lock_guard<std::mutex> lock(connections_->mutex);
        if (connections_->stopping) return false;
        connections_->sockets.insert(&socket_);
        return true;
    }

    void leave() {
        std::lock_guard<std::mutex> lock(connections_->mutex);
        connections_->sockets.erase(&socket_);
    }

    std::string base_uri(const http::request<http::string_body>& req) const {
        auto host = HeaderValue(req, http::field::host);
        if (host && !host->empty()) return "http://" + *host;
        beast::error_code ec;
        auto ep = socket_.local_endpoint(ec);
        return "http://" + ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    bool handle(const http::request<http::string_body>& req) {
        const std::string target(req.target());
        const std::string path = UrlUtil::GetPath(target);
        Logger::Log(LogLevel::Info, std::string(req.method_string()) + " " + target);

        try {
            if (req.method() != http::verb::get) {
                return send_text(req, http::status::method_not_allowed, "text/plain; charset=utf-8", "Method not allowed");
            }

            // GET /
            if (path == "/") {
                return send_text(req, http::status::ok, "text/plain; charset=utf-8",
                                 "Use " + base_uri(req) + "/p?url=<Url> to parse any valid video posts url");
            }

            // GET /p?url=
            if (path == "/p") {
                auto url = UrlUtil::GetQueryParam(target, "url");
                if (!url) return send_error(req, 400, "Missing query 'url'");
                auto result = service_.Resolve(base_uri(req), *url);
                return send_text(req, http::status::ok, "application/json", result.dump());
            }

            // GET /c/{id}[?playlist=fmt] or /c/{id}/{fmt}
            if (path.rfind("/c/", 0) == 0) {
                std::string rest = path.substr(3);
                std::optional<std::string> format = UrlUtil::GetQueryParam(target, "playlist");
                auto slash = rest.find('/');
                bool attachment = format.has_value();
                if (slash != std::string::npos) {
                    if (!format) format = UrlUtil::PercentDecode(rest.substr(slash + 1));
                    rest = rest.substr(0, slash);
                }
                std::string category_id = UrlUtil::PercentDecode(rest);
                if (category_id.empty()) return send_error(req, 404, "Missing category id");

                PlaylistInfo playlist = service_.GetPlaylist(base_uri(req), category_id, format);
                http::response<http::string_body> res{ http::status::ok, req.version() };
                res.set(http::field::content_type, playlist.media_type);
                if (attachment) {
                    res.set(http::field::content_disposition,
                            "attachment; filename=\"" + UrlUtil::PercentEncode(playlist.file_name) + "\"");
                }
                res.keep_alive(req.keep_alive());
                res.body() = std::move(playlist.content);
                res.prepare_payload();
                return write(std::move(res));
            }

            // GET /v/{id}
            if (path.rfind("/v/", 0) == 0) {
                std::string post_id = UrlUtil::PercentDecode(path.substr(3));
                if (post_id.empty() || post_id.find('/') != std::string::npos) {
                    return send_error(req, 404, "Unknown video");
                }
                return stream_video(req, post_id);
            }

            return send_error(req, 404, "Not found");
        }
        catch (const RelayError& e) {
            Logger::Log(LogLevel::Warn, target + " failed: " + e.what());
            return send_error(req, StatusFor(e), e.what());
        }
        catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, target + " failed: " + e.what());
            return send_error(req, 500, e.what());
        }
    }

    bool stream_video(const http::request<http::string_body>& req, const std::string& post_id) {
        VideoStream video = service_.OpenVideo(post_id,
                                               HeaderValue(req, http::field::range),
                                               HeaderValue(req, http::field::if_range));

        http::response<http::buffer_body> res;
        res.version(req.version());
        res.result(static_cast<unsigned>(video.status));
        res.set(http::field::content_type, video.media_type);
        bool has_length = false;
        for (const auto& header : video.headers) {
            res.set(header.first, header.second);
            if (header.first == "Content-Length") has_length = true;
        }
        if (!has_length) res.chunked(true);
        res.keep_alive(req.keep_alive());
        res.body().data = nullptr;
        res.body().more = true;

        // From here on the response has begun; failures only close the connection.
        beast::error_code ec;
        http::response_serializer<http::buffer_body> sr{ res };
        http::write_header(socket_, sr, ec);
        if (ec) {
            Logger::Log(LogLevel::Debug, "Client went away before headers for post " + post_id);
            return false;
        }

        std::string chunk;
        try {
            while (video.body->ReadChunk(chunk)) {
                res.body().data = chunk.data();
                res.body().size = chunk.size();
                res.body().more = true;
                http::write(socket_, sr, ec);
                if (ec == http::error::need_buffer) {
                    ec = {};
                } else if (ec) {
                    Logger::Log(LogLevel::Debug, "Client disconnected while streaming post " + post_id + ": " + ec.message());
                    return false;
                }
            }
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "Stream aborted for post " + post_id + ": " + e.what());
            return false;
        }

        res.body().data = nullptr;
        res.body().more = false;
        http::write(socket_, sr, ec);
        if (ec && ec != http::error::need_buffer) return false;
        return res.keep_alive();
    }

    bool send_text(const http::request<http::string_body>& req, http::status status,
                   const std::string& content_type, std::string body) {
        http::response<http::string_body> res{ status, req.version() };
        res.set(http::field::content_type, content_type);
        res.keep_alive(req.keep_alive());
        res.body() = std::move(body);
        res.prepare_payload();
        return write(std::move(res));
    }

    bool send_error(const http::request<http::string_body>& req, unsigned status, const std::string& detail) {
        http::response<http::string_body> res{ http::int_to_status(status), req.version() };
        res.result(status);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        res.body() = nlohmann::json{ {"detail", detail} }.dump();
        res.prepare_payload();
        return write(std::move(res));
    }

    bool write(http::response<http::string_body>&& res) {
        beast::error_code ec;
        http::write(socket_, res, ec);
        if (ec) return false;
        return res.keep_alive();
    }

    tcp::socket socket_;
    RelayService& service_;
    std::shared_ptr<HttpServer::Connections> connections_;
};

} // anonymous namespace

HttpServer::HttpServer(boost::asio::io_context& ioc,
                       const std::string& host,
                       unsigned short port,
                       RelayService& service)
    : acceptor_(ioc), service_(service), connections_(std::make_shared<Connections>())
{
    beast::error_code ec;

    auto address = boost::asio::ip::make_address(host, ec);
    if (ec) throw std::runtime_error("invalid listen_host '" + host + "': " + ec.message());

    tcp::endpoint ep{ address, port };
    acceptor_.open(ep.protocol(), ec);
    if (ec) throw std::runtime_error("acceptor.open: " + ec.message());

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("acceptor.set_option: " + ec.message());

    acceptor_.bind(ep, ec);
    if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());
}

void HttpServer::run() {
    do_accept();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) mutable {
            if (ec == boost::asio::error::operation_aborted) return;
            self->reap_finished();
            if (!ec) {
                auto done = std::make_shared<std::atomic<bool>>(false);
                std::thread worker([sock = std::move(socket), &service = self->service_,
                                    connections = self->connections_, done]() mutable {
                    Session(std::move(sock), service, connections).run();
                    *done = true;
                });
                self->workers_.push_back(Worker{ std::move(worker), done });
            }
            else {
                Logger::Log(LogLevel::Warn, "[accept] " + ec.message());
            }
            self->do_accept();
        }
    );
}

void HttpServer::reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (*it->done) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

unsigned short HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);

    {
        std::lock_guard<std::mutex> lock(connections_->mutex);
        connections_->stopping = true;
        for (auto* socket : connections_->sockets) {
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) worker.thread.join();
    }
    workers_.clear();
    Logger::Log(LogLevel::Info, "HTTP server stopped.");
}

}
