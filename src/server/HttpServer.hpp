#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace Anime1Relay {

class RelayService;

// Accepts on the io_context; every connection is served by its own thread
// because upstream calls and streaming block.
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& ioc,
               const std::string& host,
               unsigned short port,
               RelayService& service);

    void run();
    // Stops accepting, shuts down open connections and joins their threads.
    // Call once the io_context has stopped running.
    void stop();

    unsigned short port() const;

    // Registry of live connections so stop() can interrupt blocking reads and writes.
    struct Connections {
        std::mutex mutex;
        std::set<boost::asio::ip::tcp::socket*> sockets;
        bool stopping = false;
    };

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void do_accept();
    void reap_finished();

    boost::asio::ip::tcp::acceptor acceptor_;
    RelayService& service_;
    std::shared_ptr<Connections> connections_;
    std::list<Worker> workers_; // io_context thread only, then stop()
};

}
