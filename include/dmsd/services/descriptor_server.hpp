/**
 * @file descriptor_server.hpp
 * @brief HTTP server for the device description document.
 *
 * DescriptorServer handles:
 * - Binding an OS-assigned port before any announcement goes out
 * - Serving registered static documents (GET and HEAD)
 * - Logging every request
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/net/http_message.hpp"
#include "dmsd/net/tcp_listener.hpp"
#include "dmsd/services/export.hpp"
#include "dmsd/utils/shutdown_signal.hpp"

#include <atomic>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dmsd {
namespace services {

/**
 * @struct HttpServerConfig
 * @brief Listener settings for the descriptor server.
 */
struct DMSD_SERVICES_API HttpServerConfig {
    std::string bind_addr;          ///< Local address (any by default)
    uint16_t port;                  ///< 0 = OS-assigned
    int receive_timeout_ms;         ///< Deadline for reading a whole request head
    size_t max_request_bytes;       ///< Upper bound on a request head
    size_t max_connections;         ///< Connections served at once; extra ones get 503

    HttpServerConfig()
        : bind_addr("0.0.0.0")
        , port(0)
        , receive_timeout_ms(5000)
        , max_request_bytes(16384)
        , max_connections(32)
    {}
};

/**
 * @class DescriptorServer
 * @brief Serves static XML documents over HTTP/1.1.
 *
 * One request per connection, answered with "Connection: close".
 * Each accepted connection is served on its own worker thread, so a
 * stalled client never delays another.
 *
 * Usage:
 * @code
 * DescriptorServer server(config);
 * server.addDocument("/rootDesc.xml", "text/xml; charset=\"utf-8\"", xml);
 * if (!server.start()) { ... }
 * uint16_t port = server.port();
 * // ... run ...
 * server.stop();
 * @endcode
 */
class DMSD_SERVICES_API DescriptorServer {
public:
    explicit DescriptorServer(const HttpServerConfig& config = HttpServerConfig());

    /**
     * @brief Destructor - stops the server if running.
     */
    ~DescriptorServer();

    DescriptorServer(const DescriptorServer&) = delete;
    DescriptorServer& operator=(const DescriptorServer&) = delete;

    /**
     * @brief Register (or replace) a document.
     * @param path Absolute request path, e.g. "/rootDesc.xml".
     */
    void addDocument(const std::string& path, const std::string& contentType,
                     const std::string& body);

    /**
     * @brief Bind, listen, and start the accept thread.
     * @return False if the listener could not be set up.
     */
    bool start();

    /**
     * @brief Stop accepting, then join the accept thread and all workers.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Port the listener is bound to, queried from the socket.
     * @return 0 if not listening.
     */
    uint16_t port() const;

    /**
     * @brief Produce the response for a parsed request.
     */
    net::HttpResponse respond(const net::HttpRequest& request) const;

    uint64_t requestCount() const { return requests_.load(); }

private:
    struct Document {
        std::string contentType;
        std::string body;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    HttpServerConfig config_;
    net::TcpListener listener_;
    utils::ShutdownSignal signal_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> requests_{0};
    std::thread acceptThread_;
    std::list<Worker> workers_;     ///< Owned by the accept thread until stop()

    mutable std::mutex documentsMutex_;
    std::map<std::string, Document> documents_;

    void acceptLoop();
    void reapWorkers();
    void joinWorkers();
    void rejectConnection(net::TcpConnection& connection);
    void handleConnection(net::TcpConnection& connection);
};

}  // namespace services
}  // namespace dmsd
