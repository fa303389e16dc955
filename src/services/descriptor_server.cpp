/**
 * @file descriptor_server.cpp
 * @brief DescriptorServer implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/services/descriptor_server.hpp"
#include "dmsd/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

namespace dmsd {
namespace services {

namespace {

// Accept and request reads wake up this often to notice a stop request
constexpr int kAcceptPollMs = 200;

}  // namespace

DescriptorServer::DescriptorServer(const HttpServerConfig& config)
    : config_(config)
{
}

DescriptorServer::~DescriptorServer() {
    stop();
}

void DescriptorServer::addDocument(const std::string& path, const std::string& contentType,
                                   const std::string& body) {
    std::lock_guard<std::mutex> lock(documentsMutex_);
    documents_[path] = Document{contentType, body};
    LOG_DEBUG("HttpServer", "Serving {} ({} bytes)", path, body.size());
}

bool DescriptorServer::start() {
    if (running_.load()) {
        LOG_WARN("HttpServer", "Server already running");
        return false;
    }

    if (!listener_.isValid()) {
        LOG_ERROR("HttpServer", "Listener socket not valid");
        return false;
    }

    if (!listener_.setReuseAddress(true)) {
        LOG_WARN("HttpServer", "Failed to set SO_REUSEADDR");
    }

    if (!listener_.bind(config_.port, config_.bind_addr)) {
        LOG_ERROR("HttpServer", "Failed to bind to {}:{}", config_.bind_addr, config_.port);
        return false;
    }

    if (!listener_.listen()) {
        LOG_ERROR("HttpServer", "Failed to listen on {}:{}", config_.bind_addr, config_.port);
        return false;
    }

    signal_.reset();
    running_.store(true);
    acceptThread_ = std::thread(&DescriptorServer::acceptLoop, this);

    LOG_INFO("HttpServer", "HTTP server on {}:{}", config_.bind_addr, port());
    return true;
}

void DescriptorServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("HttpServer", "Stopping HTTP server...");
    signal_.requestStop();

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    joinWorkers();

    listener_.close();
    running_.store(false);
    LOG_INFO("HttpServer", "HTTP server stopped");
}

uint16_t DescriptorServer::port() const {
    return listener_.getLocalPort();
}

void DescriptorServer::acceptLoop() {
    LOG_DEBUG("HttpServer", "Accept thread started");

    while (!signal_.stopRequested()) {
        reapWorkers();

        net::TcpConnection connection;
        int result = listener_.accept(kAcceptPollMs, connection);

        if (result > 0) {
            if (workers_.size() >= config_.max_connections) {
                rejectConnection(connection);
                continue;
            }

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread worker([this, done](net::TcpConnection conn) {
                handleConnection(conn);
                done->store(true);
            }, std::move(connection));
            workers_.push_back(Worker{std::move(worker), done});
        } else if (result < 0) {
            LOG_ERROR("HttpServer", "Accept failed: {}",
                      net::socketErrorString(listener_.getLastError()));
            // Back off so a persistent error (e.g. EMFILE) does not spin
            signal_.waitFor(std::chrono::milliseconds(kAcceptPollMs));
        }
    }

    LOG_DEBUG("HttpServer", "Accept thread stopped");
}

void DescriptorServer::reapWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void DescriptorServer::joinWorkers() {
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    workers_.clear();
}

void DescriptorServer::rejectConnection(net::TcpConnection& connection) {
    LOG_WARN("HttpServer", "Rejecting {}: {} connections in progress",
             connection.peer().toString(), workers_.size());

    net::HttpResponse response;
    response.status = 503;
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    response.headers.emplace_back("Connection", "close");
    response.body = std::string(net::httpReasonPhrase(response.status)) + "\n";

    std::string wire = response.serialize();
    if (!connection.sendAll(wire.data(), wire.size())) {
        LOG_DEBUG("HttpServer", "Failed to send 503 to {}: {}",
                  connection.peer().toString(),
                  net::socketErrorString(connection.getLastError()));
    }
}

void DescriptorServer::handleConnection(net::TcpConnection& connection) {
    // One deadline for the whole head, however the bytes trickle in
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.receive_timeout_ms);

    std::string data;
    std::vector<char> buffer(4096);
    size_t headerEnd = std::string::npos;

    while (headerEnd == std::string::npos && data.size() < config_.max_request_bytes) {
        if (signal_.stopRequested()) {
            LOG_DEBUG("HttpServer", "Dropping {} on shutdown", connection.peer().toString());
            return;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG_DEBUG("HttpServer", "Request from {} timed out", connection.peer().toString());
            break;
        }

        int ready = connection.waitReadable(
            static_cast<int>(std::min<long long>(remaining, kAcceptPollMs)));
        if (ready < 0) {
            break;
        }
        if (ready == 0) {
            continue;
        }

        int received = connection.receive(buffer.data(), buffer.size());
        if (received <= 0) {
            break;
        }
        data.append(buffer.data(), static_cast<size_t>(received));
        headerEnd = net::findHeaderEnd(data);
    }

    if (data.empty()) {
        LOG_DEBUG("HttpServer", "Connection from {} closed without a request",
                  connection.peer().toString());
        return;
    }

    requests_.fetch_add(1);

    net::HttpRequest request;
    net::HttpResponse response;

    if (headerEnd == std::string::npos) {
        response.status = data.size() >= config_.max_request_bytes ? 413 : 400;
    } else if (!net::parseHttpRequest(data.substr(0, headerEnd), request)) {
        response.status = 400;
    } else {
        response = respond(request);
    }

    if (response.status != 200) {
        response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
        response.body = std::string(net::httpReasonPhrase(response.status)) + "\n";
        response.omitBody = request.method == "HEAD";
    }
    response.headers.emplace_back("Connection", "close");

    LOG_INFO("HttpServer", "{} {} {} from {} -> {}",
             request.method.empty() ? "-" : request.method,
             request.target.empty() ? "-" : request.target,
             request.version.empty() ? "-" : request.version,
             connection.peer().toString(), response.status);

    std::string wire = response.serialize();
    if (!connection.sendAll(wire.data(), wire.size())) {
        LOG_WARN("HttpServer", "Failed to send response to {}: {}",
                 connection.peer().toString(),
                 net::socketErrorString(connection.getLastError()));
    }
}

net::HttpResponse DescriptorServer::respond(const net::HttpRequest& request) const {
    net::HttpResponse response;

    if (request.method != "GET" && request.method != "HEAD") {
        response.status = 405;
        response.headers.emplace_back("Allow", "GET, HEAD");
        return response;
    }

    std::lock_guard<std::mutex> lock(documentsMutex_);
    auto it = documents_.find(request.path());
    if (it == documents_.end()) {
        response.status = 404;
        return response;
    }

    response.status = 200;
    response.headers.emplace_back("Content-Type", it->second.contentType);
    response.body = it->second.body;
    response.omitBody = request.method == "HEAD";
    return response;
}

}  // namespace services
}  // namespace dmsd
