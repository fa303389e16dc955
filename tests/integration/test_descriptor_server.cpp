/**
 * @file test_descriptor_server.cpp
 * @brief Integration test: descriptor document served over a real TCP socket
 */

#include <gtest/gtest.h>
#include <dmsd/net/tcp_listener.hpp>
#include <dmsd/services/descriptor_server.hpp>
#include <dmsd/upnp/descriptor.hpp>
#include <dmsd/utils/logger.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace dmsd;

namespace {

struct RawResponse {
    int status = 0;
    std::string head;
    std::string body;

    std::string header(const std::string& name) const {
        std::string key = "\r\n" + name + ": ";
        size_t start = head.find(key);
        if (start == std::string::npos) {
            return "";
        }
        start += key.size();
        return head.substr(start, head.find("\r\n", start) - start);
    }
};

}  // namespace

class DescriptorServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        document_ = upnp::buildDescriptorDocument(
            "uuid:aaaaaaaa-bbbb-cccc-dddd-eeeeeeeeeeee", "mediabox", "alice");

        services::HttpServerConfig config;
        config.bind_addr = "127.0.0.1";
        config.port = 0;
        config.receive_timeout_ms = 1000;
        config.max_request_bytes = 1024;

        server_ = std::make_unique<services::DescriptorServer>(config);
        server_->addDocument(upnp::kDescriptorPath, upnp::kDescriptorContentType, document_);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        server_->stop();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    // Sends raw bytes and reads until the server closes the connection
    RawResponse exchange(const std::string& request) {
        RawResponse response;

        net::TcpConnection client;
        EXPECT_TRUE(client.connect(net::SocketAddress("127.0.0.1", server_->port())));
        EXPECT_TRUE(client.setReceiveTimeout(2000));
        EXPECT_TRUE(client.sendAll(request.data(), request.size()));

        std::string data;
        std::vector<char> buffer(4096);
        while (true) {
            int received = client.receive(buffer.data(), buffer.size());
            if (received <= 0) {
                break;
            }
            data.append(buffer.data(), static_cast<size_t>(received));
        }

        size_t split = data.find("\r\n\r\n");
        if (split == std::string::npos) {
            return response;
        }
        response.head = data.substr(0, split + 2);
        response.body = data.substr(split + 4);

        if (response.head.compare(0, 9, "HTTP/1.1 ") == 0) {
            response.status = std::stoi(response.head.substr(9, 3));
        }
        return response;
    }

    std::string document_;
    std::unique_ptr<services::DescriptorServer> server_;
};

TEST_F(DescriptorServerTest, ServesDescriptor) {
    RawResponse response = exchange(
        "GET /rootDesc.xml HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), "text/xml; charset=\"utf-8\"");
    EXPECT_EQ(response.header("Content-Length"), std::to_string(document_.size()));
    EXPECT_EQ(response.header("Connection"), "close");
    EXPECT_EQ(response.body, document_);
}

TEST_F(DescriptorServerTest, RepeatedRequestsGetIdenticalBodies) {
    RawResponse first = exchange("GET /rootDesc.xml HTTP/1.1\r\n\r\n");
    RawResponse second = exchange("GET /rootDesc.xml?cache=0 HTTP/1.0\r\n\r\n");

    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(first.body, second.body);
    EXPECT_EQ(server_->requestCount(), 2u);
}

TEST_F(DescriptorServerTest, HeadOmitsBody) {
    RawResponse response = exchange("HEAD /rootDesc.xml HTTP/1.1\r\n\r\n");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Length"), std::to_string(document_.size()));
    EXPECT_TRUE(response.body.empty());
}

TEST_F(DescriptorServerTest, UnknownPathIs404) {
    RawResponse response = exchange("GET /nothing.xml HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.status, 404);
}

TEST_F(DescriptorServerTest, OtherMethodsAre405) {
    RawResponse response = exchange("POST /rootDesc.xml HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.header("Allow"), "GET, HEAD");
}

TEST_F(DescriptorServerTest, MalformedRequestIs400) {
    RawResponse response = exchange("garbage\r\n\r\n");
    EXPECT_EQ(response.status, 400);
}

TEST_F(DescriptorServerTest, OversizedHeadIs413) {
    std::string request = "GET /rootDesc.xml HTTP/1.1\r\nX-Padding: " +
                          std::string(2048, 'a') + "\r\n\r\n";
    RawResponse response = exchange(request);
    EXPECT_EQ(response.status, 413);
}

TEST_F(DescriptorServerTest, AddDocumentReplacesBody) {
    server_->addDocument("/extra.txt", "text/plain", "hello");

    RawResponse response = exchange("GET /extra.txt HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), "text/plain");
    EXPECT_EQ(response.body, "hello");
}

TEST_F(DescriptorServerTest, ServesConcurrentClients) {
    std::vector<std::thread> clients;
    std::vector<int> statuses(8, 0);

    for (size_t i = 0; i < statuses.size(); ++i) {
        clients.emplace_back([this, &statuses, i]() {
            statuses[i] = exchange("GET /rootDesc.xml HTTP/1.1\r\n\r\n").status;
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    for (int status : statuses) {
        EXPECT_EQ(status, 200);
    }
}

TEST_F(DescriptorServerTest, StalledClientDoesNotBlockOthers) {
    // Connects, sends one byte of a request line, then goes quiet
    net::TcpConnection stalled;
    ASSERT_TRUE(stalled.connect(net::SocketAddress("127.0.0.1", server_->port())));
    ASSERT_TRUE(stalled.sendAll("G", 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto before = std::chrono::steady_clock::now();
    RawResponse response = exchange("GET /rootDesc.xml HTTP/1.1\r\n\r\n");
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, document_);
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
}

TEST_F(DescriptorServerTest, TricklingClientHitsOverallDeadline) {
    net::TcpConnection client;
    ASSERT_TRUE(client.connect(net::SocketAddress("127.0.0.1", server_->port())));
    ASSERT_TRUE(client.setReceiveTimeout(3000));

    auto before = std::chrono::steady_clock::now();
    for (char c : std::string("GET")) {
        ASSERT_TRUE(client.sendAll(&c, 1));
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
    }

    std::string data;
    std::vector<char> buffer(1024);
    int received;
    while ((received = client.receive(buffer.data(), buffer.size())) > 0) {
        data.append(buffer.data(), static_cast<size_t>(received));
    }
    auto elapsed = std::chrono::steady_clock::now() - before;

    // Each byte arrives well inside the 1 s timeout, but the head as a whole does not
    EXPECT_EQ(data.compare(0, 12, "HTTP/1.1 400"), 0) << data;
    EXPECT_LT(elapsed, std::chrono::milliseconds(1800));
}

TEST_F(DescriptorServerTest, StopDoesNotWaitForStalledClients) {
    net::TcpConnection stalled;
    ASSERT_TRUE(stalled.connect(net::SocketAddress("127.0.0.1", server_->port())));
    ASSERT_TRUE(stalled.sendAll("GET /", 5));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto before = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(800));
}

TEST(DescriptorServerLimitTest, ExtraConnectionsGet503) {
    services::HttpServerConfig config;
    config.bind_addr = "127.0.0.1";
    config.receive_timeout_ms = 2000;
    config.max_connections = 1;

    services::DescriptorServer server(config);
    server.addDocument("/rootDesc.xml", "text/xml", "<root/>");
    ASSERT_TRUE(server.start());

    net::TcpConnection holder;
    ASSERT_TRUE(holder.connect(net::SocketAddress("127.0.0.1", server.port())));
    ASSERT_TRUE(holder.sendAll("G", 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    // Rejected before any request is read
    net::TcpConnection extra;
    ASSERT_TRUE(extra.connect(net::SocketAddress("127.0.0.1", server.port())));
    ASSERT_TRUE(extra.setReceiveTimeout(1000));

    std::vector<char> buffer(1024);
    int received = extra.receive(buffer.data(), buffer.size());
    ASSERT_GT(received, 0);
    std::string data(buffer.data(), static_cast<size_t>(received));
    EXPECT_EQ(data.compare(0, 12, "HTTP/1.1 503"), 0) << data;

    server.stop();
}

TEST_F(DescriptorServerTest, StopIsPromptAndFinal) {
    uint16_t port = server_->port();

    auto before = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(1));
    EXPECT_FALSE(server_->isRunning());

    net::TcpConnection client;
    EXPECT_FALSE(client.connect(net::SocketAddress("127.0.0.1", port)));
}

TEST(DescriptorServerRespondTest, RespondWithoutSocket) {
    services::DescriptorServer server;
    server.addDocument("/rootDesc.xml", "text/xml", "<root/>");

    net::HttpRequest get;
    get.method = "GET";
    get.target = "/rootDesc.xml";
    get.version = "HTTP/1.1";
    net::HttpResponse ok = server.respond(get);
    EXPECT_EQ(ok.status, 200);
    EXPECT_EQ(ok.body, "<root/>");
    EXPECT_FALSE(ok.omitBody);

    net::HttpRequest put = get;
    put.method = "PUT";
    EXPECT_EQ(server.respond(put).status, 405);

    net::HttpRequest missing = get;
    missing.target = "/missing";
    EXPECT_EQ(server.respond(missing).status, 404);

    EXPECT_EQ(server.port(), 0);
}
