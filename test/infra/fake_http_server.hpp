// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <cctype>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace svcnet {
namespace test {

struct ReceivedRequest {
    std::string method;
    std::string target;
    std::string body;
};

// One-request-per-connection HTTP responder running on its own io thread.
// The handler returns the complete raw response (status line, headers and
// body); the connection is closed after it is written.
// Protocol is boost::asio::ip::tcp or boost::asio::local::stream_protocol.
template <typename Protocol>
class FakeHttpServer {
public:
    using Handler = std::function<std::string(const ReceivedRequest&)>;

    FakeHttpServer(const typename Protocol::endpoint& endpoint, Handler handler)
        : acceptor_(io_, endpoint), handler_(std::move(handler)) {
        Accept();
        thread_ = std::thread([this] { io_.run(); });
    }

    ~FakeHttpServer() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeHttpServer(const FakeHttpServer&) = delete;
    FakeHttpServer& operator=(const FakeHttpServer&) = delete;

    typename Protocol::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    static std::string Respond(int status, const std::string& body,
                               const std::string& reason = "OK") {
        return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "Connection: close\r\n\r\n" + body;
    }

private:
    void Accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec,
                                      typename Protocol::socket socket) {
            if (ec) {
                return;
            }
            Serve(socket);
            Accept();
        });
    }

    void Serve(typename Protocol::socket& socket) {
        namespace asio = boost::asio;
        boost::system::error_code ec;
        std::string data;
        size_t header_size = asio::read_until(socket, asio::dynamic_buffer(data), "\r\n\r\n", ec);
        if (ec) {
            return;
        }

        ReceivedRequest request;
        std::string head = data.substr(0, header_size);
        size_t first_space = head.find(' ');
        size_t second_space = head.find(' ', first_space + 1);
        request.method = head.substr(0, first_space);
        request.target = head.substr(first_space + 1, second_space - first_space - 1);

        size_t content_length = 0;
        std::string lower = head;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        size_t header = lower.find("content-length:");
        if (header != std::string::npos) {
            content_length = std::stoul(head.substr(header + 15, head.find("\r\n", header) - header - 15));
        }
        if (data.size() < header_size + content_length) {
            asio::read(socket, asio::dynamic_buffer(data),
                       asio::transfer_exactly(header_size + content_length - data.size()), ec);
            if (ec) {
                return;
            }
        }
        request.body = data.substr(header_size, content_length);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        std::string response = handler_(request);
        asio::write(socket, asio::buffer(response), ec);
        socket.shutdown(Protocol::socket::shutdown_both, ec);
        socket.close(ec);
    }

    boost::asio::io_context io_;
    typename Protocol::acceptor acceptor_;
    Handler handler_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<ReceivedRequest> requests_;
};

using FakeTcpServer = FakeHttpServer<boost::asio::ip::tcp>;
using FakeUnixServer = FakeHttpServer<boost::asio::local::stream_protocol>;

} // namespace test
} // namespace svcnet
