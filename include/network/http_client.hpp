// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Minimal blocking HTTP/1.1 client over boost::asio

 Used for two local conversations:
 - Docker Engine API over its Unix domain socket
 - JSON-RPC liveness probes against published host ports (TCP)

 Every request is sent with "Connection: close" and the response is read
 until the peer closes, so no connection reuse or pipelining is needed.
 Content-Length and chunked bodies are both decoded.
*/

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace svcnet {
namespace network {

// Transport-level failure (connect/write/read/timeout/unparsable response)
class HttpError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct HttpRequest {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string content_type{"application/json"};
  std::string body;
};

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers;  // lower-cased names
  std::string body;

  bool IsSuccess() const { return status >= 200 && status < 300; }
};

constexpr std::chrono::milliseconds DEFAULT_HTTP_TIMEOUT{30000};

// Wire form of a request
std::string SerializeRequest(const HttpRequest &request);

// Parse a complete response read up to connection close.
// Returns std::nullopt if the status line, headers or body framing are
// malformed.
std::optional<HttpResponse> ParseResponse(const std::string &raw);

/**
 * Send a request over a Unix domain socket
 * @throws HttpError on connect/IO failure, timeout or malformed response
 */
HttpResponse SendOverUnixSocket(const std::string &socket_path,
                                const HttpRequest &request,
                                std::chrono::milliseconds timeout = DEFAULT_HTTP_TIMEOUT);

/**
 * Send a request over TCP
 * @throws HttpError on resolve/connect/IO failure, timeout or malformed response
 */
HttpResponse SendOverTcp(const std::string &host, uint16_t port,
                         const HttpRequest &request,
                         std::chrono::milliseconds timeout = DEFAULT_HTTP_TIMEOUT);

} // namespace network
} // namespace svcnet
