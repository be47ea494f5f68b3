// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/http_client.hpp"
#include "version.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <cctype>
#include <sstream>

namespace svcnet {
namespace network {

namespace asio = boost::asio;

namespace {

constexpr const char *CRLF = "\r\n";

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

// Decode a chunked body; nullopt on framing errors or truncated input
std::optional<std::string> DecodeChunked(const std::string &raw, size_t pos) {
  std::string body;
  while (true) {
    size_t line_end = raw.find(CRLF, pos);
    if (line_end == std::string::npos) {
      return std::nullopt;
    }
    std::string size_field = raw.substr(pos, line_end - pos);
    size_t extension = size_field.find(';');
    if (extension != std::string::npos) {
      size_field = size_field.substr(0, extension);
    }
    size_field = Trim(size_field);
    if (size_field.empty() ||
        !std::all_of(size_field.begin(), size_field.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
      return std::nullopt;
    }

    size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(size_field, nullptr, 16);
    } catch (const std::out_of_range &) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (chunk_size == 0) {
      return body;  // trailers, if any, are ignored
    }
    // pos <= raw.size(); chunk_size may be close to SIZE_MAX
    if (raw.size() < pos + 2 || chunk_size > raw.size() - pos - 2 ||
        raw.compare(pos + chunk_size, 2, CRLF) != 0) {
      return std::nullopt;
    }
    body.append(raw, pos, chunk_size);
    pos += chunk_size + 2;
  }
}

// Connect, write the request, read until close. The whole exchange shares
// one deadline enforced by io_context::run_for.
template <typename Socket, typename Endpoint>
HttpResponse Exchange(asio::io_context &io, Socket &socket, const Endpoint &endpoint,
                      const HttpRequest &request, std::chrono::milliseconds timeout,
                      const std::string &peer) {
  const std::string wire = SerializeRequest(request);
  std::string raw;
  boost::system::error_code result;
  bool done = false;

  socket.async_connect(endpoint, [&](const boost::system::error_code &connect_ec) {
    if (connect_ec) {
      result = connect_ec;
      done = true;
      return;
    }
    asio::async_write(socket, asio::buffer(wire),
                      [&](const boost::system::error_code &write_ec, std::size_t) {
      if (write_ec) {
        result = write_ec;
        done = true;
        return;
      }
      asio::async_read(socket, asio::dynamic_buffer(raw),
                       [&](const boost::system::error_code &read_ec, std::size_t) {
        if (read_ec && read_ec != asio::error::eof) {
          result = read_ec;
        }
        done = true;
      });
    });
  });

  io.run_for(timeout);

  if (!done) {
    boost::system::error_code ignored;
    socket.close(ignored);
    throw HttpError(request.method + " " + request.target + " to " + peer +
                    " timed out after " + std::to_string(timeout.count()) + " ms");
  }
  if (result) {
    throw HttpError(request.method + " " + request.target + " to " + peer +
                    " failed: " + result.message());
  }

  auto response = ParseResponse(raw);
  if (!response) {
    throw HttpError("Malformed HTTP response from " + peer + " for " +
                    request.method + " " + request.target);
  }
  return *response;
}

} // namespace

std::string SerializeRequest(const HttpRequest &request) {
  std::ostringstream out;
  out << request.method << " " << request.target << " HTTP/1.1" << CRLF;
  out << "Host: " << request.host << CRLF;
  out << "User-Agent: " << GetContainerLabel() << CRLF;
  out << "Accept: application/json" << CRLF;
  if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
    out << "Content-Type: " << request.content_type << CRLF;
    out << "Content-Length: " << request.body.size() << CRLF;
  }
  out << "Connection: close" << CRLF << CRLF;
  out << request.body;
  return out.str();
}

std::optional<HttpResponse> ParseResponse(const std::string &raw) {
  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return std::nullopt;
  }

  // Status line: HTTP/1.1 200 OK
  size_t status_end = raw.find(CRLF);
  std::string status_line = raw.substr(0, status_end);
  if (status_line.rfind("HTTP/", 0) != 0) {
    return std::nullopt;
  }
  size_t code_start = status_line.find(' ');
  if (code_start == std::string::npos || status_line.size() < code_start + 4) {
    return std::nullopt;
  }
  std::string code = status_line.substr(code_start + 1, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }

  HttpResponse response;
  response.status = std::stoi(code);

  size_t pos = status_end + 2;
  while (pos < header_end) {
    size_t line_end = raw.find(CRLF, pos);
    std::string line = raw.substr(pos, line_end - pos);
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    response.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    pos = line_end + 2;
  }

  size_t body_start = header_end + 4;
  auto transfer_encoding = response.headers.find("transfer-encoding");
  auto content_length = response.headers.find("content-length");

  if (transfer_encoding != response.headers.end() &&
      ToLower(transfer_encoding->second).find("chunked") != std::string::npos) {
    auto body = DecodeChunked(raw, body_start);
    if (!body) {
      return std::nullopt;
    }
    response.body = std::move(*body);
  } else if (content_length != response.headers.end()) {
    size_t length = 0;
    try {
      length = std::stoul(content_length->second);
    } catch (const std::exception &) {
      return std::nullopt;
    }
    if (raw.size() < body_start + length) {
      return std::nullopt;
    }
    response.body = raw.substr(body_start, length);
  } else {
    response.body = raw.substr(body_start);
  }

  return response;
}

HttpResponse SendOverUnixSocket(const std::string &socket_path,
                                const HttpRequest &request,
                                std::chrono::milliseconds timeout) {
  asio::io_context io;
  asio::local::stream_protocol::socket socket(io);
  asio::local::stream_protocol::endpoint endpoint(socket_path);
  return Exchange(io, socket, endpoint, request, timeout, "unix:" + socket_path);
}

HttpResponse SendOverTcp(const std::string &host, uint16_t port,
                         const HttpRequest &request,
                         std::chrono::milliseconds timeout) {
  asio::io_context io;
  const std::string peer = host + ":" + std::to_string(port);

  boost::system::error_code ec;
  asio::ip::tcp::resolver resolver(io);
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if (ec || results.empty()) {
    throw HttpError("Failed to resolve " + peer + ": " +
                    (ec ? ec.message() : std::string("no addresses")));
  }

  asio::ip::tcp::socket socket(io);
  return Exchange(io, socket, results.begin()->endpoint(), request, timeout, peer);
}

} // namespace network
} // namespace svcnet
