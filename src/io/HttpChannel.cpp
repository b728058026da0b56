/* @file HttpChannel.cpp
 * @brief minimal HTTP/1.1 client for controller query endpoints - POSIX sockets + poll deadline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstring> // for strerror
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

// Linux headers
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

// benchguard headers
#include "io/HttpChannel.hpp"

using namespace benchguard::io;

namespace {
  using SteadyClock = std::chrono::steady_clock;

  // owns one socket fd; release() hands it back to the caller
  class SocketFd {
  public:
    explicit SocketFd(int fd) : fd_(fd) {}
    ~SocketFd() {
      if (fd_ >= 0)
        ::close(fd_);
    }
    SocketFd(const SocketFd&) = delete;
    SocketFd& operator=(const SocketFd&) = delete;

    int get() const { return fd_; }
    int release() { return std::exchange(fd_, -1); }

  private:
    int fd_{ -1 };
  };

  int msLeft(SteadyClock::time_point deadline) {
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  // false on timeout
  bool waitFor(int fd, short events, SteadyClock::time_point deadline) {
    pollfd pfd{ fd, events, 0 };
    while (true) {
      int ms = msLeft(deadline);
      if (ms == 0)
        return false;
      int rc = ::poll(&pfd, 1, ms);
      if (rc == -1) {
        if (errno == EINTR)
          continue;
        throw std::runtime_error(std::string("[HttpChannel] poll: ") + strerror(errno));
      }
      return rc > 0;
    }
  }

  int connectTo(const Url& url, SteadyClock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV; // no DNS: it would ignore the deadline

    const std::string port = std::to_string(url.port);
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0)
      throw std::runtime_error("[HttpChannel] " + url.host +
                               " is not a numeric address: " + gai_strerror(rc));
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    std::string lastError = "no usable address";
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
      SocketFd sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                             ai->ai_protocol));
      if (sock.get() < 0) {
        lastError = strerror(errno);
        continue;
      }
      if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0)
        return sock.release();
      if (errno != EINPROGRESS) {
        lastError = strerror(errno);
        continue;
      }
      if (!waitFor(sock.get(), POLLOUT, deadline))
        throw std::runtime_error("[HttpChannel] connect to " + url.host + ":" + port +
                                 " timed out");

      int soErr = 0;
      socklen_t len = sizeof(soErr);
      if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 && soErr == 0)
        return sock.release();
      lastError = strerror(soErr != 0 ? soErr : errno);
    }
    throw std::runtime_error("[HttpChannel] connect to " + url.host + ":" + port +
                             " failed: " + lastError);
  }

  void sendAll(int fd, const std::string& data, SteadyClock::time_point deadline) {
    std::size_t total = 0;
    while (total < data.size()) {
      ssize_t n = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
      if (n > 0) {
        total += static_cast<std::size_t>(n);
      } else if (n == -1 && errno == EINTR) {
        continue;
      } else if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        if (!waitFor(fd, POLLOUT, deadline))
          throw std::runtime_error("[HttpChannel] send timed out");
      } else {
        throw std::runtime_error(std::string("[HttpChannel] send: ") + strerror(errno));
      }
    }
  }

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
  }

  struct Head {
    int status{ 0 };
    std::size_t bodyOffset{ 0 };
    std::optional<std::size_t> contentLength{};
    bool chunked{ false };
  };

  // std::nullopt until the blank line that ends the headers has arrived
  std::optional<Head> parseHead(const std::string& raw) {
    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos)
      return std::nullopt;

    Head head;
    head.bodyOffset = end + 4;

    auto lineEnd = raw.find("\r\n");
    const std::string statusLine = raw.substr(0, lineEnd);
    auto sp = statusLine.find(' ');
    if (!statusLine.starts_with("HTTP/") || sp == std::string::npos ||
        statusLine.size() < sp + 4)
      throw std::runtime_error("[HttpChannel] malformed status line: " + statusLine);
    try {
      head.status = std::stoi(statusLine.substr(sp + 1, 3));
    } catch (const std::exception&) {
      throw std::runtime_error("[HttpChannel] malformed status line: " + statusLine);
    }

    std::size_t pos = lineEnd + 2;
    while (pos < end) {
      auto next = raw.find("\r\n", pos);
      const std::string line = raw.substr(pos, next - pos);
      pos = next + 2;
      auto colon = line.find(':');
      if (colon == std::string::npos)
        continue;
      const std::string name = lower(trim(line.substr(0, colon)));
      const std::string value = trim(line.substr(colon + 1));
      if (name == "content-length") {
        try {
          head.contentLength = static_cast<std::size_t>(std::stoul(value));
        } catch (const std::exception&) {
          throw std::runtime_error("[HttpChannel] bad Content-Length: " + value);
        }
      } else if (name == "transfer-encoding" && lower(value).find("chunked") != std::string::npos) {
        head.chunked = true;
      }
    }
    return head;
  }

  std::string decodeChunked(const std::string& body) {
    std::string out;
    std::size_t pos = 0;
    while (true) {
      auto lineEnd = body.find("\r\n", pos);
      if (lineEnd == std::string::npos)
        throw std::runtime_error("[HttpChannel] truncated chunked body");
      std::size_t size = 0;
      try {
        size = std::stoul(body.substr(pos, lineEnd - pos), nullptr, 16);
      } catch (const std::exception&) {
        throw std::runtime_error("[HttpChannel] bad chunk size");
      }
      pos = lineEnd + 2;
      if (size == 0)
        return out;
      if (pos + size > body.size())
        throw std::runtime_error("[HttpChannel] truncated chunked body");
      out.append(body, pos, size);
      pos += size + 2; // chunk data + CRLF
    }
  }
} // namespace

Url benchguard::io::parseUrl(const std::string& url) {
  std::string rest = url;
  if (rest.starts_with("https://"))
    throw std::invalid_argument("[HttpChannel] https is not supported: " + url);
  if (rest.starts_with("http://"))
    rest.erase(0, 7);

  Url out;
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos)
    out.target = rest.substr(slash);

  std::string::size_type colon = std::string::npos;
  if (authority.starts_with('[')) {
    auto close = authority.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument("[HttpChannel] unterminated IPv6 literal in url: " + url);
    if (close + 1 < authority.size() && authority[close + 1] == ':')
      colon = close + 1;
    else if (close + 1 != authority.size())
      throw std::invalid_argument("[HttpChannel] bad authority in url: " + url);
  } else {
    colon = authority.rfind(':');
  }
  if (colon != std::string::npos) {
    try {
      int port = std::stoi(authority.substr(colon + 1));
      if (port <= 0 || port > 65535)
        throw std::out_of_range("port");
      out.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception&) {
      throw std::invalid_argument("[HttpChannel] bad port in url: " + url);
    }
    authority.erase(colon);
  }
  if (authority.starts_with('[') && authority.ends_with(']'))
    authority = authority.substr(1, authority.size() - 2);
  if (authority.empty())
    throw std::invalid_argument("[HttpChannel] url has no host: " + url);
  out.host = authority;
  return out;
}

std::string benchguard::io::urlEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

HttpResponse HttpChannel::get(const std::string& url, std::chrono::milliseconds timeout) {
  return request("GET", url, {}, timeout);
}

HttpResponse HttpChannel::post(const std::string& url, const std::string& jsonBody,
                               std::chrono::milliseconds timeout) {
  return request("POST", url, jsonBody, timeout);
}

HttpResponse HttpChannel::request(const std::string& method, const std::string& url,
                                  const std::string& body, std::chrono::milliseconds timeout) {
  const Url target = parseUrl(url);
  const auto deadline = SteadyClock::now() + timeout;

  SocketFd sock(connectTo(target, deadline));

  std::string req = method + " " + target.target + " HTTP/1.1\r\n";
  req += "Host: " + target.host + ":" + std::to_string(target.port) + "\r\n";
  req += "Accept: application/json\r\n";
  req += "Connection: close\r\n";
  if (method == "POST") {
    req += "Content-Type: application/json\r\n";
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  req += "\r\n";
  req += body;
  sendAll(sock.get(), req, deadline);

  std::string raw;
  std::optional<Head> head;
  char temp[4096];
  bool eof = false;
  while (!eof) {
    if (!head)
      head = parseHead(raw);
    if (head && head->contentLength && raw.size() >= head->bodyOffset + *head->contentLength)
      break;

    if (!waitFor(sock.get(), POLLIN, deadline))
      throw std::runtime_error("[HttpChannel] " + method + " " + url + " timed out");

    ssize_t n = ::recv(sock.get(), temp, sizeof(temp), 0);
    if (n > 0) {
      raw.append(temp, static_cast<std::size_t>(n));
    } else if (n == 0) {
      eof = true; // peer closed: body ends here
    } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    } else {
      throw std::runtime_error(std::string("[HttpChannel] recv: ") + strerror(errno));
    }
  }

  if (!head)
    head = parseHead(raw);
  if (!head)
    throw std::runtime_error("[HttpChannel] connection closed before response headers");

  HttpResponse response;
  response.status = head->status;
  response.body = raw.substr(head->bodyOffset);
  if (head->chunked)
    response.body = decodeChunked(response.body);
  else if (head->contentLength) {
    if (response.body.size() < *head->contentLength)
      throw std::runtime_error("[HttpChannel] truncated body from " + url);
    response.body.resize(*head->contentLength);
  }
  return response;
}
