/* @file SnmpChannel.cpp
 * @brief SNMPv2c request/response over a connected UDP socket - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <memory>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// Linux headers
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// benchguard headers
#include "io/SnmpChannel.hpp"

using namespace benchguard::io;

namespace {
  using SteadyClock = std::chrono::steady_clock;

  const char* errorStatusName(std::int32_t status) {
    switch (status) {
    case 1:
      return "tooBig";
    case 2:
      return "noSuchName";
    case 3:
      return "badValue";
    case 4:
      return "readOnly";
    case 5:
      return "genErr";
    case 6:
      return "noAccess";
    case 7:
      return "wrongType";
    case 10:
      return "wrongValue";
    case 16:
      return "authorizationError";
    case 17:
      return "notWritable";
    default:
      return "error";
    }
  }

  class UdpSocket {
  public:
    explicit UdpSocket(const SnmpTarget& target) {
      addrinfo hints{};
      hints.ai_family = AF_UNSPEC;
      hints.ai_socktype = SOCK_DGRAM;
      hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV; // no DNS: it would ignore the deadline
      const std::string port = std::to_string(target.port);
      addrinfo* res = nullptr;
      int rc = ::getaddrinfo(target.host.c_str(), port.c_str(), &hints, &res);
      if (rc != 0)
        throw std::runtime_error("[SnmpChannel] " + target.host +
                                 " is not a numeric address: " + gai_strerror(rc));
      std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

      for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd_ < 0)
          continue;
        // connect() filters datagrams from any other peer
        if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0)
          return;
        ::close(fd_);
        fd_ = -1;
      }
      throw std::runtime_error("[SnmpChannel] cannot reach " + target.host + ":" + port + ": " +
                               strerror(errno));
    }
    ~UdpSocket() {
      if (fd_ >= 0)
        ::close(fd_);
    }
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    int get() const { return fd_; }

  private:
    int fd_{ -1 };
  };
} // namespace

SnmpValue SnmpChannel::get(const SnmpTarget& target, const std::string& oid,
                           std::chrono::milliseconds timeout) {
  SnmpMessage req;
  req.community = target.community;
  req.pduType = ber::kGetRequest;
  req.varbinds.push_back(VarBind{ oid, SnmpValue{} });

  SnmpMessage resp = exchange(target, std::move(req), timeout);
  if (resp.varbinds.empty())
    throw std::runtime_error("[SnmpChannel] empty response for " + oid);
  const SnmpValue& value = resp.varbinds.front().value;
  if (value.isException())
    throw std::runtime_error("[SnmpChannel] " + oid + " not present on " + target.host);
  return value;
}

void SnmpChannel::setInteger(const SnmpTarget& target, const std::string& oid, std::int64_t value,
                             std::chrono::milliseconds timeout) {
  SnmpValue v;
  v.tag = ber::kInteger;
  v.integer = value;

  SnmpMessage req;
  req.community = target.community;
  req.pduType = ber::kSetRequest;
  req.varbinds.push_back(VarBind{ oid, v });
  exchange(target, std::move(req), timeout);
}

SnmpMessage SnmpChannel::exchange(const SnmpTarget& target, SnmpMessage request,
                                  std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  request.requestId = nextRequestId_.fetch_add(1);
  const auto wire = encodeMessage(request);

  UdpSocket sock(target);
  while (true) {
    ssize_t n = ::send(sock.get(), wire.data(), wire.size(), 0);
    if (n >= 0)
      break;
    if (errno == EINTR)
      continue;
    throw std::runtime_error(std::string("[SnmpChannel] send: ") + strerror(errno));
  }

  std::uint8_t buf[65536];
  pollfd pfd{ sock.get(), POLLIN, 0 };
  while (true) {
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (left.count() <= 0)
      break;

    int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error(std::string("[SnmpChannel] poll: ") + strerror(errno));
    }
    if (rc == 0)
      break; // timeout

    ssize_t n = ::recv(sock.get(), buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue;
      // ECONNREFUSED: nothing listening on the agent port
      throw std::runtime_error(std::string("[SnmpChannel] recv: ") + strerror(errno));
    }

    SnmpMessage resp;
    try {
      resp = decodeMessage(buf, static_cast<std::size_t>(n));
    } catch (const std::runtime_error& e) {
      spdlog::debug("[SnmpChannel] dropped malformed datagram from {}: {}", target.host, e.what());
      continue; // keep waiting for the real reply until the deadline
    }
    if (resp.pduType != ber::kGetResponse || resp.requestId != request.requestId)
      continue; // stale or foreign datagram
    if (resp.errorStatus != 0)
      throw std::runtime_error("[SnmpChannel] agent " + target.host + " returned " +
                               errorStatusName(resp.errorStatus) + " (index " +
                               std::to_string(resp.errorIndex) + ")");
    return resp;
  }
  throw std::runtime_error("[SnmpChannel] " + target.host + ":" + std::to_string(target.port) +
                           " timed out");
}
