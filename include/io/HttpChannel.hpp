#pragma once
/** @file  HttpChannel.hpp
 *  @brief Blocking HTTP/1.1 client over POSIX sockets with a hard deadline.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace benchguard {
  namespace io {

    struct HttpResponse {
      int status{ 0 };
      std::string body{};

      bool ok() const { return status >= 200 && status < 300; }
    };

    /// Split form of "http://host[:port][/target]".
    struct Url {
      std::string host;
      std::uint16_t port{ 80 };
      std::string target{ "/" };
    };

    /// Throws std::invalid_argument for https:// or an empty host.
    Url parseUrl(const std::string& url);

    /// Percent-encodes everything outside the RFC 3986 unreserved set.
    std::string urlEncode(const std::string& text);

    /**
 * @class HttpChannel
 * @brief One request per connection (`Connection: close`); the whole exchange
 *        (connect, send, receive) must finish before \p timeout.
 *
 *  * Throws `std::runtime_error` on resolve/connect/IO failure or timeout.
 *  * A non-2xx reply is not an error here; callers inspect `status`.
 *  * Methods are virtual so adapters can be tested against a fake.
 */
    class HttpChannel {

    public:
      //---ctr / dtr--------------------------------------------
      HttpChannel() = default;
      virtual ~HttpChannel() = default;

      //---public API-------------------------------------------
      virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout);
      virtual HttpResponse post(const std::string& url, const std::string& jsonBody,
                                std::chrono::milliseconds timeout);

      //---non-copyable-----------------------------------------
      HttpChannel(const HttpChannel&) = delete;
      HttpChannel& operator=(const HttpChannel&) = delete;

    private:
      HttpResponse request(const std::string& method, const std::string& url,
                           const std::string& body, std::chrono::milliseconds timeout);
    };

  } // namespace io
} // namespace benchguard
