#pragma once
/** @file  SnmpChannel.hpp
 *  @brief SNMPv2c GET/SET over UDP with request-id matching and a deadline.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "io/BerCodec.hpp"

namespace benchguard {
  namespace io {

    struct SnmpTarget {
      std::string host;
      std::uint16_t port{ 161 };
      std::string community{ "public" };
    };

    /**
 * @class SnmpChannel
 * @brief One UDP socket per exchange; replies with a foreign request-id are ignored.
 *
 *  * Throws `std::runtime_error` on timeout, agent error-status, or a
 *    noSuchObject/noSuchInstance value.
 *  * Virtual so the PDU adapter can be tested against a fake agent.
 */
    class SnmpChannel {
    public:
      SnmpChannel() = default;
      virtual ~SnmpChannel() = default;

      //---public API------------------------------------------------------
      virtual SnmpValue get(const SnmpTarget& target, const std::string& oid,
                            std::chrono::milliseconds timeout);
      virtual void setInteger(const SnmpTarget& target, const std::string& oid, std::int64_t value,
                              std::chrono::milliseconds timeout);

      //---non-copyable----------------------------------------------------
      SnmpChannel(const SnmpChannel&) = delete;
      SnmpChannel& operator=(const SnmpChannel&) = delete;

    private:
      SnmpMessage exchange(const SnmpTarget& target, SnmpMessage request,
                           std::chrono::milliseconds timeout);

      std::atomic<std::int32_t> nextRequestId_{ 1 };
    };

  } // namespace io
} // namespace benchguard
