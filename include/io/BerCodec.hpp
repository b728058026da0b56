#pragma once
/** @file  BerCodec.hpp
 *  @brief ASN.1 BER encode/decode for the SNMPv2c message subset the PDU adapter needs.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace benchguard {
  namespace io {
    namespace ber {

      // universal / application / context tags used by SNMP
      inline constexpr std::uint8_t kInteger = 0x02;
      inline constexpr std::uint8_t kOctetString = 0x04;
      inline constexpr std::uint8_t kNull = 0x05;
      inline constexpr std::uint8_t kObjectId = 0x06;
      inline constexpr std::uint8_t kSequence = 0x30;
      inline constexpr std::uint8_t kIpAddress = 0x40;
      inline constexpr std::uint8_t kCounter32 = 0x41;
      inline constexpr std::uint8_t kGauge32 = 0x42;
      inline constexpr std::uint8_t kTimeTicks = 0x43;
      inline constexpr std::uint8_t kCounter64 = 0x46;
      inline constexpr std::uint8_t kNoSuchObject = 0x80;
      inline constexpr std::uint8_t kNoSuchInstance = 0x81;
      inline constexpr std::uint8_t kEndOfMibView = 0x82;

      inline constexpr std::uint8_t kGetRequest = 0xA0;
      inline constexpr std::uint8_t kGetResponse = 0xA2;
      inline constexpr std::uint8_t kSetRequest = 0xA3;

      inline constexpr std::int32_t kVersion2c = 1;

    } // namespace ber

    struct SnmpValue {
      std::uint8_t tag{ ber::kNull };
      std::int64_t integer{ 0 }; ///< INTEGER / Counter / Gauge / TimeTicks
      std::string text{};        ///< OCTET STRING payload, dotted OID, or dotted IP

      bool isNumeric() const;
      bool isException() const; ///< noSuchObject / noSuchInstance / endOfMibView
    };

    struct VarBind {
      std::string oid; ///< dotted, leading dot optional
      SnmpValue value{};
    };

    struct SnmpMessage {
      std::int32_t version{ ber::kVersion2c };
      std::string community{};
      std::uint8_t pduType{ ber::kGetRequest };
      std::int32_t requestId{ 0 };
      std::int32_t errorStatus{ 0 };
      std::int32_t errorIndex{ 0 };
      std::vector<VarBind> varbinds{};
    };

    /// Serialises a full message. Throws std::invalid_argument on a malformed OID.
    std::vector<std::uint8_t> encodeMessage(const SnmpMessage& msg);

    /// Parses a full message. Throws std::runtime_error on truncated or malformed input.
    SnmpMessage decodeMessage(const std::uint8_t* data, std::size_t len);

    /// ".1.3.6.1" -> {1,3,6,1}. Throws std::invalid_argument.
    std::vector<std::uint32_t> parseOid(const std::string& dotted);

  } // namespace io
} // namespace benchguard
