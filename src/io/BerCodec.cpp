/* @file BerCodec.cpp
 * @brief BER TLV writer/reader for SNMPv2c Get/Set/Response PDUs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// benchguard headers
#include "io/BerCodec.hpp"

using namespace benchguard::io;

namespace {
  using Bytes = std::vector<std::uint8_t>;

  void appendLength(Bytes& out, std::size_t len) {
    if (len < 0x80) {
      out.push_back(static_cast<std::uint8_t>(len));
      return;
    }
    Bytes tmp;
    while (len > 0) {
      tmp.insert(tmp.begin(), static_cast<std::uint8_t>(len & 0xFF));
      len >>= 8;
    }
    out.push_back(static_cast<std::uint8_t>(0x80 | tmp.size()));
    out.insert(out.end(), tmp.begin(), tmp.end());
  }

  void appendTlv(Bytes& out, std::uint8_t tag, const Bytes& content) {
    out.push_back(tag);
    appendLength(out, content.size());
    out.insert(out.end(), content.begin(), content.end());
  }

  // minimal two's-complement, big-endian
  Bytes integerContent(std::int64_t value) {
    Bytes bytes;
    for (int shift = 56; shift >= 0; shift -= 8)
      bytes.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> shift) & 0xFF));

    std::size_t start = 0;
    while (start + 1 < bytes.size()) {
      const bool redundantZero = bytes[start] == 0x00 && (bytes[start + 1] & 0x80) == 0;
      const bool redundantOnes = bytes[start] == 0xFF && (bytes[start + 1] & 0x80) != 0;
      if (!redundantZero && !redundantOnes)
        break;
      ++start;
    }
    return Bytes(bytes.begin() + static_cast<std::ptrdiff_t>(start), bytes.end());
  }

  void appendBase128(Bytes& out, std::uint32_t arc) {
    Bytes tmp{ static_cast<std::uint8_t>(arc & 0x7F) };
    arc >>= 7;
    while (arc > 0) {
      tmp.insert(tmp.begin(), static_cast<std::uint8_t>(0x80 | (arc & 0x7F)));
      arc >>= 7;
    }
    out.insert(out.end(), tmp.begin(), tmp.end());
  }

  Bytes oidContent(const std::string& dotted) {
    const auto arcs = parseOid(dotted);
    if (arcs.size() < 2 || arcs[0] > 2)
      throw std::invalid_argument("[BerCodec] OID needs at least two arcs: " + dotted);
    Bytes out;
    appendBase128(out, arcs[0] * 40 + arcs[1]);
    for (std::size_t i = 2; i < arcs.size(); ++i)
      appendBase128(out, arcs[i]);
    return out;
  }

  Bytes valueTlv(const SnmpValue& v) {
    Bytes out;
    switch (v.tag) {
    case ber::kInteger:
    case ber::kCounter32:
    case ber::kGauge32:
    case ber::kTimeTicks:
    case ber::kCounter64:
      appendTlv(out, v.tag, integerContent(v.integer));
      break;
    case ber::kOctetString:
      appendTlv(out, v.tag, Bytes(v.text.begin(), v.text.end()));
      break;
    case ber::kObjectId:
      appendTlv(out, v.tag, oidContent(v.text));
      break;
    default: // NULL and the v2 exception markers carry no content
      appendTlv(out, v.tag, {});
      break;
    }
    return out;
  }

  // bounds-checked cursor over one TLV region
  class Reader {
  public:
    Reader(const std::uint8_t* data, std::size_t len) : data_(data), len_(len) {}

    bool atEnd() const { return pos_ >= len_; }

    // returns a reader over the content of the next TLV, which must carry `tag`
    Reader enter(std::uint8_t tag) {
      const std::uint8_t got = readByte();
      if (got != tag)
        throw std::runtime_error("[BerCodec] unexpected tag " + std::to_string(got) +
                                 ", wanted " + std::to_string(tag));
      return take(readLength());
    }

    // next TLV of any tag
    std::pair<std::uint8_t, Reader> next() {
      const std::uint8_t tag = readByte();
      return { tag, take(readLength()) };
    }

    std::int64_t asInteger(bool isSigned) const {
      if (len_ == 0 || len_ > 9)
        throw std::runtime_error("[BerCodec] bad integer length");
      std::uint64_t acc = (isSigned && (data_[0] & 0x80)) ? ~0ULL : 0ULL;
      for (std::size_t i = 0; i < len_; ++i)
        acc = (acc << 8) | data_[i];
      return static_cast<std::int64_t>(acc);
    }

    std::string asString() const { return std::string(data_, data_ + len_); }

    std::string asOid() const {
      if (len_ == 0)
        throw std::runtime_error("[BerCodec] empty OID");
      std::vector<std::uint32_t> arcs;
      std::uint64_t arc = 0;
      for (std::size_t i = 0; i < len_; ++i) {
        arc = (arc << 7) | (data_[i] & 0x7F);
        if (arc > 0xFFFFFFFFULL)
          throw std::runtime_error("[BerCodec] OID arc overflow");
        if ((data_[i] & 0x80) == 0) {
          if (arcs.empty()) {
            const auto first = static_cast<std::uint32_t>(arc < 80 ? arc / 40 : 2);
            arcs.push_back(first);
            arcs.push_back(static_cast<std::uint32_t>(arc - first * 40));
          } else {
            arcs.push_back(static_cast<std::uint32_t>(arc));
          }
          arc = 0;
        }
      }
      std::string out;
      for (auto a : arcs)
        out += "." + std::to_string(a);
      return out;
    }

  private:
    void need(std::size_t n) const {
      if (pos_ + n > len_)
        throw std::runtime_error("[BerCodec] truncated message");
    }

    std::uint8_t readByte() {
      need(1);
      return data_[pos_++];
    }

    std::size_t readLength() {
      const std::uint8_t first = readByte();
      if ((first & 0x80) == 0)
        return first;
      const std::size_t count = first & 0x7F;
      if (count == 0 || count > 4)
        throw std::runtime_error("[BerCodec] unsupported length encoding");
      std::size_t len = 0;
      for (std::size_t i = 0; i < count; ++i)
        len = (len << 8) | readByte();
      return len;
    }

    Reader take(std::size_t n) {
      need(n);
      Reader sub(data_ + pos_, n);
      pos_ += n;
      return sub;
    }

    const std::uint8_t* data_;
    std::size_t len_;
    std::size_t pos_{ 0 };
  };

  SnmpValue decodeValue(std::uint8_t tag, const Reader& content) {
    SnmpValue v;
    v.tag = tag;
    switch (tag) {
    case ber::kInteger:
      v.integer = content.asInteger(true);
      break;
    case ber::kCounter32:
    case ber::kGauge32:
    case ber::kTimeTicks:
    case ber::kCounter64:
      v.integer = content.asInteger(false);
      break;
    case ber::kOctetString:
      v.text = content.asString();
      break;
    case ber::kObjectId:
      v.text = content.asOid();
      break;
    case ber::kIpAddress: {
      const std::string raw = content.asString();
      for (std::size_t i = 0; i < raw.size(); ++i)
        v.text += (i ? "." : "") + std::to_string(static_cast<unsigned char>(raw[i]));
      break;
    }
    default:
      break;
    }
    return v;
  }
} // namespace

bool SnmpValue::isNumeric() const {
  return tag == ber::kInteger || tag == ber::kCounter32 || tag == ber::kGauge32 ||
         tag == ber::kTimeTicks || tag == ber::kCounter64;
}

bool SnmpValue::isException() const {
  return tag == ber::kNoSuchObject || tag == ber::kNoSuchInstance || tag == ber::kEndOfMibView;
}

std::vector<std::uint32_t> benchguard::io::parseOid(const std::string& dotted) {
  std::vector<std::uint32_t> arcs;
  std::size_t pos = dotted.starts_with(".") ? 1 : 0;
  while (pos <= dotted.size()) {
    auto dot = dotted.find('.', pos);
    const std::string part = dotted.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
    if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos)
      throw std::invalid_argument("[BerCodec] malformed OID: " + dotted);
    try {
      arcs.push_back(static_cast<std::uint32_t>(std::stoul(part)));
    } catch (const std::exception&) {
      throw std::invalid_argument("[BerCodec] OID arc out of range: " + dotted);
    }
    if (dot == std::string::npos)
      break;
    pos = dot + 1;
  }
  return arcs;
}

std::vector<std::uint8_t> benchguard::io::encodeMessage(const SnmpMessage& msg) {
  Bytes varbindList;
  for (const auto& vb : msg.varbinds) {
    Bytes pair;
    appendTlv(pair, ber::kObjectId, oidContent(vb.oid));
    const Bytes value = valueTlv(vb.value);
    pair.insert(pair.end(), value.begin(), value.end());
    appendTlv(varbindList, ber::kSequence, pair);
  }

  Bytes pdu;
  appendTlv(pdu, ber::kInteger, integerContent(msg.requestId));
  appendTlv(pdu, ber::kInteger, integerContent(msg.errorStatus));
  appendTlv(pdu, ber::kInteger, integerContent(msg.errorIndex));
  appendTlv(pdu, ber::kSequence, varbindList);

  Bytes body;
  appendTlv(body, ber::kInteger, integerContent(msg.version));
  appendTlv(body, ber::kOctetString, Bytes(msg.community.begin(), msg.community.end()));
  appendTlv(body, msg.pduType, pdu);

  Bytes out;
  appendTlv(out, ber::kSequence, body);
  return out;
}

SnmpMessage benchguard::io::decodeMessage(const std::uint8_t* data, std::size_t len) {
  Reader top(data, len);
  Reader body = top.enter(ber::kSequence);

  SnmpMessage msg;
  msg.version = static_cast<std::int32_t>(body.enter(ber::kInteger).asInteger(true));
  msg.community = body.enter(ber::kOctetString).asString();

  auto [pduType, pdu] = body.next();
  msg.pduType = pduType;
  msg.requestId = static_cast<std::int32_t>(pdu.enter(ber::kInteger).asInteger(true));
  msg.errorStatus = static_cast<std::int32_t>(pdu.enter(ber::kInteger).asInteger(true));
  msg.errorIndex = static_cast<std::int32_t>(pdu.enter(ber::kInteger).asInteger(true));

  Reader list = pdu.enter(ber::kSequence);
  while (!list.atEnd()) {
    Reader pair = list.enter(ber::kSequence);
    VarBind vb;
    vb.oid = pair.enter(ber::kObjectId).asOid();
    auto [tag, content] = pair.next();
    vb.value = decodeValue(tag, content);
    msg.varbinds.push_back(std::move(vb));
  }
  return msg;
}
