#include "cggmp/net/envelope.hpp"

#include <stdexcept>

#include "cggmp/common/wire.hpp"

namespace cggmp {

Bytes EncodeEnvelope(const Envelope& envelope) {
  Bytes out;
  out.reserve(4 + envelope.session_id.size() + 16 + 4 + envelope.payload.size());

  AppendSizedField(envelope.session_id, &out);
  AppendU32Be(envelope.from, &out);
  AppendU32Be(envelope.to, &out);
  AppendU32Be(envelope.round, &out);
  AppendU32Be(envelope.type, &out);
  AppendSizedField(envelope.payload, &out);
  return out;
}

Envelope DecodeEnvelope(std::span<const uint8_t> encoded,
                        size_t max_session_id_len,
                        size_t max_payload_len) {
  size_t offset = 0;

  Envelope out;
  out.session_id = ReadSizedField(encoded, &offset, max_session_id_len, "session_id");
  out.from = ReadU32Be(encoded, &offset);
  out.to = ReadU32Be(encoded, &offset);
  out.round = ReadU32Be(encoded, &offset);
  out.type = ReadU32Be(encoded, &offset);
  out.payload = ReadSizedField(encoded, &offset, max_payload_len, "payload");

  EnsureFullyConsumed(encoded, offset, "Envelope");
  return out;
}

}  // namespace cggmp
