#include "cggmp/zk/proof_context.hpp"

namespace cggmp {

const char* ProofCheckName(ProofCheck check) {
  switch (check) {
    case ProofCheck::kOk:
      return "ok";
    case ProofCheck::kRangeExceeded:
      return "range exceeded";
    case ProofCheck::kPaillierRelation:
      return "Paillier relation mismatch";
    case ProofCheck::kPedersenRelation:
      return "ring-Pedersen relation mismatch";
    case ProofCheck::kGroupRelation:
      return "group relation mismatch";
    case ProofCheck::kMalformedStatement:
      return "malformed statement";
    case ProofCheck::kModulusMalformed:
      return "modulus malformed";
  }
  return "unknown";
}

Transcript StartProofTranscript(std::string_view proof_id, const ProofContext& ctx) {
  Transcript transcript;
  transcript.append_proof_id(proof_id);
  transcript.append_session_id(ctx.session_id);
  transcript.append_u32_be("prover", ctx.prover);
  transcript.append_u32_be("verifier", ctx.verifier);
  transcript.append_u32_be("round", ctx.round);
  transcript.append("tag", ctx.tag);
  transcript.append_ascii("curve", "secp256k1");
  return transcript;
}

}  // namespace cggmp
