#include "cggmp/crypto/ring_pedersen.hpp"

#include "cggmp/crypto/bigint.hpp"

namespace cggmp {

mpz_class RingPedersenParams::Commit(const mpz_class& x, const mpz_class& mu) const {
  return MulMod(PowModSigned(s, x, n), PowModSigned(t, mu, n), n);
}

bool RingPedersenParams::IsWellFormed() const {
  return n > 3 && mpz_odd_p(n.get_mpz_t()) != 0 && IsZnStarElement(s, n) && IsZnStarElement(t, n) &&
         s != 1 && t != 1;
}

RingPedersenSetup GenerateRingPedersen(const PaillierProvider& paillier) {
  const mpz_class n = paillier.modulus_n();
  const mpz_class phi = paillier.phi();

  RingPedersenSetup out;
  out.witness.phi = phi;
  while (true) {
    const mpz_class r = RandomZnStar(n);
    out.witness.lambda = RandomBelow(phi);
    out.params.n = n;
    out.params.s = MulMod(r, r, n);
    out.params.t = PowMod(out.params.s, out.witness.lambda, n);
    if (out.params.IsWellFormed()) {
      return out;
    }
  }
}

}  // namespace cggmp
