#pragma once

#include <span>
#include <unordered_map>
#include <vector>

#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/types.hpp"

namespace cggmp {

// Coefficients a_0..a_{degree}; a_0 is the shared secret.
struct Polynomial {
  std::vector<Scalar> coefficients;

  static Polynomial Random(size_t degree);
  static Polynomial RandomWithConstant(const Scalar& constant, size_t degree);

  Scalar EvaluateAt(PartyIndex x) const;
  std::vector<ECPoint> Commit() const;
  void Zeroize() noexcept;
};

// Sum_k commitments[k] * x^k
ECPoint EvaluateCommitmentAt(std::span<const ECPoint> commitments, PartyIndex x);
bool VerifyFeldmanShare(std::span<const ECPoint> commitments, PartyIndex x, const Scalar& share);

// Lagrange coefficients for interpolation at zero over the given ids.
std::unordered_map<PartyIndex, Scalar> ComputeLagrangeAtZero(const std::vector<PartyIndex>& participants);
Scalar LagrangeCoefficientAtZero(const std::vector<PartyIndex>& participants, PartyIndex i);

ECPoint SumPoints(std::span<const ECPoint> points);

}  // namespace cggmp
