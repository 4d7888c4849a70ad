#include "cggmp/crypto/feldman.hpp"

#include <stdexcept>

#include "cggmp/common/secure_zeroize.hpp"
#include "cggmp/crypto/random.hpp"

namespace cggmp {

Polynomial Polynomial::Random(size_t degree) {
  return RandomWithConstant(Csprng::RandomScalar(), degree);
}

Polynomial Polynomial::RandomWithConstant(const Scalar& constant, size_t degree) {
  Polynomial out;
  out.coefficients.reserve(degree + 1);
  out.coefficients.push_back(constant);
  for (size_t k = 0; k < degree; ++k) {
    out.coefficients.push_back(Csprng::RandomScalar());
  }
  return out;
}

Scalar Polynomial::EvaluateAt(PartyIndex x) const {
  if (coefficients.empty()) {
    throw std::invalid_argument("cannot evaluate empty polynomial");
  }

  const Scalar x_scalar = Scalar::FromUint64(x);
  Scalar acc = coefficients.back();
  for (size_t k = coefficients.size() - 1; k > 0; --k) {
    acc = acc * x_scalar + coefficients[k - 1];
  }
  return acc;
}

std::vector<ECPoint> Polynomial::Commit() const {
  std::vector<ECPoint> out;
  out.reserve(coefficients.size());
  for (const Scalar& coefficient : coefficients) {
    out.push_back(ECPoint::GeneratorMultiply(coefficient));
  }
  return out;
}

void Polynomial::Zeroize() noexcept {
  SecureZeroize(&coefficients);
}

ECPoint EvaluateCommitmentAt(std::span<const ECPoint> commitments, PartyIndex x) {
  if (commitments.empty()) {
    throw std::invalid_argument("empty Feldman commitment");
  }

  const Scalar x_scalar = Scalar::FromUint64(x);
  ECPoint acc = commitments.back();
  for (size_t k = commitments.size() - 1; k > 0; --k) {
    acc = acc.Mul(x_scalar).Add(commitments[k - 1]);
  }
  return acc;
}

bool VerifyFeldmanShare(std::span<const ECPoint> commitments, PartyIndex x, const Scalar& share) {
  return ECPoint::GeneratorMultiply(share) == EvaluateCommitmentAt(commitments, x);
}

std::unordered_map<PartyIndex, Scalar> ComputeLagrangeAtZero(const std::vector<PartyIndex>& participants) {
  std::unordered_map<PartyIndex, Scalar> out;
  out.reserve(participants.size());
  for (PartyIndex i : participants) {
    out.emplace(i, LagrangeCoefficientAtZero(participants, i));
  }
  return out;
}

Scalar LagrangeCoefficientAtZero(const std::vector<PartyIndex>& participants, PartyIndex i) {
  Scalar numerator = Scalar::FromUint64(1);
  Scalar denominator = Scalar::FromUint64(1);
  bool found = false;

  for (PartyIndex j : participants) {
    if (j == i) {
      if (found) {
        throw std::invalid_argument("duplicate participant id in lagrange coefficient set");
      }
      found = true;
      continue;
    }

    const Scalar j_scalar = Scalar::FromUint64(j);
    const Scalar diff = j_scalar - Scalar::FromUint64(i);
    if (diff.IsZero()) {
      throw std::invalid_argument("duplicate participant id in lagrange coefficient set");
    }
    numerator = numerator * j_scalar;
    denominator = denominator * diff;
  }
  if (!found) {
    throw std::invalid_argument("lagrange index is not in the participant set");
  }

  const std::optional<Scalar> denominator_inv = denominator.Inverse();
  if (!denominator_inv.has_value()) {
    throw std::invalid_argument("failed to invert lagrange denominator");
  }
  return numerator * *denominator_inv;
}

ECPoint SumPoints(std::span<const ECPoint> points) {
  ECPoint sum;
  for (const ECPoint& point : points) {
    sum = sum.Add(point);
  }
  return sum;
}

}  // namespace cggmp
