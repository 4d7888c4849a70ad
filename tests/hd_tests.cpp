#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cggmp/common/bytes.hpp"
#include "cggmp/common/errors.hpp"
#include "cggmp/crypto/ec_point.hpp"
#include "cggmp/crypto/feldman.hpp"
#include "cggmp/crypto/scalar.hpp"
#include "cggmp/protocol/hd_derivation.hpp"
#include "cggmp/protocol/key_share.hpp"
#include "cggmp/protocol/runner.hpp"

namespace {

using cggmp::Bytes;
using cggmp::CoreKeyShare;
using cggmp::DerivedKey;
using cggmp::ECPoint;
using cggmp::PartyIndex;
using cggmp::RunParams;
using cggmp::Scalar;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectLocalError(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const cggmp::LocalValidationError&) {
    return;
  }
  throw std::runtime_error("Expected LocalValidationError: " + message);
}

Bytes FromHex(const std::string& hex) {
  Bytes out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return out;
}

std::vector<CoreKeyShare> HdKeygen(std::optional<uint32_t> t, uint64_t seed) {
  RunParams params;
  params.n = 3;
  params.t = t;
  params.hd_enabled = true;
  params.seed = seed;
  return cggmp::RunKeygen(params);
}

// BIP-32 test vector 1, public derivation m/0'/1 from m/0'.
void TestPublicDerivationVector() {
  const ECPoint parent =
      ECPoint::FromCompressed(FromHex("035a784662a4a20a65bf6aab9ae98a6c068a81c52e4b032c0fb5400c706cfccc56"));
  const Bytes chain_code = FromHex("47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141");

  const DerivedKey child = cggmp::DeriveChildPublicKey(parent, chain_code, 1);
  Expect(child.public_key.ToCompressedBytes() ==
             FromHex("03501e454bf00751f24b1b489aa925215d66af2234e3891c3b21a52bedb3cd711c"),
         "child public key must match BIP-32 vector");
  Expect(cggmp::ToHex(child.chain_code) == "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19",
         "child chain code must match BIP-32 vector");
  Expect(parent.Add(ECPoint::GeneratorMultiply(child.shift)) == child.public_key, "child = parent + shift * G");

  ExpectLocalError([&]() { (void)cggmp::DeriveChildPublicKey(parent, chain_code, cggmp::kHardenedIndexBit); },
                   "hardened index");
  ExpectLocalError([&]() { (void)cggmp::DeriveChildPublicKey(parent, Bytes(31, 0), 1); }, "short chain code");
  ExpectLocalError([&]() { (void)cggmp::DeriveChildPublicKey(ECPoint::Infinity(), chain_code, 1); },
                   "infinite parent");
}

void TestThresholdChildShares() {
  const std::vector<CoreKeyShare> shares = HdKeygen(2, 21);
  const std::vector<uint32_t> path = {0, 42, 7};

  const DerivedKey derived = cggmp::DeriveAdditiveShift(shares.front().key_info, path);
  Expect(derived.public_key ==
             shares.front().key_info.shared_public_key.Add(ECPoint::GeneratorMultiply(derived.shift)),
         "path shift moves the shared key");

  std::vector<CoreKeyShare> children;
  for (const CoreKeyShare& share : shares) {
    children.push_back(cggmp::DeriveChildKeyShare(share, path));
  }
  for (const CoreKeyShare& child : children) {
    child.Validate();
    Expect(child.key_info.shared_public_key == derived.public_key, "child share carries the derived key");
    Expect(child.key_info.chain_code == derived.chain_code, "child share carries the derived chain code");
  }

  const std::vector<PartyIndex> pair = {1, 3};
  const Scalar child_secret = cggmp::LagrangeCoefficientAtZero(pair, 1) * children[0].x +
                              cggmp::LagrangeCoefficientAtZero(pair, 3) * children[2].x;
  Expect(ECPoint::GeneratorMultiply(child_secret) == derived.public_key, "child shares reconstruct the child key");

  // Deriving step by step lands on the same key.
  const DerivedKey first = cggmp::DeriveAdditiveShift(shares.front().key_info, std::vector<uint32_t>{0, 42});
  const DerivedKey last = cggmp::DeriveChildPublicKey(first.public_key, first.chain_code, 7);
  Expect(last.public_key == derived.public_key, "derivation composes along the path");
}

void TestAdditiveChildShares() {
  const std::vector<CoreKeyShare> shares = HdKeygen(std::nullopt, 22);
  const std::vector<uint32_t> path = {5};
  const DerivedKey derived = cggmp::DeriveAdditiveShift(shares.front().key_info, path);

  Scalar child_secret;
  for (const CoreKeyShare& share : shares) {
    const CoreKeyShare child = cggmp::DeriveChildKeyShare(share, path);
    child_secret = child_secret + child.x;
  }
  Expect(ECPoint::GeneratorMultiply(child_secret) == derived.public_key, "additive child shares sum to child key");
}

void TestDerivationErrors() {
  const std::vector<CoreKeyShare> hd = HdKeygen(2, 23);
  const std::vector<uint32_t> hardened = {1, cggmp::kHardenedIndexBit | 3};
  ExpectLocalError([&]() { (void)cggmp::DeriveAdditiveShift(hd.front().key_info, hardened); },
                   "hardened step in a path");
  ExpectLocalError([&]() { (void)cggmp::DeriveChildKeyShare(hd.front(), hardened); }, "hardened child share");

  RunParams params;
  params.n = 2;
  params.t = 2;
  params.seed = 24;
  const std::vector<CoreKeyShare> plain = cggmp::RunKeygen(params);
  const std::vector<uint32_t> path = {1};
  ExpectLocalError([&]() { (void)cggmp::DeriveAdditiveShift(plain.front().key_info, path); }, "no chain code");

  const DerivedKey empty = cggmp::DeriveAdditiveShift(hd.front().key_info, std::vector<uint32_t>{});
  Expect(empty.public_key == hd.front().key_info.shared_public_key && empty.shift.IsZero(),
         "empty path keeps the root key");
}

}  // namespace

int main() {
  try {
    TestPublicDerivationVector();
    TestThresholdChildShares();
    TestAdditiveChildShares();
    TestDerivationErrors();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "HD derivation tests passed" << '\n';
  return 0;
}
