#include "commitment.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

namespace atomicswap::htlc {
namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::array<std::uint8_t, kHashlockSize> Sha256(const std::uint8_t* data, std::size_t size) {
  DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  std::array<std::uint8_t, kHashlockSize> digest{};
  unsigned int                            length = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 || length != digest.size()) {
    throw std::runtime_error("sha256 digest failed");
  }
  return digest;
}

} // namespace

Secret GenerateSecret() {
  Secret secret{};
  if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed to produce a swap secret");
  }
  return secret;
}

std::string Hashlock(const Secret& secret) {
  const auto digest = Sha256(secret.data(), secret.size());
  return util::ToHex(digest.data(), digest.size());
}

bool Verify(const Secret& secret, std::string_view hashlock) {
  return Hashlock(secret) == util::ToLower(hashlock);
}

std::string SecretToHex(const Secret& secret) {
  return util::ToHex(secret.data(), secret.size());
}

Secret SecretFromHex(std::string_view hex) {
  auto bytes = util::FromHex(hex);
  if (!bytes || bytes->size() != kSecretSize) {
    throw util::Validation("secret must be " + std::to_string(kSecretSize * 2) + " hex characters");
  }

  Secret secret{};
  std::copy(bytes->begin(), bytes->end(), secret.begin());
  return secret;
}

bool IsWellFormedHashlock(std::string_view hashlock) {
  auto bytes = util::FromHex(hashlock);
  return bytes && bytes->size() == kHashlockSize;
}

util::TimePoint MakeTimelock(const util::Clock& clock, std::chrono::milliseconds duration) {
  return util::TruncateToSeconds(clock.Now() + duration);
}

bool IsExpired(const util::Clock& clock, util::TimePoint timelock) {
  return clock.Now() > timelock;
}

} // namespace atomicswap::htlc
