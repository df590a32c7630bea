#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/clock.hpp"

namespace atomicswap::htlc {

/*
  Hashed-timelock commitment primitives.

  A swap is bound to one 32 byte secret. The hashlock (sha256 of the
  secret, lower-case hex) is public from creation on; the secret only
  becomes public when the initiator redeems the acceptor's lock.

  Timelocks are absolute instants truncated to whole seconds so that
  every store and every backend compares the same value.
*/

inline constexpr std::size_t kSecretSize   = 32;
inline constexpr std::size_t kHashlockSize = 32;

using Secret = std::array<std::uint8_t, kSecretSize>;

// Throws std::runtime_error if the CSPRNG cannot produce bytes.
Secret GenerateSecret();

std::string Hashlock(const Secret& secret);

bool Verify(const Secret& secret, std::string_view hashlock);

std::string SecretToHex(const Secret& secret);

// Throws util::Validation unless hex is exactly 64 hex characters.
Secret SecretFromHex(std::string_view hex);

// True if hashlock is 64 hex characters.
bool IsWellFormedHashlock(std::string_view hashlock);

util::TimePoint MakeTimelock(const util::Clock& clock, std::chrono::milliseconds duration);

bool IsExpired(const util::Clock& clock, util::TimePoint timelock);

} // namespace atomicswap::htlc
