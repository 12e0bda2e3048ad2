#pragma once

#include <array>
#include <string>
#include <utility>

#include "types.hpp"

namespace swarmsync::ed25519 {

/// Pubkey (32 bytes) and libsodium-style secret key (seed followed by pubkey, 64 bytes).
using key_pair_t = std::pair<std::array<unsigned char, 32>, std::array<unsigned char, 64>>;

/// Fresh random key pair.
key_pair_t ed25519_key_pair();

/// Key pair derived from a 32-byte seed; throws std::invalid_argument for any other size.
key_pair_t ed25519_key_pair(ustring_view ed25519_seed);

/// API: ed25519/sign
///
/// Detached 64-byte signature of `msg`.  `ed25519_privkey` may be the full 64-byte secret key or
/// its 32-byte seed.
ustring sign(ustring_view ed25519_privkey, ustring_view msg);

/// API: ed25519/session_id
///
/// "05" followed by the hex X25519 conversion of `ed25519_pubkey`.  Throws
/// std::invalid_argument if the key is not 32 bytes or is not a valid curve point.
std::string session_id(ustring_view ed25519_pubkey);

}  // namespace swarmsync::ed25519
