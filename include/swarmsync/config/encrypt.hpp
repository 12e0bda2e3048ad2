#pragma once

#include "../errors.hpp"
#include "../types.hpp"

namespace swarmsync::config {

/// Bytes added to a message by `encrypt` (the Poly1305 tag plus the 24-byte nonce).
constexpr size_t ENCRYPT_DATA_OVERHEAD = 40;

/// API: encrypt/encrypt
///
/// Encrypts a config message with XChaCha20-Poly1305.  The nonce is a keyed hash of the
/// plaintext, so every device that encrypts the same config data produces the same ciphertext and
/// the swarm can store it once.
///
/// Inputs:
/// - `message` -- the plaintext
/// - `key_base` -- 32-byte key that every reader of the message can compute on its own (derived
///   from the user's seed, or a group key generation); the actual key mixes in the message size
///   and `domain`
/// - `domain` -- 1-24 character tag of the kind of config, e.g. "Contacts"
///
/// Outputs:
/// - the ciphertext, `ENCRYPT_DATA_OVERHEAD` bytes longer than the message
ustring encrypt(ustring_view message, ustring_view key_base, std::string_view domain);

/// API: encrypt/encrypt_inplace
///
/// Same as `encrypt`, replacing `message` with its ciphertext.
void encrypt_inplace(ustring& message, ustring_view key_base, std::string_view domain);

/// API: encrypt/decrypt
///
/// Reverses `encrypt` given the same `key_base` and `domain`.  Throws `decrypt_error` if the
/// ciphertext does not authenticate under that key.
ustring decrypt(ustring_view ciphertext, ustring_view key_base, std::string_view domain);

/// Size a message of `s` bytes gets padded to so that, with `overhead` bytes appended, its total
/// length is a multiple of the chunk size for its range: 256 bytes below 5kiB, 1kiB below 20kiB,
/// 2kiB below 40kiB and 5kiB above that.
inline constexpr size_t padded_size(size_t s, size_t overhead = ENCRYPT_DATA_OVERHEAD) {
    const size_t total = s + overhead;
    const size_t chunk = total < 5120 ? 256 : total < 20480 ? 1024 : total < 40960 ? 2048 : 5120;
    return (total + chunk - 1) / chunk * chunk - overhead;
}

/// Prefixes `data` with null bytes up to `padded_size`.
void pad_message(ustring& data, size_t overhead = ENCRYPT_DATA_OVERHEAD);

/// Strips the null prefix added by `pad_message`.
void unpad_message(ustring& data);

}  // namespace swarmsync::config
