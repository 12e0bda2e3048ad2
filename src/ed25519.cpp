#include "swarmsync/ed25519.hpp"

#include <oxenc/hex.h>
#include <sodium/crypto_sign_ed25519.h>

#include <stdexcept>

#include "swarmsync/util.hpp"

namespace swarmsync::ed25519 {

key_pair_t ed25519_key_pair() {
    key_pair_t kp;
    crypto_sign_ed25519_keypair(kp.first.data(), kp.second.data());
    return kp;
}

key_pair_t ed25519_key_pair(ustring_view ed25519_seed) {
    if (ed25519_seed.size() != 32)
        throw std::invalid_argument{"Invalid ed25519 seed: expected 32 bytes"};
    key_pair_t kp;
    crypto_sign_ed25519_seed_keypair(kp.first.data(), kp.second.data(), ed25519_seed.data());
    return kp;
}

ustring sign(ustring_view ed25519_privkey, ustring_view msg) {
    sodium_cleared<std::array<unsigned char, 64>> expanded;
    if (ed25519_privkey.size() == 32) {
        std::array<unsigned char, 32> unused_pk;
        crypto_sign_ed25519_seed_keypair(
                unused_pk.data(), expanded.data(), ed25519_privkey.data());
        ed25519_privkey = ustring_view{expanded.data(), expanded.size()};
    } else if (ed25519_privkey.size() != 64) {
        throw std::invalid_argument{"Invalid ed25519 secret key: expected 32 or 64 bytes"};
    }

    ustring sig(crypto_sign_ed25519_BYTES, 0);
    if (crypto_sign_ed25519_detached(
                sig.data(), nullptr, msg.data(), msg.size(), ed25519_privkey.data()) != 0)
        throw std::runtime_error{"Unable to sign message with the given ed25519 key"};
    return sig;
}

std::string session_id(ustring_view ed25519_pubkey) {
    if (ed25519_pubkey.size() != 32)
        throw std::invalid_argument{"Invalid ed25519 pubkey: expected 32 bytes"};
    std::array<unsigned char, 32> x25519;
    if (crypto_sign_ed25519_pk_to_curve25519(x25519.data(), ed25519_pubkey.data()) != 0)
        throw std::invalid_argument{"Invalid ed25519 pubkey: not convertible to x25519"};
    return "05" + oxenc::to_hex(x25519.begin(), x25519.end());
}

}  // namespace swarmsync::ed25519
