#include "swarmsync/config/encrypt.hpp"

#include <oxenc/endian.h>
#include <sodium/crypto_aead_xchacha20poly1305.h>
#include <sodium/crypto_generichash_blake2b.h>

#include <algorithm>
#include <array>
#include <string>

#include "swarmsync/util.hpp"

using namespace std::literals;

namespace swarmsync::config {

namespace {

    constexpr size_t MAX_DOMAIN = 24;
    constexpr auto NONCE_HASH_KEY = "swarmsync-config-encrypted-"sv;
    static_assert(NONCE_HASH_KEY.size() + MAX_DOMAIN <= crypto_generichash_blake2b_KEYBYTES_MAX);

    constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
    static_assert(
            ENCRYPT_DATA_OVERHEAD == crypto_aead_xchacha20poly1305_ietf_ABYTES + NONCE_SIZE);

    using nonce_t = std::array<unsigned char, NONCE_SIZE>;
    using aead_key =
            sodium_cleared<std::array<unsigned char, crypto_aead_xchacha20poly1305_ietf_KEYBYTES>>;

    void check_domain(std::string_view domain) {
        if (domain.empty() || domain.size() > MAX_DOMAIN)
            throw std::invalid_argument{
                    "Invalid encryption domain: must be 1 to " + std::to_string(MAX_DOMAIN) +
                    " characters"};
    }

    // Per-message key: H(key_base || be64(plaintext size) || domain).
    aead_key message_key(ustring_view key_base, uint64_t plaintext_size, std::string_view domain) {
        if (key_base.size() != 32)
            throw std::invalid_argument{"Invalid encryption key: expected 32 bytes"};

        auto size_be = oxenc::host_to_big(plaintext_size);
        aead_key key;
        crypto_generichash_blake2b_state st;
        crypto_generichash_blake2b_init(&st, nullptr, 0, key.size());
        crypto_generichash_blake2b_update(&st, key_base.data(), key_base.size());
        crypto_generichash_blake2b_update(
                &st, reinterpret_cast<const unsigned char*>(&size_be), sizeof(size_be));
        crypto_generichash_blake2b_update(&st, to_unsigned(domain.data()), domain.size());
        crypto_generichash_blake2b_final(&st, key.data(), key.size());
        return key;
    }

    // Deterministic nonce: identical plaintexts encrypt identically, so swarms can deduplicate.
    nonce_t message_nonce(ustring_view plaintext, std::string_view domain) {
        std::string hash_key{NONCE_HASH_KEY};
        hash_key += domain;
        nonce_t nonce;
        crypto_generichash_blake2b(
                nonce.data(),
                nonce.size(),
                plaintext.data(),
                plaintext.size(),
                to_unsigned(hash_key.data()),
                hash_key.size());
        return nonce;
    }

}  // namespace

ustring encrypt(ustring_view message, ustring_view key_base, std::string_view domain) {
    ustring out{message};
    encrypt_inplace(out, key_base, domain);
    return out;
}

void encrypt_inplace(ustring& message, ustring_view key_base, std::string_view domain) {
    check_domain(domain);
    const auto key = message_key(key_base, message.size(), domain);
    const auto nonce = message_nonce(message, domain);

    // Layout: ciphertext || tag || nonce
    const size_t plain_size = message.size();
    message.resize(plain_size + ENCRYPT_DATA_OVERHEAD);
    unsigned long long cipher_size = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(
            message.data(),
            &cipher_size,
            message.data(),
            plain_size,
            nullptr,
            0,
            nullptr,
            nonce.data(),
            key.data());
    std::copy(nonce.begin(), nonce.end(), message.begin() + cipher_size);
}

ustring decrypt(ustring_view ciphertext, ustring_view key_base, std::string_view domain) {
    check_domain(domain);
    if (ciphertext.size() < ENCRYPT_DATA_OVERHEAD)
        throw decrypt_error{"Unable to decrypt: ciphertext is too short"};

    auto nonce = ciphertext.substr(ciphertext.size() - NONCE_SIZE);
    auto sealed = ciphertext.substr(0, ciphertext.size() - NONCE_SIZE);
    const auto key = message_key(key_base, ciphertext.size() - ENCRYPT_DATA_OVERHEAD, domain);

    ustring plain(sealed.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES, 0);
    unsigned long long plain_size = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
                plain.data(),
                &plain_size,
                nullptr,
                sealed.data(),
                sealed.size(),
                nullptr,
                0,
                nonce.data(),
                key.data()) != 0)
        throw decrypt_error{"Unable to decrypt: authentication failed"};
    plain.resize(plain_size);
    return plain;
}

void pad_message(ustring& data, size_t overhead) {
    if (auto target = padded_size(data.size(), overhead); target > data.size())
        data.insert(0, target - data.size(), static_cast<unsigned char>(0));
}

void unpad_message(ustring& data) {
    auto first = data.find_first_not_of(static_cast<unsigned char>(0));
    data.erase(0, first == ustring::npos ? data.size() : first);
}

}  // namespace swarmsync::config
