#include "swarmsync/config/groups/keys.hpp"

#include <oxenc/hex.h>
#include <sodium/crypto_aead_xchacha20poly1305.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/crypto_scalarmult_curve25519.h>
#include <sodium/crypto_sign_ed25519.h>
#include <sodium/randombytes.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <variant>

#include "../internal.hpp"
#include "swarmsync/errors.hpp"

namespace swarmsync::config::groups {

namespace {

    constexpr auto KEY_PREFIX = "k/"sv;
    constexpr auto MEMBER_FIELD_PREFIX = "m"sv;

    constexpr auto KEYS_HASH_KEY = "swarmsync-group-keys"sv;
    constexpr auto ADMIN_KEY_HASH_KEY = "swarmsync-group-admin-key"sv;
    constexpr auto MEMBER_KEY_HASH_KEY = "swarmsync-group-member-key"sv;

    constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
    constexpr size_t ENCRYPTED_KEY_SIZE =
            ConfigBase::KEY_SIZE + crypto_aead_xchacha20poly1305_ietf_ABYTES;

    static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == ConfigBase::KEY_SIZE);

    std::string key_record(int64_t generation) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%010lld", static_cast<long long>(generation));
        return std::string{KEY_PREFIX} + buf;
    }

    std::optional<int64_t> record_generation(std::string_view rec) {
        rec.remove_prefix(KEY_PREFIX.size());
        int64_t gen = 0;
        if (auto [p, ec] = std::from_chars(rec.data(), rec.data() + rec.size(), gen);
            ec == std::errc{} && p == rec.data() + rec.size())
            return gen;
        return std::nullopt;
    }

    // The key used to encrypt the keys config itself.  Anyone who knows the group id can derive
    // it, so the generation keys inside are encrypted again, separately for admins and for each
    // member.
    std::array<unsigned char, 32> keys_encryption_key(ustring_view group_pk) {
        std::array<unsigned char, 32> key;
        crypto_generichash_blake2b(
                key.data(),
                key.size(),
                group_pk.data(),
                group_pk.size(),
                to_unsigned(KEYS_HASH_KEY.data()),
                KEYS_HASH_KEY.size());
        return key;
    }

    std::array<unsigned char, 32> compute_xpk(const unsigned char* ed25519_pk) {
        std::array<unsigned char, 32> xpk;
        if (0 != crypto_sign_ed25519_pk_to_curve25519(xpk.data(), ed25519_pk))
            throw std::runtime_error{
                    "An error occured while attempting to convert Ed25519 pubkey to X25519; "
                    "is the pubkey valid?"};
        return xpk;
    }

    // Turns the X25519 shared secret of the group and a member into the key of the member's copy:
    // H(shared || group_xpk || member_xpk).  Admins compute the secret as aB, members as bA.
    void hash_member_key(
            std::array<unsigned char, 32>& shared,
            const std::array<unsigned char, 32>& group_xpk,
            const std::array<unsigned char, 32>& member_xpk) {
        crypto_generichash_blake2b_state st;
        crypto_generichash_blake2b_init(
                &st,
                to_unsigned(MEMBER_KEY_HASH_KEY.data()),
                MEMBER_KEY_HASH_KEY.size(),
                shared.size());
        crypto_generichash_blake2b_update(&st, shared.data(), shared.size());
        crypto_generichash_blake2b_update(&st, group_xpk.data(), group_xpk.size());
        crypto_generichash_blake2b_update(&st, member_xpk.data(), member_xpk.size());
        crypto_generichash_blake2b_final(&st, shared.data(), shared.size());
    }

    std::string encrypt_key(
            const ConfigBase::Key& key,
            const std::array<unsigned char, NONCE_SIZE>& nonce,
            const unsigned char* enc_key) {
        std::string out(ENCRYPTED_KEY_SIZE, '\0');
        crypto_aead_xchacha20poly1305_ietf_encrypt(
                to_unsigned(out.data()),
                nullptr,
                key.data(),
                key.size(),
                nullptr,
                0,
                nullptr,
                nonce.data(),
                enc_key);
        return out;
    }

    // Returns true (after writing to `out`) if decryption succeeds, false if it fails.
    bool try_decrypting(
            ConfigBase::Key& out,
            std::string_view encrypted,
            std::string_view nonce,
            const unsigned char* key) {
        if (encrypted.size() != ENCRYPTED_KEY_SIZE || nonce.size() != NONCE_SIZE)
            return false;
        return 0 == crypto_aead_xchacha20poly1305_ietf_decrypt(
                            out.data(),
                            nullptr,
                            nullptr,
                            to_unsigned(encrypted.data()),
                            encrypted.size(),
                            nullptr,
                            0,
                            to_unsigned(nonce.data()),
                            key);
    }

}  // namespace

Keys::Keys(
        ustring_view user_ed25519_secretkey,
        ustring_view group_ed25519_pubkey,
        std::optional<ustring_view> group_ed25519_secretkey,
        std::optional<ustring_view> dumped,
        Info& info,
        Members& members) :
        ConfigBase{dumped, group_ed25519_pubkey, group_ed25519_secretkey},
        id{"03" + oxenc::to_hex(group_ed25519_pubkey.begin(), group_ed25519_pubkey.end())},
        _info{info},
        _members{members} {

    if (user_ed25519_secretkey.size() != 64)
        throw std::invalid_argument{"Invalid Keys construction: invalid user ed25519 secret key"};
    if (group_ed25519_pubkey.size() != 32)
        throw std::invalid_argument{"Invalid Keys construction: invalid group ed25519 public key"};
    if (group_ed25519_secretkey && group_ed25519_secretkey->size() != 64)
        throw std::invalid_argument{"Invalid Keys construction: invalid group ed25519 secret key"};

    auto enc_key = keys_encryption_key(group_ed25519_pubkey);
    add_key(to_sv(enc_key));
    sodium_zero_buffer(enc_key.data(), enc_key.size());

    // Our decryption key for the member copies: H(bA || A || B) [A = group, B = member]
    auto group_xpk = compute_xpk(group_ed25519_pubkey.data());
    auto member_xpk = compute_xpk(user_ed25519_secretkey.data() + 32);
    sodium_cleared<std::array<unsigned char, 32>> member_xsk;
    crypto_sign_ed25519_sk_to_curve25519(member_xsk.data(), user_ed25519_secretkey.data());
    if (0 != crypto_scalarmult_curve25519(
                     _member_key.data(), member_xsk.data(), group_xpk.data()))
        throw std::runtime_error{
                "Unable to compute member decryption key; invalid group or member keys?"};
    hash_member_key(_member_key, group_xpk, member_xpk);

    if (dumped)
        install_keys(/*dirty=*/false);
    else if (admin())
        rekey();
}

void Keys::load_admin_key(ustring_view secret) {
    if (admin())
        return;

    if (secret.size() == 32) {
        std::array<unsigned char, 32> pk;
        sodium_cleared<std::array<unsigned char, 64>> sk;
        crypto_sign_ed25519_seed_keypair(pk.data(), sk.data(), secret.data());
        load_admin_key(to_sv(sk));
        return;
    }
    if (secret.size() != 64)
        throw std::invalid_argument{"Invalid group admin key: expected 32 or 64 bytes"};

    auto pk = get_sig_pubkey();
    if (!pk || secret.substr(32) != to_sv(*pk))
        throw std::invalid_argument{"Invalid group admin key: key does not belong to this group"};

    set_sig_keys(secret);
    _info.set_sig_keys(secret);
    _members.set_sig_keys(secret);

    // The admin copy opens generations that were never issued to us as a member
    install_keys(/*dirty=*/false);
}

int64_t Keys::rekey() {
    if (!admin()) {
        log(LogLevel::critical, "Unable to rekey group " + id + ": no admin key loaded");
        throw admin_violation{Error::NO_ADMIN_KEY};
    }

    const auto& group_sk = *get_sig_secret();
    auto group_xpk = compute_xpk(group_sk.data() + 32);
    sodium_cleared<std::array<unsigned char, 32>> group_xsk;
    crypto_sign_ed25519_sk_to_curve25519(group_xsk.data(), group_sk.data());

    sodium_cleared<Key> key;
    randombytes_buf(key.data(), key.size());
    std::array<unsigned char, NONCE_SIZE> nonce;
    randombytes_buf(nonce.data(), nonce.size());

    auto gen = newest_generation().value_or(-1) + 1;
    auto rec = key_record(gen);
    set_field(rec, "n", std::string{from_unsigned_sv(nonce)});

    // One copy for every admin, under a key only the group secret key gives
    auto admin_key = seed_hash(ADMIN_KEY_HASH_KEY);
    set_field(rec, "K", encrypt_key(key, nonce, admin_key.data()));
    sodium_zero_buffer(admin_key.data(), admin_key.size());

    // ...and one per member: the fields are unnamed, so the message does not list who is in the
    // group.  Members try each copy.
    int issued = 0;
    for (auto& m : _members.all()) {
        auto m_xpk = session_id_pk(m.session_id);
        sodium_cleared<std::array<unsigned char, 32>> member_k;
        if (0 != crypto_scalarmult_curve25519(member_k.data(), group_xsk.data(), m_xpk.data())) {
            log(LogLevel::warning,
                "Unable to issue the keys of group " + id + " to " + m.session_id +
                        ": invalid session id");
            continue;
        }
        hash_member_key(member_k, group_xpk, m_xpk);
        set_field(
                rec,
                std::string{MEMBER_FIELD_PREFIX} + std::to_string(issued++),
                encrypt_key(key, nonce, member_k.data()));
    }
    set_field(rec, "t", get_timestamp_ms());

    install_keys(/*dirty=*/true);
    log(LogLevel::info,
        "Rekeyed group " + id + " to generation " + std::to_string(gen) + " for " +
                std::to_string(issued) + " member(s)");
    return gen;
}

std::optional<ConfigBase::Key> Keys::decrypt_generation(std::string_view rec) const {
    auto nonce = _data.get_string(rec, "n");
    if (!nonce)
        return std::nullopt;

    Key out;
    if (admin()) {
        auto admin_key = seed_hash(ADMIN_KEY_HASH_KEY);
        auto enc = _data.get_string(rec, "K");
        bool opened = enc && try_decrypting(out, *enc, *nonce, admin_key.data());
        sodium_zero_buffer(admin_key.data(), admin_key.size());
        if (opened)
            return out;
    }

    auto* fields = _data.record_fields(rec);
    if (!fields)
        return std::nullopt;
    for (auto& [name, f] : *fields) {
        if (!starts_with(name, MEMBER_FIELD_PREFIX) || f.deleted())
            continue;
        if (auto* enc = std::get_if<std::string>(&*f.value);
            enc && try_decrypting(out, *enc, *nonce, _member_key.data()))
            return out;
    }
    return std::nullopt;
}

std::optional<int64_t> Keys::newest_generation() const {
    std::optional<int64_t> gen;
    for (auto& rec : _data.records(KEY_PREFIX))
        if (auto g = record_generation(rec))
            gen = std::max(gen.value_or(*g), *g);
    return gen;
}

std::optional<int64_t> Keys::current_generation() const {
    auto recs = _data.records(KEY_PREFIX);
    // Records sort by (zero-padded) generation, oldest first
    for (auto it = recs.rbegin(); it != recs.rend(); ++it) {
        auto g = record_generation(*it);
        if (!g)
            continue;
        if (auto k = decrypt_generation(*it)) {
            sodium_zero_buffer(k->data(), k->size());
            return g;
        }
    }
    return std::nullopt;
}

std::vector<ustring> Keys::group_keys() const {
    std::vector<ustring> keys;
    auto recs = _data.records(KEY_PREFIX);
    for (auto it = recs.rbegin(); it != recs.rend(); ++it) {
        if (auto k = decrypt_generation(*it)) {
            keys.emplace_back(k->data(), k->size());
            sodium_zero_buffer(k->data(), k->size());
        }
    }
    return keys;
}

size_t Keys::size() const {
    return group_keys().size();
}

void Keys::install_keys(bool dirty) {
    auto keys = group_keys();
    std::vector<ustring_view> views{keys.begin(), keys.end()};
    _info.replace_keys(views, dirty);
    _members.replace_keys(views, dirty);
    for (auto& k : keys)
        sodium_zero_buffer(k.data(), k.size());
}

void Keys::emit_changes(const changes& c) {
    for (auto& [rec, field] : c.fields) {
        // "t" is written last by rekey(), once the key copies are in place
        if (starts_with(rec, KEY_PREFIX) && field == "t") {
            auto gen = current_generation();
            emit("group." + id + ".keys", gen ? std::to_string(*gen) : "");
            return;
        }
    }
}

void Keys::after_merge() {
    install_keys(/*dirty=*/false);
}

}  // namespace swarmsync::config::groups
