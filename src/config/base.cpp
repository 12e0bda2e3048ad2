#include "swarmsync/config/base.hpp"

#include <oxenc/bt_producer.h>
#include <oxenc/bt_serialize.h>
#include <oxenc/hex.h>
#include <sodium/core.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/crypto_sign_ed25519.h>
#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal.hpp"
#include "swarmsync/config/encrypt.hpp"
#include "swarmsync/errors.hpp"
#include "swarmsync/util.hpp"

using namespace std::literals;

namespace swarmsync::config {

namespace {

    bool is_printable(std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](char c) {
            auto u = static_cast<unsigned char>(c);
            return u >= 0x20 && u != 0x7f;
        });
    }

    // Tries to compresses the message; if the compressed version (including the 'z' prefix tag)
    // is smaller than the source message then we modify `msg` to contain the 'z'-prefixed
    // compressed message, otherwise we leave it as-is.
    void compress_message(ustring& msg, int level) {
        if (!level)
            return;
        // "z" is our zstd compression marker prefix byte
        ustring compressed = zstd_compress(msg, level, to_unsigned_sv("z"sv));
        if (compressed.size() < msg.size())
            msg = std::move(compressed);
    }

}  // namespace

ConfigBase::ConfigBase(
        std::optional<ustring_view> dump,
        std::optional<ustring_view> ed25519_pubkey,
        std::optional<ustring_view> ed25519_secretkey) {

    if (sodium_init() == -1)
        throw std::runtime_error{"libsodium initialization failed!"};

    if (dump)
        init_from_dump(*dump);

    if (_writer.empty()) {
        std::array<unsigned char, 8> w;
        randombytes_buf(w.data(), w.size());
        _writer = oxenc::to_hex(w.begin(), w.end());
    }

    if (ed25519_secretkey) {
        if (ed25519_pubkey && *ed25519_pubkey != ed25519_secretkey->substr(32))
            throw std::invalid_argument{"Invalid signing keys: secret key and pubkey do not match"};
        set_sig_keys(*ed25519_secretkey);
    } else if (ed25519_pubkey) {
        set_sig_pubkey(*ed25519_pubkey);
    }
}

ConfigBase::~ConfigBase() {
    for (auto& k : _keys)
        sodium_zero_buffer(k.data(), k.size());
    if (_sign_sk)
        sodium_zero_buffer(_sign_sk->data(), _sign_sk->size());
}

void ConfigBase::init_from_dump(ustring_view dump) {
    try {
        oxenc::bt_dict_consumer d{from_unsigned_sv(dump)};
        if (!d.skip_until("!"))
            throw config_parse_error{
                    "Unable to parse dumped config data: did not find '!' state key"};
        auto state = d.consume_integer<int>();
        if (state < 0 || state > static_cast<int>(ConfigState::Waiting))
            throw config_parse_error{"Unable to parse dumped config data: invalid state"};
        _state = static_cast<ConfigState>(state);

        if (!d.skip_until("$"))
            throw config_parse_error{
                    "Unable to parse dumped config data: did not find '$' data key"};
        _data = ConfigData{to_unsigned_sv(d.consume_string_view())};

        if (d.skip_until("(")) {
            _curr_hash = d.consume_string();
            if (!d.skip_until(")"))
                throw config_parse_error{
                        "Unable to parse dumped config data: found '(' without ')'"};
            for (auto old = d.consume_list_consumer(); !old.is_finished();)
                _old_hashes.insert(old.consume_string());
        }

        if (d.skip_until("*"))
            _writer = d.consume_string();

        if (d.skip_until("+"))
            for (auto merged = d.consume_list_consumer(); !merged.is_finished();)
                remember_merged(merged.consume_string());
    } catch (const oxenc::bt_deserialize_invalid& e) {
        throw config_parse_error{"Unable to parse dumped config data: "s + e.what()};
    }
}

void ConfigBase::set_state(ConfigState s) {
    if (s == ConfigState::Dirty && is_readonly())
        throw std::runtime_error{Error::READ_ONLY_CONFIG};

    if (_state == ConfigState::Clean && !_curr_hash.empty()) {
        _old_hashes.insert(std::move(_curr_hash));
        _curr_hash.clear();
    }
    _state = s;
    _needs_dump = true;
}

void ConfigBase::dirty() {
    if (_state != ConfigState::Dirty)
        set_state(ConfigState::Dirty);
    _needs_dump = true;
}

void ConfigBase::set_max_merged_hashes(size_t n) {
    _max_merged_hashes = std::max<size_t>(n, 1);
    while (_merged_order.size() > _max_merged_hashes) {
        _merged_hashes.erase(_merged_order.front());
        _merged_order.pop_front();
    }
}

void ConfigBase::remember_merged(const std::string& hash) {
    if (hash.empty() || !_merged_hashes.insert(hash).second)
        return;
    _merged_order.push_back(hash);
    if (_merged_order.size() > _max_merged_hashes) {
        _merged_hashes.erase(_merged_order.front());
        _merged_order.pop_front();
    }
}

ConfigData::sign_callable ConfigBase::signer() const {
    if (!_sign_sk)
        return nullptr;
    return [this](ustring_view data) {
        ustring sig;
        sig.resize(64);
        if (0 != crypto_sign_ed25519_detached(
                         sig.data(), nullptr, data.data(), data.size(), _sign_sk->data()))
            throw std::runtime_error{"Internal error: config signing failed!"};
        return sig;
    };
}

ConfigData::verify_callable ConfigBase::verifier() const {
    if (!_sign_pk)
        return nullptr;
    return [this](ustring_view data, ustring_view sig) {
        return 0 == crypto_sign_ed25519_verify_detached(
                            sig.data(), data.data(), data.size(), _sign_pk->data());
    };
}

void ConfigBase::emit(std::string key, std::string value) {
    _events.push_back(ObservedEvent{std::move(key), std::move(value)});
}

std::string ConfigBase::event_key(std::string_view rec, std::string_view field) const {
    std::string key{variant_name(variant())};
    if (!rec.empty()) {
        key += '.';
        key += rec;
    }
    key += '.';
    key += field;
    return key;
}

std::string ConfigBase::event_value(std::string_view rec, std::string_view field) const {
    auto* v = _data.get(rec, field);
    if (!v)
        return "";
    if (auto* i = std::get_if<int64_t>(v))
        return std::to_string(*i);
    auto& s = std::get<std::string>(*v);
    if (is_printable(s))
        return s;
    return oxenc::to_hex(s.begin(), s.end());
}

void ConfigBase::emit_changes(const changes& c) {
    for (auto& [rec, field] : c.fields)
        if (auto key = event_key(rec, field); !key.empty())
            emit(std::move(key), event_value(rec, field));
    for (auto& [set, elem] : c.set_elements)
        if (auto key = event_key(set, elem); !key.empty())
            emit(std::move(key), _data.set_contains(set, elem) ? "1" : "0");
}

EventList ConfigBase::take_events() {
    EventList out;
    out.swap(_events);
    return out;
}

bool ConfigBase::set_field(
        std::string_view rec, std::string_view field, std::optional<scalar> value) {
    if (is_readonly())
        throw std::runtime_error{Error::READ_ONLY_CONFIG};
    if (!_data.set(rec, field, std::move(value), get_timestamp_ms(), _writer))
        return false;
    dirty();
    changes c;
    c.fields.emplace(std::string{rec}, std::string{field});
    emit_changes(c);
    return true;
}

void ConfigBase::set_flag(std::string_view rec, std::string_view field, bool val) {
    if (val)
        set_field(rec, field, int64_t{1});
    else
        set_field(rec, field, std::nullopt);
}

void ConfigBase::set_nonempty_str(
        std::string_view rec, std::string_view field, std::string_view val) {
    if (!val.empty())
        set_field(rec, field, std::string{val});
    else
        set_field(rec, field, std::nullopt);
}

void ConfigBase::set_nonzero_int(std::string_view rec, std::string_view field, int64_t val) {
    if (val != 0)
        set_field(rec, field, val);
    else
        set_field(rec, field, std::nullopt);
}

void ConfigBase::set_positive_int(std::string_view rec, std::string_view field, int64_t val) {
    if (val > 0)
        set_field(rec, field, val);
    else
        set_field(rec, field, std::nullopt);
}

void ConfigBase::set_pair_if(
        bool condition,
        std::string_view rec,
        std::string_view field1,
        std::string_view val1,
        std::string_view field2,
        std::string_view val2) {
    if (condition) {
        set_field(rec, field1, std::string{val1});
        set_field(rec, field2, std::string{val2});
    } else {
        set_field(rec, field1, std::nullopt);
        set_field(rec, field2, std::nullopt);
    }
}

bool ConfigBase::erase_record(std::string_view rec) {
    if (is_readonly())
        throw std::runtime_error{Error::READ_ONLY_CONFIG};
    auto erased = _data.erase_record(rec, get_timestamp_ms(), _writer);
    if (erased.empty())
        return false;
    dirty();
    changes c;
    c.fields.insert(erased.begin(), erased.end());
    emit_changes(c);
    return true;
}

bool ConfigBase::set_insert(std::string_view set, std::string_view elem) {
    if (is_readonly())
        throw std::runtime_error{Error::READ_ONLY_CONFIG};
    if (!_data.set_insert(set, elem, get_timestamp_ms()))
        return false;
    dirty();
    changes c;
    c.set_elements.emplace(std::string{set}, std::string{elem});
    emit_changes(c);
    return true;
}

bool ConfigBase::set_erase(std::string_view set, std::string_view elem) {
    if (is_readonly())
        throw std::runtime_error{Error::READ_ONLY_CONFIG};
    if (!_data.set_erase(set, elem, get_timestamp_ms()))
        return false;
    dirty();
    changes c;
    c.set_elements.emplace(std::string{set}, std::string{elem});
    emit_changes(c);
    return true;
}

std::vector<std::string> ConfigBase::merge(
        const std::vector<std::pair<std::string, ustring>>& configs) {
    std::vector<std::pair<std::string, ustring_view>> config_views;
    config_views.reserve(configs.size());
    for (auto& [hash, data] : configs)
        config_views.emplace_back(hash, data);
    return merge(config_views);
}

std::vector<std::string> ConfigBase::merge(
        const std::vector<std::pair<std::string, ustring_view>>& configs) {
    if (_keys.empty())
        throw std::logic_error{"Cannot merge configs without any decryption keys"};

    struct incoming {
        std::string hash;
        ConfigData data;
    };
    std::vector<incoming> parsed;
    auto verify = verifier();

    for (size_t ci = 0; ci < configs.size(); ci++) {
        auto& [hash, conf] = configs[ci];
        if (!hash.empty() && (hash == _curr_hash || _merged_hashes.count(hash))) {
            log(LogLevel::debug, "Skipping already merged message " + hash);
            continue;
        }

        std::optional<ustring> plain;
        for (size_t i = 0; !plain && i < _keys.size(); i++) {
            try {
                plain = decrypt(conf, key(i), encryption_domain());
            } catch (const decrypt_error&) {
                log(LogLevel::debug,
                    "Failed to decrypt message " + std::to_string(ci) + " using key " +
                            std::to_string(i));
            }
        }
        if (!plain) {
            log(LogLevel::warning, "Failed to decrypt message " + std::to_string(ci));
            continue;
        }

        unpad_message(*plain);
        if (plain->empty()) {
            log(LogLevel::error, "Invalid config message: contains no data");
            continue;
        }

        // 'z' prefix indicates zstd-compressed data:
        if ((*plain)[0] == 'z') {
            if (auto decompressed = zstd_decompress(ustring_view{*plain}.substr(1));
                decompressed && !decompressed->empty())
                *plain = std::move(*decompressed);
            else {
                log(LogLevel::warning, "Invalid config message: decompression failed");
                continue;
            }
        }

        try {
            parsed.push_back(incoming{hash, ConfigData{*plain, verify}});
        } catch (const config_error& e) {
            log(LogLevel::warning,
                "Invalid config message " + std::to_string(ci) + ": " + e.what());
        }
    }
    log(LogLevel::debug,
        "successfully parsed " + std::to_string(parsed.size()) + " of " +
                std::to_string(configs.size()) + " incoming messages");

    std::vector<std::string> merged;
    if (parsed.empty())
        return merged;

    changes all_changes;
    bool modified = false;
    for (auto& in : parsed) {
        bool mod = false;
        all_changes.absorb(_data.merge(in.data, &mod));
        modified = modified || mod;
        remember_merged(in.hash);
        merged.push_back(in.hash);
    }

    // The newest incoming message that holds everything we now have, if any: that message is our
    // state on the swarm.
    const incoming* superconf = nullptr;
    for (auto& in : parsed)
        if (_data.same_content(in.data) &&
            (!superconf || in.data.seqno() > superconf->data.seqno()))
            superconf = &in;

    // Everything else we received is superseded by either that message or our next push.
    for (auto& in : parsed)
        if (&in != superconf && !in.hash.empty() && in.hash != _curr_hash)
            _old_hashes.insert(in.hash);

    if (is_dirty()) {
        // Our unpushed changes are still unpushed; the merged result goes out with them.
    } else if (superconf && !superconf->hash.empty()) {
        if (superconf->hash != _curr_hash) {
            if (!_curr_hash.empty())
                _old_hashes.insert(std::move(_curr_hash));
            _old_hashes.erase(superconf->hash);
            _curr_hash = superconf->hash;
            _state = ConfigState::Clean;
            _needs_dump = true;
        }
    } else if (modified) {
        if (is_readonly()) {
            // We can't push a merge resolution, so the newest message we received stands in as
            // the current state until an admin pushes one.
            auto newest = std::max_element(parsed.begin(), parsed.end(), [](auto& a, auto& b) {
                return a.data.seqno() < b.data.seqno();
            });
            if (!_curr_hash.empty())
                _old_hashes.insert(std::move(_curr_hash));
            _old_hashes.erase(newest->hash);
            _curr_hash = newest->hash;
            _state = ConfigState::Clean;
        } else {
            set_state(ConfigState::Dirty);
        }
    }

    if (modified) {
        _needs_dump = true;
        if (!all_changes.empty())
            emit_changes(all_changes);
        after_merge();
    }

    return merged;
}

std::vector<std::string> ConfigBase::current_hashes() const {
    std::vector<std::string> hashes;
    if (!_curr_hash.empty())
        hashes.push_back(_curr_hash);
    return hashes;
}

bool ConfigBase::needs_push() const {
    return !is_clean();
}

std::tuple<seqno_t, ustring, std::vector<std::string>> ConfigBase::push() {
    if (_keys.empty())
        throw std::logic_error{"Cannot push data without an encryption key!"};
    if (is_readonly())
        throw std::logic_error{"Unable to push a read-only config object"};

    const auto old_seqno = _data.seqno();
    if (is_dirty())
        _data.seqno(old_seqno + 1);

    std::tuple<seqno_t, ustring, std::vector<std::string>> ret;
    auto& [seqno, msg, obs] = ret;
    try {
        seqno = _data.seqno();
        msg = _data.serialize(signer());

        if (auto lvl = compression_level())
            compress_message(msg, *lvl);

        pad_message(msg);  // Prefix pad with nulls
        encrypt_inplace(msg, key(), encryption_domain());

        if (msg.size() > MAX_MESSAGE_SIZE)
            throw std::length_error{"Config data is too large"};
    } catch (const std::exception&) {
        _data.seqno(old_seqno);
        throw;
    }

    if (is_dirty())
        set_state(ConfigState::Waiting);

    for (auto& old : _old_hashes)
        obs.push_back(old);
    _old_hashes.clear();

    return ret;
}

void ConfigBase::confirm_pushed(seqno_t seqno, std::string msg_hash) {
    // Make sure seqno hasn't changed; if it has then that means we set some other data *after* the
    // caller got the last data to push, and so we don't care about this confirmation.
    if (_state == ConfigState::Waiting && seqno == _data.seqno()) {
        set_state(ConfigState::Clean);
        remember_merged(msg_hash);
        _curr_hash = std::move(msg_hash);
    }
}

ustring ConfigBase::dump() {
    if (is_readonly())
        _old_hashes.clear();

    auto d = make_dump();
    _needs_dump = false;
    return d;
}

ustring ConfigBase::make_dump() const {
    auto data = _data.serialize();

    oxenc::bt_dict_producer d;
    d.append("!", static_cast<int>(_state));
    d.append("$", from_unsigned_sv(data));
    d.append("(", _curr_hash);

    d.append_list(")").append(_old_hashes.begin(), _old_hashes.end());

    d.append("*", _writer);

    d.append_list("+").append(_merged_order.begin(), _merged_order.end());

    return ustring{to_unsigned_sv(d.view())};
}

bool ConfigBase::has_key(ustring_view key) const {
    if (key.size() != KEY_SIZE)
        throw std::invalid_argument{"invalid key given to has_key(): not 32-bytes"};

    for (const auto& k : _keys)
        if (sodium_memcmp(key.data(), k.data(), KEY_SIZE) == 0)
            return true;
    return false;
}

std::vector<ustring_view> ConfigBase::get_keys() const {
    std::vector<ustring_view> ret;
    ret.reserve(_keys.size());
    for (const auto& key : _keys)
        ret.emplace_back(key.data(), key.size());
    return ret;
}

ustring_view ConfigBase::key(size_t i) const {
    if (i >= _keys.size())
        throw std::out_of_range{"Config key index out of range"};
    return {_keys[i].data(), _keys[i].size()};
}

void ConfigBase::add_key(ustring_view key, bool high_priority, bool dirty_config) {
    if (key.size() != KEY_SIZE)
        throw std::invalid_argument{"add_key failed: key size must be 32 bytes"};

    if (!_keys.empty() && sodium_memcmp(_keys.front().data(), key.data(), KEY_SIZE) == 0)
        return;
    if (!high_priority && has_key(key))
        return;

    if (high_priority)
        _keys.erase(
                std::remove_if(
                        _keys.begin(),
                        _keys.end(),
                        [&key](const Key& k) {
                            return sodium_memcmp(key.data(), k.data(), KEY_SIZE) == 0;
                        }),
                _keys.end());

    auto& newkey = *_keys.emplace(high_priority ? _keys.begin() : _keys.end());
    std::memcpy(newkey.data(), key.data(), KEY_SIZE);

    if (dirty_config && !is_readonly() && (_keys.size() == 1 || high_priority))
        dirty();
}

void ConfigBase::replace_keys(const std::vector<ustring_view>& new_keys, bool dirty_config) {
    if (new_keys.empty()) {
        clear_keys(dirty_config);
        return;
    }

    for (auto& k : new_keys)
        if (k.size() != KEY_SIZE)
            throw std::invalid_argument{"replace_keys failed: keys must be 32 bytes"};

    dirty_config = dirty_config && !is_readonly() &&
                   (_keys.empty() ||
                    sodium_memcmp(_keys.front().data(), new_keys.front().data(), KEY_SIZE) != 0);

    for (auto& k : _keys)
        sodium_zero_buffer(k.data(), k.size());
    _keys.clear();
    for (auto& k : new_keys)
        add_key(k, /*high_priority=*/false);  // The first key gets the high priority spot even
                                              // with `false` since we just emptied the list

    if (dirty_config)
        dirty();
}

int ConfigBase::clear_keys(bool dirty_config) {
    int ret = static_cast<int>(_keys.size());
    for (auto& k : _keys)
        sodium_zero_buffer(k.data(), k.size());
    _keys.clear();

    if (dirty_config && !is_readonly() && ret > 0)
        dirty();

    return ret;
}

void ConfigBase::load_key(ustring_view ed25519_secretkey) {
    if (!(ed25519_secretkey.size() == 64 || ed25519_secretkey.size() == 32))
        throw std::invalid_argument{
                encryption_domain() + " requires an Ed25519 64-byte secret key or 32-byte seed"s};

    add_key(ed25519_secretkey.substr(0, 32));
}

void ConfigBase::set_sig_keys(ustring_view secret) {
    if (secret.size() != 64)
        throw std::invalid_argument{"Invalid sodium secret: expected 64 bytes"};
    clear_sig_keys();
    _sign_sk.emplace();
    std::memcpy(_sign_sk->data(), secret.data(), secret.size());
    _sign_pk.emplace();
    crypto_sign_ed25519_sk_to_pk(_sign_pk->data(), _sign_sk->data());
}

void ConfigBase::set_sig_pubkey(ustring_view pubkey) {
    if (pubkey.size() != 32)
        throw std::invalid_argument{"Invalid pubkey: expected 32 bytes"};
    _sign_pk.emplace();
    std::memcpy(_sign_pk->data(), pubkey.data(), 32);
}

void ConfigBase::clear_sig_keys() {
    _sign_pk.reset();
    if (_sign_sk)
        sodium_zero_buffer(_sign_sk->data(), _sign_sk->size());
    _sign_sk.reset();
}

std::array<unsigned char, 32> ConfigBase::seed_hash(std::string_view key) const {
    if (!_sign_sk)
        throw std::runtime_error{"Cannot make a seed hash without a signing secret key"};
    std::array<unsigned char, 32> out;
    crypto_generichash_blake2b(
            out.data(),
            out.size(),
            _sign_sk->data(),
            32,  // Just the seed part of the value, not the last half (which is just the pubkey)
            to_unsigned(key.data()),
            std::min<size_t>(key.size(), 64));
    return out;
}

}  // namespace swarmsync::config
