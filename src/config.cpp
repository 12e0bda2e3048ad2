#include "swarmsync/config.hpp"

#include <oxenc/bt_producer.h>
#include <oxenc/bt_serialize.h>
#include <sodium/crypto_generichash_blake2b.h>

#include <algorithm>

#include "swarmsync/util.hpp"

using namespace std::literals;

namespace swarmsync::config {

namespace {

    // Orders optional scalars: a deletion sorts before any integer, and integers before strings.
    int compare_values(const std::optional<scalar>& a, const std::optional<scalar>& b) {
        if (!a || !b)
            return static_cast<int>(a.has_value()) - static_cast<int>(b.has_value());
        if (a->index() != b->index())
            return a->index() < b->index() ? -1 : 1;
        if (auto* ai = std::get_if<int64_t>(&*a)) {
            auto bi = std::get<int64_t>(*b);
            return *ai < bi ? -1 : *ai > bi ? 1 : 0;
        }
        return std::get<std::string>(*a).compare(std::get<std::string>(*b));
    }

    std::string_view view(const std::string& s) { return s; }

    field_value parse_field(oxenc::bt_list_consumer l) {
        field_value fv;
        fv.timestamp_ms = l.consume_integer<int64_t>();
        fv.writer = l.consume_string();
        if (!l.is_finished()) {
            if (l.is_integer())
                fv.value = l.consume_integer<int64_t>();
            else if (l.is_string())
                fv.value = l.consume_string();
            else
                throw config_parse_error{"Invalid config field value: expected integer or string"};
        }
        if (!l.is_finished())
            throw config_parse_error{"Invalid config field: unexpected trailing values"};
        return fv;
    }

}  // namespace

bool supersedes(const field_value& a, const field_value& b) {
    if (a.timestamp_ms != b.timestamp_ms)
        return a.timestamp_ms > b.timestamp_ms;
    if (a.writer != b.writer)
        return a.writer > b.writer;
    return compare_values(a.value, b.value) > 0;
}

ConfigData::ConfigData(ustring_view serialized, const verify_callable& verifier) {
    try {
        oxenc::bt_dict_consumer d{from_unsigned_sv(serialized)};

        if (!d.skip_until("#"))
            throw config_parse_error{"Invalid config: missing seqno"};
        _seqno = d.consume_integer<seqno_t>();

        if (d.skip_until("f")) {
            auto recs = d.consume_dict_consumer();
            while (!recs.is_finished()) {
                std::string rec_name{recs.key()};
                auto fields = recs.consume_dict_consumer();
                auto& rec = _records[rec_name];
                while (!fields.is_finished()) {
                    std::string name{fields.key()};
                    rec.emplace(std::move(name), parse_field(fields.consume_list_consumer()));
                }
                if (rec.empty())
                    _records.erase(rec_name);
            }
        }

        if (d.skip_until("s")) {
            auto sets = d.consume_dict_consumer();
            while (!sets.is_finished()) {
                std::string set_name{sets.key()};
                auto elems = sets.consume_dict_consumer();
                auto& set = _sets[set_name];
                while (!elems.is_finished()) {
                    std::string elem{elems.key()};
                    auto l = elems.consume_list_consumer();
                    set_entry e;
                    e.added_ms = l.consume_integer<int64_t>();
                    e.removed_ms = l.consume_integer<int64_t>();
                    set.emplace(std::move(elem), e);
                }
                if (set.empty())
                    _sets.erase(set_name);
            }
        }

        if (d.skip_until("~")) {
            d.consume_signature([&](ustring_view to_verify, ustring_view sig) {
                if (sig.size() != 64)
                    throw signature_error{"Config signature is invalid (not 64B)"};
                if (verifier && !verifier(to_verify, sig))
                    throw signature_error{"Config signature failed verification"};
            });
        } else if (verifier) {
            throw signature_error{"Config signature is missing"};
        }

        if (!d.is_finished())
            throw config_parse_error{"Invalid config: dict has invalid key(s) after \"~\""};
    } catch (const oxenc::bt_deserialize_invalid& e) {
        throw config_parse_error{"Failed to parse config data: "s + e.what()};
    }
}

const field_value* ConfigData::field(std::string_view rec, std::string_view name) const {
    auto rit = _records.find(rec);
    if (rit == _records.end())
        return nullptr;
    auto fit = rit->second.find(name);
    if (fit == rit->second.end())
        return nullptr;
    return &fit->second;
}

const scalar* ConfigData::get(std::string_view rec, std::string_view name) const {
    if (auto* f = field(rec, name); f && f->value)
        return &*f->value;
    return nullptr;
}

std::optional<int64_t> ConfigData::get_int(std::string_view rec, std::string_view name) const {
    if (auto* v = get(rec, name))
        if (auto* i = std::get_if<int64_t>(v))
            return *i;
    return std::nullopt;
}

std::optional<std::string> ConfigData::get_string(
        std::string_view rec, std::string_view name) const {
    if (auto* v = get(rec, name))
        if (auto* s = std::get_if<std::string>(v))
            return *s;
    return std::nullopt;
}

bool ConfigData::set(
        std::string_view rec,
        std::string_view name,
        std::optional<scalar> value,
        int64_t now_ms,
        std::string_view writer) {
    auto rit = _records.find(rec);
    if (rit == _records.end()) {
        if (!value)
            return false;
        rit = _records.emplace(std::string{rec}, record{}).first;
    }
    auto& fields = rit->second;
    auto fit = fields.find(name);
    if (fit == fields.end()) {
        if (!value)
            return false;
        fields.emplace(
                std::string{name}, field_value{std::move(value), now_ms, std::string{writer}});
        return true;
    }

    auto& existing = fit->second;
    if (existing.value == value)
        return false;
    existing.value = std::move(value);
    existing.timestamp_ms = std::max(now_ms, existing.timestamp_ms + 1);
    existing.writer = writer;
    return true;
}

std::vector<field_key> ConfigData::erase_record(
        std::string_view rec, int64_t now_ms, std::string_view writer) {
    std::vector<field_key> erased;
    auto rit = _records.find(rec);
    if (rit == _records.end())
        return erased;
    for (auto& [name, fv] : rit->second) {
        if (!fv.value)
            continue;
        fv.value.reset();
        fv.timestamp_ms = std::max(now_ms, fv.timestamp_ms + 1);
        fv.writer = writer;
        erased.emplace_back(rit->first, name);
    }
    return erased;
}

const ConfigData::record* ConfigData::record_fields(std::string_view rec) const {
    auto rit = _records.find(rec);
    if (rit == _records.end())
        return nullptr;
    return &rit->second;
}

bool ConfigData::has_record(std::string_view rec) const {
    auto rit = _records.find(rec);
    if (rit == _records.end())
        return false;
    return std::any_of(rit->second.begin(), rit->second.end(), [](const auto& f) {
        return f.second.value.has_value();
    });
}

std::vector<std::string> ConfigData::records(std::string_view prefix) const {
    std::vector<std::string> result;
    for (auto it = _records.lower_bound(prefix); it != _records.end(); ++it) {
        if (!starts_with(it->first, prefix))
            break;
        if (has_record(it->first))
            result.push_back(it->first);
    }
    return result;
}

const set_entry* ConfigData::set_element(std::string_view set, std::string_view elem) const {
    auto sit = _sets.find(set);
    if (sit == _sets.end())
        return nullptr;
    auto eit = sit->second.find(elem);
    if (eit == sit->second.end())
        return nullptr;
    return &eit->second;
}

bool ConfigData::set_contains(std::string_view set, std::string_view elem) const {
    auto* e = set_element(set, elem);
    return e && e->present();
}

std::vector<std::string> ConfigData::set_elements(std::string_view set) const {
    std::vector<std::string> result;
    if (auto sit = _sets.find(set); sit != _sets.end())
        for (auto& [elem, e] : sit->second)
            if (e.present())
                result.push_back(elem);
    return result;
}

bool ConfigData::set_insert(std::string_view set, std::string_view elem, int64_t now_ms) {
    if (set_contains(set, elem))
        return false;
    auto sit = _sets.find(set);
    if (sit == _sets.end())
        sit = _sets.emplace(std::string{set}, set_type{}).first;
    auto& e = sit->second[std::string{elem}];
    e.added_ms = std::max({now_ms, e.removed_ms, e.added_ms + 1});
    return true;
}

bool ConfigData::set_erase(std::string_view set, std::string_view elem, int64_t now_ms) {
    auto sit = _sets.find(set);
    if (sit == _sets.end())
        return false;
    auto eit = sit->second.find(elem);
    if (eit == sit->second.end() || !eit->second.present())
        return false;
    auto& e = eit->second;
    e.removed_ms = std::max(now_ms, e.added_ms + 1);
    return true;
}

changes ConfigData::merge(const ConfigData& other, bool* modified) {
    changes result;
    bool mod = false;

    for (auto& [rec_name, other_fields] : other._records) {
        auto& fields = _records[rec_name];
        for (auto& [name, theirs] : other_fields) {
            auto fit = fields.find(name);
            if (fit == fields.end()) {
                fields.emplace(name, theirs);
                mod = true;
                if (theirs.value)
                    result.fields.emplace(rec_name, name);
            } else if (supersedes(theirs, fit->second)) {
                if (theirs.value != fit->second.value)
                    result.fields.emplace(rec_name, name);
                fit->second = theirs;
                mod = true;
            }
        }
    }

    for (auto& [set_name, other_elems] : other._sets) {
        auto& elems = _sets[set_name];
        for (auto& [elem, theirs] : other_elems) {
            auto& mine = elems[elem];
            bool was_present = mine.present();
            set_entry merged{
                    std::max(mine.added_ms, theirs.added_ms),
                    std::max(mine.removed_ms, theirs.removed_ms)};
            if (merged != mine) {
                mine = merged;
                mod = true;
            }
            if (mine.present() != was_present)
                result.set_elements.emplace(set_name, elem);
        }
    }

    if (other._seqno > _seqno) {
        _seqno = other._seqno;
        mod = true;
    }

    if (modified)
        *modified = mod;
    return result;
}

bool ConfigData::same_content(const ConfigData& other) const {
    auto strip = [](const auto& m) {
        // Records or sets may exist as empty containers after a lookup; ignore those.
        size_t n = 0;
        for (auto& [k, v] : m)
            if (!v.empty())
                n++;
        return n;
    };
    if (strip(_records) != strip(other._records) || strip(_sets) != strip(other._sets))
        return false;
    for (auto& [name, rec] : _records) {
        if (rec.empty())
            continue;
        auto it = other._records.find(name);
        if (it == other._records.end() || it->second != rec)
            return false;
    }
    for (auto& [name, set] : _sets) {
        if (set.empty())
            continue;
        auto it = other._sets.find(name);
        if (it == other._sets.end() || it->second != set)
            return false;
    }
    return true;
}

ustring ConfigData::serialize(const sign_callable& signer) const {
    oxenc::bt_dict_producer d;
    d.append("#", _seqno);

    {
        auto recs = d.append_dict("f");
        for (auto& [rec_name, fields] : _records) {
            if (fields.empty())
                continue;
            auto rec = recs.append_dict(rec_name);
            for (auto& [name, fv] : fields) {
                auto l = rec.append_list(name);
                l.append(fv.timestamp_ms);
                l.append(view(fv.writer));
                if (fv.value) {
                    if (auto* i = std::get_if<int64_t>(&*fv.value))
                        l.append(*i);
                    else
                        l.append(view(std::get<std::string>(*fv.value)));
                }
            }
        }
    }

    {
        auto sets = d.append_dict("s");
        for (auto& [set_name, elems] : _sets) {
            if (elems.empty())
                continue;
            auto set = sets.append_dict(set_name);
            for (auto& [elem, e] : elems) {
                auto l = set.append_list(elem);
                l.append(e.added_ms);
                l.append(e.removed_ms);
            }
        }
    }

    if (signer) {
        d.append_signature("~", [&signer](ustring_view to_sign) {
            auto sig = signer(to_sign);
            if (sig.size() != 64)
                throw std::logic_error{
                        "Invalid signature: signing function did not return 64 bytes"};
            return sig;
        });
    }

    return ustring{to_unsigned_sv(d.view())};
}

hash_t ConfigData::hash() const {
    auto serialized = serialize();
    hash_t h;
    crypto_generichash_blake2b(
            h.data(), h.size(), serialized.data(), serialized.size(), nullptr, 0);
    return h;
}

}  // namespace swarmsync::config
