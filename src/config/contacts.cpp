#include "swarmsync/config/contacts.hpp"

#include "internal.hpp"

namespace swarmsync::config {

namespace {

    constexpr auto CONTACT_PREFIX = "c/"sv;

    std::string contact_record(std::string_view session_id) {
        check_session_id(session_id);
        std::string rec{CONTACT_PREFIX};
        rec += session_id;
        make_lc(rec);
        return rec;
    }

}  // namespace

contact_info::contact_info(std::string sid) : session_id{std::move(sid)} {
    check_session_id(session_id);
    make_lc(session_id);
}

void contact_info::set_name(std::string n) {
    if (n.size() > MAX_NAME_LENGTH)
        throw std::invalid_argument{"Invalid contact name: exceeds maximum length"};
    name = std::move(n);
}

bool contact_info::operator==(const contact_info& o) const {
    return session_id == o.session_id && name == o.name && profile_picture == o.profile_picture &&
           approved == o.approved && approved_me == o.approved_me && blocked == o.blocked &&
           priority == o.priority && exp_mode == o.exp_mode && exp_timer == o.exp_timer &&
           created == o.created;
}

void contact_info::load(const ConfigData& data, std::string_view rec) {
    name = data.get_string(rec, "n").value_or("");
    profile_picture = read_profile_pic(data, rec);

    approved = data.get_int(rec, "a").value_or(0);
    approved_me = data.get_int(rec, "A").value_or(0);
    blocked = data.get_int(rec, "b").value_or(0);

    priority = static_cast<int>(data.get_int(rec, "+").value_or(0));

    auto exp_mode_ = data.get_int(rec, "e").value_or(0);
    if (exp_mode_ >= static_cast<int>(expiration_mode::none) &&
        exp_mode_ <= static_cast<int>(expiration_mode::after_read))
        exp_mode = static_cast<expiration_mode>(exp_mode_);
    else
        exp_mode = expiration_mode::none;

    if (exp_mode == expiration_mode::none)
        exp_timer = 0s;
    else {
        auto secs = data.get_int(rec, "E").value_or(0);
        if (secs <= 0) {
            exp_mode = expiration_mode::none;
            exp_timer = 0s;
        } else {
            exp_timer = std::chrono::seconds{secs};
        }
    }

    created = data.get_int(rec, "j").value_or(0);
}

Contacts::Contacts(ustring_view ed25519_secretkey, std::optional<ustring_view> dumped) :
        ConfigBase{dumped} {
    load_key(ed25519_secretkey);
}

std::optional<contact_info> Contacts::get(std::string_view pubkey_hex) const {
    auto rec = contact_record(pubkey_hex);
    if (!_data.has_record(rec))
        return std::nullopt;

    auto result = std::make_optional<contact_info>(std::string{pubkey_hex});
    result->load(_data, rec);
    return result;
}

contact_info Contacts::get_or_construct(std::string_view pubkey_hex) const {
    if (auto maybe = get(pubkey_hex))
        return *std::move(maybe);

    return contact_info{std::string{pubkey_hex}};
}

void Contacts::set(const contact_info& contact) {
    auto rec = contact_record(contact.session_id);

    // Always set the name, even if empty, to keep the record alive if there are no other fields.
    set_field(rec, "n", contact.name.substr(0, contact_info::MAX_NAME_LENGTH));

    set_pair_if(
            static_cast<bool>(contact.profile_picture),
            rec,
            "p",
            contact.profile_picture.url,
            "q",
            from_unsigned_sv(contact.profile_picture.key));

    set_flag(rec, "a", contact.approved);
    set_flag(rec, "A", contact.approved_me);
    set_flag(rec, "b", contact.blocked);

    set_nonzero_int(rec, "+", contact.priority);

    if (contact.exp_mode != expiration_mode::none && contact.exp_timer > 0s) {
        set_field(rec, "e", int64_t{static_cast<int8_t>(contact.exp_mode)});
        set_field(rec, "E", int64_t{contact.exp_timer.count()});
    } else {
        set_field(rec, "e", std::nullopt);
        set_field(rec, "E", std::nullopt);
    }

    set_positive_int(rec, "j", contact.created);
}

void Contacts::set_name(std::string_view session_id, std::string name) {
    auto c = get_or_construct(session_id);
    c.set_name(std::move(name));
    set(c);
}
void Contacts::set_profile_pic(std::string_view session_id, profile_pic pic) {
    auto c = get_or_construct(session_id);
    c.profile_picture = std::move(pic);
    set(c);
}
void Contacts::set_approved(std::string_view session_id, bool approved) {
    auto c = get_or_construct(session_id);
    c.approved = approved;
    set(c);
}
void Contacts::set_approved_me(std::string_view session_id, bool approved_me) {
    auto c = get_or_construct(session_id);
    c.approved_me = approved_me;
    set(c);
}
void Contacts::set_blocked(std::string_view session_id, bool blocked) {
    auto c = get_or_construct(session_id);
    c.blocked = blocked;
    set(c);
}

void Contacts::set_priority(std::string_view session_id, int priority) {
    auto c = get_or_construct(session_id);
    c.priority = priority;
    set(c);
}

void Contacts::set_expiry(
        std::string_view session_id, expiration_mode mode, std::chrono::seconds timer) {
    auto c = get_or_construct(session_id);
    c.exp_mode = mode;
    c.exp_timer = c.exp_mode == expiration_mode::none ? 0s : timer;
    set(c);
}

void Contacts::set_created(std::string_view session_id, int64_t timestamp) {
    auto c = get_or_construct(session_id);
    c.created = timestamp;
    set(c);
}

bool Contacts::erase(std::string_view session_id) {
    return erase_record(contact_record(session_id));
}

size_t Contacts::size() const {
    return _data.records(CONTACT_PREFIX).size();
}

std::vector<contact_info> Contacts::all() const {
    std::vector<contact_info> result;
    for (auto& rec : _data.records(CONTACT_PREFIX)) {
        auto sid = std::string_view{rec}.substr(CONTACT_PREFIX.size());
        if (sid.size() != 66)
            continue;
        auto& c = result.emplace_back(std::string{sid});
        c.load(_data, rec);
    }
    return result;
}

std::string Contacts::event_key(std::string_view rec, std::string_view field) const {
    std::string key{"contact."};
    key += rec.substr(CONTACT_PREFIX.size());
    key += '.';
    if (field == "n")
        key += "name";
    else if (field == "p")
        key += "pic_url";
    else if (field == "q")
        key += "pic_key";
    else if (field == "a")
        key += "approved";
    else if (field == "A")
        key += "approved_me";
    else if (field == "b")
        key += "blocked";
    else if (field == "+")
        key += "priority";
    else if (field == "e")
        key += "exp_mode";
    else if (field == "E")
        key += "exp_timer";
    else if (field == "j")
        key += "created";
    else
        key += field;
    return key;
}

}  // namespace swarmsync::config
