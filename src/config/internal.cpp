#include "internal.hpp"

#include <oxenc/base64.h>
#include <oxenc/hex.h>
#include <zstd.h>

#include <iterator>
#include <memory>
#include <stdexcept>

#include "swarmsync/util.hpp"

namespace swarmsync::config {

namespace {

    bool looks_like_session_id(std::string_view id, std::string_view prefix) {
        return id.size() == prefix.size() + 64 && starts_with(id, prefix) && oxenc::is_hex(id);
    }

    bool looks_like_base64_key(std::string_view pk) {
        if (pk.size() == 44)
            return pk.back() == '=' && oxenc::is_base64(pk);
        return pk.size() == 43 && oxenc::is_base64(pk);
    }

    struct dctx_deleter {
        void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
    };

}  // namespace

void check_session_id(std::string_view session_id, std::string_view prefix) {
    if (!looks_like_session_id(session_id, prefix))
        throw std::invalid_argument{
                "Invalid session ID: expected " + std::to_string(prefix.size() + 64) +
                " hex digits starting with " + std::string{prefix} + "; got " +
                std::string{session_id}};
}

std::array<unsigned char, 32> session_id_pk(std::string_view session_id, std::string_view prefix) {
    check_session_id(session_id, prefix);
    auto hex = session_id.substr(prefix.size());
    std::array<unsigned char, 32> pk;
    oxenc::from_hex(hex.begin(), hex.end(), pk.begin());
    return pk;
}

ustring decode_pubkey(std::string_view pk) {
    ustring out;
    out.reserve(32);
    auto into = std::back_inserter(out);
    if (pk.size() == 64 && oxenc::is_hex(pk))
        oxenc::from_hex(pk.begin(), pk.end(), into);
    else if (looks_like_base64_key(pk))
        oxenc::from_base64(pk.begin(), pk.end(), into);
    else
        throw std::invalid_argument{"Invalid encoded pubkey: expected hex or base64"};
    return out;
}

profile_pic read_profile_pic(const ConfigData& data, std::string_view rec) {
    profile_pic pic{};
    auto url = data.get_string(rec, "p");
    auto key = data.get_string(rec, "q");
    if (url && !url->empty())
        pic.url = *url;
    if (key && key->size() == 32)
        pic.key = to_unsigned_sv(*key);
    return pic;
}

void make_lc(std::string& s) {
    s = to_lower(s);
}

ustring zstd_compress(ustring_view data, int level, ustring_view prefix) {
    ustring out{prefix};
    out.resize(prefix.size() + ZSTD_compressBound(data.size()));
    const size_t written = ZSTD_compress(
            out.data() + prefix.size(),
            out.size() - prefix.size(),
            data.data(),
            data.size(),
            level);
    if (ZSTD_isError(written))
        throw std::runtime_error{
                "zstd compression failed: " + std::string{ZSTD_getErrorName(written)}};
    out.resize(prefix.size() + written);
    return out;
}

std::optional<ustring> zstd_decompress(ustring_view data, size_t max_size) {
    std::unique_ptr<ZSTD_DCtx, dctx_deleter> ctx{ZSTD_createDCtx()};
    if (!ctx)
        return std::nullopt;

    ZSTD_inBuffer in{data.data(), data.size(), 0};
    std::array<unsigned char, 4096> chunk;
    ustring result;

    // The stream is complete once a frame has ended and all input has been consumed.
    size_t remaining = 1;
    while (remaining != 0 || in.pos < in.size) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        remaining = ZSTD_decompressStream(ctx.get(), &out, &in);
        if (ZSTD_isError(remaining))
            return std::nullopt;
        if (out.pos == 0 && in.pos == in.size && remaining != 0)
            return std::nullopt;  // truncated frame
        if (max_size && result.size() + out.pos > max_size)
            return std::nullopt;
        result.append(chunk.data(), out.pos);
    }
    return result;
}

}  // namespace swarmsync::config
