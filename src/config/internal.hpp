#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "swarmsync/config.hpp"
#include "swarmsync/config/profile_pic.hpp"
#include "swarmsync/types.hpp"

namespace swarmsync::config {

// Throws std::invalid_argument unless `session_id` is `prefix` followed by 64 hex digits.  Group
// ids use the "03" prefix.
void check_session_id(std::string_view session_id, std::string_view prefix = "05");

// Validates `session_id` and returns the 32 pubkey bytes that follow its prefix.
std::array<unsigned char, 32> session_id_pk(
        std::string_view session_id, std::string_view prefix = "05");

// Decodes a 32-byte community pubkey given as hex or (padded or unpadded) base64.
ustring decode_pubkey(std::string_view pk);

// Picture stored in the "p" (url) and "q" (key) fields of `rec`; a key of the wrong size reads
// as no key.
profile_pic read_profile_pic(const ConfigData& data, std::string_view rec);

// Lowercases `s` in place (ascii only).
void make_lc(std::string& s);

// zstd compression of `data`, written after `prefix`.
ustring zstd_compress(ustring_view data, int level = 1, ustring_view prefix = {});

// nullopt on corrupt or truncated input, or when the output would exceed a non-zero `max_size`.
std::optional<ustring> zstd_decompress(ustring_view data, size_t max_size = 0);

}  // namespace swarmsync::config
