#pragma once

#include <string>

namespace crypto {

std::string hmac_sha256(const std::string& key, const std::string& data);

// Unpadded, url-safe alphabet.
std::string base64url_encode(const std::string& in);

// Keyed one-way replacement for an event UID: HMAC-SHA256(seed, uid),
// base64url encoded. Same (uid, seed) always yields the same identifier.
std::string hide_uid(const std::string& uid, const std::string& seed);

}
