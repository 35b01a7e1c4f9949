#include <iostream>
#include <string>
#include "crypto/Digest.h"
#include "test_util.h"

static std::string to_hex(const std::string& s) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    for (unsigned char c : s) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0xF]);
    }
    return out;
}

int main() {
    // RFC 4231 test case 2
    {
        std::string mac = crypto::hmac_sha256("Jefe", "what do ya want for nothing?");
        if (to_hex(mac) != "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843") return fail("HMAC-SHA256 vector mismatch: " + to_hex(mac));
    }

    if (crypto::base64url_encode("f") != "Zg") return fail("base64url f");
    if (crypto::base64url_encode("fo") != "Zm8") return fail("base64url fo");
    if (crypto::base64url_encode("foo") != "Zm9v") return fail("base64url foo");
    if (crypto::base64url_encode(std::string("\xfb\xff", 2)) != "-_8") return fail("base64url alphabet");
    if (!crypto::base64url_encode("").empty()) return fail("base64url of empty input");
    {
        std::string expected;
        for (int i = 0; i < 40000; ++i) expected += "YWFh";
        if (crypto::base64url_encode(std::string(120000, 'a')) != expected) return fail("base64url of a large input was truncated");
    }

    {
        std::string a = crypto::hide_uid("abc123", "s1");
        std::string b = crypto::hide_uid("abc123", "s1");
        std::string c = crypto::hide_uid("abc123", "s2");
        std::string d = crypto::hide_uid("abc124", "s1");
        if (a != b) return fail("hide_uid not deterministic");
        if (a == c) return fail("hide_uid ignores the seed");
        if (a == d) return fail("hide_uid ignores the uid");
        if (a.size() != 43) return fail("hide_uid length should be 43 got " + std::to_string(a.size()));
        if (a.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_") != std::string::npos) return fail("hide_uid not url-safe: " + a);
        if (a != crypto::base64url_encode(crypto::hmac_sha256("s1", "abc123"))) return fail("hide_uid should be HMAC keyed by the seed");
    }

    std::cout << "digest_unit ok\n";
    return 0;
}
