#include "Digest.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <stdexcept>

namespace crypto {

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<char*>(md), len);
}

std::string base64url_encode(const std::string& in) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    if (!b64 || !bmem) {
        BIO_free(b64);
        BIO_free(bmem);
        throw std::runtime_error("BIO_new failed");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    if ((!in.empty() && BIO_write(b64, in.data(), static_cast<int>(in.size())) != static_cast<int>(in.size())) || BIO_flush(b64) != 1) {
        BIO_free_all(b64);
        throw std::runtime_error("base64 encoding failed");
    }
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);
    if (!bptr) {
        BIO_free_all(b64);
        throw std::runtime_error("base64 encoding failed");
    }
    std::string out = bptr->length ? std::string(bptr->data, bptr->length) : std::string();
    BIO_free_all(b64);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string hide_uid(const std::string& uid, const std::string& seed) {
    return base64url_encode(hmac_sha256(seed, uid));
}

}
