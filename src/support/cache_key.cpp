#include <modgraph/support/cache_key.h>
#include <modgraph/support/key_writer.h>

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace modgraph::support {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

template <typename T>
std::string key_of(const T& value) {
    KeyWriter writer;
    value.write_key(writer);
    return sha256_hex(writer.view());
}

} // namespace

std::string sha256_hex(std::string_view bytes) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result += hex[(digest[i] >> 4) & 0xF];
        result += hex[digest[i] & 0xF];
    }
    return result;
}

std::string cache_key(const reference::ReferenceType& type) {
    return key_of(type);
}

std::string cache_key(const reference::ImportContext& context) {
    return key_of(context);
}

std::string cache_key(const module::InnerAssets& assets) {
    return key_of(assets);
}

std::string cache_key(const resolve::ResolveOptions& options) {
    return key_of(options);
}

} // namespace modgraph::support
