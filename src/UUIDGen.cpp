#include "UUIDGen.h"

#include <stdexcept>

#include <openssl/evp.h>

// --- INTERNAL HELPERS ---

// RAII owner for an OpenSSL digest context.
class DigestContext {
public:
    DigestContext() : _ctx(EVP_MD_CTX_new()) {}
    ~DigestContext() { EVP_MD_CTX_free(_ctx); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    EVP_MD_CTX* get() const { return _ctx; }

private:
    EVP_MD_CTX* _ctx;
};

// Hash ns || name and keep the first 16 bytes of the digest.
static void name_digest(const EVP_MD* md, const char* md_name,
                        const UUID128& ns, const char* name, size_t len,
                        uint8_t out[16]) {
    DigestContext ctx;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!md || !ctx.get()
        || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), ns.data(), 16) != 1
        || (len > 0 && EVP_DigestUpdate(ctx.get(), name, len) != 1)
        || EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1
        || digest_len < 16) {
        throw std::runtime_error(std::string("UUIDKit: ") + md_name + " digest failed");
    }

    memcpy(out, digest, 16);
}

static inline void store_be48(uint8_t* dst, uint64_t v) {
    dst[5] = (uint8_t)(v & 0xFF); v >>= 8;
    dst[4] = (uint8_t)(v & 0xFF); v >>= 8;
    dst[3] = (uint8_t)(v & 0xFF); v >>= 8;
    dst[2] = (uint8_t)(v & 0xFF); v >>= 8;
    dst[1] = (uint8_t)(v & 0xFF); v >>= 8;
    dst[0] = (uint8_t)(v & 0xFF);
}

static inline uint64_t load_be64(const uint8_t* src) {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) v = (v << 8) | src[i];
    return v;
}

// --- NAME BASED ---

UUID128 UUIDGen::v3(const UUID128& ns, const char* name, size_t len) {
    uint8_t b[16];
    name_digest(EVP_md5(), "MD5", ns, name, len, b);
    return UUID128::seal(b, 3);
}

UUID128 UUIDGen::v3(const UUID128& ns, const std::string& name) {
    return v3(ns, name.data(), name.size());
}

UUID128 UUIDGen::v5(const UUID128& ns, const char* name, size_t len) {
    uint8_t b[16];
    name_digest(EVP_sha1(), "SHA-1", ns, name, len, b);
    return UUID128::seal(b, 5);
}

UUID128 UUIDGen::v5(const UUID128& ns, const std::string& name) {
    return v5(ns, name.data(), name.size());
}

// --- RANDOM BASED ---

bool UUIDGen::v4(const uint8_t* random, size_t len, UUID128& out) noexcept {
    if (!random || len < 16) return false;
    uint8_t b[16];
    memcpy(b, random, 16);
    out = UUID128::seal(b, 4);
    return true;
}

// --- TIME BASED ---

UUID128 UUIDGen::v7(uint64_t t_ms, uint16_t rand_a, uint64_t rand_b) noexcept {
    uint8_t b[16];

    // unix_ts_ms (48)
    store_be48(b, t_ms & 0x0000FFFFFFFFFFFFULL);

    // ver (4) | rand_a (12)
    b[6] = (uint8_t)((rand_a >> 8) & 0x0F);
    b[7] = (uint8_t)(rand_a & 0xFF);

    // var (2) | rand_b (62)
    b[8] = (uint8_t)((rand_b >> 56) & 0x3F);
    b[9] = (uint8_t)((rand_b >> 48) & 0xFF);
    b[10] = (uint8_t)((rand_b >> 40) & 0xFF);
    b[11] = (uint8_t)((rand_b >> 32) & 0xFF);
    b[12] = (uint8_t)((rand_b >> 24) & 0xFF);
    b[13] = (uint8_t)((rand_b >> 16) & 0xFF);
    b[14] = (uint8_t)((rand_b >> 8) & 0xFF);
    b[15] = (uint8_t)(rand_b & 0xFF);

    return UUID128::seal(b, 7);
}

bool UUIDGen::v7ns(uint64_t t_ns, const uint8_t* rand_b, size_t len, UUID128& out) noexcept {
    if (!rand_b || len < 8) return false;
    uint64_t t_ms = t_ns / 1000000ULL;
    out = v7(t_ms, subMillisecond(t_ns), load_be64(rand_b) & 0x3FFFFFFFFFFFFFFFULL);
    return true;
}
