#include "UUID128.h"

// --- INTERNAL HELPERS ---

static const uint8_t NS_DNS_BYTES[16] = {
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t NS_URL_BYTES[16] = {
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t NS_OID_BYTES[16] = {
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t NS_X500_BYTES[16] = {
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};
static const uint8_t MAX_BYTES[16] = {
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff
};

// Mixed-endian <-> standard is an involution: reverse the three leading
// fields, keep clock_seq and node as they are.
static void swap_leading_fields(const uint8_t* in, uint8_t out[16]) {
    out[0] = in[3]; out[1] = in[2]; out[2] = in[1]; out[3] = in[0];
    out[4] = in[5]; out[5] = in[4];
    out[6] = in[7]; out[7] = in[6];
    memcpy(out + 8, in + 8, 8);
}

static inline int hexval(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

static inline bool has_room(size_t len, size_t pos, size_t need) {
    return pos <= len && len - pos >= need;
}

// --- CONSTANTS ---

const UUID128& UUID128::nil() {
    static const UUID128 u;
    return u;
}

const UUID128& UUID128::max() {
    static const UUID128 u(MAX_BYTES);
    return u;
}

const UUID128& UUID128::nsDNS() {
    static const UUID128 u(NS_DNS_BYTES);
    return u;
}

const UUID128& UUID128::nsURL() {
    static const UUID128 u(NS_URL_BYTES);
    return u;
}

const UUID128& UUID128::nsOID() {
    static const UUID128 u(NS_OID_BYTES);
    return u;
}

const UUID128& UUID128::nsX500() {
    static const UUID128 u(NS_X500_BYTES);
    return u;
}

// --- BINARY FORMATS ---

std::string UUID128::toBytes() const {
    return std::string((const char*)_b, 16);
}

bool UUID128::fromBytes(const uint8_t* buf, size_t len, UUID128& out, size_t pos) noexcept {
    if (!buf || !has_room(len, pos, 16)) return false;
    out = UUID128(buf + pos);
    return true;
}

bool UUID128::fromBytes(const std::string& s, UUID128& out, size_t pos) noexcept {
    return fromBytes((const uint8_t*)s.data(), s.size(), out, pos);
}

void UUID128::toMixedEndianBytes(uint8_t out[16]) const noexcept {
    swap_leading_fields(_b, out);
}

std::string UUID128::toMixedEndianBytes() const {
    uint8_t tmp[16];
    swap_leading_fields(_b, tmp);
    return std::string((const char*)tmp, 16);
}

bool UUID128::fromMixedEndianBytes(const uint8_t* buf, size_t len, UUID128& out, size_t pos) noexcept {
    if (!buf || !has_room(len, pos, 16)) return false;
    uint8_t tmp[16];
    swap_leading_fields(buf + pos, tmp);
    out = UUID128(tmp);
    return true;
}

bool UUID128::fromMixedEndianBytes(const std::string& s, UUID128& out, size_t pos) noexcept {
    return fromMixedEndianBytes((const uint8_t*)s.data(), s.size(), out, pos);
}

// --- ASCII FORMAT ---

bool UUID128::toString(char* out, size_t buflen, bool uppercase) const noexcept {
    if (!out || buflen < 37) return false;

    static const char hexLower[] = "0123456789abcdef";
    static const char hexUpper[] = "0123456789ABCDEF";
    const char* hex = uppercase ? hexUpper : hexLower;
    const uint8_t* p = _b;
    char* s = out;

    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            *s++ = '-';
        }
        *s++ = hex[(*p >> 4) & 0x0F];
        *s++ = hex[*p++ & 0x0F];
    }

    *s = '\0';
    return true;
}

std::string UUID128::toString(bool uppercase) const {
    char buf[37];
    toString(buf, sizeof(buf), uppercase);
    return std::string(buf, 36);
}

bool UUID128::parseFromString(const char* str, size_t len, UUID128& out, size_t pos) noexcept {
    if (!str || !has_room(len, pos, 36)) return false;

    const char* p = str + pos;
    uint8_t tmp[16];

    // UUID structure: 4-2-2-2-6 bytes, a hyphen before bytes 4, 6, 8 and 10.
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            if (*p != '-') return false;
            p++;
        }

        int hi = hexval(*p++);
        int lo = hexval(*p++);

        if (hi < 0 || lo < 0) return false;

        tmp[i] = (uint8_t)((hi << 4) | lo);
    }

    out = UUID128(tmp);
    return true;
}

bool UUID128::parseFromString(const char* str, UUID128& out, size_t pos) noexcept {
    if (!str) return false;
    return parseFromString(str, strlen(str), out, pos);
}

bool UUID128::parseFromString(const std::string& s, UUID128& out, size_t pos) noexcept {
    return parseFromString(s.data(), s.size(), out, pos);
}
