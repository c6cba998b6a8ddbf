#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <ostream>
#include <string>

class UUIDGen;
class UUID4Sequence;

/**
 * 128-bit RFC 9562 UUID value.
 *
 * Bytes are stored in standard (big-endian field) order:
 * time_low(4) time_mid(2) time_hi_and_version(2)
 * clock_seq_hi_and_reserved(1) clock_seq_low(1) node(6).
 *
 * Values are immutable once built. The only ways to obtain one are the
 * generators (UUIDGen, UUID4Sequence, UUID7Clock), the decoders below and
 * the fixed constants. A default constructed value is the nil UUID.
 */
class UUID128 {
public:
    UUID128() noexcept {
        memset(_b, 0, sizeof(_b));
    }

    /**
     * @brief Access raw 16 bytes in standard binary order.
     * @return Pointer to internal byte array.
     */
    const uint8_t* data() const noexcept { return _b; }

    /** @brief Version nibble (high 4 bits of byte 6). */
    uint8_t version() const noexcept { return (_b[6] >> 4) & 0x0F; }

    /** @brief Variant bits (high 2 bits of byte 8). 2 means RFC 9562. */
    uint8_t variant() const noexcept { return (_b[8] >> 6) & 0x03; }

    // --- Constants ---

    static const UUID128& nil();
    static const UUID128& max();
    static const UUID128& nsDNS();
    static const UUID128& nsURL();
    static const UUID128& nsOID();
    static const UUID128& nsX500();

    // --- Standard binary format ---

    /**
     * @brief Write the 16 bytes in standard (RFC 4122/9562) order.
     * @param out Destination 16-byte array.
     */
    void toBytes(uint8_t out[16]) const noexcept {
        memcpy(out, _b, 16);
    }

    /** @brief The 16 bytes as a binary string. */
    std::string toBytes() const;

    /**
     * @brief Decode 16 bytes starting at pos.
     *
     * Any 16-byte sequence is accepted, conformant version/variant bits are
     * not required.
     *
     * @param buf Source buffer.
     * @param len Length of source buffer.
     * @param out Destination, unchanged on failure.
     * @param pos Offset of the first byte.
     * @return false if fewer than 16 bytes are available from pos.
     */
    static bool fromBytes(const uint8_t* buf, size_t len, UUID128& out, size_t pos = 0) noexcept;
    static bool fromBytes(const std::string& s, UUID128& out, size_t pos = 0) noexcept;

    /**
     * @brief Build a value from exactly 16 raw bytes.
     * @param bytes Source 16-byte array.
     */
    static UUID128 fromRawBytes(const uint8_t bytes[16]) noexcept {
        UUID128 u;
        memcpy(u._b, bytes, 16);
        return u;
    }

    // --- Mixed-endian binary format ---
    // time_low, time_mid and time_hi_and_version are little-endian, the
    // rest is unchanged (UEFI / Microsoft GUID layout).

    void toMixedEndianBytes(uint8_t out[16]) const noexcept;
    std::string toMixedEndianBytes() const;

    static bool fromMixedEndianBytes(const uint8_t* buf, size_t len, UUID128& out, size_t pos = 0) noexcept;
    static bool fromMixedEndianBytes(const std::string& s, UUID128& out, size_t pos = 0) noexcept;

    // --- US-ASCII format ---

    /**
     * @brief Format UUID as "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX".
     * @param out Destination buffer (must be >= 37 bytes).
     * @param buflen Length of destination buffer.
     * @param uppercase If true, uses UPPERCASE hex.
     * @return true if successful, false if buffer is too small.
     */
    bool toString(char* out, size_t buflen, bool uppercase = false) const noexcept;

    std::string toString(bool uppercase = false) const;

    /**
     * @brief Parse the 36-character hyphenated form starting at pos.
     *
     * Hex digits may be lower, upper or mixed case. Hyphens are required at
     * offsets 8, 13, 18 and 23. Characters after pos + 36 are ignored.
     *
     * @param str Source characters.
     * @param len Number of characters in str.
     * @param out Destination, unchanged on failure.
     * @param pos Offset of the first character.
     * @return true if a UUID was parsed, false otherwise.
     */
    static bool parseFromString(const char* str, size_t len, UUID128& out, size_t pos = 0) noexcept;
    static bool parseFromString(const char* str, UUID128& out, size_t pos = 0) noexcept;
    static bool parseFromString(const std::string& s, UUID128& out, size_t pos = 0) noexcept;

    // --- Comparison ---

    /** @brief Byte-wise identity. */
    static bool equal(const UUID128& a, const UUID128& b) noexcept {
        return memcmp(a._b, b._b, 16) == 0;
    }

    /**
     * @brief Unsigned lexicographic byte order.
     * @return -1, 0 or 1.
     */
    static int compare(const UUID128& a, const UUID128& b) noexcept {
        int c = memcmp(a._b, b._b, 16);
        return (c > 0) - (c < 0);
    }

    bool operator==(const UUID128& other) const { return equal(*this, other); }
    bool operator!=(const UUID128& other) const { return !equal(*this, other); }
    bool operator< (const UUID128& other) const { return compare(*this, other) < 0; }
    bool operator<=(const UUID128& other) const { return compare(*this, other) <= 0; }
    bool operator> (const UUID128& other) const { return compare(*this, other) > 0; }
    bool operator>=(const UUID128& other) const { return compare(*this, other) >= 0; }

    /** @brief Writes the lowercase canonical form. */
    friend std::ostream& operator<<(std::ostream& os, const UUID128& uuid) {
        char buf[37];
        uuid.toString(buf, sizeof(buf));
        os << buf;
        return os;
    }

private:
    friend class UUIDGen;
    friend class UUID4Sequence;

    explicit UUID128(const uint8_t bytes[16]) noexcept {
        memcpy(_b, bytes, 16);
    }

    // Final step of every generator: stamp version nibble and RFC variant.
    static UUID128 seal(uint8_t bytes[16], uint8_t version) noexcept {
        bytes[6] = (bytes[6] & 0x0F) | (uint8_t)(version << 4);
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return UUID128(bytes);
    }

    uint8_t _b[16];
};
