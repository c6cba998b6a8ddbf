#pragma once

#include <stdint.h>
#include <stddef.h>

#include <string>

#include "UUID128.h"

/**
 * Stateless UUID generators for versions 3, 4, 5 and 7.
 *
 * Every function here is pure: no shared state, safe to call from any
 * thread. Randomness is always supplied by the caller.
 */
class UUIDGen {
public:
    /**
     * @brief Name-based UUID, MD5 hashing (version 3).
     * @param ns Namespace UUID (e.g. UUID128::nsDNS()).
     * @param name Name bytes, hashed verbatim.
     * @param len Length of name.
     * @throws std::runtime_error if the MD5 digest is unavailable.
     */
    static UUID128 v3(const UUID128& ns, const char* name, size_t len);
    static UUID128 v3(const UUID128& ns, const std::string& name);

    /**
     * @brief Name-based UUID, SHA-1 hashing (version 5).
     * @throws std::runtime_error if the SHA-1 digest is unavailable.
     */
    static UUID128 v5(const UUID128& ns, const char* name, size_t len);
    static UUID128 v5(const UUID128& ns, const std::string& name);

    /**
     * @brief Random-based UUID (version 4) from the first 16 bytes of random.
     *
     * Apart from the 6 version/variant bits, the bytes are seen literally
     * in the result. Use a CSPRNG if the value must be unpredictable.
     *
     * @param random Source bytes.
     * @param len Length of random.
     * @param out Destination, unchanged on failure.
     * @return false if fewer than 16 random bytes were supplied.
     */
    static bool v4(const uint8_t* random, size_t len, UUID128& out) noexcept;

    /**
     * @brief Time-ordered UUID (version 7).
     * @param t_ms Unix time in milliseconds, 48 low bits used.
     * @param rand_a 12 low bits used.
     * @param rand_b 62 low bits used.
     */
    static UUID128 v7(uint64_t t_ms, uint16_t rand_a, uint64_t rand_b) noexcept;

    /**
     * @brief Time-ordered UUID (version 7) from a nanosecond timestamp.
     *
     * The sub-millisecond part of t_ns is rescaled into rand_a, giving a
     * resolution of about 244ns, so the UUID order matches the timestamp
     * order. rand_b is the first 8 bytes of rand_b read big-endian, top
     * 2 bits dropped.
     *
     * @param t_ns Unsigned nanoseconds since the Unix epoch.
     * @param rand_b Source bytes.
     * @param len Length of rand_b.
     * @param out Destination, unchanged on failure.
     * @return false if fewer than 8 random bytes were supplied.
     */
    static bool v7ns(uint64_t t_ns, const uint8_t* rand_b, size_t len, UUID128& out) noexcept;

    /** @brief 12-bit rescaling of the sub-millisecond part of t_ns. */
    static uint16_t subMillisecond(uint64_t t_ns) noexcept {
        return (uint16_t)(((t_ns % 1000000ULL) * 4096ULL) / 1000000ULL);
    }
};
