#pragma once

#include <stdint.h>

#include <random>

#include "UUID128.h"

/**
 * Seeded sequence of random-based (version 4) UUIDs.
 *
 * Owns a 64-bit Mersenne Twister seeded once at construction. The sequence
 * is fully determined by the seed and the number of calls, so it is
 * predictable to anyone who knows the seed or observes enough outputs.
 * Feed UUIDGen::v4 from a CSPRNG when that matters.
 *
 * Thread Safety: none. Confine an instance to one thread or guard it.
 */
class UUID4Sequence {
public:
    /**
     * @brief Start a new sequence.
     * @param seed Engine seed.
     */
    explicit UUID4Sequence(uint64_t seed) : _engine(seed) {}

    /**
     * @brief Draw 16 fresh pseudo-random bytes and return them as a v4 UUID.
     */
    UUID128 next();

private:
    std::mt19937_64 _engine;
};
