#include "UUID4Sequence.h"

UUID128 UUID4Sequence::next() {
    // Raw engine output rather than a distribution: the engine sequence is
    // fixed by the standard, distributions are implementation-defined.
    uint64_t hi = _engine();
    uint64_t lo = _engine();

    uint8_t b[16];
    for (int i = 7; i >= 0; i--) { b[i] = (uint8_t)(hi & 0xFF); hi >>= 8; }
    for (int i = 15; i >= 8; i--) { b[i] = (uint8_t)(lo & 0xFF); lo >>= 8; }

    return UUID128::seal(b, 4);
}
