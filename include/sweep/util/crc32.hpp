#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sweep {

/**
 * Running CRC-32 (IEEE 802.3 polynomial).
 *
 * Used to checksum metadata journal records. The lookup table is built
 * once on first use and is safe to share between threads.
 */
class Crc32 {
public:
    Crc32() = default;

    Crc32& update(const void* data, size_t len);
    Crc32& update(const std::string& data) { return update(data.data(), data.size()); }

    uint32_t value() const { return state_ ^ 0xFFFFFFFFu; }

    static uint32_t of(const void* data, size_t len) {
        return Crc32().update(data, len).value();
    }
    static uint32_t of(const std::string& data) { return of(data.data(), data.size()); }

private:
    uint32_t state_ = 0xFFFFFFFFu;
};

}  // namespace sweep
