#include <sweep/util/crc32.hpp>

#include <array>

namespace sweep {

namespace {

std::array<uint32_t, 256> build_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320u : 0u);
        }
        table[i] = crc;
    }
    return table;
}

const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = build_table();
    return table;
}

}  // namespace

Crc32& Crc32::update(const void* data, size_t len) {
    const auto& table = crc_table();
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < len; ++i) {
        state_ = table[(state_ ^ bytes[i]) & 0xFF] ^ (state_ >> 8);
    }
    return *this;
}

}  // namespace sweep
