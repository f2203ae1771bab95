#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace savings::ledger {

    // Fixed-width little-endian binary codec for account records
    class BinarySerializer {
      public:
        // Write operations
        static void writeUint64(std::vector<uint8_t> &buffer, uint64_t value) {
            for (int shift = 0; shift < 64; shift += 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        template <size_t N> static void writeFixed(std::vector<uint8_t> &buffer, const std::array<uint8_t, N> &data) {
            buffer.insert(buffer.end(), data.begin(), data.end());
        }

        // Read operations
        static uint64_t readUint64(const std::vector<uint8_t> &buffer, size_t &offset) {
            if (offset + 8 > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading uint64");
            }
            uint64_t value = 0;
            for (int i = 7; i >= 0; --i) {
                value = (value << 8) | buffer[offset + i];
            }
            offset += 8;
            return value;
        }

        template <size_t N> static std::array<uint8_t, N> readFixed(const std::vector<uint8_t> &buffer, size_t &offset) {
            if (offset + N > buffer.size()) {
                throw std::runtime_error("Buffer underflow reading fixed bytes");
            }
            std::array<uint8_t, N> result{};
            std::copy(buffer.begin() + offset, buffer.begin() + offset + N, result.begin());
            offset += N;
            return result;
        }
    };

} // namespace savings::ledger
