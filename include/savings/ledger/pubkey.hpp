#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace savings::ledger {

    /// 32-byte opaque principal value.
    /// Caller identities and account addresses share this representation
    /// (an Ed25519 public key).
    class Pubkey {
      public:
        static constexpr dp::usize SIZE = 32;
        using Bytes = std::array<dp::u8, SIZE>;

        inline Pubkey() : bytes_{} {}
        inline explicit Pubkey(const Bytes &bytes) : bytes_(bytes) {}

        /// Build from a raw byte vector (must be exactly 32 bytes)
        inline static dp::Result<Pubkey, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            if (data.size() != SIZE) {
                return dp::Result<Pubkey, dp::Error>::err(dp::Error::invalid_argument("Pubkey must be 32 bytes"));
            }
            Bytes bytes{};
            std::copy(data.begin(), data.end(), bytes.begin());
            return dp::Result<Pubkey, dp::Error>::ok(Pubkey(bytes));
        }

        /// Parse a 64 character hex string
        inline static dp::Result<Pubkey, dp::Error> fromHex(const std::string &hex) {
            if (hex.size() != SIZE * 2) {
                return dp::Result<Pubkey, dp::Error>::err(
                    dp::Error::invalid_argument("Pubkey hex must be 64 characters"));
            }
            for (char c : hex) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) {
                    return dp::Result<Pubkey, dp::Error>::err(
                        dp::Error::invalid_argument("Pubkey hex contains non-hex characters"));
                }
            }
            return fromBytes(keylock::keylock::from_hex(hex));
        }

        inline std::string toHex() const {
            std::vector<uint8_t> data(bytes_.begin(), bytes_.end());
            return keylock::keylock::to_hex(data);
        }

        /// Shortened hex form for log lines
        inline std::string shortHex() const { return toHex().substr(0, 8); }

        inline const Bytes &bytes() const { return bytes_; }

        inline std::vector<uint8_t> toVector() const { return std::vector<uint8_t>(bytes_.begin(), bytes_.end()); }

        inline bool isZero() const {
            return std::all_of(bytes_.begin(), bytes_.end(), [](dp::u8 b) { return b == 0; });
        }

        inline bool operator==(const Pubkey &other) const { return bytes_ == other.bytes_; }
        inline bool operator!=(const Pubkey &other) const { return bytes_ != other.bytes_; }
        inline bool operator<(const Pubkey &other) const { return bytes_ < other.bytes_; }

      private:
        Bytes bytes_;
    };

    /// Who is calling
    using Identity = Pubkey;

    /// Where an account record lives
    using Address = Pubkey;

} // namespace savings::ledger

template <> struct std::hash<savings::ledger::Pubkey> {
    inline size_t operator()(const savings::ledger::Pubkey &key) const noexcept {
        size_t h = 0;
        const auto &bytes = key.bytes();
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            h = (h << 8) | bytes[i];
        }
        return h;
    }
};
