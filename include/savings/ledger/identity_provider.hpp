#pragma once

#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>
#include <vector>

#include "key.hpp"
#include "pubkey.hpp"
#include "serializer.hpp"
#include "savings/common/error.hpp"

namespace savings::ledger {

    /// Supplies the already-authenticated identity of whoever is calling
    class IIdentityProvider {
      public:
        virtual ~IIdentityProvider() = default;
        virtual dp::Result<Identity, dp::Error> currentCaller() const = 0;
    };

    /// Always reports the same identity (tests, trusted embedding)
    class FixedIdentityProvider : public IIdentityProvider {
      public:
        inline explicit FixedIdentityProvider(const Identity &identity) : identity_(identity) {}

        inline dp::Result<Identity, dp::Error> currentCaller() const override {
            return dp::Result<Identity, dp::Error>::ok(identity_);
        }

      private:
        Identity identity_;
    };

    /// Wallet-backed caller: proves possession of the private key by signing a
    /// fresh challenge before reporting its public key.
    class KeyIdentityProvider : public IIdentityProvider {
      public:
        inline explicit KeyIdentityProvider(Key key) : key_(std::move(key)) {}

        inline dp::Result<Identity, dp::Error> currentCaller() const override {
            if (!key_.hasPrivateKey()) {
                return dp::Result<Identity, dp::Error>::err(unauthorized("Wallet key cannot sign"));
            }

            auto challenge = makeChallenge();
            auto signature = key_.sign(challenge);
            if (!signature.is_ok()) {
                return dp::Result<Identity, dp::Error>::err(unauthorized(signature.error().message));
            }

            auto verified = key_.verify(challenge, signature.value());
            if (!verified.is_ok() || !verified.value()) {
                return dp::Result<Identity, dp::Error>::err(unauthorized("Wallet signature did not verify"));
            }

            return dp::Result<Identity, dp::Error>::ok(key_.pubkey());
        }

        inline const Key &key() const { return key_; }

      private:
        inline std::vector<uint8_t> makeChallenge() const {
            std::vector<uint8_t> challenge;
            auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            BinarySerializer::writeUint64(challenge, static_cast<uint64_t>(now));
            BinarySerializer::writeUint64(challenge, counter_.fetch_add(1, std::memory_order_relaxed));
            BinarySerializer::writeFixed(challenge, key_.pubkey().bytes());
            return challenge;
        }

        Key key_;
        mutable std::atomic<dp::u64> counter_{0};
    };

} // namespace savings::ledger
