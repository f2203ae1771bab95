#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <vector>

#include "pubkey.hpp"

namespace savings::ledger {

    /// Ed25519 keypair used for wallet identities and fresh account addresses
    /// Header-only implementation using keylock for crypto operations
    class Key {
      public:
        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty() || keypair.public_key.size() != Pubkey::SIZE) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load a 64-byte wallet secret (32-byte seed followed by the 32-byte public key)
        inline static dp::Result<Key, dp::Error> fromSecretBytes(const std::vector<uint8_t> &secret) {
            if (secret.size() != 64) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Wallet secret must be 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.private_key = secret;
            keypair.public_key = std::vector<uint8_t>(secret.begin() + 32, secret.end());
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only (for verification)
        inline static dp::Result<Key, dp::Error> fromPublicKey(const Pubkey &public_key) {
            keylock::KeyPair keypair;
            keypair.public_key = public_key.toVector();
            // private_key left empty - can only verify, not sign
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Sign data
        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// Verify signature against this key's public half
        inline dp::Result<bool, dp::Error> verify(const std::vector<uint8_t> &data,
                                                  const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty()) {
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("No public key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, keypair_.public_key);

            if (!result.success) {
                return dp::Result<bool, dp::Error>::err(
                    dp::Error::invalid_argument(dp::String(result.error_message.c_str())));
            }

            return dp::Result<bool, dp::Error>::ok(result.success);
        }

        /// Public key as a ledger identity / address
        inline Pubkey pubkey() const {
            Pubkey::Bytes bytes{};
            std::copy_n(keypair_.public_key.begin(), std::min(keypair_.public_key.size(), Pubkey::SIZE),
                        bytes.begin());
            return Pubkey(bytes);
        }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// 64-byte wallet secret, empty for verify-only keys
        inline const std::vector<uint8_t> &secretBytes() const { return keypair_.private_key; }

        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        keylock::KeyPair keypair_;
    };

} // namespace savings::ledger
