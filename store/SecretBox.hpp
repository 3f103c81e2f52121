#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netscout::store
{
    // AES-256-GCM sealing of credential passwords. The key is the SHA-256 of
    // the operator secret; sealed blobs are iv(12) || tag(16) || ciphertext.
    class SecretBox
    {
    public:
        static constexpr size_t IV_SIZE = 12;
        static constexpr size_t TAG_SIZE = 16;

        // Throws std::invalid_argument on an empty secret.
        explicit SecretBox(const std::string &secret);
        ~SecretBox();

        SecretBox(const SecretBox &) = delete;
        SecretBox &operator=(const SecretBox &) = delete;

        // Throws std::runtime_error if OpenSSL fails.
        std::vector<uint8_t> Seal(const std::string &plaintext) const;

        // nullopt on a truncated blob, wrong key or tampered data.
        std::optional<std::string> Open(const std::vector<uint8_t> &blob) const;

    private:
        std::array<uint8_t, 32> key_{};
    };
}
