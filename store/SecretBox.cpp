#include "SecretBox.hpp"

#include <memory>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace netscout::store
{
    namespace
    {
        struct CipherCtxDeleter
        {
            void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
        };
        using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
    }

    SecretBox::SecretBox(const std::string &secret)
    {
        if (secret.empty())
            throw std::invalid_argument("credential encryption secret is empty");

        SHA256(reinterpret_cast<const unsigned char *>(secret.data()), secret.size(), key_.data());
    }

    SecretBox::~SecretBox()
    {
        OPENSSL_cleanse(key_.data(), key_.size());
    }

    std::vector<uint8_t> SecretBox::Seal(const std::string &plaintext) const
    {
        std::vector<uint8_t> blob(IV_SIZE + TAG_SIZE + plaintext.size());
        uint8_t *iv = blob.data();
        uint8_t *tag = blob.data() + IV_SIZE;
        uint8_t *ciphertext = blob.data() + IV_SIZE + TAG_SIZE;

        if (RAND_bytes(iv, static_cast<int>(IV_SIZE)) != 1)
            throw std::runtime_error("RAND_bytes failed");

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx)
            throw std::runtime_error("EVP_CIPHER_CTX_new failed");

        int len = 0;
        int total = 0;
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1)
            throw std::runtime_error("AES-GCM init failed");

        if (!plaintext.empty())
        {
            if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                                  reinterpret_cast<const unsigned char *>(plaintext.data()),
                                  static_cast<int>(plaintext.size())) != 1)
                throw std::runtime_error("AES-GCM encrypt failed");
            total = len;
        }

        if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + total, &len) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1)
            throw std::runtime_error("AES-GCM finalize failed");

        return blob;
    }

    std::optional<std::string> SecretBox::Open(const std::vector<uint8_t> &blob) const
    {
        if (blob.size() < IV_SIZE + TAG_SIZE)
            return std::nullopt;

        const uint8_t *iv = blob.data();
        std::vector<uint8_t> tag(blob.begin() + IV_SIZE, blob.begin() + IV_SIZE + TAG_SIZE);
        const uint8_t *ciphertext = blob.data() + IV_SIZE + TAG_SIZE;
        size_t ciphertext_size = blob.size() - IV_SIZE - TAG_SIZE;

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx)
            return std::nullopt;

        std::string plaintext(ciphertext_size, '\0');
        int len = 0;
        int total = 0;

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1)
            return std::nullopt;

        if (ciphertext_size > 0)
        {
            if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char *>(&plaintext[0]), &len,
                                  ciphertext, static_cast<int>(ciphertext_size)) != 1)
            {
                OPENSSL_cleanse(&plaintext[0], plaintext.size());
                return std::nullopt;
            }
            total = len;
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1 ||
            EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(&plaintext[0]) + total, &len) <= 0)
        {
            if (!plaintext.empty())
                OPENSSL_cleanse(&plaintext[0], plaintext.size());
            return std::nullopt;
        }

        plaintext.resize(static_cast<size_t>(total + len));
        return plaintext;
    }
}
