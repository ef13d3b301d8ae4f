#include <pulsenet/crypto/Aead.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace pulsenet::crypto
{

namespace
{
struct CipherCtxDeleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const noexcept { ::EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// 키/IV 길이까지 설정된 컨텍스트. 실패 시 nullptr.
CipherCtxPtr initCipher(const Key &key, const Nonce &nonce, bool encrypt) noexcept
{
    CipherCtxPtr ctx{::EVP_CIPHER_CTX_new()};
    if (!ctx)
        return nullptr;

    const int enc = encrypt ? 1 : 0;
    if (::EVP_CipherInit_ex(ctx.get(), ::EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1)
        return nullptr;
    if (::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes),
                              nullptr) != 1)
        return nullptr;
    if (::EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
        return nullptr;
    return ctx;
}
} // namespace

bool aeadSeal(std::span<const std::uint8_t> plaintext, std::span<const std::uint8_t> aad,
              const Nonce &nonce, const Key &key, std::span<std::uint8_t> out) noexcept
{
    if (out.size() != plaintext.size() + kTagBytes)
        return false;

    auto ctx = initCipher(key, nonce, true);
    if (!ctx)
        return false;

    int n = 0;
    if (!aad.empty() &&
        ::EVP_EncryptUpdate(ctx.get(), nullptr, &n, aad.data(), static_cast<int>(aad.size())) != 1)
        return false;

    std::uint8_t *p = out.data();
    if (::EVP_EncryptUpdate(ctx.get(), p, &n, plaintext.data(),
                            static_cast<int>(plaintext.size())) != 1)
        return false;
    p += n;

    // GCM 은 패딩이 없으므로 Final 은 0 bytes
    if (::EVP_EncryptFinal_ex(ctx.get(), p, &n) != 1)
        return false;
    p += n;
    if (p != out.data() + plaintext.size())
        return false;

    return ::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes),
                                 p) == 1;
}

bool aeadOpen(std::span<const std::uint8_t> sealed, std::span<const std::uint8_t> aad,
              const Nonce &nonce, const Key &key, std::span<std::uint8_t> out) noexcept
{
    if (sealed.size() < kTagBytes || out.size() != sealed.size() - kTagBytes)
        return false;

    auto fail = [&out]() {
        ::OPENSSL_cleanse(out.data(), out.size());
        return false;
    };

    auto ctx = initCipher(key, nonce, false);
    if (!ctx)
        return fail();

    int n = 0;
    if (!aad.empty() &&
        ::EVP_DecryptUpdate(ctx.get(), nullptr, &n, aad.data(), static_cast<int>(aad.size())) != 1)
        return fail();

    if (::EVP_DecryptUpdate(ctx.get(), out.data(), &n, sealed.data(),
                            static_cast<int>(out.size())) != 1)
        return fail();

    // 기대 tag 를 넘겨야 Final 에서 검증된다. ctrl 은 non-const 포인터를 받는다.
    std::uint8_t tag[kTagBytes];
    for (std::size_t i = 0; i < kTagBytes; ++i)
        tag[i] = sealed[out.size() + i];
    if (::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), tag) !=
        1)
        return fail();

    if (::EVP_DecryptFinal_ex(ctx.get(), out.data() + n, &n) != 1)
        return fail();
    return true;
}

} // namespace pulsenet::crypto
