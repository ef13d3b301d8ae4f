#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pulsenet::crypto
{

/// AES-256-GCM (OpenSSL EVP)
inline constexpr std::size_t kKeyBytes = 32;
inline constexpr std::size_t kNonceBytes = 12;
inline constexpr std::size_t kTagBytes = 16;

using Key = std::array<std::uint8_t, kKeyBytes>;
using Nonce = std::array<std::uint8_t, kNonceBytes>;

/// plaintext 를 봉인해 out 에 [ciphertext][tag] 로 씁니다.
/// - out.size() 는 정확히 plaintext.size() + kTagBytes 여야 합니다.
/// - aad 는 암호화되지 않지만 tag 에 포함됩니다.
[[nodiscard]] bool aeadSeal(std::span<const std::uint8_t> plaintext,
                            std::span<const std::uint8_t> aad, const Nonce &nonce,
                            const Key &key, std::span<std::uint8_t> out) noexcept;

/// [ciphertext][tag] 를 열어 out 에 평문을 씁니다.
/// - out.size() 는 정확히 sealed.size() - kTagBytes 여야 합니다.
/// - tag 불일치(변조, 다른 키, 다른 aad)면 false. 실패 시 out 은 0 으로 지워진다.
[[nodiscard]] bool aeadOpen(std::span<const std::uint8_t> sealed,
                            std::span<const std::uint8_t> aad, const Nonce &nonce,
                            const Key &key, std::span<std::uint8_t> out) noexcept;

} // namespace pulsenet::crypto
