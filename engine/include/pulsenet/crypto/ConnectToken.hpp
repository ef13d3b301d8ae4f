#pragma once

#include <pulsenet/crypto/Aead.hpp>
#include <pulsenet/net/Address.hpp>
#include <pulsenet/protocol/ByteCodec.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pulsenet::crypto
{

inline constexpr std::size_t kConnectTokenBytes = 1024;
inline constexpr std::size_t kConnectTokenPrivateBytes = 512;
inline constexpr std::size_t kVersionInfoBytes = 16;
inline constexpr std::size_t kUserDataBytes = 256;
inline constexpr std::size_t kMaxServersPerConnect = 8;

/// "PULSENET 1.00" + 0 padding
inline constexpr std::array<std::uint8_t, kVersionInfoBytes> kVersionInfo = {
    'P', 'U', 'L', 'S', 'E', 'N', 'E', 'T', ' ', '1', '.', '0', '0', 0, 0, 0};

using ConnectTokenBytes = std::array<std::uint8_t, kConnectTokenBytes>;
using SealedPrivateBytes = std::array<std::uint8_t, kConnectTokenPrivateBytes>;

/// 봉인되는 부분. 서버만 열 수 있다.
struct ConnectTokenPrivate
{
    std::uint64_t clientId{0};
    std::int32_t timeoutSeconds{0};
    std::vector<net::Address> serverAddresses;
    std::array<std::uint8_t, kUserDataBytes> userData{};
};

/// 1024-byte 토큰의 공개 헤더 + 봉인된 private 부분
///
/// 레이아웃 (big-endian):
///   version[16] protocolId:u64 createTs:u64 expireTs:u64 nonce[12]
///   sealedPrivate[512] timeout:i32 serverCount:u32 addresses... (0 padding)
struct ConnectToken
{
    std::array<std::uint8_t, kVersionInfoBytes> versionInfo{};
    std::uint64_t protocolId{0};
    std::uint64_t createTimestamp{0};
    std::uint64_t expireTimestamp{0};
    Nonce nonce{};
    SealedPrivateBytes sealedPrivate{};
    std::int32_t timeoutSeconds{0};
    std::vector<net::Address> serverAddresses;
};

struct ConnectTokenParams
{
    std::uint64_t protocolId{0};
    std::uint64_t clientId{0};
    std::int32_t timeoutSeconds{0};
    int expirySeconds{0};
    std::uint64_t nowUnixSeconds{0};
    Nonce nonce{};
    std::vector<net::Address> serverAddresses;
    std::array<std::uint8_t, kUserDataBytes> userData{};
};

/// 토큰을 만들어 out 에 씁니다.
/// - 서버 주소가 0개이거나 kMaxServersPerConnect 초과, invalid 주소가 섞여 있으면 false.
[[nodiscard]] bool generateConnectToken(const ConnectTokenParams &params, const Key &key,
                                        ConnectTokenBytes &out);

/// 공개 헤더를 파싱합니다. (봉인은 열지 않는다)
[[nodiscard]] bool readConnectToken(std::span<const std::uint8_t> bytes, ConnectToken &out);

/// 봉인된 private 부분을 엽니다. aad 는 version + protocolId + expireTs.
/// - 변조/다른 키/다른 protocolId/다른 만료 시각이면 false.
[[nodiscard]] bool openConnectTokenPrivate(const SealedPrivateBytes &sealed,
                                           std::span<const std::uint8_t> versionInfo,
                                           std::uint64_t protocolId,
                                           std::uint64_t expireTimestamp, const Nonce &nonce,
                                           const Key &key, ConnectTokenPrivate &out);

/// Address 직렬화: [type:u8][ip 4|16][port:u16]
void writeAddress(protocol::ByteWriter &w, const net::Address &address);
[[nodiscard]] bool readAddress(protocol::ByteReader &r, net::Address &out);

} // namespace pulsenet::crypto
