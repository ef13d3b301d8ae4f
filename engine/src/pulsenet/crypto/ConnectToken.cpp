#include <pulsenet/crypto/ConnectToken.hpp>

#include <pulsenet/core/Logger.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <cstring>

namespace pulsenet::crypto
{

namespace
{
std::array<std::uint8_t, kVersionInfoBytes + 16> buildAad(std::span<const std::uint8_t> version,
                                                          std::uint64_t protocolId,
                                                          std::uint64_t expireTimestamp) noexcept
{
    std::array<std::uint8_t, kVersionInfoBytes + 16> aad{};
    std::copy_n(version.begin(), std::min(version.size(), kVersionInfoBytes), aad.begin());
    protocol::storeU64Be(protocolId, aad.data() + kVersionInfoBytes);
    protocol::storeU64Be(expireTimestamp, aad.data() + kVersionInfoBytes + 8);
    return aad;
}

void writeAddressList(protocol::ByteWriter &w, const std::vector<net::Address> &list)
{
    w.writeU32Be(static_cast<std::uint32_t>(list.size()));
    for (const auto &a : list)
    {
        writeAddress(w, a);
    }
}

bool readAddressList(protocol::ByteReader &r, std::vector<net::Address> &out)
{
    std::uint32_t count = 0;
    if (!r.readU32Be(count) || count == 0 || count > kMaxServersPerConnect)
        return false;

    out.clear();
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i)
    {
        net::Address a;
        if (!readAddress(r, a))
            return false;
        out.push_back(a);
    }
    return true;
}
} // namespace

void writeAddress(protocol::ByteWriter &w, const net::Address &address)
{
    w.writeU8(static_cast<std::uint8_t>(address.type()));
    const std::size_t n = address.type() == net::AddressType::IPv4 ? 4 : 16;
    w.writeBytes(std::span<const std::uint8_t>(address.bytes().data(), n));
    w.writeU16Be(address.port());
}

bool readAddress(protocol::ByteReader &r, net::Address &out)
{
    std::uint8_t type = 0;
    if (!r.readU8(type))
        return false;

    std::size_t n = 0;
    if (type == static_cast<std::uint8_t>(net::AddressType::IPv4))
        n = 4;
    else if (type == static_cast<std::uint8_t>(net::AddressType::IPv6))
        n = 16;
    else
        return false;

    std::array<std::uint8_t, 16> ip{};
    std::uint16_t port = 0;
    if (!r.readBytes(std::span<std::uint8_t>(ip.data(), n)) || !r.readU16Be(port))
        return false;

    out = net::Address::fromBytes(static_cast<net::AddressType>(type),
                                  std::span<const std::uint8_t>(ip.data(), n), port);
    return out.isValid();
}

bool generateConnectToken(const ConnectTokenParams &params, const Key &key,
                          ConnectTokenBytes &out)
{
    if (params.serverAddresses.empty() ||
        params.serverAddresses.size() > kMaxServersPerConnect)
    {
        SLOG_ERROR("ConnectToken", "BadServerList", "count={}", params.serverAddresses.size());
        return false;
    }
    for (const auto &a : params.serverAddresses)
    {
        if (!a.isValid())
        {
            SLOG_ERROR("ConnectToken", "InvalidServerAddress");
            return false;
        }
    }

    const std::uint64_t expireTs =
        params.nowUnixSeconds + static_cast<std::uint64_t>(std::max(params.expirySeconds, 0));

    // private 부분 평문 (tag 자리를 뺀 크기까지 0 padding)
    protocol::ByteWriter priv(kConnectTokenPrivateBytes);
    priv.writeU64Be(params.clientId);
    priv.writeU32Be(static_cast<std::uint32_t>(params.timeoutSeconds));
    writeAddressList(priv, params.serverAddresses);
    priv.writeBytes(params.userData);
    if (priv.size() > kConnectTokenPrivateBytes - kTagBytes)
        return false;
    priv.padTo(kConnectTokenPrivateBytes - kTagBytes);

    const auto aad = buildAad(kVersionInfo, params.protocolId, expireTs);
    SealedPrivateBytes sealed{};
    const bool ok = aeadSeal(priv.buffer(), aad, params.nonce, key, sealed);
    auto plain = priv.release();
    ::OPENSSL_cleanse(plain.data(), plain.size());
    if (!ok)
    {
        SLOG_ERROR("ConnectToken", "SealFailed");
        return false;
    }

    protocol::ByteWriter w(kConnectTokenBytes);
    w.writeBytes(kVersionInfo);
    w.writeU64Be(params.protocolId);
    w.writeU64Be(params.nowUnixSeconds);
    w.writeU64Be(expireTs);
    w.writeBytes(params.nonce);
    w.writeBytes(sealed);
    w.writeU32Be(static_cast<std::uint32_t>(params.timeoutSeconds));
    writeAddressList(w, params.serverAddresses);
    if (w.size() > kConnectTokenBytes)
        return false;
    w.padTo(kConnectTokenBytes);

    std::memcpy(out.data(), w.buffer().data(), kConnectTokenBytes);
    return true;
}

bool readConnectToken(std::span<const std::uint8_t> bytes, ConnectToken &out)
{
    if (bytes.size() != kConnectTokenBytes)
        return false;

    protocol::ByteReader r(bytes);
    std::uint32_t timeout = 0;
    if (!r.readBytes(out.versionInfo) || !r.readU64Be(out.protocolId) ||
        !r.readU64Be(out.createTimestamp) || !r.readU64Be(out.expireTimestamp) ||
        !r.readBytes(out.nonce) || !r.readBytes(out.sealedPrivate) || !r.readU32Be(timeout) ||
        !readAddressList(r, out.serverAddresses))
        return false;

    out.timeoutSeconds = static_cast<std::int32_t>(timeout);
    return out.versionInfo == kVersionInfo;
}

bool openConnectTokenPrivate(const SealedPrivateBytes &sealed,
                             std::span<const std::uint8_t> versionInfo, std::uint64_t protocolId,
                             std::uint64_t expireTimestamp, const Nonce &nonce, const Key &key,
                             ConnectTokenPrivate &out)
{
    const auto aad = buildAad(versionInfo, protocolId, expireTimestamp);
    std::array<std::uint8_t, kConnectTokenPrivateBytes - kTagBytes> plain{};
    if (!aeadOpen(sealed, aad, nonce, key, plain))
        return false;

    protocol::ByteReader r(plain);
    std::uint32_t timeout = 0;
    const bool ok = r.readU64Be(out.clientId) && r.readU32Be(timeout) &&
                    readAddressList(r, out.serverAddresses) && r.readBytes(out.userData);
    ::OPENSSL_cleanse(plain.data(), plain.size());
    if (!ok)
        return false;

    out.timeoutSeconds = static_cast<std::int32_t>(timeout);
    return true;
}

} // namespace pulsenet::crypto
