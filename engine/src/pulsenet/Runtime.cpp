#include <pulsenet/Runtime.hpp>

#include <pulsenet/core/Logger.hpp>
#include <pulsenet/core/LoggingConfig.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>

namespace pulsenet
{

namespace
{
std::atomic<const Runtime *> g_active{nullptr};

std::string lastOpenSslError()
{
    const unsigned long code = ::ERR_get_error();
    if (code == 0)
        return "unknown";
    char buf[256];
    ::ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}
} // namespace

Runtime::Runtime(const core::LogSettings &logSettings)
{
    const Runtime *expected = nullptr;
    if (!g_active.compare_exchange_strong(expected, this))
    {
        throw std::logic_error("Runtime: already initialized");
    }

    try
    {
        core::applyLoggingConfig(logSettings);

        if (::OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr) != 1)
        {
            throw std::runtime_error("Runtime: OPENSSL_init_crypto failed: " +
                                     lastOpenSslError());
        }
        if (::RAND_status() != 1)
        {
            throw std::runtime_error("Runtime: RNG not seeded");
        }
    }
    catch (...)
    {
        g_active.store(nullptr);
        throw;
    }

    SLOG_INFO("Runtime", "Init", "openssl={}", ::OpenSSL_version(OPENSSL_VERSION));
}

Runtime::~Runtime()
{
    SLOG_INFO("Runtime", "Shutdown");
    core::shutdownLogger();
    g_active.store(nullptr);
}

bool Runtime::isInitialized() const noexcept
{
    return g_active.load() == this;
}

void Runtime::requireInitialized(const char *who) const
{
    if (!isInitialized())
    {
        throw std::logic_error(std::string(who) + ": Runtime is not initialized");
    }
}

void Runtime::randomBytes(std::span<std::uint8_t> out) const
{
    if (out.empty())
        return;
    if (::RAND_bytes(out.data(), static_cast<int>(out.size())) != 1)
    {
        throw std::runtime_error("Runtime: RAND_bytes failed: " + lastOpenSslError());
    }
}

std::uint64_t Runtime::randomU64() const
{
    std::uint8_t buf[8];
    randomBytes(buf);
    std::uint64_t v = 0;
    std::memcpy(&v, buf, sizeof(v));
    return v;
}

std::uint64_t Runtime::unixTimeSeconds() const noexcept
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace pulsenet
