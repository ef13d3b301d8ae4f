#pragma once

#include <atomic>
#include <cstdint>

namespace pulsenet::monitoring
{

struct SessionCountersSnapshot
{
    std::uint64_t packetsSent = 0;
    std::uint64_t packetsReceived = 0;
    std::uint64_t packetsInvalid = 0;
    std::uint64_t messagesSent = 0;
    std::uint64_t messagesReceived = 0;
    std::uint64_t messageDecodeFailures = 0;
    std::uint64_t messagesDropped = 0;
    std::uint64_t sendErrors = 0;
};

/// 세션(Client/Server) 단위 카운터. 쓰기는 세션 스레드, 읽기는 어디서든.
class SessionCounters
{
  public:
    SessionCounters() = default;
    SessionCounters(const SessionCounters &) = delete;
    SessionCounters &operator=(const SessionCounters &) = delete;

    void onPacketSent() noexcept { packetsSent_.fetch_add(1, std::memory_order_relaxed); }
    void onPacketReceived() noexcept { packetsReceived_.fetch_add(1, std::memory_order_relaxed); }
    void onPacketInvalid() noexcept { packetsInvalid_.fetch_add(1, std::memory_order_relaxed); }
    void onMessagesSent(std::uint64_t n) noexcept
    {
        messagesSent_.fetch_add(n, std::memory_order_relaxed);
    }
    void onMessagesReceived(std::uint64_t n) noexcept
    {
        messagesReceived_.fetch_add(n, std::memory_order_relaxed);
    }
    void onMessageDecodeFailures(std::uint64_t n) noexcept
    {
        messageDecodeFailures_.fetch_add(n, std::memory_order_relaxed);
    }
    void onMessageDropped() noexcept { messagesDropped_.fetch_add(1, std::memory_order_relaxed); }
    void onSendError() noexcept { sendErrors_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] SessionCountersSnapshot snapshot() const noexcept
    {
        SessionCountersSnapshot s;
        s.packetsSent = packetsSent_.load(std::memory_order_relaxed);
        s.packetsReceived = packetsReceived_.load(std::memory_order_relaxed);
        s.packetsInvalid = packetsInvalid_.load(std::memory_order_relaxed);
        s.messagesSent = messagesSent_.load(std::memory_order_relaxed);
        s.messagesReceived = messagesReceived_.load(std::memory_order_relaxed);
        s.messageDecodeFailures = messageDecodeFailures_.load(std::memory_order_relaxed);
        s.messagesDropped = messagesDropped_.load(std::memory_order_relaxed);
        s.sendErrors = sendErrors_.load(std::memory_order_relaxed);
        return s;
    }

  private:
    std::atomic<std::uint64_t> packetsSent_{0};
    std::atomic<std::uint64_t> packetsReceived_{0};
    std::atomic<std::uint64_t> packetsInvalid_{0};
    std::atomic<std::uint64_t> messagesSent_{0};
    std::atomic<std::uint64_t> messagesReceived_{0};
    std::atomic<std::uint64_t> messageDecodeFailures_{0};
    std::atomic<std::uint64_t> messagesDropped_{0};
    std::atomic<std::uint64_t> sendErrors_{0};
};

} // namespace pulsenet::monitoring
