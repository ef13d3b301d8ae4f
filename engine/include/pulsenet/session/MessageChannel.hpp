#pragma once

#include <pulsenet/SessionConfig.hpp>
#include <pulsenet/message/Message.hpp>
#include <pulsenet/monitoring/SessionCounters.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <vector>

namespace pulsenet::session
{

/// 연결 하나의 unreliable 메시지 송수신 큐.
///
/// - 송신 큐가 가득 차면 send() 는 false. 수신 큐가 가득 차면 새 메시지를 버리고 카운트한다.
/// - 순서 보장/재전송 없음. 패킷 하나가 빠지면 그 안의 메시지도 같이 빠진다.
class MessageChannel
{
  public:
    MessageChannel(const SessionConfig &config, monitoring::SessionCounters &counters) noexcept
        : config_(config), counters_(counters)
    {
    }

    [[nodiscard]] bool canSend() const noexcept;
    bool send(message::Message message);
    [[nodiscard]] std::optional<message::Message> receive();

    [[nodiscard]] bool hasPending() const noexcept { return !sendQueue_.empty(); }

    /// 송신 큐 앞에서부터 payload body 하나를 만든다. 보낼 것이 없으면 빈 vector.
    [[nodiscard]] std::vector<std::uint8_t> takeNextPayload();

    /// 수신한 payload body 를 디코딩해 수신 큐에 넣는다. 실패한 메시지만 버린다.
    void processPayload(std::span<const std::uint8_t> bits);

    void reset() noexcept;

  private:
    const SessionConfig &config_;
    monitoring::SessionCounters &counters_;
    std::vector<message::Message> sendQueue_;
    std::deque<message::Message> receiveQueue_;
};

} // namespace pulsenet::session
