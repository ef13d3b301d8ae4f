#include <pulsenet/message/MessageCodec.hpp>

#include <cstdint>
#include <iostream>
#include <variant>
#include <vector>

using pulsenet::message::DecodedBatch;
using pulsenet::message::Message;
using pulsenet::message::MessageType;
using pulsenet::message::SerializeFailOnReadMessage;
using pulsenet::message::TestBlockMessage;
using pulsenet::message::TestMessage;
using pulsenet::protocol::BitReader;
using pulsenet::protocol::BitWriter;

namespace {

constexpr std::size_t kMaxBlock = 1024;

/// 테이블 값과 modulo 21 매핑을 고정합니다.
bool test_bit_width_table() {
    using pulsenet::message::messageBitWidth;

    const int expected[21] = {1,   320, 120, 4, 256, 45, 11, 13, 101, 100, 84,
                              95,  203, 2,   3, 8,   512, 5,  3,  7,   50};
    for (std::uint16_t s = 0; s < 21; ++s) {
        if (messageBitWidth(s) != expected[s]) {
            std::cerr << "[table] seq=" << s << " width=" << messageBitWidth(s) << "\n";
            return false;
        }
    }
    // 21 주기
    if (messageBitWidth(21) != 1 || messageBitWidth(37) != 512 ||
        messageBitWidth(65535) != expected[65535 % 21]) {
        std::cerr << "[table] modulo mapping broken\n";
        return false;
    }
    return true;
}

/// seq 0 -> 16 + 1 bits, seq 16 -> 16 + 512 bits
bool test_body_bit_counts() {
    using pulsenet::message::encodeMessage;
    using pulsenet::message::messageBodyBits;

    struct Case {
        std::uint16_t seq;
        std::size_t bits;
    };
    const Case cases[] = {{0, 17}, {16, 528}, {1, 336}, {13, 18}, {20, 66}};

    for (const auto &c : cases) {
        const Message m = TestMessage{c.seq};
        if (messageBodyBits(m) != c.bits) {
            std::cerr << "[bits] seq=" << c.seq << " bodyBits=" << messageBodyBits(m) << "\n";
            return false;
        }
        BitWriter w(4096);
        if (!encodeMessage(m, w, kMaxBlock) || w.bitsWritten() != c.bits) {
            std::cerr << "[bits] seq=" << c.seq << " written=" << w.bitsWritten() << "\n";
            return false;
        }
    }
    return true;
}

/// 1-bit / 512-bit 경계 폭이 정확히 같은 길이로 읽히는지
bool test_edge_widths_decode() {
    using pulsenet::message::decodeMessage;
    using pulsenet::message::encodeMessage;

    for (std::uint16_t seq : {std::uint16_t{0}, std::uint16_t{16}, std::uint16_t{21 * 7 + 16}}) {
        BitWriter w(4096);
        if (!encodeMessage(TestMessage{seq}, w, kMaxBlock)) {
            std::cerr << "[edge] encode failed seq=" << seq << "\n";
            return false;
        }

        BitReader r(w.data(), w.bitsWritten());
        Message out;
        if (!decodeMessage(MessageType::Test, r, out, kMaxBlock) || !r.atEnd()) {
            std::cerr << "[edge] decode failed seq=" << seq << " remaining=" << r.bitsRemaining()
                      << "\n";
            return false;
        }
        const auto *t = std::get_if<TestMessage>(&out);
        if (t == nullptr || t->sequence != seq) {
            std::cerr << "[edge] wrong message seq=" << seq << "\n";
            return false;
        }
    }
    return true;
}

/// 0..65535 전 구간: 폭은 테이블 값, body 는 16 + 폭, 디코딩은 정확히 끝까지 소비
bool test_every_sequence_width_and_decode() {
    using pulsenet::message::decodeMessage;
    using pulsenet::message::encodeMessage;
    using pulsenet::message::kMessageBitsTable;
    using pulsenet::message::messageBitWidth;

    for (std::uint32_t s = 0; s <= 0xFFFF; ++s) {
        const auto seq = static_cast<std::uint16_t>(s);
        const int width = messageBitWidth(seq);
        if (width != kMessageBitsTable[s % 21]) {
            std::cerr << "[all] seq=" << s << " width=" << width << "\n";
            return false;
        }

        BitWriter w(1024);
        if (!encodeMessage(TestMessage{seq}, w, kMaxBlock) ||
            w.bitsWritten() != 16 + static_cast<std::size_t>(width)) {
            std::cerr << "[all] seq=" << s << " written=" << w.bitsWritten() << "\n";
            return false;
        }

        BitReader r(w.data(), w.bitsWritten());
        Message out;
        if (!decodeMessage(MessageType::Test, r, out, kMaxBlock) || !r.atEnd()) {
            std::cerr << "[all] seq=" << s << " decode failed remaining=" << r.bitsRemaining()
                      << "\n";
            return false;
        }
        const auto *t = std::get_if<TestMessage>(&out);
        if (t == nullptr || t->sequence != seq) {
            std::cerr << "[all] seq=" << s << " sequence mismatch\n";
            return false;
        }
    }
    return true;
}

/// 헤더가 큰 개수를 주장해도 실제 비트만큼만 읽고 잘렸다고 보고한다.
bool test_batch_count_exceeds_payload() {
    using pulsenet::message::decodeMessageBatch;
    using pulsenet::message::encodeMessage;

    BitWriter w(256);
    w.writeBits(0xFFFF, 16);
    w.writeBits(static_cast<std::uint32_t>(MessageType::Test), 2);
    w.writeBits(17, 16);
    if (!encodeMessage(TestMessage{0}, w, kMaxBlock)) {
        std::cerr << "[count] encode failed\n";
        return false;
    }

    BitReader r(w.data(), w.bitsWritten());
    const DecodedBatch out = decodeMessageBatch(r, kMaxBlock);
    if (out.messages.size() != 1 || !out.truncated || out.messages.capacity() > 8) {
        std::cerr << "[count] decoded=" << out.messages.size() << " truncated=" << out.truncated
                  << " capacity=" << out.messages.capacity() << "\n";
        return false;
    }
    return true;
}

bool test_block_message_bytes() {
    using pulsenet::message::decodeMessage;
    using pulsenet::message::encodeMessage;

    TestBlockMessage in;
    in.sequence = 77;
    for (int i = 0; i < 300; ++i)
        in.block.push_back(static_cast<std::uint8_t>(i * 7));

    BitWriter w(8 * 1024 * 8);
    if (!encodeMessage(in, w, kMaxBlock)) {
        std::cerr << "[block] encode failed\n";
        return false;
    }

    BitReader r(w.data(), w.bitsWritten());
    Message out;
    if (!decodeMessage(MessageType::TestBlock, r, out, kMaxBlock)) {
        std::cerr << "[block] decode failed\n";
        return false;
    }
    const auto *b = std::get_if<TestBlockMessage>(&out);
    if (b == nullptr || b->sequence != 77 || b->block != in.block) {
        std::cerr << "[block] bytes differ\n";
        return false;
    }

    // 한도 초과 블록은 쓰지 않는다.
    TestBlockMessage big;
    big.block.resize(kMaxBlock + 1);
    BitWriter w2(64 * 1024 * 8);
    if (encodeMessage(big, w2, kMaxBlock) || w2.bitsWritten() != 0) {
        std::cerr << "[block] oversized block accepted\n";
        return false;
    }
    return true;
}

/// 실패하는 메시지는 자기만 버려지고 형제는 그대로 나온다.
bool test_batch_isolation() {
    using pulsenet::message::decodeMessageBatch;
    using pulsenet::message::encodeMessageBatch;

    std::vector<Message> batch;
    batch.emplace_back(TestMessage{1});
    batch.emplace_back(SerializeFailOnReadMessage{});
    batch.emplace_back(TestMessage{2});
    TestBlockMessage blk;
    blk.sequence = 3;
    blk.block = {9, 8, 7};
    batch.emplace_back(blk);
    batch.emplace_back(SerializeFailOnReadMessage{});
    batch.emplace_back(TestMessage{16});

    BitWriter w(8 * 1024 * 8);
    const std::size_t n = encodeMessageBatch(batch, w, 64, kMaxBlock);
    if (n != batch.size()) {
        std::cerr << "[batch] encoded=" << n << "\n";
        return false;
    }

    BitReader r(w.data(), w.bitsWritten());
    const DecodedBatch out = decodeMessageBatch(r, kMaxBlock);
    if (out.failed != 2 || out.truncated || out.messages.size() != 4) {
        std::cerr << "[batch] failed=" << out.failed << " truncated=" << out.truncated
                  << " decoded=" << out.messages.size() << "\n";
        return false;
    }

    const std::uint16_t wantSeq[] = {1, 2, 3, 16};
    for (std::size_t i = 0; i < out.messages.size(); ++i) {
        std::uint16_t seq = 0;
        if (const auto *t = std::get_if<TestMessage>(&out.messages[i]))
            seq = t->sequence;
        else if (const auto *b = std::get_if<TestBlockMessage>(&out.messages[i]))
            seq = b->sequence;
        if (seq != wantSeq[i]) {
            std::cerr << "[batch] index=" << i << " seq=" << seq << "\n";
            return false;
        }
    }
    const auto *b = std::get_if<TestBlockMessage>(&out.messages[2]);
    if (b == nullptr || b->block != blk.block) {
        std::cerr << "[batch] block sibling corrupted\n";
        return false;
    }
    return true;
}

/// 용량이 모자라면 앞에서부터 들어가는 만큼만 인코딩한다.
bool test_batch_capacity_limit() {
    using pulsenet::message::encodeMessageBatch;

    std::vector<Message> batch;
    for (std::uint16_t s = 0; s < 10; ++s)
        batch.emplace_back(TestMessage{16}); // 528 bits each

    BitWriter w(16 + 3 * (18 + 528));
    const std::size_t n = encodeMessageBatch(batch, w, 64, kMaxBlock);
    if (n != 3 || w.overflowed()) {
        std::cerr << "[capacity] encoded=" << n << " overflow=" << w.overflowed() << "\n";
        return false;
    }

    BitWriter w2(8 * 1024 * 8);
    if (encodeMessageBatch(batch, w2, 4, kMaxBlock) != 4) {
        std::cerr << "[capacity] maxMessages not honoured\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_bit_width_table();
    ok = ok && test_body_bit_counts();
    ok = ok && test_edge_widths_decode();
    ok = ok && test_every_sequence_width_and_decode();
    ok = ok && test_block_message_bytes();
    ok = ok && test_batch_isolation();
    ok = ok && test_batch_capacity_limit();
    ok = ok && test_batch_count_exceeds_payload();

    if (!ok) {
        std::cerr << "MessageCodec tests FAILED\n";
        return 1;
    }

    std::cout << "MessageCodec tests PASSED\n";
    return 0;
}
