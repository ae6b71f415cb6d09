#include <gtest/gtest.h>

#include "error.hpp"
#include "protocol.hpp"

TEST(ProtocolTest, FrameHeaderIsBigEndian) {
    std::vector<uint8_t> out;
    write_frame(out, MessageType::QUOTE, std::string(258, 'x'));
    ASSERT_EQ(out.size(), MESSAGE_HEADER_SIZE + 258);
    EXPECT_EQ(out[0], static_cast<uint8_t>(MessageType::QUOTE));
    EXPECT_EQ(out[1], 0x01);
    EXPECT_EQ(out[2], 0x02);
}

TEST(ProtocolTest, ReadsEveryCompleteFrame) {
    std::vector<uint8_t> wire;
    write_frame(wire, MessageType::QUOTE, "symbol=0700;last=312.4");
    write_frame(wire, MessageType::HEARTBEAT, "");
    write_frame(wire, MessageType::SUBSCRIBE, make_subscription_payload("ws-stock-quote", {"0700"}));

    std::vector<Frame> frames;
    EXPECT_EQ(read_frames(wire.data(), wire.size(), frames), wire.size());
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].type, MessageType::QUOTE);
    EXPECT_EQ(frames[0].payload, "symbol=0700;last=312.4");
    EXPECT_EQ(frames[1].type, MessageType::HEARTBEAT);
    EXPECT_TRUE(frames[1].payload.empty());
    EXPECT_EQ(frames[2].type, MessageType::SUBSCRIBE);
}

TEST(ProtocolTest, PartialFrameWaitsForMoreBytes) {
    std::vector<uint8_t> wire;
    write_frame(wire, MessageType::QUOTE, "symbol=0700");
    const size_t first_size = wire.size();
    write_frame(wire, MessageType::QUOTE, "symbol=0005");

    std::vector<Frame> frames;
    EXPECT_EQ(read_frames(wire.data(), wire.size() - 3, frames), first_size);
    ASSERT_EQ(frames.size(), 1u);

    frames.clear();
    EXPECT_EQ(read_frames(wire.data(), 2, frames), 0u);
    EXPECT_TRUE(frames.empty());
}

TEST(ProtocolTest, UnknownTypeIsRejected) {
    const std::vector<uint8_t> wire{0x09, 0x00, 0x00};
    std::vector<Frame> frames;
    EXPECT_THROW(read_frames(wire.data(), wire.size(), frames), ValidationError);
}

TEST(ProtocolTest, OversizePayloadIsRejected) {
    std::vector<uint8_t> out;
    EXPECT_THROW(write_frame(out, MessageType::QUOTE, std::string(MAX_PAYLOAD_SIZE + 1, 'x')), ValidationError);
    EXPECT_TRUE(out.empty());
}

TEST(ProtocolTest, ParsesFieldsLeniently) {
    const FieldMap fields = parse_fields(" symbol=0700;last=312.4;;=orphan;flag;bid=");
    EXPECT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields.at("symbol"), "0700");
    EXPECT_EQ(fields.at("last"), "312.4");
    EXPECT_EQ(fields.at("bid"), "");
    EXPECT_EQ(format_fields({{"b", "2"}, {"a", "1"}}), "a=1;b=2");
}

TEST(ProtocolTest, SubscriptionPayloadCarriesCapabilityAndSymbols) {
    const std::string payload = make_subscription_payload("ws-option-quote", {"0700", "AAPL"});
    EXPECT_EQ(payload, "ws-option-quote\n0700,AAPL");

    const auto [capability, symbols] = parse_subscription_payload(payload);
    EXPECT_EQ(capability, "ws-option-quote");
    EXPECT_EQ(symbols, (SymbolList{"0700", "AAPL"}));

    const auto bare = parse_subscription_payload("ws-stock-quote");
    EXPECT_EQ(bare.first, "ws-stock-quote");
    EXPECT_TRUE(bare.second.empty());
}

TEST(ProtocolTest, ExtractsSymbolsFromEitherKey) {
    EXPECT_EQ(extract_symbols({{"symbol", "0700, AAPL,,"}}), (SymbolList{"0700", "AAPL"}));
    EXPECT_EQ(extract_symbols({{"s", "TSLA"}}), (SymbolList{"TSLA"}));
    EXPECT_EQ(extract_symbols({{"symbol", "0700"}, {"s", "TSLA"}}), (SymbolList{"0700"}));
    EXPECT_TRUE(extract_symbols({{"last", "1"}}).empty());
}
