// ============================================================
// test_packet.cpp -- Wire codec tests
// ============================================================

#include <gtest/gtest.h>
#include "../common/packet.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<u8> bytes(std::initializer_list<int> list) {
    std::vector<u8> out;
    for (int b : list) out.push_back((u8)b);
    return out;
}

std::vector<u8> with_text(std::vector<u8> head, const std::string& text) {
    head.insert(head.end(), text.begin(), text.end());
    return head;
}

ParseError decode_failure(const std::vector<u8>& wire) {
    try {
        proto::decode(wire);
    } catch (const PacketError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode() accepted a malformed datagram";
    return ParseError::NOT_ENOUGH_DATA;
}

} // namespace

TEST(PacketCodec, ReadRequestLayout) {
    std::vector<u8> wire = proto::encode(ReadRequest{"boot.img", "octet"});
    std::vector<u8> expected = with_text(bytes({0x00, 0x01}), std::string("boot.img\0octet", 14));
    expected.push_back(0);
    EXPECT_EQ(wire, expected);

    Packet back = proto::decode(wire);
    ASSERT_TRUE(std::holds_alternative<ReadRequest>(back));
    EXPECT_EQ(std::get<ReadRequest>(back), (ReadRequest{"boot.img", "octet"}));
}

TEST(PacketCodec, EveryKindSurvivesEncodeDecode) {
    std::vector<Packet> packets = {
        ReadRequest{"a/b.txt", "netascii"},
        WriteRequest{"upload.bin", "OCTET"},
        DataPacket{7, std::vector<u8>(BLOCK_SIZE, 0xAB)},
        DataPacket{8, {}},
        AckPacket{65535},
        ErrorPacket{ErrorCode::DISK_FULL, "no room"},
        ErrorPacket{ErrorCode::NOT_DEFINED, ""},
    };
    for (const auto& p : packets) {
        EXPECT_EQ(proto::decode(proto::encode(p)), p) << proto::describe(p);
    }
}

TEST(PacketCodec, DataAndAckAreBigEndian) {
    EXPECT_EQ(proto::encode(AckPacket{0x1234}), bytes({0x00, 0x04, 0x12, 0x34}));
    EXPECT_EQ(proto::encode(DataPacket{0x0102, {0xFF}}), bytes({0x00, 0x03, 0x01, 0x02, 0xFF}));
    EXPECT_EQ(proto::encode(ErrorPacket{ErrorCode::FILE_NOT_FOUND, "x"}),
              bytes({0x00, 0x05, 0x00, 0x01, 'x', 0x00}));
}

TEST(PacketCodec, BlockNumberWraps) {
    EXPECT_EQ(proto::next_block(1), 2);
    EXPECT_EQ(proto::next_block(65534), 65535);
    EXPECT_EQ(proto::next_block(65535), 0);
}

TEST(PacketCodec, TerminalBlockIsShort) {
    EXPECT_FALSE(proto::is_terminal(DataPacket{1, std::vector<u8>(BLOCK_SIZE)}));
    EXPECT_TRUE(proto::is_terminal(DataPacket{1, std::vector<u8>(BLOCK_SIZE - 1)}));
    EXPECT_TRUE(proto::is_terminal(DataPacket{1, {}}));
}

TEST(PacketCodec, UnknownOpcode) {
    EXPECT_EQ(decode_failure(bytes({0x00, 0x06})), ParseError::INVALID_OPCODE);
    EXPECT_EQ(decode_failure(bytes({0x00, 0x00, 0x00, 0x01})), ParseError::INVALID_OPCODE);
    EXPECT_EQ(decode_failure(bytes({0xFF, 0x03, 0x00, 0x01})), ParseError::INVALID_OPCODE);
}

TEST(PacketCodec, TruncatedDatagrams) {
    EXPECT_EQ(decode_failure({}), ParseError::NOT_ENOUGH_DATA);
    EXPECT_EQ(decode_failure(bytes({0x00})), ParseError::NOT_ENOUGH_DATA);
    EXPECT_EQ(decode_failure(bytes({0x00, 0x04, 0x00})), ParseError::NOT_ENOUGH_DATA);
    EXPECT_EQ(decode_failure(bytes({0x00, 0x03, 0x01})), ParseError::NOT_ENOUGH_DATA);
    EXPECT_EQ(decode_failure(bytes({0x00, 0x05, 0x00, 0x01})), ParseError::NOT_ENOUGH_DATA);
    // ERROR text without its terminator
    EXPECT_EQ(decode_failure(bytes({0x00, 0x05, 0x00, 0x01, 'o', 'o', 'p', 's'})),
              ParseError::NOT_ENOUGH_DATA);
    // Filename without terminator
    EXPECT_EQ(decode_failure(with_text(bytes({0x00, 0x01}), "file")), ParseError::NOT_ENOUGH_DATA);
    // Filename terminated, mode missing
    EXPECT_EQ(decode_failure(with_text(bytes({0x00, 0x02}), std::string("file\0", 5))),
              ParseError::NOT_ENOUGH_DATA);
}

TEST(PacketCodec, ModeMayRunToEndOfDatagram) {
    Packet p = proto::decode(with_text(bytes({0x00, 0x01}), std::string("f\0octet", 7)));
    EXPECT_EQ(std::get<ReadRequest>(p), (ReadRequest{"f", "octet"}));
}

TEST(PacketCodec, RequestOptionsAreIgnored) {
    std::string body("f.bin\0octet\0blksize\0" "1428\0", 25);
    Packet p = proto::decode(with_text(bytes({0x00, 0x02}), body));
    EXPECT_EQ(std::get<WriteRequest>(p), (WriteRequest{"f.bin", "octet"}));
}

TEST(PacketCodec, EmptyDataPayload) {
    Packet p = proto::decode(bytes({0x00, 0x03, 0x00, 0x09}));
    const auto& d = std::get<DataPacket>(p);
    EXPECT_EQ(d.block, 9);
    EXPECT_TRUE(d.payload.empty());
}

TEST(PacketCodec, OversizedDataPayloadIsCapped) {
    std::vector<u8> wire = bytes({0x00, 0x03, 0x00, 0x01});
    wire.resize(DATA_HEADER_LEN + BLOCK_SIZE + 100, 0x5A);
    Packet p = proto::decode(wire);
    EXPECT_EQ(std::get<DataPacket>(p).payload.size(), BLOCK_SIZE);
}

TEST(PacketCodec, TrailingAckBytesAreIgnored) {
    Packet p = proto::decode(bytes({0x00, 0x04, 0x00, 0x02, 0xDE, 0xAD}));
    EXPECT_EQ(std::get<AckPacket>(p).block, 2);
}

TEST(PacketCodec, UnknownErrorCodeBecomesNotDefined) {
    Packet p = proto::decode(bytes({0x00, 0x05, 0x00, 0x63, 'h', 'i', 0x00}));
    const auto& e = std::get<ErrorPacket>(p);
    EXPECT_EQ(e.code, ErrorCode::NOT_DEFINED);
    EXPECT_EQ(e.message, "hi");

    EXPECT_EQ(proto::error_code_from_wire(7), ErrorCode::NO_SUCH_USER);
    EXPECT_EQ(proto::error_code_from_wire(8), ErrorCode::NOT_DEFINED);
}

TEST(PacketCodec, EncodeRejectsEmbeddedNul) {
    try {
        proto::encode(ReadRequest{std::string("a\0b", 3), "octet"});
        FAIL() << "embedded NUL accepted";
    } catch (const PacketError& e) {
        EXPECT_EQ(e.kind(), ParseError::INVALID_FILENAME);
    }
    try {
        proto::encode(WriteRequest{"a", std::string("oc\0tet", 6)});
        FAIL() << "embedded NUL accepted";
    } catch (const PacketError& e) {
        EXPECT_EQ(e.kind(), ParseError::INVALID_MODE);
    }
    try {
        proto::encode(ErrorPacket{ErrorCode::NOT_DEFINED, std::string("x\0y", 3)});
        FAIL() << "embedded NUL accepted";
    } catch (const PacketError& e) {
        EXPECT_EQ(e.kind(), ParseError::INVALID_ERROR_MESSAGE);
    }
}

TEST(PacketCodec, EncodeRejectsOversizedPayload) {
    DataPacket d{1, std::vector<u8>(BLOCK_SIZE + 1)};
    EXPECT_THROW(proto::encode(d), std::length_error);
}

TEST(PacketCodec, EncodeRejectsFilenameLongerThanDatagram) {
    EXPECT_THROW(proto::encode(ReadRequest{std::string(MAX_DATAGRAM, 'a'), "octet"}), PacketError);
}

TEST(PacketCodec, ParseModeIsCaseInsensitive) {
    EXPECT_EQ(proto::parse_mode("octet"), TransferMode::OCTET);
    EXPECT_EQ(proto::parse_mode("OcTeT"), TransferMode::OCTET);
    EXPECT_EQ(proto::parse_mode("binary"), TransferMode::OCTET);
    EXPECT_EQ(proto::parse_mode("NETASCII"), TransferMode::NETASCII);
    EXPECT_EQ(proto::parse_mode("mail"), TransferMode::MAIL);
    EXPECT_THROW(proto::parse_mode("octets"), PacketError);
    EXPECT_THROW(proto::parse_mode(""), PacketError);
    EXPECT_STREQ(proto::mode_name(proto::parse_mode("BINARY")), "octet");
    EXPECT_STREQ(proto::mode_name(TransferMode::NETASCII), "netascii");
}

TEST(PacketCodec, OpcodeOfAndDescribe) {
    EXPECT_EQ(proto::opcode_of(AckPacket{1}), Opcode::OP_ACK);
    EXPECT_EQ(proto::opcode_of(ErrorPacket{}), Opcode::OP_ERROR);
    EXPECT_EQ(proto::describe(DataPacket{7, std::vector<u8>(512)}), "DATA #7 (512 B)");
    EXPECT_EQ(proto::describe(ReadRequest{"a\x01", "octet"}), "RRQ 'a\\x01' (octet)");
}
