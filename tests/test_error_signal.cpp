// ============================================================
// test_error_signal.cpp -- ERROR packet delivery
// ============================================================

#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../server/error_signal.hpp"
#include <cerrno>
#include <memory>
#include <string>
#include <vector>

TEST(ErrorSignal, SendsOneErrorPacket) {
    auto wire = std::make_shared<FakeWire>();
    FakeSocket sock(wire);
    Endpoint dst = Endpoint::from("127.0.0.1", 6000);

    errsig::send_error(sock, dst, ErrorCode::FILE_NOT_FOUND, "no such file");

    ASSERT_EQ(wire->sent.size(), 1u);
    EXPECT_EQ(wire->sent[0].dst, dst);
    EXPECT_EQ(wire->sent_packet(0), Packet(ErrorPacket{ErrorCode::FILE_NOT_FOUND, "no such file"}));
}

TEST(ErrorSignal, MessageIsCutAtNulAndCapped) {
    auto wire = std::make_shared<FakeWire>();
    FakeSocket sock(wire);
    Endpoint dst = Endpoint::from("127.0.0.1", 6000);

    errsig::send_error(sock, dst, ErrorCode::NOT_DEFINED, std::string("abc\0def", 7));
    errsig::send_error(sock, dst, ErrorCode::NOT_DEFINED, std::string(1000, 'x'));

    ASSERT_EQ(wire->sent.size(), 2u);
    EXPECT_EQ(std::get<ErrorPacket>(wire->sent_packet(0)).message, "abc");
    EXPECT_EQ(std::get<ErrorPacket>(wire->sent_packet(1)).message.size(), errsig::MAX_MESSAGE_LEN);
}

TEST(ErrorSignal, SendFailureIsSwallowed) {
    auto wire = std::make_shared<FakeWire>();
    wire->fail_send = true;
    FakeSocket sock(wire);
    EXPECT_NO_THROW(errsig::send_error(sock, Endpoint::from("127.0.0.1", 6000),
                                       ErrorCode::DISK_FULL, "full"));
    EXPECT_TRUE(wire->sent.empty());
}

TEST(ErrorSignal, FreshSocketReachesPeer) {
    UdpSocket receiver;
    receiver.bind("127.0.0.1", 0);
    receiver.set_recv_timeout_ms(2000);
    Endpoint dst = receiver.local_endpoint();

    errsig::send_error(dst, ErrorCode::ILLEGAL_OPERATION, "unexpected ACK packet", "127.0.0.1");

    std::vector<u8> buf;
    Endpoint src;
    ASSERT_TRUE(receiver.recv_from(buf, src));
    EXPECT_NE(src.port(), dst.port());
    EXPECT_EQ(proto::decode(buf),
              Packet(ErrorPacket{ErrorCode::ILLEGAL_OPERATION, "unexpected ACK packet"}));
}

TEST(ErrorSignal, ErrnoMapping) {
    EXPECT_EQ(errsig::code_for_errno(ENOENT), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(errsig::code_for_errno(ENOTDIR), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(errsig::code_for_errno(EACCES), ErrorCode::ACCESS_VIOLATION);
    EXPECT_EQ(errsig::code_for_errno(EPERM), ErrorCode::ACCESS_VIOLATION);
    EXPECT_EQ(errsig::code_for_errno(EISDIR), ErrorCode::ACCESS_VIOLATION);
    EXPECT_EQ(errsig::code_for_errno(ENOSPC), ErrorCode::DISK_FULL);
    EXPECT_EQ(errsig::code_for_errno(EFBIG), ErrorCode::DISK_FULL);
    EXPECT_EQ(errsig::code_for_errno(EEXIST), ErrorCode::FILE_ALREADY_EXISTS);
    EXPECT_EQ(errsig::code_for_errno(EIO), ErrorCode::NOT_DEFINED);
    EXPECT_EQ(errsig::code_for_errno(0), ErrorCode::NOT_DEFINED);
}
