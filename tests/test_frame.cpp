#include <doctest/doctest.h>
#include "viamesh/frame.hpp"
#include <string>

using namespace viamesh;

static FrameStatus decode(const std::string& s, Frame& out) {
    return decode_frame(reinterpret_cast<const uint8_t*>(s.data()), s.size(), out);
}

static std::string encode(const Frame& f) {
    FrameBytes bytes;
    REQUIRE(encode_frame(f, bytes));
    return std::string(bytes.begin(), bytes.end());
}

TEST_CASE("Frame encodes as a stamp with upper-case hex id") {
    Frame f;
    f.id = 0x00ab12cd;
    f.sequence = 42;
    f.flags.syn = true;
    f.flags.requires_ack = true;
    f.destination = "BASE";
    f.source = "NODE7";
    f.port = 10;
    f.payload = "hello";

    CHECK(encode(f) == "00AB12CD~42~s1r1~BASE~NODE7~10~hello");
}

TEST_CASE("Frame decode keeps separators and binary bytes in the payload") {
    const std::string wire("deadBEEF~7~r1f0~B~A~3~a~b\0c~", 28);
    Frame f;
    REQUIRE(decode(wire, f) == FrameStatus::Ok);

    CHECK(f.id == 0xDEADBEEFu);
    CHECK(f.sequence == 7);
    CHECK(f.flags.requires_ack);
    CHECK(f.flags.more_fragments);
    CHECK(f.destination == HostStr("B"));
    CHECK(f.source == HostStr("A"));
    CHECK(f.port == 3);
    CHECK(std::string(f.payload.data(), f.payload.size()) == std::string("a~b\0c~", 6));

    // encoding the decoded frame reproduces the stamp (id now upper-case)
    CHECK(encode(f) == std::string("DEADBEEF~7~r1f0~B~A~3~a~b\0c~", 28));
}

TEST_CASE("Frame decode accepts an empty flags token and empty payload") {
    Frame f;
    REQUIRE(decode("00000001~0~a1~A~B~0~", f) == FrameStatus::Ok);
    CHECK(f.flags.ack);
    CHECK(f.sequence == 0);
    CHECK(f.payload.empty());

    REQUIRE(decode("00000002~5~~*~B~9~x", f) == FrameStatus::Ok);
    CHECK(f.flags == PacketFlags());
    CHECK(f.destination == HostStr(BROADCAST_HOST));
}

TEST_CASE("Frame decode reports the first bad field") {
    Frame f;
    CHECK(decode("", f) == FrameStatus::MissingField);
    CHECK(decode("00000001~1~r1~B~A", f) == FrameStatus::MissingField);
    CHECK(decode("0001~1~r1~B~A~1~x", f) == FrameStatus::BadId);
    CHECK(decode("0000000G~1~r1~B~A~1~x", f) == FrameStatus::BadId);
    CHECK(decode("00000001~~r1~B~A~1~x", f) == FrameStatus::BadSequence);
    CHECK(decode("00000001~-1~r1~B~A~1~x", f) == FrameStatus::BadSequence);
    CHECK(decode("00000001~4294967296~r1~B~A~1~x", f) == FrameStatus::BadSequence);
    CHECK(decode("00000001~1~q1~B~A~1~x", f) == FrameStatus::BadFlags);
    CHECK(decode("00000001~1~r1~~A~1~x", f) == FrameStatus::BadHost);
    CHECK(decode("00000001~1~r1~B~~1~x", f) == FrameStatus::BadHost);
    CHECK(decode("00000001~1~r1~B~A~65536~x", f) == FrameStatus::BadPort);
    CHECK(decode("00000001~1~r1~B~A~p~x", f) == FrameStatus::BadPort);

    const std::string big = "00000001~1~~B~A~1~" + std::string(VM_PAYLOAD_MAX + 1, 'z');
    CHECK(decode(big, f) == FrameStatus::Oversize);
}

TEST_CASE("Frame encode refuses invalid hosts") {
    Frame f;
    f.id = 1;
    f.sequence = 1;
    f.destination = "";
    f.source = "A";
    FrameBytes bytes;
    CHECK_FALSE(encode_frame(f, bytes));

    f.destination = "B~C";
    CHECK_FALSE(encode_frame(f, bytes));
}

TEST_CASE("is_valid_host") {
    CHECK(is_valid_host("A"));
    CHECK(is_valid_host("*"));
    CHECK(is_valid_host(std::string(VM_HOST_MAX, 'h').c_str()));
    CHECK_FALSE(is_valid_host(nullptr));
    CHECK_FALSE(is_valid_host(""));
    CHECK_FALSE(is_valid_host("a~b"));
    CHECK_FALSE(is_valid_host(std::string(VM_HOST_MAX + 1, 'h').c_str()));
}
