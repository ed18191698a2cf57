#include <doctest/doctest.h>
#include "lanmsg/frame.hpp"
#include "lanmsg/text_encoding.hpp"

#include <string>
#include <vector>

using namespace lanmsg;

static const uint64_t NOW_S = 1761386707;

static std::string as_text(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

static ProtocolFrame sample() {
    ProtocolFrame f;
    f.packet_id   = 42;
    f.sender_name = "alice";
    f.sender_host = "alice-pc";
    f.kind        = bits::pack(Mode::SendMsg, opt::UTF8);
    f.content     = "hello there";
    return f;
}

TEST_CASE("canonical frame decodes field by field") {
    auto r = codec::decode(std::string("1:42:alice:alice-pc:8388896:hello there"), NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Canonical);
    CHECK(r.encoding == TextEncoding::Utf8);
    CHECK(r.frame.version == 1);
    CHECK(r.frame.packet_id == 42);
    CHECK(r.frame.sender_name == "alice");
    CHECK(r.frame.sender_host == "alice-pc");
    CHECK(r.frame.kind == 8388896u);
    CHECK(r.frame.mode() == Mode::SendMsg);
    CHECK(r.frame.content == "hello there");
}

TEST_CASE("content keeps its colons") {
    auto r = codec::decode(std::string("1:5:a:h:32:see you at 10:30:00"), NOW_S);
    REQUIRE(r.ok());
    CHECK(r.frame.content == "see you at 10:30:00");
}

TEST_CASE("encode then decode gives the same frame, escapes included") {
    ProtocolFrame f = sample();
    f.content = "path C:\\tmp\\x and 12:00";
    std::vector<uint8_t> out;
    REQUIRE(codec::encode(f, out) == FrameStatus::Ok);

    auto r = codec::decode(out, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.frame == f);
}

TEST_CASE("encode writes the canonical text exactly") {
    std::vector<uint8_t> out;
    REQUIRE(codec::encode(sample(), out) == FrameStatus::Ok);
    CHECK(as_text(out) == "1:42:alice:alice-pc:8388896:hello there");
}

TEST_CASE("encode rejects what decode could not read back") {
    std::vector<uint8_t> out{1, 2, 3};

    ProtocolFrame f = sample();
    f.sender_name = "al:ice";
    CHECK(codec::encode(f, out) == FrameStatus::DelimiterInField);
    CHECK(out.size() == 3);                       // untouched on failure

    f = sample(); f.sender_name.clear();
    CHECK(codec::encode(f, out) == FrameStatus::EmptySender);
    f = sample(); f.sender_host.clear();
    CHECK(codec::encode(f, out) == FrameStatus::EmptyHost);
    f = sample(); f.version = 2;
    CHECK(codec::encode(f, out) == FrameStatus::VersionMismatch);
    f = sample(); f.packet_id = MAX_PACKET_ID + 1;
    CHECK(codec::encode(f, out) == FrameStatus::PacketIdRange);
    f = sample(); f.content.assign(MAX_CONTENT_SIZE + 1, 'x');
    CHECK(codec::encode(f, out) == FrameStatus::ContentTooLarge);
}

TEST_CASE("malformed canonical frames get precise statuses") {
    CHECK(codec::decode(std::string("1:2:a:h:32"), NOW_S).status == FrameStatus::TooFewFields);
    CHECK(codec::decode(std::string(""), NOW_S).status == FrameStatus::TooFewFields);
    CHECK(codec::decode(std::string("x:2:a:h:32:c"), NOW_S).status == FrameStatus::BadVersion);
    CHECK(codec::decode(std::string("1:-2:a:h:32:c"), NOW_S).status == FrameStatus::BadPacketId);
    CHECK(codec::decode(std::string("1:4294967296:a:h:32:c"), NOW_S).status == FrameStatus::PacketIdRange);
    CHECK(codec::decode(std::string("1:2::h:32:c"), NOW_S).status == FrameStatus::EmptySender);
    CHECK(codec::decode(std::string("1:2:a::32:c"), NOW_S).status == FrameStatus::EmptyHost);
    CHECK(codec::decode(std::string("1:2:a:h:0x20:c"), NOW_S).status == FrameStatus::BadKind);
    CHECK(codec::decode(std::string("1:2:a:h:4294967296:c"), NOW_S).status == FrameStatus::BadKind);
}

TEST_CASE("packet id at the u32 limit is accepted") {
    auto r = codec::decode(std::string("1:4294967295:a:h:32:c"), NOW_S);
    REQUIRE(r.ok());
    CHECK(r.frame.packet_id == 4294967295ull);
}

TEST_CASE("largest id we emit still reads back as canonical") {
    ProtocolFrame f = sample();
    f.packet_id = MAX_OWN_PACKET_ID;
    std::vector<uint8_t> bytes;
    REQUIRE(codec::encode(f, bytes) == FrameStatus::Ok);
    auto r = codec::decode(bytes, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Canonical);
    CHECK(r.frame.packet_id == 999999999u);
    CHECK(r.frame.sender_name == "alice");
}

TEST_CASE("ten-digit packet id in field[1] is taken for a vendor stamp") {
    ProtocolFrame f = sample();
    f.packet_id = 1234567890;
    std::vector<uint8_t> bytes;
    REQUIRE(codec::encode(f, bytes) == FrameStatus::Ok);
    auto r = codec::decode(bytes, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Vendor);
    CHECK(r.frame.packet_id != 1234567890u);
}

TEST_CASE("other versions are accepted and flagged") {
    auto r = codec::decode(std::string("2:9:a:h:32:c"), NOW_S);
    REQUIRE(r.ok());
    CHECK(r.version_mismatch);
    CHECK(r.frame.version == 2);
}

TEST_CASE("vendor hybrid presence frame: username comes from content") {
    auto r = codec::decode(std::string("1_x#128#AA#0#0#0#1#9:1761386707:bob:host-1:6291459:Bob"), 1234);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Vendor);
    CHECK(r.frame.sender_host == "host-1");
    CHECK(r.frame.sender_name == "Bob");
    CHECK(r.frame.mode_raw() == 3);
    CHECK(r.frame.user_id == "bob");
    CHECK(r.frame.packet_id == 1234);           // third field not numeric: timestamp fallback
    CHECK(r.frame.content.empty());
}

TEST_CASE("vendor hybrid text frame keeps its content") {
    const uint32_t kind = bits::pack(Mode::SendMsg, opt::UTF8);
    const std::string wire = "1_lbt6_0#128#5C60BA7361C6#1944#0#0#4001#9:1765442982:77:HOST-N:" +
                             std::to_string(kind) + ":hi: there";
    auto r = codec::decode(wire, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Vendor);
    CHECK(r.frame.packet_id == 77);
    CHECK(r.frame.sender_name == "HOST-N");
    CHECK(r.frame.sender_host == "HOST-N");
    CHECK(r.frame.content == "hi: there");
}

TEST_CASE("a '#' inside canonical content is not a vendor header") {
    auto r = codec::decode(std::string("1:3:a:h:32:issue #12 fixed"), NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Canonical);
    CHECK(r.frame.content == "issue #12 fixed");
}

TEST_CASE("vendor encode decodes back to the announcing identity") {
    ProtocolFrame f;
    f.packet_id   = 11;
    f.sender_name = "alice";
    f.sender_host = "alice-pc";
    f.kind        = bits::pack(Mode::BrEntry, opt::UTF8);
    f.content     = "alice";

    std::vector<uint8_t> out;
    REQUIRE(codec::encode_vendor(f, "0A0B0C0D0E0F", 2425, NOW_S, out) == FrameStatus::Ok);
    CHECK(as_text(out).rfind("1_lbt6_0#128#0A0B0C0D0E0F#2425#0#11:", 0) == 0);

    auto r = codec::decode(out, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.layout == Layout::Vendor);
    CHECK(r.frame.sender_name == "alice");
    CHECK(r.frame.sender_host == "alice-pc");
    CHECK(r.frame.mode() == Mode::BrEntry);
}

TEST_CASE("GBK datagram is detected and decoded to UTF-8") {
    // "1:1:a:h:32:" + GBK "中文"
    std::vector<uint8_t> wire = {'1', ':', '1', ':', 'a', ':', 'h', ':', '3', '2', ':',
                                 0xD6, 0xD0, 0xCE, 0xC4};
    auto r = codec::decode(wire, NOW_S);
    REQUIRE(r.ok());
    CHECK(r.encoding == TextEncoding::Gbk);
    CHECK(r.frame.content == "\xE4\xB8\xAD\xE6\x96\x87");
}

TEST_CASE("bytes that are neither UTF-8 nor GBK are undecodable") {
    std::vector<uint8_t> wire = {'1', ':', '1', ':', 'a', ':', 'h', ':', '3', '2', ':', 0xFF, 0xFF};
    CHECK(codec::decode(wire, NOW_S).status == FrameStatus::Undecodable);
}

TEST_CASE("escape helpers are inverse") {
    CHECK(codec::escape_delimiters("a:b\\c") == "a\\:b\\\\c");
    CHECK(codec::unescape_delimiters("a\\:b\\\\c") == "a:b\\c");
    CHECK(codec::unescape_delimiters("trailing\\") == "trailing\\");
    CHECK(std::string(codec::status_name(FrameStatus::TooFewFields)) == "too_few_fields");
}
