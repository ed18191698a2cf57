#include <doctest/doctest.h>
#include "lanmsg/content_hash.hpp"
#include "lanmsg/payload.hpp"
#include "test_support.hpp"

using namespace lanmsg;
using namespace lanmsg::testing;

TEST_CASE("offer body requires name and an unsigned size") {
    auto p = offer_from_json(R"({"name":"a.txt","size":3,"hash":"abc"})");
    REQUIRE(p.has_value());
    CHECK(p->name == "a.txt");
    CHECK(p->size == 3);
    CHECK(p->hash == "abc");

    CHECK_FALSE(offer_from_json(R"({"size":3})").has_value());
    CHECK_FALSE(offer_from_json(R"({"name":"a","size":-1})").has_value());
    CHECK_FALSE(offer_from_json(R"({"name":"a","size":"3"})").has_value());
    CHECK_FALSE(offer_from_json(R"({"name":"","size":3})").has_value());
    CHECK_FALSE(offer_from_json(R"(["a",3])").has_value());
    CHECK_FALSE(offer_from_json("a.txt|3").has_value());
}

TEST_CASE("offer hash falls back to the md5 key and may be missing") {
    auto legacy = offer_from_json(R"({"name":"a","size":1,"md5":"d41d8cd98f00b204e9800998ecf8427e"})");
    REQUIRE(legacy.has_value());
    CHECK(legacy->hash == "d41d8cd98f00b204e9800998ecf8427e");

    auto bare = offer_from_json(R"({"name":"a","size":1})");
    REQUIRE(bare.has_value());
    CHECK(bare->hash.empty());
}

TEST_CASE("answer body: port only on accept and inside 1..65535") {
    FileAnswerPayload yes{true, uint16_t{8123}};
    auto y = answer_from_json(to_json(yes));
    REQUIRE(y.has_value());
    CHECK(y->accept);
    CHECK(*y->port == 8123);

    FileAnswerPayload no{false, uint16_t{8123}};
    CHECK(to_json(no).find("port") == std::string::npos);

    CHECK_FALSE(answer_from_json(R"({"accept":true,"port":0})").has_value());
    CHECK_FALSE(answer_from_json(R"({"accept":true,"port":70000})").has_value());
    CHECK_FALSE(answer_from_json(R"({"port":8000})").has_value());
    CHECK_FALSE(answer_from_json(R"({"accept":"yes"})").has_value());
}

TEST_CASE("event json carries only the fields that are set") {
    Event ev;
    ev.type         = EventType::MessageReceived;
    ev.peer_ip      = "10.0.0.7";
    ev.peer_port    = 2425;
    ev.peer_name    = "bob";
    ev.packet_id    = 9;
    ev.text         = "hi";
    ev.timestamp_ms = 1761386707000;

    auto j = event_json(ev);
    CHECK(j["type"].get<std::string>() == "message-received");
    CHECK(j["ip"].get<std::string>() == "10.0.0.7");
    CHECK(j["port"].get<int>() == 2425);
    CHECK(j["packet_id"].get<uint64_t>() == 9);
    CHECK(j["ts"].get<int64_t>() == 1761386707000LL);
    CHECK_FALSE(j.contains("offline"));
    CHECK_FALSE(j.contains("error"));
    CHECK_FALSE(j.contains("total"));

    Event sent;
    sent.type       = EventType::MessageSent;
    sent.is_offline = true;
    CHECK(event_json(sent)["offline"].get<bool>());

    Event err;
    err.type  = EventType::Error;
    err.error = ErrorKind::Validation;
    CHECK(event_json(err)["error"].get<std::string>() == "validation");
}

TEST_CASE("bodies and events with non-UTF-8 bytes serialise without throwing") {
    FileOfferPayload offer{"\xD6\xD0.txt", 2, ""};
    std::string text;
    CHECK_NOTHROW(text = to_json(offer));
    auto back = offer_from_json(text);
    REQUIRE(back.has_value());
    CHECK(back->name.rfind("\xEF\xBF\xBD", 0) == 0);
    CHECK(back->name.find(".txt") != std::string::npos);

    Event ev;
    ev.type = EventType::FileOfferReceived;
    ev.text = "\xFF";
    std::string line;
    CHECK_NOTHROW(line = dump_text(event_json(ev)));
    CHECK(line.find("\xEF\xBF\xBD") != std::string::npos);
}

TEST_CASE("md5 of files and strings") {
    CHECK(md5_hex("").value_or("") == "d41d8cd98f00b204e9800998ecf8427e");
    CHECK(md5_hex("abc").value_or("") == "900150983cd24fb0d6963f7d28e17f72");

    TempDir dir;
    uint64_t size = 0;
    auto h = md5_file_hex(dir.write("abc", "abc"), &size);
    REQUIRE(h.has_value());
    CHECK(*h == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(size == 3);

    // larger than one read chunk
    const std::string big(10000, 'z');
    CHECK(md5_file_hex(dir.write("big", big)).value_or("x") == md5_hex(big).value_or("y"));

    CHECK_FALSE(md5_file_hex(dir.file("missing")).has_value());
}
