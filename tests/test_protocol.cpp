#include <doctest/doctest.h>
#include "lanmsg/protocol.hpp"

#include <string>

using namespace lanmsg;

TEST_CASE("kind splits into mode (low 8 bits) and options (high 24 bits)") {
    const uint32_t k = bits::pack(Mode::SendMsg, opt::UTF8 | opt::SENDCHECK);
    CHECK(k == 0x00800120u);
    CHECK(bits::mode(k) == 0x20);
    CHECK(bits::options(k) == 0x00800100u);
    CHECK(bits::has_option(k, opt::UTF8));
    CHECK(bits::has_option(k, opt::SENDCHECK));
    CHECK_FALSE(bits::has_option(k, opt::FILEATTACH));
    CHECK_FALSE(bits::has_option(k, 0));
}

TEST_CASE("pack ignores mode bits smuggled in through options") {
    CHECK(bits::pack(Mode::BrEntry, 0x000000FFu | opt::UTF8) == (opt::UTF8 | 0x01u));
}

TEST_CASE("classify maps the catalog and folds everything else into Unknown") {
    CHECK(classify(0x00000001u) == Mode::BrEntry);
    CHECK(classify(0x00600003u) == Mode::AnsEntry);
    CHECK(classify(0x00000061u) == Mode::ReleaseFiles);
    CHECK(classify(0x00000073u) == Mode::AnsPubKey);
    CHECK(classify(0x00000005u) == Mode::Unknown);
    CHECK(classify(0x000000FEu) == Mode::Unknown);
}

TEST_CASE("presence class is entry, exit, entry answer and absence") {
    CHECK(is_presence(Mode::BrEntry));
    CHECK(is_presence(Mode::BrExit));
    CHECK(is_presence(Mode::AnsEntry));
    CHECK(is_presence(Mode::BrAbsence));
    CHECK_FALSE(is_presence(Mode::SendMsg));
    CHECK_FALSE(is_presence(Mode::Unknown));
}

TEST_CASE("SENDCHECK only requests an ack on a text message") {
    CHECK(bits::requests_ack(bits::pack(Mode::SendMsg, opt::SENDCHECK)));
    CHECK_FALSE(bits::requests_ack(bits::pack(Mode::SendMsg, opt::UTF8)));
    // same bit on a presence frame means ABSENCE
    CHECK_FALSE(bits::requests_ack(bits::pack(Mode::BrEntry, opt::ABSENCE)));
    CHECK(bits::is_absent(bits::pack(Mode::BrEntry, opt::ABSENCE)));
    CHECK_FALSE(bits::is_absent(bits::pack(Mode::SendMsg, opt::SENDCHECK)));
}

TEST_CASE("mode_name and explain are readable") {
    CHECK(std::string(mode_name(0x20)) == "IPMSG_SENDMSG");
    CHECK(std::string(mode_name(0x01)) == "IPMSG_BR_ENTRY");
    CHECK(std::string(mode_name(0x05)) == "UNKNOWN");

    const std::string e = explain(bits::pack(Mode::SendMsg, opt::UTF8 | opt::SENDCHECK));
    CHECK(e.find("IPMSG_SENDMSG") != std::string::npos);
    CHECK(e.find("UTF8") != std::string::npos);
    CHECK(e.find("SENDCHECK") != std::string::npos);

    // the 0x100 bit is named by context
    const std::string p = explain(bits::pack(Mode::BrEntry, opt::ABSENCE));
    CHECK(p.find("ABSENCE") != std::string::npos);
    CHECK(p.find("SENDCHECK") == std::string::npos);
}
