#include <doctest/doctest.h>
#include "lanmsg/config.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace lanmsg;
using namespace lanmsg::testing;

TEST_CASE("defaults are valid and carry an identity") {
    Config cfg = default_config();
    CHECK(validate(cfg) == ConfigStatus::Ok);
    CHECK_FALSE(cfg.username.empty());
    CHECK_FALSE(cfg.hostname.empty());
    CHECK(cfg.udp_port == 2425);
    CHECK(cfg.peer_timeout_s > cfg.heartbeat_interval_s);
}

TEST_CASE("validation rules, one field at a time") {
    const Config base = default_config();
    Config c;

    c = base; c.udp_port = 0;
    CHECK(validate(c) == ConfigStatus::BadUdpPort);
    c = base; c.tcp_port_start = 1023;
    CHECK(validate(c) == ConfigStatus::BadTcpRange);
    c = base; c.tcp_port_start = 9000; c.tcp_port_end = 9000;
    CHECK(validate(c) == ConfigStatus::BadTcpRange);
    c = base; c.peer_timeout_s = c.heartbeat_interval_s;
    CHECK(validate(c) == ConfigStatus::TimeoutNotAboveHeartbeat);
    c = base; c.bind_ip.clear();
    CHECK(validate(c) == ConfigStatus::EmptyBindIp);
    c = base; c.username.clear();
    CHECK(validate(c) == ConfigStatus::EmptyUsername);
    c = base; c.poll_timeout_ms = 0;
    CHECK(validate(c) == ConfigStatus::BadPollTimeout);
    c = base; c.poll_timeout_ms = 1001;
    CHECK(validate(c) == ConfigStatus::BadPollTimeout);
    c = base; c.log_level = "loud";
    CHECK(validate(c) == ConfigStatus::BadLogLevel);
    c = base; c.bind_attempts = 0;
    CHECK(validate(c) == ConfigStatus::BadBindAttempts);

    CHECK(std::string(config_status_name(ConfigStatus::BadTcpRange)) == "bad_tcp_range");
}

TEST_CASE("save then load restores every field") {
    TempDir dir;
    Config out = default_config();
    out.username          = "alice";
    out.udp_port          = 2525;
    out.tcp_port_start    = 10000;
    out.tcp_port_end      = 10100;
    out.auto_accept_files = true;
    out.file_save_dir     = "/srv/inbox";
    out.log_level         = "debug";
    out.vendor_announce   = false;

    const std::string path = dir.file("nested/config.json");
    REQUIRE(save_config(path, out) == ConfigStatus::Ok);

    Config in = default_config();
    REQUIRE(load_config(path, in) == ConfigStatus::Ok);
    CHECK(config_to_json(in) == config_to_json(out));
}

TEST_CASE("missing file keeps defaults; partial file overrides what it names") {
    TempDir dir;
    Config cfg = default_config();
    const std::string user = cfg.username;
    CHECK(load_config(dir.file("absent.json"), cfg) == ConfigStatus::Ok);
    CHECK(cfg.username == user);

    const std::string path = dir.write("partial.json", R"({"udp_port": 3000, "unknown_key": 1})");
    REQUIRE(load_config(path, cfg) == ConfigStatus::Ok);
    CHECK(cfg.udp_port == 3000);
    CHECK(cfg.username == user);
}

TEST_CASE("broken files report ParseError and leave the config untouched") {
    TempDir dir;
    Config cfg = default_config();
    cfg.udp_port = 4000;

    CHECK(load_config(dir.write("a.json", "{ not json"), cfg) == ConfigStatus::ParseError);
    CHECK(load_config(dir.write("b.json", "[1,2]"), cfg) == ConfigStatus::ParseError);
    CHECK(load_config(dir.write("c.json", R"({"udp_port":"high"})"), cfg) == ConfigStatus::ParseError);
    CHECK(cfg.udp_port == 4000);
}

TEST_CASE("atomic write leaves no temp file behind") {
    TempDir dir;
    const std::string path = dir.file("x.json");
    REQUIRE(write_json_atomic(path, nlohmann::json{{"a", 1}}));
    REQUIRE(write_json_atomic(path, nlohmann::json{{"a", 2}}));
    CHECK(read_all(path).find("2") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("config dir follows XDG_CONFIG_HOME") {
    TempDir dir;
    ::setenv("XDG_CONFIG_HOME", dir.path().c_str(), 1);
    CHECK(default_config_dir() == dir.file("lanmsg"));
    CHECK(default_config_path() == dir.file("lanmsg/config.json"));
    ::unsetenv("XDG_CONFIG_HOME");
}
