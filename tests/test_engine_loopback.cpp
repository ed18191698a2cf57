#include <doctest/doctest.h>
#include "lanmsg/engine.hpp"
#include "test_support.hpp"

#include <functional>
#include <thread>

using namespace lanmsg;
using namespace lanmsg::testing;

namespace {

Config loopback_config(const std::string& user, const std::string& save_dir, uint16_t tcp_start) {
    Config c = default_config();
    c.username        = user;
    c.hostname        = user + "-pc";
    c.bind_ip         = "127.0.0.1";
    c.broadcast_ip    = "127.0.0.1";
    c.udp_port        = 36425;
    c.bind_attempts   = 50;
    c.tcp_port_start  = tcp_start;
    c.tcp_port_end    = static_cast<uint16_t>(tcp_start + 50);
    c.poll_timeout_ms = 20;
    c.rate_limit_ms   = 0;
    c.vendor_announce = false;
    c.log_level       = "warn";
    c.file_save_dir   = save_dir;
    return c;
}

// Pulls events out of a buffer into a history until pred matches one.
struct Watcher {
    EventBuffer        buf;
    std::vector<Event> seen;

    bool wait(const std::function<bool(const Event&)>& pred, int timeout_ms = 5000) {
        for (const auto& e : seen) if (pred(e)) return true;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            Event ev;
            while (buf.poll(ev)) {
                seen.push_back(ev);
                if (pred(ev)) return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

} // namespace

TEST_CASE("invalid configuration refuses to start") {
    EventBuffer events;
    Config c = loopback_config("x", ".", 43000);
    c.peer_timeout_s = c.heartbeat_interval_s;
    Engine e(c, events);
    CHECK_THROWS_AS(e.start(), std::runtime_error);
    CHECK_FALSE(e.running());
}

TEST_CASE("two engines discover each other, chat with acks and move a file") {
    TempDir inbox, outbox;
    Watcher wa, wb;
    Engine a(loopback_config("alice", outbox.path(), 43100), wa.buf);
    Engine b(loopback_config("bob", inbox.path(), 43200), wb.buf);
    a.start();
    b.start();
    REQUIRE(a.running());
    REQUIRE(b.running());
    REQUIRE(a.port() != b.port());
    CHECK(a.local_ip() == "127.0.0.1");

    // discovery: unicast entry, answered with an entry answer
    REQUIRE(a.announce_to("127.0.0.1", b.port()));
    CHECK(wb.wait([](const Event& e) { return e.type == EventType::PeerOnline && e.peer_name == "alice"; }));
    CHECK(wa.wait([](const Event& e) { return e.type == EventType::PeerOnline && e.peer_name == "bob"; }));
    CHECK(a.peers_snapshot().size() == 1);
    CHECK(b.peers_snapshot().size() == 1);

    // text with acknowledgment
    auto id = a.send_text("127.0.0.1", b.port(), "hello bob", true);
    REQUIRE(id.has_value());
    CHECK(wb.wait([](const Event& e) {
        return e.type == EventType::MessageReceived && e.text == "hello bob" && !e.is_offline;
    }));
    const uint64_t want = *id;
    CHECK(wa.wait([want](const Event& e) { return e.type == EventType::MessageAck && e.packet_id == want; }));

    // file offer, accept, stream, verify
    std::string payload(50000, 'q');
    const std::string path = outbox.write("notes.txt", payload);
    std::string up_id;
    REQUIRE(a.offer_file(path, "127.0.0.1", b.port(), up_id) == TransferResult::Ok);

    std::string offer_id;
    REQUIRE(wb.wait([&](const Event& e) {
        if (e.type != EventType::FileOfferReceived) return false;
        offer_id = e.ref_id;
        return true;
    }));
    CHECK(b.pending_offers().size() == 1);

    std::string down_id;
    REQUIRE(b.decide_offer(offer_id, true, &down_id) == TransferResult::Ok);
    CHECK(wb.wait([&](const Event& e) { return e.type == EventType::TransferFinished && e.ref_id == down_id; }));
    CHECK(wa.wait([&](const Event& e) { return e.type == EventType::TransferFinished && e.ref_id == up_id; }));

    bool down_ok = false;
    for (const auto& t : b.transfer_tasks_snapshot()) {
        if (t.id == down_id) down_ok = t.status == TransferStatus::Completed;
    }
    CHECK(down_ok);
    CHECK(read_all(inbox.file("notes.txt")) == payload);

    a.stop();
    b.stop();
    CHECK_FALSE(a.running());
    a.stop();                                   // second stop is harmless
}

TEST_CASE("auto-accept takes offers without a decision") {
    TempDir inbox, outbox;
    Watcher wa, wb;
    Config cb = loopback_config("bob", inbox.path(), 43400);
    cb.auto_accept_files = true;
    Engine a(loopback_config("alice", outbox.path(), 43300), wa.buf);
    Engine b(cb, wb.buf);
    a.start();
    b.start();

    std::string up_id;
    REQUIRE(a.offer_file(outbox.write("auto.txt", "auto"), "127.0.0.1", b.port(), up_id) == TransferResult::Ok);
    CHECK(wa.wait([&](const Event& e) { return e.type == EventType::TransferFinished && e.ref_id == up_id; }));
    CHECK(wb.wait([](const Event& e) { return e.type == EventType::TransferFinished && e.error == ErrorKind::None; }));
    CHECK(read_all(inbox.file("auto.txt")) == "auto");
}

TEST_CASE("a rejected offer cancels the upload") {
    TempDir inbox, outbox;
    Watcher wa, wb;
    Engine a(loopback_config("alice", outbox.path(), 43500), wa.buf);
    Engine b(loopback_config("bob", inbox.path(), 43600), wb.buf);
    a.start();
    b.start();

    std::string up_id;
    REQUIRE(a.offer_file(outbox.write("no.txt", "no"), "127.0.0.1", b.port(), up_id) == TransferResult::Ok);
    std::string offer_id;
    REQUIRE(wb.wait([&](const Event& e) {
        if (e.type != EventType::FileOfferReceived) return false;
        offer_id = e.ref_id;
        return true;
    }));
    REQUIRE(b.decide_offer(offer_id, false) == TransferResult::Ok);
    CHECK(wa.wait([&](const Event& e) { return e.type == EventType::TransferFinished && e.ref_id == up_id; }));

    bool cancelled = false;
    for (const auto& t : a.transfer_tasks_snapshot()) {
        if (t.id == up_id) cancelled = t.status == TransferStatus::Cancelled;
    }
    CHECK(cancelled);
}

TEST_CASE("stop does not wait for an uploader that never connects") {
    TempDir inbox;
    Watcher wb;
    Engine b(loopback_config("bob", inbox.path(), 43700), wb.buf);
    b.start();

    const Endpoint ghost = transport::make_endpoint("127.0.0.1", 9);
    auto offer = remote_frame(bits::pack(Mode::GetFileData, opt::UTF8 | opt::FILEATTACH),
                              R"({"name":"late.bin","size":10})");
    b.handle_incoming_frame(offer, ghost, b.local_ip());
    REQUIRE(b.pending_offers().size() == 1);

    std::string down_id;
    REQUIRE(b.decide_offer(b.pending_offers()[0].id, true, &down_id) == TransferResult::Ok);
    CHECK(b.transfer_threads() == 1);

    const auto t0 = std::chrono::steady_clock::now();
    b.stop();
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
    CHECK(b.transfer_threads() == 0);

    bool failed = false;
    for (const auto& t : b.transfer_tasks_snapshot()) {
        if (t.id == down_id) failed = t.status == TransferStatus::Failed;
    }
    CHECK(failed);
}

TEST_CASE("finished transfer threads are reaped while running") {
    TempDir inbox, outbox;
    Watcher wa, wb;
    Config cb = loopback_config("bob", inbox.path(), 43900);
    cb.auto_accept_files = true;
    Engine a(loopback_config("alice", outbox.path(), 43800), wa.buf);
    Engine b(cb, wb.buf);
    a.start();
    b.start();

    for (int i = 0; i < 3; ++i) {
        const std::string name = "r" + std::to_string(i) + ".txt";
        std::string up_id;
        REQUIRE(a.offer_file(outbox.write(name, name), "127.0.0.1", b.port(), up_id) == TransferResult::Ok);
        REQUIRE(wa.wait([&](const Event& e) { return e.type == EventType::TransferFinished && e.ref_id == up_id; }));
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((a.transfer_threads() || b.transfer_threads()) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    CHECK(a.transfer_threads() == 0);
    CHECK(b.transfer_threads() == 0);
}

TEST_CASE("no transfer thread starts after stop") {
    TempDir inbox;
    Watcher wb;
    Engine b(loopback_config("bob", inbox.path(), 44000), wb.buf);
    b.start();
    b.stop();

    const Endpoint ghost = transport::make_endpoint("127.0.0.1", 9);
    b.handle_incoming_frame(remote_frame(bits::pack(Mode::GetFileData, opt::UTF8 | opt::FILEATTACH),
                                         R"({"name":"after.bin","size":10})"),
                            ghost, b.local_ip());
    REQUIRE(b.pending_offers().size() == 1);

    std::string down_id;
    CHECK(b.decide_offer(b.pending_offers()[0].id, true, &down_id) == TransferResult::StreamFailed);
    CHECK(down_id.empty());
    CHECK(b.transfer_threads() == 0);
    for (const auto& t : b.transfer_tasks_snapshot()) {
        CHECK(t.status == TransferStatus::Failed);
    }
}
