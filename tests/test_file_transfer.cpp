#include <doctest/doctest.h>
#include "lanmsg/file_transfer.hpp"
#include "lanmsg/payload.hpp"
#include "lanmsg/transport/tcp_stream.hpp"
#include "test_support.hpp"

#include <set>
#include <thread>

using namespace lanmsg;
using namespace lanmsg::testing;
using std::chrono::seconds;

namespace {

struct Fixture {
    FakePort      port{2425};
    Messenger     out{port, LocalIdentity{"alice", "alice-pc", ""}};
    RecordingSink sink;
    ManualClock   clock;
    FileTransferCoordinator ft{out, &sink, clock.fn()};
    Endpoint      bob = transport::make_endpoint("10.0.0.7", 2425);

    std::string active_task(uint64_t size) {
        TransferTask t;
        t.id        = ft.new_id();
        t.direction = Direction::Download;
        t.peer_ip   = "10.0.0.7";
        t.file_name = "x.bin";
        t.file_size = size;
        REQUIRE(ft.add_task(t) == TransferResult::Ok);
        REQUIRE(ft.activate(t.id, 9000) == TransferResult::Ok);
        return t.id;
    }
};

ProtocolFrame offer_frame(const std::string& json_body) {
    return remote_frame(bits::pack(Mode::GetFileData, opt::UTF8 | opt::FILEATTACH), json_body);
}

} // namespace

TEST_CASE("task ids are 32 lowercase hex characters and unique") {
    Fixture fx;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string id = fx.ft.new_id();
        CHECK(id.size() == 32);
        CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        seen.insert(id);
    }
    CHECK(seen.size() == 100);
}

TEST_CASE("state machine: pending, active, paused, terminal") {
    Fixture fx;
    TransferTask t;
    t.id = "t1"; t.peer_ip = "10.0.0.7"; t.file_size = 10;
    REQUIRE(fx.ft.add_task(t) == TransferResult::Ok);
    CHECK(fx.ft.add_task(t) == TransferResult::Duplicate);

    CHECK(fx.ft.pause("t1") == TransferResult::InvalidTransition);       // not active yet
    CHECK(fx.ft.progress("t1", 5) == TransferResult::InvalidTransition);
    CHECK(fx.ft.activate("t1", 9001) == TransferResult::Ok);
    CHECK(fx.ft.activate("t1", 9001) == TransferResult::InvalidTransition);
    CHECK(fx.ft.find("t1")->port == 9001);

    CHECK(fx.ft.pause("t1") == TransferResult::Ok);
    CHECK(fx.ft.progress("t1", 5) == TransferResult::InvalidTransition);
    CHECK(fx.ft.resume("t1") == TransferResult::Ok);
    CHECK(fx.ft.complete("t1") == TransferResult::Ok);

    auto done = fx.ft.find("t1");
    REQUIRE(done.has_value());
    CHECK(done->status == TransferStatus::Completed);
    CHECK(done->transferred_bytes == 10);
    CHECK(done->progress() == doctest::Approx(1.0));

    // terminal is final
    CHECK(fx.ft.cancel("t1") == TransferResult::InvalidTransition);
    CHECK(fx.ft.fail("t1", "late") == TransferResult::InvalidTransition);
    CHECK(fx.ft.resume("t1") == TransferResult::InvalidTransition);
    CHECK(fx.sink.count(EventType::TransferFinished) == 1);

    CHECK(fx.ft.complete("nope") == TransferResult::NotFound);
}

TEST_CASE("progress is monotonic, capped, and reported per whole percent") {
    Fixture fx;
    const std::string id = fx.active_task(1000);

    CHECK(fx.ft.progress(id, 400) == TransferResult::Ok);
    CHECK(fx.ft.progress(id, 100) == TransferResult::Ok);        // never backwards
    CHECK(fx.ft.find(id)->transferred_bytes == 400);
    CHECK(fx.ft.progress(id, 401) == TransferResult::Ok);        // same percent, no event
    CHECK(fx.ft.progress(id, 5000) == TransferResult::Ok);       // capped at size
    CHECK(fx.ft.find(id)->transferred_bytes == 1000);
    CHECK(fx.ft.find(id)->progress_percent() == 100);

    CHECK(fx.sink.count(EventType::TransferProgress) == 2);
    CHECK(fx.sink.events.back().bytes == 1000);
    CHECK(fx.sink.events.back().total == 1000);
}

TEST_CASE("failure records the reason and raises a file-transfer error") {
    Fixture fx;
    const std::string id = fx.active_task(10);
    CHECK(fx.ft.fail(id, "disk full") == TransferResult::Ok);
    auto t = fx.ft.find(id);
    CHECK(t->status == TransferStatus::Failed);
    CHECK(t->error == "disk full");
    REQUIRE_FALSE(fx.sink.events.empty());
    CHECK(fx.sink.events.back().type == EventType::TransferFinished);
    CHECK(fx.sink.events.back().error == ErrorKind::FileTransfer);
}

TEST_CASE("cleanup drops only finished tasks; queries filter") {
    Fixture fx;
    const std::string a = fx.active_task(10);
    const std::string b = fx.active_task(10);
    fx.clock.advance(seconds(1));
    TransferTask other;
    other.id = "other"; other.peer_ip = "10.0.0.8";
    REQUIRE(fx.ft.add_task(other) == TransferResult::Ok);

    CHECK(fx.ft.tasks_by_peer("10.0.0.7").size() == 2);
    CHECK(fx.ft.tasks_by_status(TransferStatus::Active).size() == 2);
    CHECK(fx.ft.snapshot().back().id == "other");               // sorted oldest first

    fx.ft.cancel(a);
    fx.ft.complete(b);
    CHECK(fx.ft.cleanup() == 2);
    CHECK(fx.ft.snapshot().size() == 1);
    CHECK(fx.ft.cleanup() == 0);
}

TEST_CASE("offer hashes the file and sends GETFILEDATA") {
    Fixture fx;
    TempDir dir;
    const std::string path = dir.write("abc.txt", "abc");

    std::string id;
    REQUIRE(fx.ft.offer(path, fx.bob, id) == TransferResult::Ok);
    auto t = fx.ft.find(id);
    REQUIRE(t.has_value());
    CHECK(t->direction == Direction::Upload);
    CHECK(t->status == TransferStatus::Pending);
    CHECK(t->file_size == 3);
    CHECK(t->content_hash == "900150983cd24fb0d6963f7d28e17f72");

    REQUIRE(fx.port.sent.size() == 1);
    auto sent = fx.port.sent[0].decoded();
    REQUIRE(sent.ok());
    CHECK(sent.frame.mode() == Mode::GetFileData);
    CHECK(sent.frame.has_option(opt::FILEATTACH));
    auto body = offer_from_json(sent.frame.content);
    REQUIRE(body.has_value());
    CHECK(body->name == "abc.txt");
    CHECK(body->size == 3);
    CHECK(body->hash == t->content_hash);
}

TEST_CASE("GBK file name is offered as UTF-8") {
    Fixture fx;
    TempDir dir;
    const std::string path = dir.write("\xD6\xD0\xCE\xC4.txt", "abc");

    std::string id;
    REQUIRE(fx.ft.offer(path, fx.bob, id) == TransferResult::Ok);
    CHECK(fx.ft.find(id)->file_name == "\xE4\xB8\xAD\xE6\x96\x87.txt");

    auto body = offer_from_json(fx.port.sent.at(0).decoded().frame.content);
    REQUIRE(body.has_value());
    CHECK(body->name == "\xE4\xB8\xAD\xE6\x96\x87.txt");
}

TEST_CASE("file name in no known encoding is offered with replacement characters") {
    Fixture fx;
    TempDir dir;
    const std::string path = dir.write("\xFF.bin", "abc");

    std::string id;
    REQUIRE(fx.ft.offer(path, fx.bob, id) == TransferResult::Ok);
    auto body = offer_from_json(fx.port.sent.at(0).decoded().frame.content);
    REQUIRE(body.has_value());
    CHECK(body->name == "\xEF\xBF\xBD.bin");
    CHECK(body->size == 3);
}

TEST_CASE("offer of a missing file sends nothing") {
    Fixture fx;
    std::string id;
    CHECK(fx.ft.offer("/definitely/not/here.bin", fx.bob, id) == TransferResult::FileNotFound);
    CHECK(fx.port.sent.empty());
    CHECK(fx.ft.snapshot().empty());
}

TEST_CASE("offer that cannot be sent is kept as Failed") {
    Fixture fx;
    TempDir dir;
    fx.port.fail_sends = true;
    std::string id;
    CHECK(fx.ft.offer(dir.write("a", "x"), fx.bob, id) == TransferResult::SendFailed);
    CHECK(fx.ft.find(id)->status == TransferStatus::Failed);
}

TEST_CASE("answers apply to the oldest pending upload of that peer") {
    Fixture fx;
    TempDir dir;
    std::string first, second;
    REQUIRE(fx.ft.offer(dir.write("1", "one"), fx.bob, first) == TransferResult::Ok);
    fx.clock.advance(seconds(1));
    REQUIRE(fx.ft.offer(dir.write("2", "two"), fx.bob, second) == TransferResult::Ok);

    std::vector<std::string> ready;
    fx.ft.on_upload_ready([&](const TransferTask& t) { ready.push_back(t.id); });

    auto accept = remote_frame(bits::pack(Mode::ReleaseFiles, opt::UTF8), R"({"accept":true,"port":8123})");
    CHECK(fx.ft.on_incoming_answer(accept, fx.bob) == TransferResult::Ok);
    REQUIRE(ready.size() == 1);
    CHECK(ready[0] == first);
    CHECK(fx.ft.find(first)->status == TransferStatus::Active);
    CHECK(fx.ft.find(first)->port == 8123);

    auto no_port = remote_frame(bits::pack(Mode::ReleaseFiles, opt::UTF8), R"({"accept":true})");
    CHECK(fx.ft.on_incoming_answer(no_port, fx.bob) == TransferResult::BadPayload);
    CHECK(fx.ft.find(second)->status == TransferStatus::Pending);

    auto reject = remote_frame(bits::pack(Mode::ReleaseFiles, opt::UTF8), R"({"accept":false})");
    CHECK(fx.ft.on_incoming_answer(reject, fx.bob) == TransferResult::Ok);
    CHECK(fx.ft.find(second)->status == TransferStatus::Cancelled);

    // nothing left pending for bob; another IP never matched
    CHECK(fx.ft.on_incoming_answer(reject, fx.bob) == TransferResult::NotFound);
    CHECK(fx.ft.on_incoming_answer(accept, transport::make_endpoint("10.0.0.99", 2425))
          == TransferResult::NotFound);
}

TEST_CASE("incoming offer waits for a decision; accept creates a download") {
    Fixture fx;
    fx.ft.set_save_dir("/tmp/inbox");
    auto o = fx.ft.on_incoming_offer(
        offer_frame(R"({"name":"../../etc/passwd","size":12,"md5":"ABC"})"), fx.bob);
    REQUIRE(o.has_value());
    CHECK(o->file_name == "../../etc/passwd");
    CHECK(o->content_hash == "ABC");
    CHECK(fx.ft.pending_offers().size() == 1);

    REQUIRE(fx.sink.events.size() == 1);
    CHECK(fx.sink.events[0].type == EventType::FileOfferReceived);
    CHECK(fx.sink.events[0].ref_id == o->id);
    CHECK(fx.sink.events[0].total == 12);

    std::string task;
    REQUIRE(fx.ft.decide(o->id, true, uint16_t{8200}, &task) == TransferResult::Ok);
    CHECK(fx.ft.pending_offers().empty());
    CHECK(fx.ft.decide(o->id, true, uint16_t{8200}) == TransferResult::NotFound);

    auto t = fx.ft.find(task);
    REQUIRE(t.has_value());
    CHECK(t->direction == Direction::Download);
    CHECK(t->status == TransferStatus::Pending);
    CHECK(t->file_path == "/tmp/inbox/passwd");                // directory part stripped

    REQUIRE(fx.port.sent.size() == 1);
    auto answer = fx.port.sent[0].decoded();
    REQUIRE(answer.ok());
    CHECK(answer.frame.mode() == Mode::ReleaseFiles);
    auto body = answer_from_json(answer.frame.content);
    REQUIRE(body.has_value());
    CHECK(body->accept);
    REQUIRE(body->port.has_value());
    CHECK(*body->port == 8200);
    CHECK(fx.port.sent[0].to == fx.bob);
}

TEST_CASE("reject answers without a port and creates no task") {
    Fixture fx;
    auto o = fx.ft.on_incoming_offer(offer_frame(R"({"name":"a.txt","size":1})"), fx.bob);
    REQUIRE(o.has_value());
    REQUIRE(fx.ft.decide(o->id, false, std::nullopt) == TransferResult::Ok);
    CHECK(fx.ft.snapshot().empty());
    auto body = answer_from_json(fx.port.sent.at(0).decoded().frame.content);
    REQUIRE(body.has_value());
    CHECK_FALSE(body->accept);
    CHECK_FALSE(body->port.has_value());
}

TEST_CASE("accept of an offer whose name reduces to nothing is sent as a reject") {
    Fixture fx;
    auto o = fx.ft.on_incoming_offer(offer_frame(R"({"name":"..","size":4})"), fx.bob);
    REQUIRE(o.has_value());

    std::string task;
    CHECK(fx.ft.decide(o->id, true, uint16_t{8200}, &task) == TransferResult::BadPayload);
    CHECK(task.empty());
    CHECK(fx.ft.snapshot().empty());
    CHECK(fx.ft.pending_offers().empty());

    auto body = answer_from_json(fx.port.sent.at(0).decoded().frame.content);
    REQUIRE(body.has_value());
    CHECK_FALSE(body->accept);
    CHECK_FALSE(body->port.has_value());
}

TEST_CASE("unanswered offers expire") {
    Fixture fx;
    fx.ft.on_incoming_offer(offer_frame(R"({"name":"a","size":1})"), fx.bob);
    fx.clock.advance(seconds(30));
    fx.ft.on_incoming_offer(offer_frame(R"({"name":"b","size":1})"), fx.bob);
    fx.clock.advance(seconds(40));
    CHECK(fx.ft.expire_offers(seconds(60)) == 1);
    REQUIRE(fx.ft.pending_offers().size() == 1);
    CHECK(fx.ft.pending_offers()[0].file_name == "b");
}

TEST_CASE("file streams over TCP between two coordinators and verifies") {
    FakePort port_a{2425}, port_b{2426};
    Messenger out_a{port_a, LocalIdentity{"alice", "alice-pc", ""}};
    Messenger out_b{port_b, LocalIdentity{"bob", "bob-pc", ""}};
    RecordingSink sink_a, sink_b;
    FileTransferCoordinator a{out_a, &sink_a};
    FileTransferCoordinator b{out_b, &sink_b};

    TempDir src, dst;
    std::string payload;
    for (int i = 0; i < 200000; ++i) payload.push_back(static_cast<char>('a' + i % 26));
    const std::string path = src.write("big.txt", payload);
    b.set_save_dir(dst.path());

    const Endpoint a_ep = transport::make_endpoint("127.0.0.1", 2425);
    const Endpoint b_ep = transport::make_endpoint("127.0.0.1", 2426);

    std::thread uploader;
    a.on_upload_ready([&](const TransferTask& t) {
        const std::string id = t.id;
        uploader = std::thread([&a, id] { a.send_file(id); });
    });

    std::string up_id;
    REQUIRE(a.offer(path, b_ep, up_id) == TransferResult::Ok);
    auto offer = port_a.sent.at(0).decoded();
    REQUIRE(offer.ok());
    auto pending = b.on_incoming_offer(offer.frame, a_ep);
    REQUIRE(pending.has_value());

    uint16_t data_port = 0;
    const int listen_fd = transport::bind_available("127.0.0.1", 42000, 42100, data_port);
    REQUIRE(listen_fd >= 0);
    std::string down_id;
    REQUIRE(b.decide(pending->id, true, data_port, &down_id) == TransferResult::Ok);
    REQUIRE(b.activate(down_id, data_port) == TransferResult::Ok);

    TransferResult received = TransferResult::NotFound;
    std::thread downloader([&] { received = b.receive_file(down_id, listen_fd, 5000); });

    auto answer = port_b.sent.at(0).decoded();
    REQUIRE(answer.ok());
    CHECK(a.on_incoming_answer(answer.frame, b_ep) == TransferResult::Ok);

    downloader.join();
    if (uploader.joinable()) uploader.join();

    CHECK(received == TransferResult::Ok);
    CHECK(a.find(up_id)->status == TransferStatus::Completed);
    CHECK(b.find(down_id)->status == TransferStatus::Completed);
    CHECK(read_all(dst.file("big.txt")) == payload);
    CHECK(sink_b.count(EventType::TransferProgress) >= 1);
}

TEST_CASE("receiver rejects content whose hash does not match") {
    FakePort port_a{2425}, port_b{2426};
    Messenger out_a{port_a, LocalIdentity{"alice", "alice-pc", ""}};
    Messenger out_b{port_b, LocalIdentity{"bob", "bob-pc", ""}};
    FileTransferCoordinator a{out_a};
    FileTransferCoordinator b{out_b};
    TempDir src, dst;
    b.set_save_dir(dst.path());

    std::string up_id;
    REQUIRE(a.offer(src.write("f.txt", "hello"), transport::make_endpoint("127.0.0.1", 2426), up_id)
            == TransferResult::Ok);

    // same name and size, wrong hash
    auto pending = b.on_incoming_offer(
        offer_frame(R"({"name":"f.txt","size":5,"hash":"00000000000000000000000000000000"})"),
        transport::make_endpoint("127.0.0.1", 2425));
    REQUIRE(pending.has_value());

    uint16_t data_port = 0;
    const int listen_fd = transport::bind_available("127.0.0.1", 42100, 42200, data_port);
    REQUIRE(listen_fd >= 0);
    std::string down_id;
    REQUIRE(b.decide(pending->id, true, data_port, &down_id) == TransferResult::Ok);
    REQUIRE(b.activate(down_id, data_port) == TransferResult::Ok);
    REQUIRE(a.activate(up_id, data_port) == TransferResult::Ok);

    TransferResult received = TransferResult::NotFound;
    std::thread downloader([&] { received = b.receive_file(down_id, listen_fd, 5000); });
    CHECK(a.send_file(up_id) == TransferResult::Ok);
    downloader.join();

    CHECK(received == TransferResult::HashFailed);
    CHECK(b.find(down_id)->status == TransferStatus::Failed);
}
