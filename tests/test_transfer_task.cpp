#include <catch2/catch.hpp>

#include "test_support.hpp"

#include "partfetch/transfer_task.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace partfetch;
using namespace partfetch::test;

namespace {

const std::string kUrl = "https://mirror.example/archive.part1.rar";

struct TaskRig {
    explicit TaskRig(std::chrono::milliseconds progress_interval = std::chrono::milliseconds(0)) {
        TaskOptions options;
        options.chunk_size = 1024;
        options.progress_interval = progress_interval;
        final_path = dir.path() / "archive.part1.rar";
        temp_path = final_path;
        temp_path += kTempSuffix;
        task = std::make_unique<TransferTask>(1, kUrl, final_path, http, events, options);
    }

    ~TaskRig() {
        http->openAll();
        task.reset();
    }

    bool runToEnd() {
        return collectUntil(events, seen, isFinal);
    }

    [[nodiscard]] std::vector<TransferEvent> ofKind(TransferEventKind kind) const {
        std::vector<TransferEvent> out;
        for (const auto& event : seen) {
            if (event.kind == kind) {
                out.push_back(event);
            }
        }
        return out;
    }

    TempDir dir;
    std::shared_ptr<FakeHttpClient> http{std::make_shared<FakeHttpClient>()};
    EventChannel events;
    fs::path final_path;
    fs::path temp_path;
    std::unique_ptr<TransferTask> task;
    std::vector<TransferEvent> seen;
};

FakeHttpClient::Resource gatedAt(const std::string& body, std::size_t gate_at) {
    FakeHttpClient::Resource res;
    res.body = body;
    res.gated = true;
    res.gate_at = gate_at;
    return res;
}

} // namespace

TEST_CASE("fresh download lands at the final path") {
    TaskRig rig;
    const std::string body = makeBody(10 * 1024 + 300);
    rig.http->serve(kUrl, {body});

    const auto generation = rig.task->run();
    REQUIRE(rig.runToEnd());

    const auto& last = rig.seen.back();
    REQUIRE(last.kind == TransferEventKind::Finished);
    REQUIRE(last.generation == generation);
    REQUIRE(last.bytes == body.size());
    REQUIRE(last.size == body.size());
    REQUIRE(last.message == rig.final_path.string());

    REQUIRE(readFile(rig.final_path) == body);
    REQUIRE_FALSE(fs::exists(rig.temp_path));
    REQUIRE(rig.http->fetches(kUrl).at(0).range_start == 0);

    std::uint64_t previous = 0;
    for (const auto& event : rig.ofKind(TransferEventKind::Progress)) {
        REQUIRE(event.bytes >= previous);
        REQUIRE(event.size);
        REQUIRE(event.bytes <= *event.size);
        previous = event.bytes;
    }
    REQUIRE(previous == body.size());
}

TEST_CASE("an existing partial file is resumed with a range request") {
    TaskRig rig;
    const std::string body = makeBody(20000);
    rig.http->serve(kUrl, {body});
    writeFile(rig.temp_path, body.substr(0, 7000));

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);

    const auto fetches = rig.http->fetches(kUrl);
    REQUIRE(fetches.size() == 1);
    REQUIRE(fetches[0].range_start == 7000);
    REQUIRE(readFile(rig.final_path) == body);

    const auto progress = rig.ofKind(TransferEventKind::Progress);
    REQUIRE(progress.front().bytes == 7000);
}

TEST_CASE("a server that ignores the range restarts from zero") {
    TaskRig rig;
    const std::string body = makeBody(9000);
    FakeHttpClient::Resource res;
    res.body = body;
    res.honor_ranges = false;
    rig.http->serve(kUrl, res);
    writeFile(rig.temp_path, std::string(5000, 'x'));

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(readFile(rig.final_path) == body);

    const auto progress = rig.ofKind(TransferEventKind::Progress);
    const bool reset_reported = std::any_of(progress.begin(), progress.end(),
                                            [](const TransferEvent& e) { return e.bytes == 0; });
    REQUIRE(reset_reported);
}

TEST_CASE("a failed probe is not fatal") {
    TaskRig rig;
    const std::string body = makeBody(6000);
    FakeHttpClient::Resource res;
    res.body = body;
    res.probe_fails = true;
    rig.http->serve(kUrl, res);
    writeFile(rig.temp_path, body.substr(0, 2500));

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().size == body.size());
    REQUIRE(rig.http->fetches(kUrl).at(0).range_start == 2500);
    REQUIRE(readFile(rig.final_path) == body);
}

TEST_CASE("unknown length is reported as unknown until the end") {
    TaskRig rig;
    const std::string body = makeBody(4096 + 17);
    FakeHttpClient::Resource res;
    res.body = body;
    res.hide_length = true;
    rig.http->serve(kUrl, res);

    rig.task->run();
    REQUIRE(rig.runToEnd());

    const auto progress = rig.ofKind(TransferEventKind::Progress);
    REQUIRE(progress.size() >= 2);
    REQUIRE_FALSE(progress.front().size);
    REQUIRE(progress.back().size == body.size());
    REQUIRE(rig.seen.back().size == body.size());
}

TEST_CASE("the streamed byte count wins over the announced size") {
    TaskRig rig;
    const std::string body = makeBody(4096);
    FakeHttpClient::Resource res;
    res.body = body;
    res.reported_size = 1000;
    rig.http->serve(kUrl, res);

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().bytes == body.size());
    REQUIRE(rig.seen.back().size == body.size());
    REQUIRE(fs::file_size(rig.final_path) == body.size());
}

TEST_CASE("an HTTP error fails the attempt") {
    TaskRig rig;
    FakeHttpClient::Resource res;
    res.status = 404;
    rig.http->serve(kUrl, res);

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Failed);
    REQUIRE(rig.seen.back().status == TransferStatus::Error);
    REQUIRE(rig.seen.back().message == "HTTP 404");
    REQUIRE_FALSE(fs::exists(rig.final_path));
}

TEST_CASE("a dropped connection keeps the partial file for the next attempt") {
    TaskRig rig;
    const std::string body = makeBody(8000);
    FakeHttpClient::Resource res;
    res.body = body;
    res.piece = 512;
    res.fail_after = 2560;
    rig.http->serve(kUrl, res);

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Failed);
    REQUIRE(rig.seen.back().message == "Connection reset by peer");
    REQUIRE(fs::file_size(rig.temp_path) == 2048);
    REQUIRE_FALSE(fs::exists(rig.final_path));

    rig.seen.clear();
    const auto generation = rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().generation == generation);

    const auto fetches = rig.http->fetches(kUrl);
    REQUIRE(fetches.size() == 2);
    REQUIRE(fetches[1].range_start == 2048);
    REQUIRE(readFile(rig.final_path) == body);
}

TEST_CASE("cancel keeps the bytes written so far and resume continues from them") {
    TaskRig rig;
    const std::string body = makeBody(64 * 1024);
    rig.http->serve(kUrl, gatedAt(body, 8192));

    rig.task->run();
    REQUIRE(rig.http->waitUntilParked(kUrl));
    rig.task->requestCancel();
    rig.http->openGate(kUrl);
    REQUIRE(rig.runToEnd());

    const auto& canceled = rig.seen.back();
    REQUIRE(canceled.kind == TransferEventKind::Status);
    REQUIRE(canceled.status == TransferStatus::Canceled);
    REQUIRE(canceled.bytes > 0);
    REQUIRE(canceled.bytes < body.size());
    REQUIRE(fs::file_size(rig.temp_path) == canceled.bytes);
    REQUIRE_FALSE(fs::exists(rig.final_path));

    const auto kept = canceled.bytes;
    rig.seen.clear();
    const auto generation = rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().generation == generation);
    REQUIRE(rig.http->fetches(kUrl).back().range_start == kept);
    REQUIRE(readFile(rig.final_path) == body);
}

TEST_CASE("pause holds the transfer until resumed") {
    TaskRig rig;
    const std::string body = makeBody(32 * 1024);
    rig.http->serve(kUrl, gatedAt(body, 4096));

    const auto generation = rig.task->run();
    REQUIRE(rig.http->waitUntilParked(kUrl));
    rig.task->requestPause();
    rig.http->openGate(kUrl);

    REQUIRE(collectUntil(rig.events, rig.seen, [](const TransferEvent& e) {
        return e.kind == TransferEventKind::Status && e.status == TransferStatus::Paused;
    }));
    const auto held = fs::file_size(rig.temp_path);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(fs::file_size(rig.temp_path) == held);
    REQUIRE(rig.task->isActive());

    REQUIRE(rig.task->run() == generation);
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(readFile(rig.final_path) == body);
    REQUIRE(rig.http->fetches(kUrl).size() == 1);
}

TEST_CASE("an existing final file is not downloaded again") {
    TaskRig rig;
    writeFile(rig.final_path, "already here");

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().bytes == 12);
    REQUIRE(rig.http->probeCount() == 0);
    REQUIRE(rig.http->fetches(kUrl).empty());
}

TEST_CASE("a complete partial file is finalized on HTTP 416") {
    TaskRig rig;
    const std::string body = makeBody(3000);
    rig.http->serve(kUrl, {body});
    writeFile(rig.temp_path, body);

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);
    REQUIRE(rig.seen.back().bytes == body.size());
    REQUIRE(readFile(rig.final_path) == body);
    REQUIRE_FALSE(fs::exists(rig.temp_path));
}

TEST_CASE("progress reports are rate limited but the final chunk is always reported") {
    TaskRig rig(std::chrono::seconds(10));
    const std::string body = makeBody(16 * 1024 + 5);
    rig.http->serve(kUrl, {body});

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Finished);

    const auto progress = rig.ofKind(TransferEventKind::Progress);
    REQUIRE(progress.size() == 3);
    REQUIRE(progress[0].bytes == 0);
    REQUIRE(progress[1].bytes == body.size());
    REQUIRE(progress[2].bytes == body.size());
    REQUIRE(progress[2].size == body.size());
}

TEST_CASE("a fetch aborted by the client fails the attempt") {
    TaskRig rig;
    FakeHttpClient::Resource res;
    res.body = makeBody(2048);
    res.abort_after_head = true;
    rig.http->serve(kUrl, res);

    rig.task->run();
    REQUIRE(rig.runToEnd());
    REQUIRE(rig.seen.back().kind == TransferEventKind::Failed);
    REQUIRE(rig.seen.back().message == "Transfer aborted");
    REQUIRE_FALSE(fs::exists(rig.final_path));
}
