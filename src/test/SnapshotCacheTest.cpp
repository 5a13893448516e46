#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>
#include "infrastructure/SnapshotCache.hpp"
#include "TestSupport.hpp"

using namespace channelcurator;
using infrastructure::DocumentSnapshot;
using infrastructure::SnapshotCache;
using infrastructure::SnapshotRecorder;

namespace {

struct ManualClock {
    std::chrono::system_clock::time_point now = std::chrono::system_clock::time_point() + std::chrono::hours(1000);
    SnapshotCache::Clock fn() {
        return [this] { return now; };
    }
};

std::shared_ptr<DocumentSnapshot> Snapshot(const std::string& body, std::chrono::system_clock::time_point at) {
    auto s = std::make_shared<DocumentSnapshot>();
    s->body = body;
    s->originLabel = "primary";
    s->fetchedAt = at;
    return s;
}

} // namespace

void TestTtl() {
    ManualClock clock;
    SnapshotCache cache(std::chrono::seconds(60), 1024, clock.fn());
    assert(!cache.getFresh());

    bool published = cache.publish(Snapshot("one", clock.now));
    assert(published);
    assert(cache.getFresh() && cache.getFresh()->body == "one");

    clock.now += std::chrono::seconds(60);
    assert(cache.getFresh());
    clock.now += std::chrono::seconds(1);
    assert(!cache.getFresh());
    std::cout << "[PASS] Snapshot expires after the TTL" << std::endl;
}

void TestOlderSnapshotNeverWins() {
    ManualClock clock;
    SnapshotCache cache(std::chrono::seconds(600), 1024, clock.fn());
    auto newer = Snapshot("newer", clock.now);
    auto older = Snapshot("older", clock.now - std::chrono::seconds(5));
    bool first = cache.publish(newer);
    bool second = cache.publish(older);
    assert(first);
    assert(!second);
    assert(cache.getFresh()->body == "newer");
    std::cout << "[PASS] A slower, older pass cannot replace a newer snapshot" << std::endl;
}

void TestRecorder() {
    ManualClock clock;
    auto cache = std::make_shared<SnapshotCache>(std::chrono::seconds(600), 16, clock.fn());

    {
        auto recorder = std::make_shared<SnapshotRecorder>(cache, "primary");
        infrastructure::RecordingByteStream stream(std::make_unique<test::StringByteStream>("#EXTM3U\nabc\n", 4), recorder);
        while (stream.read()) {}
        recorder->commit();
    }
    assert(cache->getFresh()->body == "#EXTM3U\nabc\n");

    clock.now += std::chrono::seconds(1);
    auto overflow = std::make_shared<SnapshotRecorder>(cache, "backup");
    overflow->append("0123456789");
    overflow->append("0123456789");
    assert(overflow->overflowed());
    overflow->commit();
    assert(cache->getFresh()->originLabel == "primary");

    auto discarded = std::make_shared<SnapshotRecorder>(cache, "backup");
    discarded->append("#EXTM3U\n");
    discarded->discard();
    discarded->commit();
    assert(cache->getFresh()->originLabel == "primary");

    infrastructure::SnapshotByteStream replay(cache->getFresh(), 5);
    std::string out;
    while (auto chunk = replay.read()) {
        assert(chunk->size() <= 5);
        out += *chunk;
    }
    assert(out == "#EXTM3U\nabc\n");
    std::cout << "[PASS] Only complete, bounded recordings are published" << std::endl;
}

void TestConcurrentReaders() {
    SnapshotCache cache(std::chrono::seconds(600), 1 << 20);
    auto base = std::chrono::system_clock::now();
    cache.publish(Snapshot("v0", base));

    std::atomic<bool> stop{false};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 8; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                auto snapshot = cache.getFresh();
                assert(snapshot);
                assert(snapshot->body.size() >= 2 && snapshot->body[0] == 'v');
                ++reads;
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 1; i <= 200; ++i) {
                cache.publish(Snapshot("v" + std::to_string(i), base + std::chrono::milliseconds(i * 4 + w)));
            }
        });
    }
    for (auto& t : writers) t.join();
    stop = true;
    for (auto& t : readers) t.join();

    assert(cache.getFresh()->body == "v200");
    assert(reads > 0);
    std::cout << "[PASS] Concurrent readers always see a complete snapshot" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Snapshot Cache Test..." << std::endl;
    TestTtl();
    TestOlderSnapshotNeverWins();
    TestRecorder();
    TestConcurrentReaders();
    std::cout << "[Test] All snapshot cache tests passed." << std::endl;
    return 0;
}
