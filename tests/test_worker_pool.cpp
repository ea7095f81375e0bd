#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/runtime/thread_safe_queue.h>
#include <dcarchive/runtime/worker_pool.h>
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dcarchive;

TEST_CASE("ThreadSafeQueue - close drains remaining items") {
    ThreadSafeQueue<int> queue;
    CHECK(queue.push(1));
    CHECK(queue.push(2));
    CHECK(queue.size() == 2);

    queue.close();
    CHECK_FALSE(queue.push(3));

    int value = 0;
    CHECK(queue.wait_and_pop(value));
    CHECK(value == 1);
    CHECK(queue.try_pop(value));
    CHECK(value == 2);
    CHECK_FALSE(queue.wait_and_pop(value));
    CHECK(queue.empty());
}

TEST_CASE("WorkerPool - futures carry results") {
    WorkerPool pool(4);
    CHECK(pool.size() == 4);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 50; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 50; ++i) {
        CHECK(results[i].get() == i * i);
    }
}

TEST_CASE("WorkerPool - a throwing job does not affect the others") {
    WorkerPool pool(2);
    std::atomic<int> completed{0};

    auto bad = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    std::vector<std::future<void>> good;
    for (int i = 0; i < 10; ++i) {
        good.push_back(pool.submit([&completed]() { ++completed; }));
    }

    CHECK_THROWS_AS(bad.get(), std::runtime_error);
    for (auto &f : good) f.get();
    CHECK(completed.load() == 10);
}

TEST_CASE("WorkerPool - shutdown finishes queued jobs") {
    std::atomic<int> completed{0};
    WorkerPool pool(1);
    for (int i = 0; i < 5; ++i) {
        pool.submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++completed;
        });
    }
    pool.shutdown();
    CHECK(completed.load() == 5);

    // Idempotent
    pool.shutdown();
    CHECK_THROWS_AS(pool.submit([]() { return 1; }), std::runtime_error);
}

TEST_CASE("WorkerPool - zero threads is rejected") {
    CHECK_THROWS_AS(WorkerPool(0), std::invalid_argument);
}
