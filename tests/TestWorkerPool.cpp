#include "common/WorkerPool.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using gridpilot::WorkerPool;

int main() {
    {
        WorkerPool pool(3);
        assert(pool.size() == 3);

        std::atomic<int> counter{0};
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 50; ++i) {
            futures.push_back(pool.submit([&counter]() { ++counter; }));
        }
        for (auto& f : futures) {
            f.get();
        }
        assert(counter.load() == 50);
    }

    {
        WorkerPool pool(1);
        auto f = pool.submit([]() { throw std::runtime_error("boom"); });
        bool thrown = false;
        try {
            f.get();
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    {
        WorkerPool pool(0);
        assert(pool.size() == 1);
        pool.shutdown();
        pool.shutdown();

        bool rejected = false;
        try {
            pool.submit([]() {});
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        assert(rejected);
    }

    std::cout << "[TEST] WorkerPool PASSED\n";
    return 0;
}
