#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <thread>
#include <vector>

#include <spdlog/cfg/env.h>

#include "lfq/bounded_queue.hpp"
#include "lfq/unbounded_queue.hpp"

// Work-queue demo: producers hand vector batches to workers through a bounded
// queue; workers post their partial sums to a collector over an unbounded queue.
int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    const int batches = argc > 1 ? std::atoi(argv[1]) : 1000;
    const int workers = argc > 2 ? std::atoi(argv[2]) : 3;
    if (batches < 1 || workers < 1) {
        std::cerr << "usage: cpu_demo [batches >= 1] [workers >= 1]\n";
        return 1;
    }

    lfq::BoundedQueue<std::vector<int>> jobs(64);
    lfq::UnboundedQueue<std::int64_t> results;
    std::atomic<bool> done{false};

    std::thread prod([&] {
        for (int i = 0; i < batches; ++i) {
            std::vector<int> batch(8, i);
            lfq::Backoff backoff;
            while (!jobs.try_push(std::move(batch))) backoff.snooze();
        }
        done.store(true);
    });

    std::vector<std::thread> pool;
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([&] {
            std::vector<int> batch;
            for (;;) {
                if (jobs.try_pop(batch)) {
                    results.push(std::accumulate(batch.begin(), batch.end(), std::int64_t{0}));
                } else if (done.load() && jobs.empty()) {
                    break;
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }

    prod.join();
    for (auto& th : pool) th.join();

    std::int64_t total = 0;
    int drained = 0;
    while (auto sum = results.try_pop()) {
        total += *sum;
        ++drained;
    }

    const std::int64_t expected = 8 * static_cast<std::int64_t>(batches - 1) * batches / 2;
    std::cout << "Drained batches: " << drained << "\n"
              << "Total: " << total << " (expected " << expected << ")\n";
    return (drained == batches && total == expected) ? 0 : 1;
}
