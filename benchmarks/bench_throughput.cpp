// benchmarks/bench_throughput.cpp: MPMC throughput and pop latency for both lfq queues

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/cfg/env.h>

#include "lfq/bounded_queue.hpp"
#include "lfq/unbounded_queue.hpp"

using SteadyClock = std::chrono::steady_clock;

static std::uint64_t parse_u64(const char* s, std::uint64_t def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<std::uint64_t>(v) : def;
}

struct Cfg {
    std::uint64_t items_per_producer = 1'000'000;
    int producers = 2;
    int consumers = 2;
    std::size_t capacity = 1u << 14;
    int batch = 32;
    bool unbounded = false;
};

// Queue-kind adapters: push returns false only when a bounded queue is full.
struct BoundedBench {
    lfq::BoundedQueue<std::uint32_t> q;
    explicit BoundedBench(const Cfg& cfg) : q(cfg.capacity) {}
    std::size_t push_many(const std::uint32_t* data, std::size_t n) { return q.try_push_many(data, n); }
    std::size_t pop_many(std::uint32_t* out, std::size_t n) { return q.try_pop_many(out, n); }
    bool pop(std::uint32_t& out) { return q.try_pop(out); }
};

struct UnboundedBench {
    lfq::UnboundedQueue<std::uint32_t> q;
    explicit UnboundedBench(const Cfg&) {}
    std::size_t push_many(const std::uint32_t* data, std::size_t n) {
        for (std::size_t i = 0; i < n; ++i) q.push(data[i]);
        return n;
    }
    std::size_t pop_many(std::uint32_t* out, std::size_t n) {
        std::size_t got = 0;
        while (got < n && q.try_pop(out[got])) ++got;
        return got;
    }
    bool pop(std::uint32_t& out) { return q.try_pop(out); }
};

template <class Bench>
static int run(const Cfg& cfg) {
    Bench q(cfg);

    std::atomic<bool> go{false};
    const std::uint64_t TOTAL_ITEMS = cfg.items_per_producer * static_cast<std::uint64_t>(cfg.producers);
    std::atomic<std::uint64_t> consumed{0};

    // Latency reservoir (ns) for p50/p95/p99
    std::atomic<std::uint64_t> lat_samples_count{0};
    constexpr std::size_t LAT_RESERVOIR = 4096;
    std::vector<std::uint32_t> lat_ns(LAT_RESERVOIR);

    // -------- Producers --------
    std::vector<std::thread> producers;
    producers.reserve(static_cast<std::size_t>(cfg.producers));
    for (int p = 0; p < cfg.producers; ++p) {
        producers.emplace_back([&, p] {
            while (!go.load(std::memory_order_acquire)) {}

            const std::uint64_t base = static_cast<std::uint64_t>(p) * cfg.items_per_producer;
            std::vector<std::uint32_t> buf;
            buf.reserve(static_cast<std::size_t>(cfg.batch));

            auto flush = [&]() {
                std::size_t placed = 0;
                lfq::Backoff backoff;
                while (placed < buf.size()) {
                    const std::size_t did = q.push_many(buf.data() + placed, buf.size() - placed);
                    placed += did;
                    if (did == 0) backoff.snooze(); else backoff.reset();
                }
                buf.clear();
            };

            for (std::uint64_t i = 0; i < cfg.items_per_producer; ++i) {
                buf.push_back(static_cast<std::uint32_t>(base + i));
                if (static_cast<int>(buf.size()) == cfg.batch) flush();
            }
            if (!buf.empty()) flush();
        });
    }

    // -------- Consumers --------
    std::vector<std::thread> consumers;
    consumers.reserve(static_cast<std::size_t>(cfg.consumers));
    for (int c = 0; c < cfg.consumers; ++c) {
        consumers.emplace_back([&] {
            while (!go.load(std::memory_order_acquire)) {}

            std::vector<std::uint32_t> outbuf(static_cast<std::size_t>(cfg.batch));
            std::uint64_t sample_token = 0;

            for (;;) {
                // latency sample (single-item pop occasionally)
                if ((++sample_token & 0x3FFu) == 0u) {
                    std::uint32_t x{};
                    auto t0 = SteadyClock::now();
                    bool ok = q.pop(x);
                    auto t1 = SteadyClock::now();
                    if (ok) {
                        const auto ns = static_cast<std::uint64_t>(
                            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
                        const std::uint64_t idx = lat_samples_count.fetch_add(1, std::memory_order_relaxed);
                        if (idx < LAT_RESERVOIR) lat_ns[static_cast<std::size_t>(idx)] = static_cast<std::uint32_t>(ns);
                        if (consumed.fetch_add(1, std::memory_order_relaxed) + 1 >= TOTAL_ITEMS) break;
                        continue;
                    }
                }

                const std::size_t got = q.pop_many(outbuf.data(), outbuf.size());
                if (got) {
                    if (consumed.fetch_add(got, std::memory_order_relaxed) + got >= TOTAL_ITEMS) break;
                    continue;
                }
                if (consumed.load(std::memory_order_relaxed) >= TOTAL_ITEMS) break;
                LFQ_PAUSE();
            }
        });
    }

    // -------- Start & timing --------
    auto t0 = SteadyClock::now();
    go.store(true, std::memory_order_release);

    for (auto& th : producers) th.join();
    for (auto& th : consumers) th.join();
    auto t1 = SteadyClock::now();

    // -------- Results --------
    const std::size_t nlat = static_cast<std::size_t>(
        std::min<std::uint64_t>(lat_samples_count.load(std::memory_order_relaxed), LAT_RESERVOIR));

    const double secs = std::chrono::duration<double>(t1 - t0).count();
    const double ops = static_cast<double>(TOTAL_ITEMS);
    const double ops_per_s = (secs > 0.0) ? (ops / secs) : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Results:\n"
              << "  elapsed (s): " << secs << "\n"
              << "  total ops :  " << ops << "\n"
              << "  throughput:  " << (ops_per_s / 1e6) << " Mops/s\n";

    if (nlat >= 8) {
        std::vector<std::uint32_t> v(lat_ns.begin(), lat_ns.begin() + static_cast<std::ptrdiff_t>(nlat));
        auto pct = [&](double p) -> std::uint32_t {
            const double idxd = std::clamp((p / 100.0) * (nlat - 1.0), 0.0, static_cast<double>(nlat - 1));
            const auto k = static_cast<std::ptrdiff_t>(idxd);
            std::nth_element(v.begin(), v.begin() + k, v.end());
            return v[static_cast<std::size_t>(k)];
        };
        const auto p50 = pct(50), p95 = pct(95), p99 = pct(99);
        std::cout << "  latency p50/p95/p99 (ns): " << p50 << " / " << p95 << " / " << p99 << "\n";
    }

    return 0;
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    // Args: [items_per_producer] [num_producers] [num_consumers] [queue_capacity] [batch] [bounded|unbounded]
    Cfg cfg;
    cfg.items_per_producer = parse_u64(argc > 1 ? argv[1] : nullptr, cfg.items_per_producer);
    cfg.producers          = static_cast<int>(parse_u64(argc > 2 ? argv[2] : nullptr, static_cast<std::uint64_t>(cfg.producers)));
    cfg.consumers          = static_cast<int>(parse_u64(argc > 3 ? argv[3] : nullptr, static_cast<std::uint64_t>(cfg.consumers)));
    cfg.capacity           = static_cast<std::size_t>(parse_u64(argc > 4 ? argv[4] : nullptr, cfg.capacity));
    cfg.batch              = static_cast<int>(parse_u64(argc > 5 ? argv[5] : nullptr, static_cast<std::uint64_t>(cfg.batch)));
    cfg.unbounded          = argc > 6 && std::strcmp(argv[6], "unbounded") == 0;

    if (cfg.producers < 1 || cfg.consumers < 1 || cfg.batch < 1 || cfg.capacity < 1) {
        std::cerr << "producers, consumers, batch and capacity must all be >= 1\n";
        return 1;
    }

    std::cout << "Benchmark config:\n"
              << "  queue              = " << (cfg.unbounded ? "unbounded" : "bounded") << "\n"
              << "  items_per_producer = " << cfg.items_per_producer << "\n"
              << "  producers          = " << cfg.producers << "\n"
              << "  consumers          = " << cfg.consumers << "\n"
              << "  queue_capacity     = " << cfg.capacity << "\n"
              << "  batch              = " << cfg.batch << "\n";

    return cfg.unbounded ? run<UnboundedBench>(cfg) : run<BoundedBench>(cfg);
}
