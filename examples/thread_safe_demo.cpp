// thread_safe_demo: many collaborators editing one canvas at once
//
// Canvas is internally synchronized: validation runs unlocked, detection
// under a shared lock, and resolution plus commit under the exclusive
// lock. Callers never manage locks themselves.
//
// Build: cmake --build build
// Run:   ./build/examples/thread_safe_demo

#include <whiteboard-ot/whiteboard_ot.hpp>

#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace wb = whiteboard_ot;

namespace {

auto make_move(const std::string& user, std::uint64_t counter, int shape) -> wb::Operation {
    auto op = wb::Operation{};
    op.id = user + "-" + std::to_string(counter);
    op.type = wb::OpType::move;
    op.element_id = "shape-" + std::to_string(shape);
    op.user_id = user;
    op.position = wb::Point{shape * 40.0 + static_cast<double>(counter % 7),
                            static_cast<double>(counter % 11) * 5.0};
    op.vector_clock = wb::VectorClock{{user, counter}};
    op.lamport_timestamp = counter;
    op.timestamp = wb::now_millis();
    return op;
}

}  // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    (void)argc;

    auto canvas = wb::Canvas{};
    canvas.set_user_priority("moderator", 10.0);

    // =========================================================================
    // Scenario 1: 50 concurrent writers on 10 shared shapes
    // =========================================================================
    std::printf("=== Scenario 1: 50 concurrent writers ===\n");

    constexpr int writers = 50;
    constexpr int ops_per_writer = 20;
    auto rejected = std::atomic<int>{0};
    const auto started = std::chrono::steady_clock::now();
    {
        auto threads = std::vector<std::jthread>{};
        for (int t = 0; t < writers; ++t) {
            threads.emplace_back([&canvas, &rejected, t] {
                const auto user = "user-" + std::to_string(t);
                for (std::uint64_t i = 1; i <= ops_per_writer; ++i) {
                    try {
                        canvas.transform(make_move(user, i, static_cast<int>((t + i) % 10)));
                    } catch (const wb::Error& e) {
                        rejected.fetch_add(1, std::memory_order_relaxed);
                        LOG(WARNING) << "rejected: " << e.what();
                    }
                    std::this_thread::sleep_for(canvas.suggested_delay() / 100);
                }
            });
        }
    }
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    const auto metrics = canvas.metrics();
    std::printf("%d writers x %d ops in %.1f ms, %d rejected\n", writers, ops_per_writer,
                elapsed, rejected.load());
    std::printf("conflicts: %llu, avg latency %.3f ms, max %.3f ms\n",
                static_cast<unsigned long long>(metrics.conflict_count),
                metrics.average_latency_ms, metrics.max_latency_ms);
    std::printf("suggested delay now %lld us\n",
                static_cast<long long>(canvas.suggested_delay().count()));

    // =========================================================================
    // Scenario 2: readers see consistent snapshots while a writer runs
    // =========================================================================
    std::printf("\n=== Scenario 2: readers + writer ===\n");

    auto stop = std::atomic<bool>{false};
    auto reads = std::atomic<int>{0};
    {
        auto writer = std::jthread{[&canvas, &stop] {
            for (std::uint64_t i = 1; i <= 200; ++i) {
                canvas.transform(make_move("writer", i, static_cast<int>(i % 10)));
            }
            stop.store(true, std::memory_order_relaxed);
        }};

        auto readers = std::vector<std::jthread>{};
        for (int r = 0; r < 8; ++r) {
            readers.emplace_back([&canvas, &stop, &reads] {
                while (!stop.load(std::memory_order_relaxed)) {
                    // read() holds the shared lock: version and states agree.
                    auto consistent = canvas.read([](const wb::TransformContext& ctx) {
                        return ctx.element_states.size() <= 10 && ctx.canvas_version > 0;
                    });
                    if (consistent) reads.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
    }
    std::printf("%d consistent reads during 200 writes\n", reads.load());

    // =========================================================================
    // Scenario 3: the merged causal history
    // =========================================================================
    std::printf("\n=== Scenario 3: vector clock ===\n");

    const auto clock = canvas.vector_clock();
    std::printf("clock has %zu nodes; writer at %llu\n", clock.size(),
                static_cast<unsigned long long>(clock.at("writer")));
    std::printf("canvas version %llu, %zu conflicts recorded\n",
                static_cast<unsigned long long>(canvas.canvas_version()),
                canvas.conflict_history().size());
    return 0;
}
