// whiteboard-ot benchmarks: measures throughput of the transform pipeline.

#include <whiteboard-ot/whiteboard_ot.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace whiteboard_ot;

static auto make_op(std::int64_t i, const std::string& user, std::uint64_t counter) -> Operation {
    auto op = Operation{};
    op.id = user + "-" + std::to_string(i);
    op.type = OpType::move;
    op.element_id = "shape-" + std::to_string(i % 64);
    op.position = Point{static_cast<double>((i % 64) * 120), static_cast<double>((i / 64) % 40 * 120)};
    op.user_id = user;
    op.vector_clock = VectorClock{{user, counter}};
    op.lamport_timestamp = counter;
    op.timestamp = now_millis();
    return op;
}

// Fill a queue with operations from a user the incoming operations never see.
static auto make_queue(std::int64_t n) -> OperationIndex {
    auto queue = OperationIndex{};
    for (std::int64_t i = 0; i < n; ++i) {
        queue.insert(make_op(i, "remote", static_cast<std::uint64_t>(i + 1)));
    }
    return queue;
}

// =============================================================================
// Conflict detection
// =============================================================================

static void bm_detect(benchmark::State& state) {
    const auto queue = make_queue(state.range(0));
    const auto detector = ConflictDetector{};
    const auto incoming = make_op(7, "local", 1);
    for (auto _ : state) {
        auto conflicts = detector.detect(incoming, {&queue});
        benchmark::DoNotOptimize(conflicts);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_detect)->Range(64, 10000);

// =============================================================================
// Transform
// =============================================================================

static void bm_transform_sequential(benchmark::State& state) {
    auto engine = Engine{};
    auto ctx = engine.create_context();
    std::uint64_t counter = 0;
    for (auto _ : state) {
        ++counter;
        auto result = engine.transform(
            make_op(static_cast<std::int64_t>(counter), "alice", counter), ctx);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_sequential);

static void bm_transform_against_queue(benchmark::State& state) {
    auto engine = Engine{};
    auto ctx = engine.create_context();
    ctx.operation_queue = make_queue(state.range(0));
    std::uint64_t counter = 0;
    for (auto _ : state) {
        ++counter;
        auto result = engine.transform(
            make_op(static_cast<std::int64_t>(counter), "alice", counter), ctx);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_against_queue)->Range(64, 4096);

static void bm_canvas_transform_threaded(benchmark::State& state) {
    static auto* canvas = new Canvas{};
    const auto user = "user-" + std::to_string(state.thread_index());
    std::uint64_t counter = 0;
    for (auto _ : state) {
        ++counter;
        auto result = canvas->transform(
            make_op(static_cast<std::int64_t>(counter), user, counter));
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_canvas_transform_threaded)->Threads(1)->Threads(4)->Threads(16)->UseRealTime();

// =============================================================================
// Compression
// =============================================================================

static void bm_compress(benchmark::State& state) {
    auto ops = std::vector<Operation>{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        ops.push_back(make_op(i, "alice", static_cast<std::uint64_t>(i + 1)));
    }
    for (auto _ : state) {
        auto compressed = compress(ops);
        benchmark::DoNotOptimize(compressed);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_compress)->Range(16, 4096);

// =============================================================================
// JSON
// =============================================================================

static void bm_parse_operation(benchmark::State& state) {
    const auto text = nlohmann::json(make_op(1, "alice", 1)).dump();
    for (auto _ : state) {
        auto op = parse_operation(text);
        benchmark::DoNotOptimize(op);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_operation);

BENCHMARK_MAIN();
