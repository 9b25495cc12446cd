// basic_usage: demonstrates the core whiteboard-ot API
//
// Shows operations decoded from JSON, a transform with no conflict, a
// concurrent edit resolved automatically, a manual conflict closed by a
// moderator, and compression of the pending queue.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <whiteboard-ot/whiteboard_ot.hpp>

#include <glog/logging.h>

#include <cstdio>
#include <string>

namespace wb = whiteboard_ot;

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    (void)argc;

    auto canvas = wb::Canvas{};
    const auto now = wb::now_millis();

    // -- Operations arrive as JSON from clients -------------------------------
    auto create = wb::parse_operation(R"({
        "id": "alice-1", "type": "create", "elementId": "rect-1",
        "elementType": "rectangle", "userId": "alice",
        "bounds": {"x": 100, "y": 100, "width": 80, "height": 40},
        "style": {"fill": "white"},
        "vectorClock": {"alice": 1}
    })");
    create.timestamp = now;

    auto result = canvas.transform(create);
    std::printf("create: %zu conflicts, canvas version %llu\n", result.conflicts.size(),
                static_cast<unsigned long long>(canvas.canvas_version()));

    // -- Two users restyle the same element concurrently ----------------------
    auto alice_style = wb::Operation{};
    alice_style.id = "alice-2";
    alice_style.type = wb::OpType::style;
    alice_style.element_id = "rect-1";
    alice_style.user_id = "alice";
    alice_style.style = nlohmann::json{{"fill", "red"}};
    alice_style.vector_clock = wb::VectorClock{{"alice", 2}};
    alice_style.timestamp = now + 10;

    auto bob_style = alice_style;
    bob_style.id = "bob-1";
    bob_style.user_id = "bob";
    bob_style.style = nlohmann::json{{"fill", "blue"}};
    bob_style.vector_clock = wb::VectorClock{{"alice", 1}, {"bob", 1}};
    bob_style.timestamp = now + 20;

    canvas.transform(alice_style);
    result = canvas.transform(bob_style);
    for (const auto& conflict : result.conflicts) {
        std::printf("conflict %s: %s / %s\n", conflict.id.c_str(),
                    std::string{wb::to_string_view(conflict.type)}.c_str(),
                    std::string{wb::to_string_view(conflict.severity)}.c_str());
    }
    std::printf("fill is now %s\n", canvas.element_state("rect-1")->style["fill"].dump().c_str());

    // -- Per-call strategy: leave the decision to a moderator -----------------
    auto carol_move = wb::Operation{};
    carol_move.id = "carol-1";
    carol_move.type = wb::OpType::move;
    carol_move.element_id = "rect-1";
    carol_move.user_id = "carol";
    carol_move.position = wb::Point{300, 120};
    carol_move.vector_clock = wb::VectorClock{{"carol", 1}};
    carol_move.timestamp = now + 30;

    result = canvas.transform(carol_move, wb::TransformOptions{wb::Strategy::manual});
    for (const auto& open : canvas.active_conflicts()) {
        std::printf("open conflict %s, moderator keeps carol's move\n", open.id.c_str());
        canvas.resolve_conflict(open.id, carol_move);
    }

    // -- History and metrics ---------------------------------------------------
    for (const auto& record : canvas.conflict_history()) {
        std::printf("history: %-32s %-16s %s\n", record.conflict.id.c_str(),
                    record.strategy.c_str(), std::string{wb::to_string_view(record.status)}.c_str());
    }

    const auto pending = canvas.drain_pending();
    std::printf("pending queue compressed to %zu operation(s)\n", pending.size());

    std::printf("metrics: %s\n", nlohmann::json(canvas.metrics()).dump(2).c_str());
    std::printf("element: %s\n", nlohmann::json(*canvas.element_state("rect-1")).dump(2).c_str());
    return 0;
}
