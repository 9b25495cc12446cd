#include <whiteboard-ot/conflict_detector.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace whiteboard_ot;
using nlohmann::json;

namespace {

constexpr auto now = Millis{1'700'000'000'000};

auto make_op(std::string id, OpType type, std::string element, std::string user,
             Millis timestamp) -> Operation {
    auto op = Operation{};
    op.id = std::move(id);
    op.type = type;
    op.element_id = std::move(element);
    op.vector_clock = VectorClock{{user, 1}};
    op.user_id = std::move(user);
    op.timestamp = timestamp;
    return op;
}

auto boxed(std::string id, std::string element, std::string user, Rect bounds) -> Operation {
    auto op = make_op(std::move(id), OpType::move, std::move(element), std::move(user), 0);
    op.bounds = bounds;
    return op;
}

auto ids(const std::vector<ConflictInfo>& conflicts) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& c : conflicts) result.push_back(c.id);
    return result;
}

}  // namespace

// -- Candidates -------------------------------------------------------------------

TEST(ConflictDetector, empty_queue_has_no_conflicts) {
    const auto detector = ConflictDetector{};
    const auto op = make_op("op-1", OpType::update, "e1", "alice", now);
    EXPECT_TRUE(detector.detect(op, std::vector<Operation>{}, now).empty());
}

TEST(ConflictDetector, causally_ordered_operations_do_not_conflict) {
    const auto detector = ConflictDetector{};
    auto earlier = make_op("op-1", OpType::update, "e1", "bob", now);
    auto op = make_op("op-2", OpType::update, "e1", "alice", now);
    op.vector_clock = VectorClock{{"alice", 1}, {"bob", 1}};

    EXPECT_TRUE(detector.detect(op, std::vector{earlier}, now).empty());
}

TEST(ConflictDetector, parents_and_itself_are_skipped) {
    const auto detector = ConflictDetector{};
    auto parent = make_op("op-1", OpType::update, "e1", "bob", now);
    auto op = make_op("op-2", OpType::update, "e1", "alice", now);
    op.parent_operations = {"op-1"};

    EXPECT_TRUE(detector.detect(op, std::vector{parent, op}, now).empty());
}

TEST(ConflictDetector, unknown_operations_are_not_classified) {
    const auto detector = ConflictDetector{};
    auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    auto op = make_op("op-2", OpType::unknown, "e1", "alice", now);
    op.raw_type = "laser";
    EXPECT_TRUE(detector.detect(op, std::vector{other}, now).empty());
}

// -- Temporal -------------------------------------------------------------------------

TEST(ConflictDetector, same_element_within_window_is_temporal) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    const auto op = make_op("op-2", OpType::update, "e1", "alice", now + 50);

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    const auto& c = conflicts[0];
    EXPECT_EQ(c.id, "temporal_op-2_op-1");
    EXPECT_EQ(c.type, ConflictType::temporal);
    EXPECT_EQ(c.severity, Severity::high);
    ASSERT_TRUE(c.temporal_proximity.has_value());
    EXPECT_EQ(c.temporal_proximity->time_diff_ms, 50);
    EXPECT_TRUE(c.temporal_proximity->simultaneous);
    EXPECT_EQ(c.affected_elements, (std::vector<std::string>{"e1"}));
    EXPECT_EQ(c.detected_at, now);
    EXPECT_EQ(c.vector_clock_divergence, 2u);
    ASSERT_EQ(c.operations.size(), 2u);
    EXPECT_EQ(c.operations[0].id, "op-2");
    EXPECT_EQ(c.operations[1].id, "op-1");
}

TEST(ConflictDetector, temporal_severity_drops_outside_the_simultaneous_window) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    const auto op = make_op("op-2", OpType::update, "e1", "alice", now - 500);

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].severity, Severity::medium);
    EXPECT_FALSE(conflicts[0].temporal_proximity->simultaneous);
    EXPECT_EQ(conflicts[0].temporal_proximity->time_diff_ms, 500);
}

TEST(ConflictDetector, same_element_outside_window_is_not_temporal) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    const auto op = make_op("op-2", OpType::update, "e1", "alice", now + 1000);
    EXPECT_TRUE(detector.detect(op, std::vector{other}, now).empty());
}

// -- Spatial ------------------------------------------------------------------------------

TEST(ConflictDetector, heavy_overlap_is_a_high_spatial_conflict) {
    const auto detector = ConflictDetector{};
    const auto other = boxed("op-1", "e1", "bob", {0, 0, 100, 100});
    const auto op = boxed("op-2", "e2", "alice", {10, 10, 100, 100});

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].type, ConflictType::spatial);
    EXPECT_EQ(conflicts[0].severity, Severity::high);
    ASSERT_TRUE(conflicts[0].spatial_overlap.has_value());
    EXPECT_DOUBLE_EQ(conflicts[0].spatial_overlap->area, 8100.0);
    EXPECT_NEAR(conflicts[0].spatial_overlap->percentage, 8100.0 / 11900.0, 1e-9);
    EXPECT_EQ(conflicts[0].affected_elements, (std::vector<std::string>{"e2", "e1"}));
}

TEST(ConflictDetector, partial_overlap_is_medium) {
    const auto detector = ConflictDetector{};
    const auto other = boxed("op-1", "e1", "bob", {0, 0, 100, 100});
    const auto op = boxed("op-2", "e2", "alice", {50, 0, 100, 100});

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].severity, Severity::medium);
}

TEST(ConflictDetector, proximity_without_overlap_is_low) {
    const auto detector = ConflictDetector{};
    const auto other = boxed("op-1", "e1", "bob", {0, 0, 100, 100});
    const auto op = boxed("op-2", "e2", "alice", {120, 0, 100, 100});

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].severity, Severity::low);
    EXPECT_DOUBLE_EQ(conflicts[0].spatial_overlap->distance, 20.0);
}

TEST(ConflictDetector, distant_elements_never_conflict) {
    const auto detector = ConflictDetector{};
    const auto other = boxed("op-1", "e1", "bob", {0, 0, 100, 100});
    const auto op = boxed("op-2", "e2", "alice", {200, 0, 100, 100});
    EXPECT_TRUE(detector.detect(op, std::vector{other}, now).empty());
}

TEST(ConflictDetector, positions_alone_use_point_distance) {
    const auto detector = ConflictDetector{};
    auto other = make_op("op-1", OpType::move, "e1", "bob", 0);
    other.position = Point{0, 0};
    auto op = make_op("op-2", OpType::move, "e2", "alice", 0);
    op.position = Point{18, 24};

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].severity, Severity::medium);
    EXPECT_DOUBLE_EQ(conflicts[0].spatial_overlap->distance, 30.0);
}

// -- Semantic ------------------------------------------------------------------------------

TEST(ConflictDetector, delete_against_update_is_semantic_high) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::del, "e1", "bob", now);
    const auto op = make_op("op-2", OpType::update, "e1", "alice", now + 5000);

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].type, ConflictType::semantic);
    EXPECT_EQ(conflicts[0].severity, Severity::high);
    EXPECT_EQ(conflicts[0].semantic->incompatible_changes,
              (std::vector<std::string>{"delete-update-conflict"}));
}

TEST(ConflictDetector, every_type_against_delete_is_semantic) {
    const auto detector = ConflictDetector{};
    for (auto type : {OpType::create, OpType::update, OpType::move, OpType::style, OpType::resize,
                      OpType::rotate, OpType::reorder}) {
        const auto other = make_op("op-1", OpType::del, "e1", "bob", now);
        const auto op = make_op("op-2", type, "e1", "alice", now + 5000);
        const auto conflicts = detector.detect(op, std::vector{other}, now);
        EXPECT_TRUE(std::ranges::any_of(conflicts, [](const ConflictInfo& c) {
            return c.type == ConflictType::semantic;
        })) << to_string_view(type);
    }
}

TEST(ConflictDetector, duplicate_create_is_semantic_high) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::create, "e1", "bob", now);
    const auto op = make_op("op-2", OpType::create, "e1", "alice", now + 5000);

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].severity, Severity::high);
    EXPECT_EQ(conflicts[0].semantic->incompatible_changes,
              (std::vector<std::string>{"duplicate-create"}));
}

TEST(ConflictDetector, differing_data_and_style_keys_are_reported) {
    const auto detector = ConflictDetector{};
    auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    other.data = {{"width", 100}, {"label", "same"}};
    other.style = json{{"color", "blue"}};
    auto op = make_op("op-2", OpType::update, "e1", "alice", now + 5000);
    op.data = {{"width", 120}, {"label", "same"}};
    op.style = json{{"color", "red"}};

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    const auto& semantic = *conflicts[0].semantic;
    EXPECT_EQ(conflicts[0].severity, Severity::medium);
    EXPECT_EQ(semantic.incompatible_changes,
              (std::vector<std::string>{"style-property-conflict", "data-property-conflict"}));
    EXPECT_EQ(semantic.data_conflicts["width"], (json{{"first", 120}, {"second", 100}}));
    EXPECT_EQ(semantic.data_conflicts["style.color"], (json{{"first", "red"}, {"second", "blue"}}));
    EXPECT_FALSE(semantic.data_conflicts.contains("label"));
}

TEST(ConflictDetector, disjoint_data_keys_are_not_semantic) {
    const auto detector = ConflictDetector{};
    auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    other.data = {{"width", 100}};
    auto op = make_op("op-2", OpType::update, "e1", "alice", now + 5000);
    op.data = {{"height", 50}};
    EXPECT_TRUE(detector.detect(op, std::vector{other}, now).empty());
}

// -- Ordering and escalation -------------------------------------------------------------------

TEST(ConflictDetector, results_are_sorted_by_severity) {
    const auto detector = ConflictDetector{};
    auto neighbour = boxed("op-1", "e9", "carol", {120, 0, 100, 100});
    auto same = boxed("op-3", "e1", "bob", {0, 0, 100, 100});
    same.timestamp = 10;
    auto op = boxed("op-2", "e1", "alice", {0, 0, 100, 100});
    op.timestamp = 20;

    const auto conflicts = detector.detect(op, std::vector{neighbour, same}, now);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].type, ConflictType::temporal);
    EXPECT_EQ(conflicts[0].severity, Severity::high);
    EXPECT_EQ(conflicts[1].type, ConflictType::spatial);
    EXPECT_EQ(conflicts[1].severity, Severity::low);
}

TEST(ConflictDetector, crowded_elements_escalate_severity) {
    const auto detector = ConflictDetector{};
    auto queue = std::vector<Operation>{};
    for (int i = 0; i < 3; ++i) {
        auto other = make_op("op-" + std::to_string(i), OpType::update, "e1",
                             "user-" + std::to_string(i), now + i * 10'000);
        other.data = {{"width", i}};
        queue.push_back(other);
    }
    auto op = make_op("mine", OpType::update, "e1", "alice", now + 100'000);
    op.data = {{"width", 99}};

    const auto crowded = detector.detect(op, queue, now);
    ASSERT_EQ(crowded.size(), 3u);
    for (const auto& c : crowded) EXPECT_EQ(c.severity, Severity::high);

    queue.pop_back();
    const auto calm = detector.detect(op, queue, now);
    ASSERT_EQ(calm.size(), 2u);
    for (const auto& c : calm) EXPECT_EQ(c.severity, Severity::medium);
}

TEST(ConflictDetector, severity_escalates_at_most_to_critical) {
    EXPECT_EQ(escalate(Severity::low), Severity::medium);
    EXPECT_EQ(escalate(Severity::high), Severity::critical);
    EXPECT_EQ(escalate(Severity::critical), Severity::critical);
}

// -- Compound and batch ----------------------------------------------------------------------------

TEST(ConflictDetector, compound_is_reported_as_a_whole) {
    const auto detector = ConflictDetector{};
    auto other = boxed("op-1", "e2", "bob", {0, 0, 50, 50});
    auto op = make_op("cmp-1", OpType::compound, "e1", "alice", 0);
    op.data = {{"moves", {{"x", 10}, {"y", 10}}}, {"rotation", 15}};

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].id, "spatial_cmp-1_op-1");
    EXPECT_EQ(conflicts[0].operations[0].type, OpType::compound);
    EXPECT_EQ(conflicts[0].operations[0].data, op.data);
}

TEST(ConflictDetector, batch_entries_are_reported_individually) {
    const auto detector = ConflictDetector{};
    const auto other = make_op("op-1", OpType::del, "e2", "bob", now);
    auto op = make_op("b1", OpType::batch, "", "alice", now + 5000);
    op.data = {{"operations",
                json::array({
                    {{"id", "b1-a"}, {"type", "update"}, {"elementId", "e1"}},
                    {{"id", "b1-b"}, {"type", "update"}, {"elementId", "e2"}},
                })}};

    const auto conflicts = detector.detect(op, std::vector{other}, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].id, "semantic_b1-b_op-1");
    EXPECT_EQ(conflicts[0].operations[0].id, "b1-b");
    EXPECT_EQ(conflicts[0].operations[0].type, OpType::update);
}

TEST(ConflictDetector, classify_ignores_clocks) {
    const auto detector = ConflictDetector{};
    auto a = make_op("op-1", OpType::update, "e1", "alice", now);
    auto b = make_op("op-2", OpType::del, "e1", "alice", now + 5000);
    b.vector_clock = VectorClock{{"alice", 2}};

    const auto conflicts = detector.classify(b, a, now);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].type, ConflictType::semantic);
    EXPECT_EQ(conflicts[0].vector_clock_divergence, 0u);
}

// -- Large candidate sets ----------------------------------------------------------------------------

TEST(ConflictDetector, parallel_classification_matches_sequential) {
    auto config = EngineConfig{};
    config.parallel_detection_threshold = 4;
    const auto parallel = ConflictDetector{config};
    const auto sequential = ConflictDetector{};

    auto queue = std::vector<Operation>{};
    for (int i = 0; i < 64; ++i) {
        auto other = make_op("op-" + std::to_string(i), OpType::update, "e1",
                             "user-" + std::to_string(i), now + i * 10'000);
        other.data = {{"width", i}};
        queue.push_back(other);
    }
    auto op = make_op("mine", OpType::update, "e1", "alice", now + 1'000'000);
    op.data = {{"width", -1}};

    const auto a = parallel.detect(op, queue, now);
    const auto b = sequential.detect(op, queue, now);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(ids(a), ids(b));
}

TEST(ConflictDetector, an_operation_in_two_sources_is_compared_once) {
    const auto detector = ConflictDetector{};
    auto queue = OperationIndex{};
    auto pending = OperationIndex{};
    const auto other = make_op("op-1", OpType::update, "e1", "bob", now);
    queue.insert(other);
    pending.insert(other);
    const auto op = make_op("op-2", OpType::update, "e1", "alice", now);

    EXPECT_EQ(detector.detect(op, {&queue, &pending}, now).size(), 1u);
}
