#include <whiteboard-ot/conflict_resolver.hpp>
#include <whiteboard-ot/error.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace whiteboard_ot;
using nlohmann::json;

namespace {

auto make_op(std::string id, std::string user, std::uint64_t lamport) -> Operation {
    auto op = Operation{};
    op.id = std::move(id);
    op.type = OpType::update;
    op.element_id = "e1";
    op.vector_clock = VectorClock{{user, lamport}};
    op.user_id = std::move(user);
    op.lamport_timestamp = lamport;
    return op;
}

auto conflict_of(ConflictType type, std::vector<Operation> ops) -> ConflictInfo {
    auto c = ConflictInfo{};
    c.id = "c1";
    c.type = type;
    c.severity = Severity::medium;
    c.operations = std::move(ops);
    return c;
}

}  // namespace

// -- Empty conflicts -------------------------------------------------------------

TEST(Resolve, every_strategy_rejects_an_empty_conflict) {
    const auto empty = conflict_of(ConflictType::temporal, {});
    for (auto strategy : {Strategy::merge, Strategy::last_writer_wins, Strategy::priority_user,
                          Strategy::manual}) {
        try {
            (void)resolve(strategy, empty, {});
            FAIL() << "expected Error for " << to_string_view(strategy);
        } catch (const Error& e) {
            EXPECT_EQ(e.kind, ErrorKind::empty_conflict);
            EXPECT_EQ(e.message, "Cannot resolve conflict with no operations");
        }
    }
}

TEST(Resolve, aggregation_helpers_reject_empty_input) {
    EXPECT_THROW((void)merge_operations({}), Error);
    EXPECT_THROW((void)last_writer({}), Error);
    EXPECT_THROW((void)highest_priority({}, {}), Error);
}

// -- Priority user --------------------------------------------------------------------

TEST(Resolve, priority_user_with_one_operation_returns_it_unchanged) {
    const auto only = make_op("op-1", "alice", 4);
    const auto resolution = resolve(Strategy::priority_user,
                                    conflict_of(ConflictType::temporal, {only}), {});
    ASSERT_TRUE(resolution.outcome.has_value());
    EXPECT_EQ(*resolution.outcome, only);
    EXPECT_EQ(resolution.outcome->user_id, "alice");
}

TEST(Resolve, priority_user_prefers_the_heaviest_user) {
    const auto alice = make_op("op-1", "alice", 9);
    const auto bob = make_op("op-2", "bob", 1);
    const auto priorities = UserPriorities{{"alice", 1.0}, {"bob", 5.0}};

    const auto resolution = resolve(Strategy::priority_user,
                                    conflict_of(ConflictType::temporal, {alice, bob}), priorities);
    EXPECT_EQ(resolution.outcome->id, "op-2");
    EXPECT_EQ(resolution.resolver, "priority-user");
}

TEST(Resolve, priority_user_falls_back_to_the_last_writer) {
    const auto alice = make_op("op-1", "alice", 9);
    const auto bob = make_op("op-2", "bob", 1);
    EXPECT_EQ(highest_priority({alice, bob}, {}).id, "op-1");
    EXPECT_EQ(highest_priority({alice, bob}, {{"alice", 2.0}, {"bob", 2.0}}).id, "op-1");
}

// -- Last writer wins -----------------------------------------------------------------

TEST(Resolve, last_writer_has_the_highest_lamport_timestamp) {
    const auto a = make_op("op-1", "zed", 3);
    const auto b = make_op("op-2", "amy", 7);
    EXPECT_EQ(last_writer({a, b}).id, "op-2");
    EXPECT_EQ(last_writer({b, a}).id, "op-2");
}

TEST(Resolve, last_writer_ties_break_on_user_id) {
    const auto a = make_op("op-1", "amy", 5);
    const auto b = make_op("op-2", "zed", 5);
    EXPECT_EQ(last_writer({a, b}).id, "op-2");
    EXPECT_EQ(last_writer({b, a}).id, "op-2");
}

// -- Merge ------------------------------------------------------------------------------

TEST(Resolve, merge_overlays_fields_in_writer_order) {
    auto first = make_op("op-1", "alice", 2);
    first.data = {{"width", 100}, {"label", "a"}};
    first.style = json{{"color", "blue"}};
    auto second = make_op("op-2", "bob", 5);
    second.data = {{"width", 120}};
    second.position = Point{150, 150};

    const auto merged = merge_operations({second, first});
    EXPECT_EQ(merged.id, "op-2");
    EXPECT_EQ(merged.data, (json{{"width", 120}, {"label", "a"}}));
    ASSERT_TRUE(merged.style.has_value());
    EXPECT_EQ(*merged.style, (json{{"color", "blue"}}));
    EXPECT_EQ(merged.position, (Point{150, 150}));
    EXPECT_EQ(merged.lamport_timestamp, 5u);
    EXPECT_EQ(merged.vector_clock, (VectorClock{{"alice", 2}, {"bob", 5}}));
}

TEST(Resolve, merge_of_different_elements_keeps_the_last_writer) {
    auto anchor = make_op("op-1", "alice", 2);
    anchor.bounds = Rect{0, 0, 100, 100};
    auto moved = make_op("op-2", "bob", 5);
    moved.element_id = "e2";
    moved.position = Point{60, 60};
    moved.bounds = Rect{60, 60, 100, 100};

    const auto merged = merge_operations({moved, anchor});
    EXPECT_EQ(merged, moved);

    const auto resolution =
        resolve(Strategy::merge, conflict_of(ConflictType::spatial, {anchor, moved}), {});
    ASSERT_TRUE(resolution.outcome.has_value());
    EXPECT_EQ(resolution.outcome->element_id, "e2");
    EXPECT_EQ(resolution.outcome->bounds, (Rect{60, 60, 100, 100}));
}

TEST(Resolve, manual_leaves_the_conflict_open) {
    const auto resolution = resolve(Strategy::manual,
                                    conflict_of(ConflictType::semantic,
                                                {make_op("op-1", "alice", 1)}),
                                    {});
    EXPECT_FALSE(resolution.outcome.has_value());
    EXPECT_EQ(resolution.confidence, 0.0);
    EXPECT_EQ(resolution.resolver, "manual");
}

// -- Strategy names -------------------------------------------------------------------

TEST(Strategy, names_round_trip) {
    for (auto s : {Strategy::merge, Strategy::last_writer_wins, Strategy::priority_user,
                   Strategy::manual}) {
        EXPECT_EQ(parse_strategy(to_string_view(s)), s);
    }
    EXPECT_EQ(to_string_view(Strategy::last_writer_wins), "last-writer-wins");
    EXPECT_FALSE(parse_strategy("coin-flip").has_value());
}

// -- Defaults and confidence -------------------------------------------------------------

TEST(DefaultStrategy, follows_the_conflict_type) {
    const auto config = EngineConfig{};
    auto c = conflict_of(ConflictType::spatial, {make_op("op-1", "alice", 1)});
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::last_writer_wins);

    c.type = ConflictType::temporal;
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::last_writer_wins);
    EXPECT_EQ(default_strategy(c, {{"alice", 1.0}}, config), Strategy::priority_user);

    c.type = ConflictType::semantic;
    c.severity = Severity::medium;
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::merge);
    c.severity = Severity::high;
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::last_writer_wins);

    c.type = ConflictType::concurrent_modification;
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::merge);
}

TEST(DefaultStrategy, overrides_take_precedence) {
    auto config = EngineConfig{};
    config.strategy_overrides[ConflictType::spatial] = Strategy::manual;
    const auto c = conflict_of(ConflictType::spatial, {make_op("op-1", "alice", 1)});
    EXPECT_EQ(default_strategy(c, {}, config), Strategy::manual);
}

TEST(ResolutionConfidence, rewards_simple_and_merged_outcomes) {
    const auto a = make_op("op-1", "alice", 1);
    auto b = make_op("op-2", "bob", 2);
    b.data = {{"width", 1}};

    const auto temporal = conflict_of(ConflictType::temporal, {a, b});
    EXPECT_DOUBLE_EQ(resolve(Strategy::last_writer_wins, temporal, {}).confidence, 0.8);

    const auto spatial = conflict_of(ConflictType::spatial, {a, b});
    EXPECT_DOUBLE_EQ(resolve(Strategy::merge, spatial, {}).confidence, 0.7);
    EXPECT_DOUBLE_EQ(resolve(Strategy::last_writer_wins, spatial, {}).confidence, 0.5);
}

TEST(ResolutionConfidence, penalizes_tangled_semantic_conflicts) {
    auto c = conflict_of(ConflictType::semantic, {make_op("op-1", "alice", 1)});
    c.semantic = SemanticDetail{{"delete-update-conflict", "style-property-conflict",
                                 "data-property-conflict"},
                                json::object()};
    EXPECT_DOUBLE_EQ(resolve(Strategy::last_writer_wins, c, {}).confidence, 0.3);
}

// -- Resolver objects ----------------------------------------------------------------------

TEST(StrategyResolver, delegates_to_the_builtin) {
    const auto resolver = StrategyResolver{Strategy::last_writer_wins};
    EXPECT_EQ(resolver.name(), "last-writer-wins");
    EXPECT_EQ(resolver.strategy(), Strategy::last_writer_wins);

    const auto c = conflict_of(ConflictType::spatial,
                               {make_op("op-1", "alice", 1), make_op("op-2", "bob", 2)});
    EXPECT_EQ(resolver.resolve(c, {}).outcome->id, "op-2");
}

TEST(FunctionResolver, names_its_resolutions) {
    const auto resolver = FunctionResolver{
        "first-wins", [](const ConflictInfo& c, const UserPriorities&) {
            return Resolution{c.operations.front(), "", 0.9};
        }};
    const auto c = conflict_of(ConflictType::spatial,
                               {make_op("op-1", "alice", 1), make_op("op-2", "bob", 2)});
    const auto resolution = resolver.resolve(c, {});
    EXPECT_EQ(resolution.outcome->id, "op-1");
    EXPECT_EQ(resolution.resolver, "first-wins");
    EXPECT_DOUBLE_EQ(resolution.confidence, 0.9);
}

TEST(FunctionResolver, rejects_an_empty_conflict_before_calling_out) {
    auto called = false;
    const auto resolver = FunctionResolver{
        "spy", [&](const ConflictInfo&, const UserPriorities&) {
            called = true;
            return Resolution{};
        }};
    EXPECT_THROW((void)resolver.resolve(conflict_of(ConflictType::spatial, {}), {}), Error);
    EXPECT_FALSE(called);
}

TEST(ConflictResolver, usable_through_the_interface) {
    const std::shared_ptr<const ConflictResolver> resolver =
        std::make_shared<StrategyResolver>(Strategy::merge);
    const auto c = conflict_of(ConflictType::concurrent_modification,
                               {make_op("op-1", "alice", 1)});
    EXPECT_TRUE(resolver->resolve(c, {}).outcome.has_value());
    EXPECT_EQ(resolver->name(), "merge");
}
