#include <whiteboard-ot/error.hpp>
#include <whiteboard-ot/operation.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace whiteboard_ot;

namespace {

auto make_op(std::string id, OpType type, std::string element) -> Operation {
    auto op = Operation{};
    op.id = std::move(id);
    op.type = type;
    op.element_id = std::move(element);
    op.user_id = "alice";
    op.vector_clock = VectorClock{{"alice", 1}};
    op.timestamp = 1000;
    op.lamport_timestamp = 3;
    return op;
}

}  // namespace

// -- Type names ---------------------------------------------------------------

TEST(OpType, wire_names_round_trip) {
    for (auto type : {OpType::create, OpType::update, OpType::move, OpType::style, OpType::del,
                      OpType::compound, OpType::batch, OpType::resize, OpType::rotate,
                      OpType::reorder}) {
        EXPECT_EQ(parse_op_type(to_string_view(type)), type);
    }
    EXPECT_EQ(to_string_view(OpType::del), "delete");
}

TEST(OpType, unrecognized_names_are_unknown) {
    EXPECT_EQ(parse_op_type("teleport"), OpType::unknown);
    EXPECT_EQ(parse_op_type(""), OpType::unknown);
    EXPECT_EQ(parse_op_type("Delete"), OpType::unknown);
}

TEST(OpType, field_updates) {
    EXPECT_TRUE(is_field_update(OpType::move));
    EXPECT_TRUE(is_field_update(OpType::reorder));
    EXPECT_FALSE(is_field_update(OpType::create));
    EXPECT_FALSE(is_field_update(OpType::del));
    EXPECT_FALSE(is_field_update(OpType::batch));
}

TEST(Operation, type_name_keeps_the_raw_name_of_unknown_types) {
    auto op = make_op("op-1", OpType::unknown, "e1");
    op.raw_type = "laser-pointer";
    EXPECT_EQ(op.type_name(), "laser-pointer");
    EXPECT_EQ(make_op("op-2", OpType::move, "e1").type_name(), "move");
}

// -- Geometry fallbacks -------------------------------------------------------------

TEST(Operation, anchor_falls_back_to_the_bounds_origin) {
    auto op = make_op("op-1", OpType::resize, "e1");
    EXPECT_FALSE(op.anchor().has_value());

    op.bounds = Rect{10, 20, 30, 40};
    EXPECT_EQ(op.anchor(), (Point{10, 20}));

    op.position = Point{1, 2};
    EXPECT_EQ(op.anchor(), (Point{1, 2}));
}

TEST(Operation, extent_falls_back_to_a_point_box) {
    auto op = make_op("op-1", OpType::move, "e1");
    op.position = Point{5, 6};
    EXPECT_EQ(op.extent(), (Rect{5, 6, 0, 0}));

    op.bounds = Rect{0, 0, 10, 10};
    EXPECT_EQ(op.extent(), (Rect{0, 0, 10, 10}));
}

TEST(Operation, clock_is_empty_when_absent) {
    auto op = make_op("op-1", OpType::move, "e1");
    op.vector_clock.reset();
    EXPECT_TRUE(op.clock().empty());
}

// -- Compound expansion --------------------------------------------------------------

TEST(ExpandOperation, plain_operations_expand_to_themselves) {
    const auto op = make_op("op-1", OpType::style, "e1");
    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], op);
}

TEST(ExpandOperation, compound_yields_one_part_per_component) {
    auto op = make_op("cmp-1", OpType::compound, "e1");
    op.bounds = Rect{0, 0, 10, 10};
    op.data = {{"moves", {{"x", 40}, {"y", 50}}},
               {"resize", {{"width", 200}, {"height", 100}}},
               {"rotation", 90}};

    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 3u);

    EXPECT_EQ(parts[0].type, OpType::move);
    EXPECT_EQ(parts[0].position, (Point{40, 50}));
    EXPECT_FALSE(parts[0].bounds.has_value());

    EXPECT_EQ(parts[1].type, OpType::resize);
    EXPECT_EQ(parts[1].data, (nlohmann::json{{"width", 200.0}, {"height", 100.0}}));
    EXPECT_EQ(parts[1].bounds, (Rect{0, 0, 200, 100}));

    EXPECT_EQ(parts[2].type, OpType::rotate);
    EXPECT_EQ(parts[2].rotation, 90.0);

    for (const auto& part : parts) {
        EXPECT_EQ(part.id, "cmp-1");
        EXPECT_EQ(part.element_id, "e1");
        EXPECT_EQ(part.user_id, "alice");
        EXPECT_EQ(part.vector_clock, op.vector_clock);
    }
}

TEST(ExpandOperation, compound_rotation_accepts_an_angle_object) {
    auto op = make_op("cmp-1", OpType::compound, "e1");
    op.data = {{"rotation", {{"angle", 45}}}};
    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].type, OpType::rotate);
    EXPECT_EQ(parts[0].rotation, 45.0);
}

TEST(ExpandOperation, compound_without_components_is_an_update) {
    auto op = make_op("cmp-1", OpType::compound, "e1");
    op.data = {{"label", "hello"}};
    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].type, OpType::update);
    EXPECT_EQ(parts[0].data, op.data);
}

// -- Batch expansion ----------------------------------------------------------------------

TEST(ExpandOperation, batch_entries_inherit_identity_from_the_batch) {
    auto op = make_op("b1", OpType::batch, "");
    op.version = 7;
    op.data = {{"operations",
                nlohmann::json::array({
                    {{"id", "b1-a"}, {"type", "move"}, {"elementId", "e1"},
                     {"position", {{"x", 1}, {"y", 2}}}},
                    {{"type", "delete"}, {"elementId", "e2"}, {"userId", "bob"}},
                })}};

    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 2u);

    EXPECT_EQ(parts[0].id, "b1-a");
    EXPECT_EQ(parts[0].type, OpType::move);
    EXPECT_EQ(parts[0].user_id, "alice");
    EXPECT_EQ(parts[0].vector_clock, op.vector_clock);
    EXPECT_EQ(parts[0].timestamp, 1000);
    EXPECT_EQ(parts[0].version, 7u);
    EXPECT_EQ(parts[0].lamport_timestamp, 3u);

    EXPECT_EQ(parts[1].id, "b1#1");
    EXPECT_EQ(parts[1].type, OpType::del);
    EXPECT_EQ(parts[1].user_id, "bob");
}

TEST(ExpandOperation, nested_batches_are_flattened) {
    auto op = make_op("outer", OpType::batch, "");
    op.data = {{"operations",
                nlohmann::json::array({
                    {{"id", "inner"}, {"type", "batch"},
                     {"data", {{"operations", nlohmann::json::array({
                                   {{"id", "leaf"}, {"type", "style"}, {"elementId", "e9"}},
                               })}}}},
                    {{"id", "sibling"}, {"type", "update"}, {"elementId", "e3"}},
                })}};

    const auto parts = expand_operation(op);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].id, "leaf");
    EXPECT_EQ(parts[1].id, "sibling");
}

TEST(ExpandOperation, batch_without_operations_array_is_invalid) {
    auto op = make_op("b1", OpType::batch, "");
    op.data = {{"ops", nlohmann::json::array()}};
    try {
        (void)expand_operation(op);
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::invalid_operation);
    }
}

TEST(ExpandOperation, malformed_batch_entry_is_invalid) {
    auto op = make_op("b1", OpType::batch, "");
    op.data = {{"operations", nlohmann::json::array({42})}};
    EXPECT_THROW((void)expand_operation(op), Error);

    op.data = {{"operations", nlohmann::json::array({{{"id", "x"}, {"type", "move"}}})}};
    try {
        (void)expand_operation(op);
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::invalid_operation);
    }
}

TEST(TouchedElements, batch_reports_each_element_once) {
    auto op = make_op("b1", OpType::batch, "");
    op.data = {{"operations",
                nlohmann::json::array({
                    {{"type", "move"}, {"elementId", "e1"}},
                    {{"type", "style"}, {"elementId", "e2"}},
                    {{"type", "update"}, {"elementId", "e1"}},
                })}};
    EXPECT_EQ(touched_elements(op), (std::vector<std::string>{"e1", "e2"}));
    EXPECT_EQ(touched_elements(make_op("op-1", OpType::move, "e5")),
              (std::vector<std::string>{"e5"}));
}
