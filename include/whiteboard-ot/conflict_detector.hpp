/// @file conflict_detector.hpp
/// @brief Classification of concurrent operations into spatial, temporal
/// and semantic conflicts.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/operation_index.hpp>
#include <whiteboard-ot/types.hpp>

#include <initializer_list>
#include <optional>
#include <vector>

namespace whiteboard_ot {

/// Finds the conflicts an incoming operation has with stored ones.
///
/// Candidates come from the element and spatial indexes of each source,
/// never from a scan. Only candidates whose vector clock is concurrent
/// with the incoming operation's clock are classified. Compound and batch
/// operations on either side are compared part by part.
///
/// @code
/// auto detector = ConflictDetector{config};
/// auto conflicts = detector.detect(op, {&ctx.operation_queue, &ctx.pending_operations});
/// @endcode
class ConflictDetector {
public:
    explicit ConflictDetector(EngineConfig config = {});

    /// Detect conflicts between `op` and every concurrent candidate in
    /// `sources`. An operation stored in several sources is compared once.
    ///
    /// @param now Detection time stamped on each conflict.
    /// @return Conflicts sorted by severity (most severe first), then by
    ///   detection order.
    auto detect(const Operation& op,
                std::initializer_list<const OperationIndex*> sources,
                Millis now = now_millis()) const -> std::vector<ConflictInfo>;

    /// Convenience overload over a plain operation list.
    auto detect(const Operation& op, const std::vector<Operation>& queue,
                Millis now = now_millis()) const -> std::vector<ConflictInfo>;

    /// Classify one pair of operations, ignoring their clocks.
    auto classify(const Operation& op, const Operation& other,
                  Millis now = now_millis()) const -> std::vector<ConflictInfo>;

    auto config() const -> const EngineConfig& { return config_; }

private:
    auto detect_in(const Operation& op, const std::vector<const OperationIndex*>& sources,
                   Millis now) const -> std::vector<ConflictInfo>;

    auto classify_parts(const Operation& op, const std::vector<Operation>& op_parts,
                        const Operation& other, const std::vector<Operation>& other_parts,
                        Millis now) const -> std::vector<ConflictInfo>;

    auto spatial(const Operation& a, const Operation& b) const -> std::optional<ConflictInfo>;
    auto temporal(const Operation& a, const Operation& b) const -> std::optional<ConflictInfo>;
    auto semantic(const Operation& a, const Operation& b) const -> std::optional<ConflictInfo>;

    EngineConfig config_;
};

}  // namespace whiteboard_ot
