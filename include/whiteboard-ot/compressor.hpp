/// @file compressor.hpp
/// @brief Semantics-preserving compaction of operation sequences.

#pragma once

#include <whiteboard-ot/operation.hpp>

#include <vector>

namespace whiteboard_ot {

/// Collapse runs of operations on the same element.
///
/// Input order is arrival order. Within an element, later field-level
/// changes overwrite earlier ones and the earliest operation's identity
/// is kept. A later delete turns the result into a delete; a write that
/// follows a delete (or a create) makes the result a create. Compound
/// and unknown operations close the run of their element, batch
/// operations close every run.
///
/// Guarantees:
/// - the output is no longer than the input;
/// - applying the output reproduces the element states of applying the
///   input in order;
/// - compress(compress(ops)) == compress(ops).
auto compress(const std::vector<Operation>& ops) -> std::vector<Operation>;

}  // namespace whiteboard_ot
