/// @file whiteboard_ot.hpp
/// @brief Umbrella header: includes the whole public API.

#pragma once

#include <whiteboard-ot/canvas.hpp>
#include <whiteboard-ot/compressor.hpp>
#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/conflict_detector.hpp>
#include <whiteboard-ot/conflict_resolver.hpp>
#include <whiteboard-ot/context.hpp>
#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/engine.hpp>
#include <whiteboard-ot/error.hpp>
#include <whiteboard-ot/json.hpp>
#include <whiteboard-ot/lru_cache.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/operation_index.hpp>
#include <whiteboard-ot/performance_monitor.hpp>
#include <whiteboard-ot/types.hpp>
#include <whiteboard-ot/vector_clock.hpp>
