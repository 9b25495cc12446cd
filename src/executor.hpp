#pragma once

// Process-global Taskflow executor and a chunked fork-join helper.
//
// The executor is sized to std::thread::hardware_concurrency() and shared
// by every engine in the process. Conflict classification over large
// candidate sets is the only user.
//
// Internal header; not installed.

#include <taskflow/taskflow.hpp>

#include <algorithm>
#include <cstddef>

namespace whiteboard_ot::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Split [0, count) into at most `chunks` contiguous ranges, run
// fn(chunk_index, begin, end) for each on the global executor, and wait.
// Chunk indexes are dense and follow range order.
template <typename Fn>
void run_chunked(std::size_t count, std::size_t chunks, Fn&& fn) {
    if (count == 0) return;
    chunks = std::clamp<std::size_t>(chunks, 1, count);
    const auto step = (count + chunks - 1) / chunks;

    auto taskflow = tf::Taskflow{};
    auto index = std::size_t{0};
    for (auto begin = std::size_t{0}; begin < count; begin += step, ++index) {
        const auto end = std::min(count, begin + step);
        taskflow.emplace([&fn, index, begin, end] { fn(index, begin, end); });
    }
    global_executor().run(taskflow).wait();
}

// Number of ranges run_chunked() produces for the same arguments.
inline auto chunk_count(std::size_t count, std::size_t chunks) -> std::size_t {
    if (count == 0) return 0;
    chunks = std::clamp<std::size_t>(chunks, 1, count);
    const auto step = (count + chunks - 1) / chunks;
    return (count + step - 1) / step;
}

}  // namespace whiteboard_ot::detail
