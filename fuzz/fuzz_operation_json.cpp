// Fuzz target for operation decoding: exercises JSON parsing, field
// validation and, for decodable input, the full transform pipeline.

#include <whiteboard-ot/engine.hpp>
#include <whiteboard-ot/error.hpp>
#include <whiteboard-ot/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static auto engine = whiteboard_ot::Engine{};

    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto op = whiteboard_ot::parse_operation(text);

        // Anything that decodes must either transform or be rejected
        // with a structured error.
        auto ctx = engine.create_context();
        auto result = engine.transform(op, ctx);
        (void)result;

        // Re-encoding a decoded operation must never throw.
        auto encoded = nlohmann::json(op).dump();
        (void)encoded;
    } catch (const whiteboard_ot::Error&) {
        // Expected for malformed or rejected input.
    }
    return 0;
}
