// Fuzz target for NativeEngine::load() - exercises native JSON and plain
// text import. Any document that loads is serialized, reloaded and rendered.

#include <docspan-cpp/engine.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    static const auto engine = docspan_cpp::NativeEngine{};
    auto doc = engine.load(span);
    if (doc) {
        // Whatever loaded must survive its own serialization unchanged.
        auto again = engine.load(engine.serialize(*doc));
        if (!again || again->text() != doc->text()) std::abort();
        auto html = engine.render_html(*doc, std::nullopt);
        (void)html;
    }
    return 0;
}
