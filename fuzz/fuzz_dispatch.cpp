// Fuzz target for dispatch_text() - feeds arbitrary request bodies to a
// live session. The first byte picks the action; the rest is the body.
// Version and doc id are patched in half the time so edits actually apply.

#include <docspan-cpp/json.hpp>
#include <docspan-cpp/session.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static constexpr auto actions = std::array<std::string_view, 12>{
        "init", "render", "update", "update_node", "update_range", "insert_text",
        "delete_range", "delete_backward", "delete_forward", "insert_break", "undo", "redo",
    };
    if (size == 0) return 0;

    spdlog::set_level(spdlog::level::off);
    static auto session = docspan_cpp::Session{};

    const auto action = actions[(data[0] & 0x7f) % actions.size()];
    const auto patch_identity = (data[0] & 0x80) != 0;
    auto body = std::string_view{reinterpret_cast<const char*>(data + 1), size - 1};

    if (patch_identity) {
        auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
        if (!j.is_discarded() && j.is_object()) {
            auto id = session.identity();
            j["doc_id"] = id.doc_id;
            j["base_version"] = id.version;
            auto reply = docspan_cpp::dispatch(session, action, j);
            (void)reply;
            return 0;
        }
    }
    auto reply = docspan_cpp::dispatch_text(session, action, body);
    (void)reply;
    return 0;
}
