#include <docspan-cpp/json.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docspan_cpp {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

// Absent and null both mean "leave unchanged".
template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

// Offsets and counts arrive as signed JSON integers; negatives clamp to 0.
auto read_index(const nlohmann::json& j, const char* key) -> std::size_t {
    auto value = j.at(key).get<std::int64_t>();
    return value < 0 ? std::size_t{0} : static_cast<std::size_t>(value);
}

auto read_caret(const nlohmann::json& j, const char* node_key, const char* offset_key) -> Caret {
    return Caret{j.at(node_key).get<std::string>(), read_index(j, offset_key)};
}

auto read_range(const nlohmann::json& j) -> TextRange {
    return TextRange{read_caret(j, "start_node_id", "start_offset"),
                     read_caret(j, "end_node_id", "end_offset")};
}

auto read_style(const nlohmann::json& j) -> std::optional<StyleUpdate> {
    auto it = j.find("style");
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<StyleUpdate>();
}

auto read_count(const nlohmann::json& j) -> std::size_t {
    if (!j.contains("count")) return 1;
    return std::max<std::size_t>(read_index(j, "count"), 1);
}

// Sizes and durations in configuration: non-negative integers only.
template <typename T>
auto read_setting(const nlohmann::json& j, const char* key, T fallback) -> T {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->template get<std::int64_t>() < 0)) {
        throw std::runtime_error{
            fmt::format("invalid configuration: {} must be a non-negative integer", key)};
    }
    return it->template get<T>();
}

auto invalid_request(std::string_view message) -> Reply {
    return error_reply(ReplyStatus::bad_request,
                       Error{ErrorKind::invalid_request, std::string{message}});
}

// Decode a request into a ready-to-run call. Throws on malformed input so
// that nothing touches the session until the whole request is understood.
auto decode(Session& session, std::string_view action, const nlohmann::json& j,
            std::size_t page) -> std::function<Reply()> {
    if (action == "init") {
        return [&session, page] { return session.init(page); };
    }
    if (action == "render") {
        return [&session, page] { return session.render(page); };
    }

    if (!j.is_object()) throw std::runtime_error{"request body must be a JSON object"};
    auto request = j.get<VersionedRequest>();

    if (action == "update") {
        // The document-wide update carries its style fields at top level.
        return [&session, request, style = j.get<StyleUpdate>(), page] {
            return session.update_document_style(request, style, page);
        };
    }
    if (action == "update_node") {
        return [&session, request, node = j.at("node_id").get<std::string>(),
                start = read_index(j, "start_offset"), end = read_index(j, "end_offset"),
                style = read_style(j).value_or(StyleUpdate{}), page] {
            return session.update_node_style(request, node, start, end, style, page);
        };
    }
    if (action == "update_range") {
        return [&session, request, range = read_range(j),
                style = read_style(j).value_or(StyleUpdate{}), page] {
            return session.update_range_style(request, range, style, page);
        };
    }
    if (action == "insert_text") {
        return [&session, request, caret = read_caret(j, "node_id", "offset"),
                text = j.at("text").get<std::string>(), style = read_style(j), page] {
            return session.insert_text(request, caret, text, style, page);
        };
    }
    if (action == "delete_range") {
        return [&session, request, range = read_range(j), page] {
            return session.delete_range(request, range, page);
        };
    }
    if (action == "delete_backward") {
        return [&session, request, caret = read_caret(j, "node_id", "offset"),
                count = read_count(j), page] {
            return session.delete_backward(request, caret, count, page);
        };
    }
    if (action == "delete_forward") {
        return [&session, request, caret = read_caret(j, "node_id", "offset"),
                count = read_count(j), page] {
            return session.delete_forward(request, caret, count, page);
        };
    }
    if (action == "insert_break") {
        return [&session, request, caret = read_caret(j, "node_id", "offset"), page] {
            return session.insert_break(request, caret, page);
        };
    }
    if (action == "undo") {
        return [&session, request, page] { return session.undo(request, page); };
    }
    if (action == "redo") {
        return [&session, request, page] { return session.redo(request, page); };
    }
    throw std::runtime_error{fmt::format("unknown action '{}'", action)};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Response fragments -------------------------------------------------------

void to_json(nlohmann::json& j, const Caret& c) {
    j = nlohmann::json{{"nodeId", c.address}, {"offset", c.offset}};
}

void from_json(const nlohmann::json& j, Caret& c) {
    c.address = j.at("nodeId").get<std::string>();
    c.offset = j.at("offset").get<std::size_t>();
}

void to_json(nlohmann::json& j, const Selection& s) {
    j = nlohmann::json{{"anchor", s.anchor}};
    if (s.focus) j["focus"] = *s.focus;
}

void from_json(const nlohmann::json& j, Selection& s) {
    s.anchor = j.at("anchor").get<Caret>();
    if (j.contains("focus") && !j.at("focus").is_null()) {
        s.focus = j.at("focus").get<Caret>();
    } else {
        s.focus.reset();
    }
}

void to_json(nlohmann::json& j, const HistoryInfo& h) {
    j = nlohmann::json{
        {"canUndo", h.can_undo},
        {"canRedo", h.can_redo},
        {"undoDepth", h.undo_depth},
        {"redoDepth", h.redo_depth},
    };
}

void to_json(nlohmann::json& j, const ParagraphPatch& p) {
    j = nlohmann::json{
        {"paragraphId", p.paragraph_id},
        {"paragraphIndex", p.paragraph_index},
        {"html", p.html},
    };
}

// -- Request fragments --------------------------------------------------------

void from_json(const nlohmann::json& j, StyleUpdate& s) {
    if (!j.is_object()) throw std::runtime_error{"style must be a JSON object"};
    read_optional(j, "font_name", s.font_name);
    read_optional(j, "font_size", s.font_size);
    read_optional(j, "color", s.color);
    read_optional(j, "first_line_indent", s.first_line_indent);
    read_optional(j, "bold", s.bold);
    read_optional(j, "italic", s.italic);

    auto alignment = std::optional<std::string>{};
    read_optional(j, "alignment", alignment);
    s.alignment.reset();
    if (alignment) {
        s.alignment = parse_alignment(*alignment);
        if (!s.alignment) {
            throw std::runtime_error{fmt::format("unknown alignment '{}'", *alignment)};
        }
    }
}

void to_json(nlohmann::json& j, const StyleUpdate& s) {
    j = nlohmann::json::object();
    if (s.font_name) j["font_name"] = *s.font_name;
    if (s.font_size) j["font_size"] = *s.font_size;
    if (s.color) j["color"] = *s.color;
    if (s.alignment) j["alignment"] = std::string{to_string_view(*s.alignment)};
    if (s.first_line_indent) j["first_line_indent"] = *s.first_line_indent;
    if (s.bold) j["bold"] = *s.bold;
    if (s.italic) j["italic"] = *s.italic;
}

void from_json(const nlohmann::json& j, VersionedRequest& r) {
    r.doc_id = j.at("doc_id").get<std::string>();
    auto version = j.at("base_version").get<std::int64_t>();
    if (version < 0) throw std::runtime_error{"base_version must not be negative"};
    r.base_version = static_cast<std::uint64_t>(version);
    r.client_op_id = j.at("client_op_id").get<std::string>();
}

void to_json(nlohmann::json& j, const VersionedRequest& r) {
    j = nlohmann::json{
        {"doc_id", r.doc_id},
        {"base_version", r.base_version},
        {"client_op_id", r.client_op_id},
    };
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const SessionOptions& o) {
    j = nlohmann::json{
        {"historyCapacity", o.history_capacity},
        {"coalesceWindowMs", o.coalesce_window.count()},
        {"opCacheCapacity", o.op_cache_capacity},
        {"strictAddressing", o.strict_addressing},
        {"patchesEnabled", o.patches_enabled},
    };
}

void from_json(const nlohmann::json& j, SessionOptions& o) {
    o.history_capacity = read_setting(j, "historyCapacity", o.history_capacity);
    o.coalesce_window = std::chrono::milliseconds{read_setting(
        j, "coalesceWindowMs", static_cast<std::uint64_t>(o.coalesce_window.count()))};
    o.op_cache_capacity = read_setting(j, "opCacheCapacity", o.op_cache_capacity);
    o.strict_addressing = j.value("strictAddressing", o.strict_addressing);
    o.patches_enabled = j.value("patchesEnabled", o.patches_enabled);
}

void to_json(nlohmann::json& j, const EngineOptions& o) {
    j = nlohmann::json{
        {"paragraphsPerPage", o.paragraphs_per_page},
        {"parallelRenderThreshold", o.parallel_render_threshold},
    };
}

void from_json(const nlohmann::json& j, EngineOptions& o) {
    o.paragraphs_per_page = read_setting(j, "paragraphsPerPage", o.paragraphs_per_page);
    o.parallel_render_threshold =
        read_setting(j, "parallelRenderThreshold", o.parallel_render_threshold);
}

// =============================================================================
// Request dispatch
// =============================================================================

auto dispatch(Session& session, std::string_view action, const nlohmann::json& request,
              std::size_t page) -> Reply {
    auto call = std::function<Reply()>{};
    try {
        call = decode(session, action, request, page);
    } catch (const nlohmann::json::exception& e) {
        return invalid_request(e.what());
    } catch (const std::runtime_error& e) {
        return invalid_request(e.what());
    }
    return call();
}

auto dispatch_text(Session& session, std::string_view action, std::string_view request,
                   std::size_t page) -> Reply {
    if (request.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return dispatch(session, action, nlohmann::json{}, page);
    }
    auto j = nlohmann::json::parse(request.begin(), request.end(), nullptr, false);
    if (j.is_discarded()) return invalid_request("request body is not valid JSON");
    return dispatch(session, action, j, page);
}

}  // namespace docspan_cpp
