/// @file json.hpp
/// @brief nlohmann/json interoperability and wire request dispatch.
///
/// Provides ADL serialization (to_json/from_json) for the types that cross
/// the wire or configuration boundary, and dispatch(), which decodes the
/// snake_case requests of the HTTP API and routes them to a Session.

#pragma once

#include <docspan-cpp/concurrency.hpp>
#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/history.hpp>
#include <docspan-cpp/options.hpp>
#include <docspan-cpp/patch.hpp>
#include <docspan-cpp/session.hpp>
#include <docspan-cpp/style.hpp>
#include <docspan-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace docspan_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Response fragments (camelCase) -------------------------------------------

void to_json(nlohmann::json& j, const Caret& c);
void from_json(const nlohmann::json& j, Caret& c);

void to_json(nlohmann::json& j, const Selection& s);
void from_json(const nlohmann::json& j, Selection& s);

void to_json(nlohmann::json& j, const HistoryInfo& h);
void to_json(nlohmann::json& j, const ParagraphPatch& p);

// -- Request fragments (snake_case, as sent by clients) -----------------------

/// Reads `font_name`, `font_size`, `color`, `alignment`,
/// `first_line_indent`, `bold`, `italic`; absent or null fields stay unset.
/// @throws std::runtime_error on an unknown alignment or a mistyped field.
void from_json(const nlohmann::json& j, StyleUpdate& s);
void to_json(nlohmann::json& j, const StyleUpdate& s);

/// Reads `doc_id`, `base_version`, `client_op_id`.
void from_json(const nlohmann::json& j, VersionedRequest& r);
void to_json(nlohmann::json& j, const VersionedRequest& r);

// -- Configuration (camelCase) ------------------------------------------------

void to_json(nlohmann::json& j, const SessionOptions& o);
void from_json(const nlohmann::json& j, SessionOptions& o);

void to_json(nlohmann::json& j, const EngineOptions& o);
void from_json(const nlohmann::json& j, EngineOptions& o);

// =============================================================================
// Request dispatch
// =============================================================================

/// Decode a wire request and route it to the matching Session operation.
///
/// Actions: `init`, `render`, `update`, `update_node`, `update_range`,
/// `insert_text`, `delete_range`, `delete_backward`, `delete_forward`,
/// `insert_break`, `undo`, `redo`. A missing or mistyped field, or an
/// unknown action, yields a `bad_request` reply with error
/// `invalid_request` and leaves the session untouched.
///
/// @code
/// auto reply = dispatch(session, "insert_text", {
///     {"doc_id", id}, {"base_version", 3}, {"client_op_id", "op-7"},
///     {"node_id", address}, {"offset", 0}, {"text", "Hi "}});
/// @endcode
auto dispatch(Session& session, std::string_view action, const nlohmann::json& request,
              std::size_t page = 1) -> Reply;

/// Parse `request` as JSON, then dispatch(). Unparsable text is an
/// `invalid_request`.
auto dispatch_text(Session& session, std::string_view action, std::string_view request,
                   std::size_t page = 1) -> Reply;

}  // namespace docspan_cpp
