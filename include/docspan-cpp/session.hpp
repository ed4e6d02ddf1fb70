/// @file session.hpp
/// @brief Session -- the per-document editing context and its request pipeline.

#pragma once

#include <docspan-cpp/address_index.hpp>
#include <docspan-cpp/concurrency.hpp>
#include <docspan-cpp/document.hpp>
#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/history.hpp>
#include <docspan-cpp/options.hpp>
#include <docspan-cpp/span_editor.hpp>
#include <docspan-cpp/style.hpp>
#include <docspan-cpp/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docspan_cpp {

/// One editable document with its history, concurrency state and reply cache.
///
/// Every mutating operation runs the same sequence under the session's
/// exclusive lock:
///
///  1. return the cached reply if this `(doc_id, base_version,
///     client_op_id, page)` was answered before;
///  2. reject a stale `doc_id` or `base_version` with a conflict reply that
///     carries the current identity and a full render;
///  3. record the pre-edit state in the history;
///  4. apply the edit;
///  5. bump the version;
///  6. build the reply (paragraph patches or the requested page);
///  7. cache it under the request's key.
///
/// Reads (render(), export_document(), the accessors) take a shared lock and
/// observe a consistent document. Operations report failure through
/// Reply::status and never throw for request-level errors.
///
/// @code
/// auto session = Session{};
/// auto first = session.init();
/// auto id = session.identity();
/// auto reply = session.insert_text({id.doc_id, id.version, "op-1"},
///                                  Caret{address, 0}, "Hi ", std::nullopt);
/// @endcode
class Session {
public:
    /// Start with the engine's default document, fully addressed, at version 0.
    explicit Session(std::shared_ptr<const DocumentEngine> engine = std::make_shared<NativeEngine>(),
                     SessionOptions options = {},
                     History::Clock clock = {});

    Session(const Session&) = delete;
    auto operator=(const Session&) -> Session& = delete;

    // -- Unversioned ------------------------------------------------------------

    /// Replace the document with the engine default under a new doc id,
    /// clear history, bump the version and render `page`.
    auto init(std::size_t page = 1) -> Reply;

    /// Render `page` of the current document.
    auto render(std::size_t page = 1) const -> Reply;

    /// Serialize the current document in the engine's native format.
    auto export_document() const -> std::vector<std::byte>;

    // -- Versioned edits --------------------------------------------------------

    /// Apply character and paragraph fields to the whole document.
    auto update_document_style(const VersionedRequest& request, const StyleUpdate& style,
                               std::size_t page = 1) -> Reply;

    /// Restyle `[start_offset, end_offset)` of one run.
    auto update_node_style(const VersionedRequest& request, const Address& node,
                           std::size_t start_offset, std::size_t end_offset,
                           const StyleUpdate& style, std::size_t page = 1) -> Reply;

    /// Restyle a range that may cross runs and paragraphs.
    auto update_range_style(const VersionedRequest& request, const TextRange& range,
                            const StyleUpdate& style, std::size_t page = 1) -> Reply;

    /// Insert text at a caret, optionally styled.
    auto insert_text(const VersionedRequest& request, const Caret& caret, std::string_view text,
                     const std::optional<StyleUpdate>& style, std::size_t page = 1) -> Reply;

    /// Delete a range.
    auto delete_range(const VersionedRequest& request, const TextRange& range,
                      std::size_t page = 1) -> Reply;

    /// Delete `count` characters before the caret.
    auto delete_backward(const VersionedRequest& request, const Caret& caret,
                         std::size_t count = 1, std::size_t page = 1) -> Reply;

    /// Delete `count` characters after the caret.
    auto delete_forward(const VersionedRequest& request, const Caret& caret,
                        std::size_t count = 1, std::size_t page = 1) -> Reply;

    /// Split the caret's paragraph.
    auto insert_break(const VersionedRequest& request, const Caret& caret,
                      std::size_t page = 1) -> Reply;

    /// Step back in history. An empty stack replies `didUndo: false`
    /// without bumping the version.
    auto undo(const VersionedRequest& request, std::size_t page = 1) -> Reply;

    /// Step forward in history.
    auto redo(const VersionedRequest& request, std::size_t page = 1) -> Reply;

    /// Replace the document with uploaded bytes. The pre-upload state becomes
    /// the only undo entry and a new doc id is minted. Unparsable bytes reply
    /// `invalid_document_format` and change nothing. The reply always shows
    /// page 1; `page` only keys the replay cache.
    auto load_document(const VersionedRequest& request, std::span<const std::byte> bytes,
                       std::size_t page = 1) -> Reply;

    // -- Inspection -------------------------------------------------------------

    auto identity() const -> DocIdentity;
    auto history_info() const -> HistoryInfo;
    auto page_count() const -> std::size_t;

    /// Plain text of the document, paragraphs joined with '\n'.
    auto text() const -> std::string;

    /// A deep copy of the current document.
    auto snapshot() const -> Document;

    auto options() const -> const SessionOptions& { return options_; }
    auto engine() const -> const DocumentEngine& { return *engine_; }

private:
    using Edit = std::function<EditOutcome(SpanEditor&)>;

    // Steps 1, 2 and 7 of the pipeline around `apply`.
    auto versioned(const VersionedRequest& request, std::size_t page,
                   const std::function<Reply()>& apply) -> Reply;

    // Steps 3 to 6 for a span edit addressing `addresses`.
    auto apply_edit(std::size_t page, ChangeKind kind, const std::vector<Address>& addresses,
                    const Edit& edit) -> Reply;

    auto history_step(std::size_t page, bool forward) -> Reply;

    auto capture() const -> HistorySnapshot;
    auto restore(const HistorySnapshot& snapshot) -> bool;
    auto clamp_page(std::size_t page) const -> std::size_t;

    // Identity, history and paging fields shared by every reply.
    auto payload(std::size_t page) const -> nlohmann::json;

    // Attach patches (if `outcome` allows) or the rendered page to `body`.
    auto finish(nlohmann::json body, std::size_t page, const EditOutcome* outcome) const -> Reply;

    auto conflict_reply(ErrorKind kind, std::size_t page) const -> Reply;

    std::shared_ptr<const DocumentEngine> engine_;
    SessionOptions options_;
    Document document_;
    AddressMinter minter_;
    History history_;
    ConcurrencyController concurrency_;
    mutable std::shared_mutex mutex_;
};

/// The `{error, message}` body of a `bad_request` reply.
auto error_reply(ReplyStatus status, const Error& error) -> Reply;

}  // namespace docspan_cpp
