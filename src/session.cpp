#include <docspan-cpp/session.hpp>

#include <docspan-cpp/json.hpp>
#include <docspan-cpp/patch.hpp>

#include "encoding/utf8.hpp"
#include "snapshot.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace docspan_cpp {

namespace {

auto require_engine(std::shared_ptr<const DocumentEngine> engine)
    -> std::shared_ptr<const DocumentEngine> {
    if (!engine) throw std::invalid_argument{"Session requires a document engine"};
    return engine;
}

// Text reaching a reply may come straight from an API caller, so invalid
// UTF-8 is replaced rather than thrown on.
auto dump(const nlohmann::json& body) -> std::string {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // anonymous namespace

auto error_reply(ReplyStatus status, const Error& error) -> Reply {
    auto body = nlohmann::json{
        {"error", std::string{to_string_view(error.kind)}},
        {"message", error.message},
    };
    return Reply{status, dump(body)};
}

Session::Session(std::shared_ptr<const DocumentEngine> engine, SessionOptions options,
                 History::Clock clock)
    : engine_{require_engine(std::move(engine))},
      options_{options},
      document_{engine_->default_document()},
      history_{options.history_capacity, options.coalesce_window, std::move(clock)},
      concurrency_{options.op_cache_capacity} {
    document_.readdress_all_runs(minter_);
    concurrency_.reset_doc_id(mint_doc_id());
}

// -- Reply building -----------------------------------------------------------

auto Session::clamp_page(std::size_t page) const -> std::size_t {
    auto count = std::max<std::size_t>(engine_->page_count(document_), 1);
    return std::clamp<std::size_t>(page == 0 ? 1 : page, 1, count);
}

auto Session::payload(std::size_t page) const -> nlohmann::json {
    return nlohmann::json{
        {"docId", concurrency_.doc_id()},
        {"version", concurrency_.version()},
        {"history", history_.info()},
        {"pageIndex", clamp_page(page)},
        {"pageCount", engine_->page_count(document_)},
    };
}

auto Session::finish(nlohmann::json body, std::size_t page, const EditOutcome* outcome) const
    -> Reply {
    if (outcome && outcome->selection) {
        body["selection"] = *outcome->selection;
    }

    if (outcome && options_.patches_enabled && outcome->resolved && !outcome->structural) {
        auto extractor = PatchExtractor{*engine_};
        if (auto patch = extractor.touched_patch(document_, outcome->touched)) {
            body["patches"] = std::vector<ParagraphPatch>{std::move(*patch)};
            return Reply{ReplyStatus::ok, dump(body)};
        }
    }

    auto html = engine_->render_html(document_, clamp_page(page));
    if (!html) {
        spdlog::error("render failed for document {} at version {}",
                      concurrency_.doc_id(), concurrency_.version());
        auto failure = nlohmann::json{
            {"error", std::string{to_string_view(ErrorKind::render_failure)}},
            {"message", "the document engine failed to render the document"},
            {"docId", concurrency_.doc_id()},
            {"version", concurrency_.version()},
        };
        return Reply{ReplyStatus::render_failure, dump(failure)};
    }
    body["html"] = std::move(*html);
    return Reply{ReplyStatus::ok, dump(body)};
}

auto Session::conflict_reply(ErrorKind kind, std::size_t page) const -> Reply {
    auto body = payload(page);
    body["error"] = std::string{to_string_view(kind)};
    auto reply = finish(std::move(body), page, nullptr);
    if (reply.status == ReplyStatus::ok) reply.status = ReplyStatus::conflict;
    return reply;
}

// -- Snapshots ----------------------------------------------------------------

auto Session::capture() const -> HistorySnapshot {
    return detail::capture_snapshot(*engine_, document_);
}

auto Session::restore(const HistorySnapshot& snapshot) -> bool {
    auto doc = detail::restore_snapshot(*engine_, snapshot);
    if (!doc) return false;
    document_ = std::move(*doc);
    document_.address_unbound_runs(minter_);
    return true;
}

// -- Pipeline -----------------------------------------------------------------

auto Session::versioned(const VersionedRequest& request, std::size_t page,
                        const std::function<Reply()>& apply) -> Reply {
    auto lock = std::unique_lock{mutex_};

    if (auto cached = concurrency_.lookup_cached(request, page)) {
        spdlog::debug("replaying reply for op '{}' at base version {}",
                      request.client_op_id, request.base_version);
        return *cached;
    }

    if (auto conflict = concurrency_.validate(request.doc_id, request.base_version)) {
        spdlog::warn("{}: op '{}' targets {}@{}, current is {}@{}",
                     to_string_view(*conflict), request.client_op_id,
                     request.doc_id, request.base_version,
                     concurrency_.doc_id(), concurrency_.version());
        return conflict_reply(*conflict, page);
    }

    auto reply = apply();
    if (reply.status == ReplyStatus::ok) {
        concurrency_.cache_reply(request, page, reply);
    }
    return reply;
}

auto Session::apply_edit(std::size_t page, ChangeKind kind, const std::vector<Address>& addresses,
                         const Edit& edit) -> Reply {
    auto missing = std::ranges::find_if(addresses, [this](const Address& address) {
        return !document_.addresses().contains(address);
    });
    if (missing != addresses.end()) {
        if (options_.strict_addressing) {
            spdlog::debug("rejecting edit on unbound address {}", *missing);
            return error_reply(ReplyStatus::bad_request,
                               Error{ErrorKind::address_not_found,
                                     fmt::format("address {} is not bound to a run", *missing)});
        }
        spdlog::debug("address {} is not bound; edit applies as a no-op", *missing);
    }

    history_.record_change(kind, [this] { return capture(); });
    auto editor = SpanEditor{document_, minter_};
    auto outcome = edit(editor);
    concurrency_.bump_version();
    return finish(payload(page), page, &outcome);
}

auto Session::history_step(std::size_t page, bool forward) -> Reply {
    auto capture_fn = [this] { return capture(); };
    auto restore_fn = [this](const HistorySnapshot& snapshot) { return restore(snapshot); };
    auto did = forward ? history_.redo(capture_fn, restore_fn)
                       : history_.undo(capture_fn, restore_fn);
    if (did) concurrency_.bump_version();

    auto body = payload(page);
    body[forward ? "didRedo" : "didUndo"] = did;
    return finish(std::move(body), page, nullptr);
}

// -- Unversioned --------------------------------------------------------------

auto Session::init(std::size_t page) -> Reply {
    auto lock = std::unique_lock{mutex_};
    document_ = engine_->default_document();
    document_.readdress_all_runs(minter_);
    history_.clear();
    concurrency_.reset_doc_id(mint_doc_id());
    concurrency_.bump_version();
    spdlog::info("initialized document {} at version {}",
                 concurrency_.doc_id(), concurrency_.version());
    return finish(payload(page), page, nullptr);
}

auto Session::render(std::size_t page) const -> Reply {
    auto lock = std::shared_lock{mutex_};
    return finish(payload(page), page, nullptr);
}

auto Session::export_document() const -> std::vector<std::byte> {
    auto lock = std::shared_lock{mutex_};
    return engine_->serialize(document_);
}

// -- Versioned edits ----------------------------------------------------------

auto Session::update_document_style(const VersionedRequest& request, const StyleUpdate& style,
                                    std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {}, [&](SpanEditor& editor) {
            return editor.update_document_style(style);
        });
    });
}

auto Session::update_node_style(const VersionedRequest& request, const Address& node,
                                std::size_t start_offset, std::size_t end_offset,
                                const StyleUpdate& style, std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {node}, [&](SpanEditor& editor) {
            return editor.update_node_style(node, start_offset, end_offset, style);
        });
    });
}

auto Session::update_range_style(const VersionedRequest& request, const TextRange& range,
                                 const StyleUpdate& style, std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {range.start.address, range.end.address},
                          [&](SpanEditor& editor) {
                              return editor.update_range_style(range, style);
                          });
    });
}

auto Session::insert_text(const VersionedRequest& request, const Caret& caret,
                          std::string_view text, const std::optional<StyleUpdate>& style,
                          std::size_t page) -> Reply {
    if (!encoding::utf8_valid(text)) {
        return error_reply(ReplyStatus::bad_request,
                           Error{ErrorKind::invalid_request, "text is not valid UTF-8"});
    }
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::insert, {caret.address}, [&](SpanEditor& editor) {
            return editor.insert_text(caret, text, style);
        });
    });
}

auto Session::delete_range(const VersionedRequest& request, const TextRange& range,
                           std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {range.start.address, range.end.address},
                          [&](SpanEditor& editor) { return editor.delete_range(range); });
    });
}

auto Session::delete_backward(const VersionedRequest& request, const Caret& caret,
                              std::size_t count, std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {caret.address}, [&](SpanEditor& editor) {
            return editor.delete_backward(caret, count);
        });
    });
}

auto Session::delete_forward(const VersionedRequest& request, const Caret& caret,
                             std::size_t count, std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {caret.address}, [&](SpanEditor& editor) {
            return editor.delete_forward(caret, count);
        });
    });
}

auto Session::insert_break(const VersionedRequest& request, const Caret& caret,
                           std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        return apply_edit(page, ChangeKind::edit, {caret.address}, [&](SpanEditor& editor) {
            return editor.insert_break(caret);
        });
    });
}

auto Session::undo(const VersionedRequest& request, std::size_t page) -> Reply {
    return versioned(request, page, [&] { return history_step(page, false); });
}

auto Session::redo(const VersionedRequest& request, std::size_t page) -> Reply {
    return versioned(request, page, [&] { return history_step(page, true); });
}

auto Session::load_document(const VersionedRequest& request, std::span<const std::byte> bytes,
                            std::size_t page) -> Reply {
    return versioned(request, page, [&] {
        auto loaded = engine_->load(bytes);
        if (!loaded) {
            spdlog::warn("rejected upload of {} bytes: not a document", bytes.size());
            return error_reply(ReplyStatus::bad_request,
                               Error{ErrorKind::invalid_document_format, "Invalid document format"});
        }

        auto previous = capture();
        document_ = std::move(*loaded);
        document_.readdress_all_runs(minter_);
        history_.reset_to(std::move(previous));
        concurrency_.reset_doc_id(mint_doc_id());
        concurrency_.bump_version();
        spdlog::info("loaded document {} ({} paragraphs) at version {}",
                     concurrency_.doc_id(), document_.paragraph_count(), concurrency_.version());
        // A fresh document always opens on its first page.
        return finish(payload(1), 1, nullptr);
    });
}

// -- Inspection ---------------------------------------------------------------

auto Session::identity() const -> DocIdentity {
    auto lock = std::shared_lock{mutex_};
    return concurrency_.identity();
}

auto Session::history_info() const -> HistoryInfo {
    auto lock = std::shared_lock{mutex_};
    return history_.info();
}

auto Session::page_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return engine_->page_count(document_);
}

auto Session::text() const -> std::string {
    auto lock = std::shared_lock{mutex_};
    return document_.text();
}

auto Session::snapshot() const -> Document {
    auto lock = std::shared_lock{mutex_};
    return document_;
}

}  // namespace docspan_cpp
