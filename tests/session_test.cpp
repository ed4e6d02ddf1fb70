#include <docspan-cpp/json.hpp>
#include <docspan-cpp/session.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace docspan_cpp;
using namespace std::chrono_literals;

namespace {

auto body_of(const Reply& reply) -> nlohmann::json {
    return nlohmann::json::parse(reply.body);
}

// A request against the session's current identity.
auto current(const Session& session, std::string op) -> VersionedRequest {
    auto id = session.identity();
    return VersionedRequest{id.doc_id, id.version, std::move(op)};
}

// Markup of the session's first page.
auto html_of(const Session& session) -> std::string {
    return body_of(session.render())["html"].get<std::string>();
}

auto address_at(const Session& session, std::size_t paragraph, std::size_t run = 0) -> Address {
    auto doc = session.snapshot();
    auto rid = doc.paragraphs().at(paragraph).runs.at(run);
    return *doc.addresses().address_of(rid);
}

auto as_bytes(std::string_view text) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    for (auto c : text) result.push_back(static_cast<std::byte>(c));
    return result;
}

auto red() -> StyleUpdate {
    auto s = StyleUpdate{};
    s.color = "#ff0000";
    return s;
}

auto bold(bool on = true) -> StyleUpdate {
    auto s = StyleUpdate{};
    s.bold = on;
    return s;
}

// Manually advanced time, so insert coalescing is deterministic.
struct ManualClock {
    std::chrono::steady_clock::time_point now{};

    auto fn() -> History::Clock {
        return [this] { return now; };
    }
};

// Delegates to NativeEngine but can be told to fail every render.
class FlakyEngine final : public DocumentEngine {
public:
    auto default_document() const -> Document override { return inner_.default_document(); }
    auto serialize(const Document& doc) const -> std::vector<std::byte> override {
        return inner_.serialize(doc);
    }
    auto load(std::span<const std::byte> bytes) const -> std::optional<Document> override {
        return inner_.load(bytes);
    }
    auto page_count(const Document& doc) const -> std::size_t override {
        return inner_.page_count(doc);
    }
    auto render_html(const Document& doc, std::optional<std::size_t> page) const
        -> std::optional<std::string> override {
        if (fail_render) return std::nullopt;
        return inner_.render_html(doc, page);
    }
    auto render_paragraph(const Document& doc, ParagraphId paragraph) const
        -> std::optional<std::string> override {
        if (fail_render) return std::nullopt;
        return inner_.render_paragraph(doc, paragraph);
    }

    std::atomic<bool> fail_render{false};

private:
    NativeEngine inner_;
};

}  // anonymous namespace

// -- Construction and unversioned calls ---------------------------------------

TEST(Session, requires_an_engine) {
    EXPECT_THROW(Session{nullptr}, std::invalid_argument);
}

TEST(Session, starts_addressed_at_version_zero) {
    auto session = Session{};
    auto doc = session.snapshot();

    EXPECT_EQ(session.identity().version, 0u);
    EXPECT_EQ(session.identity().doc_id.size(), 32u);
    EXPECT_EQ(doc.paragraph_count(), 3u);
    EXPECT_EQ(doc.addresses().size(), doc.run_count());
}

TEST(Session, init_replaces_identity_and_bumps_version) {
    auto session = Session{};
    auto before = session.identity();

    auto reply = session.init();
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    auto body = body_of(reply);

    EXPECT_NE(body["docId"].get<std::string>(), before.doc_id);
    EXPECT_EQ(body["version"], before.version + 1);
    EXPECT_EQ(body["history"]["canUndo"], false);
    EXPECT_EQ(body["pageIndex"], 1);
    EXPECT_EQ(body["pageCount"], 1);
    EXPECT_NE(body["html"].get<std::string>().find("Hello, this is a prototype document."),
              std::string::npos);
}

TEST(Session, render_clamps_page_and_does_not_bump) {
    auto session = Session{};
    session.init();
    auto version = session.identity().version;

    EXPECT_EQ(body_of(session.render(0))["pageIndex"], 1);
    EXPECT_EQ(body_of(session.render(99))["pageIndex"], 1);
    EXPECT_EQ(session.identity().version, version);
}

TEST(Session, export_loads_back_to_same_text) {
    auto session = Session{};
    auto exported = session.export_document();
    auto doc = session.engine().load(exported);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->text(), session.text());
}

// -- Editing scenarios --------------------------------------------------------

TEST(Session, insert_then_style_the_inserted_text) {
    auto session = Session{};
    session.init();
    auto address = address_at(session, 0);

    auto insert = session.insert_text(current(session, "op-1"), Caret{address, 0}, "ABCDE",
                                      std::nullopt);
    ASSERT_EQ(insert.status, ReplyStatus::ok);
    auto inserted = body_of(insert);
    EXPECT_EQ(inserted["selection"]["anchor"]["nodeId"].get<std::string>(), address);
    EXPECT_EQ(inserted["selection"]["anchor"]["offset"], 5);
    ASSERT_EQ(inserted["patches"].size(), 1u);
    EXPECT_EQ(inserted["patches"][0]["paragraphIndex"], 0);
    EXPECT_FALSE(inserted.contains("html"));

    auto style = session.update_range_style(current(session, "op-2"),
                                            TextRange{Caret{address, 0}, Caret{address, 5}}, red());
    ASSERT_EQ(style.status, ReplyStatus::ok);

    auto render = body_of(session.render());
    auto expected = "color:#ff0000\"><a name=\"" + address + "\">ABCDE</a>";
    EXPECT_NE(render["html"].get<std::string>().find(expected), std::string::npos);
    EXPECT_EQ(render["docId"].get<std::string>(), session.identity().doc_id);
    EXPECT_EQ(render["version"], session.identity().version);
}

TEST(Session, backspace_at_paragraph_start_merges) {
    auto session = Session{};
    auto loaded = session.load_document(current(session, "upload"), as_bytes("Hello\nWorld"));
    ASSERT_EQ(loaded.status, ReplyStatus::ok);
    auto hello = address_at(session, 0);
    auto world = address_at(session, 1);

    auto reply = session.delete_backward(current(session, "bs"), Caret{world, 0});
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    auto body = body_of(reply);

    EXPECT_EQ(session.text(), "HelloWorld");
    EXPECT_EQ(body["selection"]["anchor"]["nodeId"].get<std::string>(), hello);
    EXPECT_EQ(body["selection"]["anchor"]["offset"], 5);
    EXPECT_TRUE(body.contains("html"));
    EXPECT_FALSE(body.contains("patches"));
}

TEST(Session, structural_edit_returns_full_page) {
    auto session = Session{};
    auto address = address_at(session, 0);

    auto body = body_of(session.insert_break(current(session, "br"), Caret{address, 5}));
    EXPECT_TRUE(body.contains("html"));
    EXPECT_EQ(session.snapshot().paragraph_count(), 4u);
}

TEST(Session, patches_can_be_disabled) {
    auto options = SessionOptions{};
    options.patches_enabled = false;
    auto session = Session{std::make_shared<NativeEngine>(), options};
    auto address = address_at(session, 0);

    auto body = body_of(session.insert_text(current(session, "op"), Caret{address, 0}, "x",
                                            std::nullopt));
    EXPECT_TRUE(body.contains("html"));
    EXPECT_FALSE(body.contains("patches"));
}

// -- Optimistic concurrency ---------------------------------------------------

TEST(Session, stale_version_is_rejected_with_current_state) {
    auto session = Session{};
    session.init();
    auto address = address_at(session, 0);
    auto stale = current(session, "first");

    ASSERT_EQ(session.update_document_style(stale, bold()).status, ReplyStatus::ok);
    auto text = session.text();
    auto identity = session.identity();

    auto late = VersionedRequest{stale.doc_id, stale.base_version, "second"};
    auto reply = session.insert_text(late, Caret{address, 0}, "lost", std::nullopt);
    EXPECT_EQ(reply.status, ReplyStatus::conflict);
    auto body = body_of(reply);
    EXPECT_EQ(body["error"], "version_conflict");
    EXPECT_EQ(body["docId"].get<std::string>(), identity.doc_id);
    EXPECT_EQ(body["version"], identity.version);
    EXPECT_TRUE(body.contains("html"));

    EXPECT_EQ(session.text(), text);
    EXPECT_EQ(session.identity(), identity);
}

TEST(Session, unknown_doc_id_is_a_doc_conflict) {
    auto session = Session{};
    auto request = VersionedRequest{"some-other-document", session.identity().version, "op"};

    auto reply = session.update_document_style(request, bold());
    EXPECT_EQ(reply.status, ReplyStatus::conflict);
    EXPECT_EQ(body_of(reply)["error"], "doc_conflict");
}

TEST(Session, retried_request_replays_cached_reply) {
    auto session = Session{};
    auto address = address_at(session, 0);
    auto request = current(session, "op-1");

    auto first = session.insert_text(request, Caret{address, 0}, "Hi ", std::nullopt);
    auto second = session.insert_text(request, Caret{address, 0}, "Hi ", std::nullopt);
    EXPECT_EQ(first, second);
    EXPECT_EQ(session.identity().version, request.base_version + 1);
    EXPECT_EQ(session.text().find("Hi Hi"), std::string::npos);

    session.update_document_style(current(session, "op-2"), bold());
    auto third = session.insert_text(request, Caret{address, 0}, "Hi ", std::nullopt);
    EXPECT_EQ(third, first);
}

TEST(Session, version_advances_by_one_per_applied_mutation) {
    auto session = Session{};
    auto address = address_at(session, 0);
    auto version = session.identity().version;

    session.insert_text(current(session, "a"), Caret{address, 0}, "x", std::nullopt);
    EXPECT_EQ(session.identity().version, version + 1);
    session.update_node_style(current(session, "b"), address, 0, 1, red());
    EXPECT_EQ(session.identity().version, version + 2);
    session.delete_forward(current(session, "c"), Caret{address, 0});
    EXPECT_EQ(session.identity().version, version + 3);

    session.delete_forward(VersionedRequest{session.identity().doc_id, version, "d"},
                           Caret{address, 0});
    EXPECT_EQ(session.identity().version, version + 3);
}

TEST(Session, concurrent_writers_serialize) {
    auto session = Session{};
    const auto start = session.identity().version;
    constexpr int threads = 4;
    constexpr int edits = 25;

    auto workers = std::vector<std::thread>{};
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&session, t] {
            for (int i = 0; i < edits; ++i) {
                auto op = "t" + std::to_string(t) + "-" + std::to_string(i);
                for (;;) {
                    auto reply = session.update_document_style(current(session, op), bold(i % 2 == 0));
                    if (reply.status == ReplyStatus::ok) break;
                }
                EXPECT_EQ(session.render().status, ReplyStatus::ok);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(session.identity().version, start + threads * edits);
}

// -- Addressing ---------------------------------------------------------------

TEST(Session, unbound_address_is_a_versioned_noop_by_default) {
    auto session = Session{};
    auto text = session.text();
    auto version = session.identity().version;

    auto reply = session.insert_text(current(session, "op"), Caret{"Run_gone", 0}, "x",
                                     std::nullopt);
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    EXPECT_EQ(session.text(), text);
    EXPECT_EQ(session.identity().version, version + 1);
    EXPECT_EQ(session.history_info().undo_depth, 1u);
    EXPECT_TRUE(body_of(reply).contains("html"));
}

TEST(Session, strict_addressing_rejects_unbound_address) {
    auto options = SessionOptions{};
    options.strict_addressing = true;
    auto session = Session{std::make_shared<NativeEngine>(), options};
    auto version = session.identity().version;

    auto reply = session.insert_text(current(session, "op"), Caret{"Run_gone", 0}, "x",
                                     std::nullopt);
    EXPECT_EQ(reply.status, ReplyStatus::bad_request);
    EXPECT_EQ(body_of(reply)["error"], "address_not_found");
    EXPECT_EQ(session.identity().version, version);
    EXPECT_EQ(session.history_info().undo_depth, 0u);
}

TEST(Session, invalid_utf8_text_is_rejected) {
    auto session = Session{};
    auto address = address_at(session, 0);
    auto version = session.identity().version;

    auto reply = session.insert_text(current(session, "op"), Caret{address, 0}, "\xFF",
                                     std::nullopt);
    EXPECT_EQ(reply.status, ReplyStatus::bad_request);
    EXPECT_EQ(body_of(reply)["error"], "invalid_request");
    EXPECT_EQ(session.identity().version, version);
}

// -- History ------------------------------------------------------------------

TEST(Session, undo_and_redo_walk_back_and_forth) {
    auto clock = ManualClock{};
    auto session = Session{std::make_shared<NativeEngine>(), SessionOptions{}, clock.fn()};
    auto a0 = address_at(session, 0);
    auto a1 = address_at(session, 1);
    auto a2 = address_at(session, 2);

    auto states = std::vector<std::vector<std::byte>>{session.export_document()};
    auto pages = std::vector<std::string>{html_of(session)};
    auto step = [&](auto&& mutate) {
        ASSERT_EQ(mutate().status, ReplyStatus::ok);
        states.push_back(session.export_document());
        pages.push_back(html_of(session));
        clock.now += 10s;
    };
    step([&] { return session.insert_text(current(session, "m1"), Caret{a0, 0}, "Start: ", std::nullopt); });
    step([&] { return session.update_node_style(current(session, "m2"), a1, 0, 3, bold()); });
    step([&] { return session.delete_range(current(session, "m3"), TextRange{Caret{a2, 0}, Caret{a2, 6}}); });
    step([&] { return session.insert_break(current(session, "m4"), Caret{a2, 4}); });
    step([&] { return session.insert_text(current(session, "m5"), Caret{a1, 1}, "!", std::nullopt); });

    for (int k = 4; k >= 0; --k) {
        auto reply = session.undo(current(session, "u" + std::to_string(k)));
        ASSERT_EQ(reply.status, ReplyStatus::ok);
        EXPECT_EQ(body_of(reply)["didUndo"], true);
        EXPECT_EQ(session.export_document(), states[k]);
        EXPECT_EQ(html_of(session), pages[k]);
    }
    EXPECT_EQ(body_of(session.undo(current(session, "u-extra")))["didUndo"], false);

    for (int k = 1; k <= 5; ++k) {
        auto reply = session.redo(current(session, "r" + std::to_string(k)));
        EXPECT_EQ(body_of(reply)["didRedo"], true);
        EXPECT_EQ(session.export_document(), states[k]);
        EXPECT_EQ(html_of(session), pages[k]);
    }
    EXPECT_EQ(session.history_info().can_redo, false);
}

TEST(Session, undo_after_a_break_renders_the_same_paragraph_ids) {
    auto session = Session{};
    auto address = address_at(session, 0);
    ASSERT_EQ(session.insert_break(current(session, "br"), Caret{address, 5}).status,
              ReplyStatus::ok);
    auto split = session.snapshot().paragraphs()[1].id;
    auto before = html_of(session);
    EXPECT_NE(before.find("data-paragraph=\"" + std::to_string(split) + "\""), std::string::npos);

    session.update_document_style(current(session, "bold"), bold());
    auto after = html_of(session);

    auto undo = body_of(session.undo(current(session, "undo")));
    EXPECT_EQ(undo["html"].get<std::string>(), before);
    EXPECT_EQ(html_of(session), before);
    EXPECT_EQ(session.snapshot().paragraphs()[1].id, split);

    session.redo(current(session, "redo"));
    EXPECT_EQ(html_of(session), after);
}

TEST(Session, undo_bumps_version_and_keeps_doc_id) {
    auto session = Session{};
    session.update_document_style(current(session, "edit"), bold());
    auto before = session.identity();

    auto body = body_of(session.undo(current(session, "undo")));
    EXPECT_EQ(body["version"], before.version + 1);
    EXPECT_EQ(body["docId"].get<std::string>(), before.doc_id);
    EXPECT_EQ(body["history"]["canRedo"], true);
}

TEST(Session, empty_undo_does_not_bump_and_is_cached) {
    auto session = Session{};
    auto request = current(session, "undo");

    auto first = session.undo(request);
    EXPECT_EQ(first.status, ReplyStatus::ok);
    EXPECT_EQ(body_of(first)["didUndo"], false);
    EXPECT_EQ(session.identity().version, request.base_version);
    EXPECT_EQ(session.undo(request), first);
}

TEST(Session, typing_burst_is_one_undo_step) {
    auto clock = ManualClock{};
    auto session = Session{std::make_shared<NativeEngine>(), SessionOptions{}, clock.fn()};
    auto address = address_at(session, 0);
    auto original = session.text();

    session.insert_text(current(session, "k1"), Caret{address, 0}, "a", std::nullopt);
    clock.now += 1s;
    session.insert_text(current(session, "k2"), Caret{address, 1}, "b", std::nullopt);
    EXPECT_EQ(session.history_info().undo_depth, 1u);

    session.undo(current(session, "undo"));
    EXPECT_EQ(session.text(), original);
}

TEST(Session, history_depth_is_bounded) {
    auto options = SessionOptions{};
    options.history_capacity = 3;
    auto session = Session{std::make_shared<NativeEngine>(), options};

    for (int i = 0; i < 6; ++i) {
        session.update_document_style(current(session, std::to_string(i)), bold(i % 2 == 0));
    }
    EXPECT_EQ(session.history_info().undo_depth, 3u);
}

// -- Upload -------------------------------------------------------------------

TEST(Session, upload_replaces_document_and_is_undoable) {
    auto session = Session{};
    session.update_document_style(current(session, "edit"), bold());
    auto original = session.text();
    auto before = session.identity();

    auto reply = session.load_document(current(session, "upload"), as_bytes("Alpha\nBeta"));
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    auto body = body_of(reply);
    EXPECT_NE(body["docId"].get<std::string>(), before.doc_id);
    EXPECT_EQ(body["version"], before.version + 1);
    EXPECT_EQ(session.text(), "Alpha\nBeta");
    EXPECT_EQ(session.history_info(), (HistoryInfo{true, false, 1, 0}));

    auto undo = body_of(session.undo(current(session, "undo")));
    EXPECT_EQ(undo["didUndo"], true);
    EXPECT_EQ(session.text(), original);
    EXPECT_EQ(undo["docId"], body["docId"]);
}

TEST(Session, upload_always_shows_the_first_page) {
    auto session = Session{std::make_shared<NativeEngine>(EngineOptions{1, 64})};
    auto request = current(session, "upload");

    auto reply = session.load_document(request, as_bytes("A\nB\nC"), 3);
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    auto body = body_of(reply);
    EXPECT_EQ(body["pageIndex"], 1);
    EXPECT_EQ(body["pageCount"], 3);
    auto html = body["html"].get<std::string>();
    EXPECT_NE(html.find(">A</a>"), std::string::npos);
    EXPECT_EQ(html.find(">C</a>"), std::string::npos);

    // The replay is keyed by the page as requested.
    EXPECT_EQ(session.load_document(request, as_bytes("A\nB\nC"), 3), reply);
}

TEST(Session, upload_of_garbage_changes_nothing) {
    auto session = Session{};
    auto text = session.text();
    auto identity = session.identity();

    auto reply = session.load_document(current(session, "upload"), as_bytes("\xFF\xFE"));
    EXPECT_EQ(reply.status, ReplyStatus::bad_request);
    EXPECT_EQ(body_of(reply)["error"], "invalid_document_format");
    EXPECT_EQ(session.text(), text);
    EXPECT_EQ(session.identity(), identity);
}

TEST(Session, upload_with_stale_identity_conflicts) {
    auto session = Session{};
    auto request = VersionedRequest{"elsewhere", 0, "upload"};

    auto reply = session.load_document(request, as_bytes("Alpha"));
    EXPECT_EQ(reply.status, ReplyStatus::conflict);
    EXPECT_NE(session.text(), "Alpha");
}

// -- Oversized counts ---------------------------------------------------------

TEST(Session, huge_delete_count_returns_at_document_edges) {
    auto session = Session{};
    auto first = address_at(session, 0);
    auto text = session.text();
    auto id = session.identity();

    auto reply = dispatch(session, "delete_backward", {
        {"doc_id", id.doc_id}, {"base_version", id.version}, {"client_op_id", "bs"},
        {"node_id", first}, {"offset", 0}, {"count", 4000000000000000000LL}});
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    EXPECT_EQ(session.text(), text);

    auto doc = session.snapshot();
    auto last_run = doc.paragraphs().back().runs.back();
    auto last = *doc.addresses().address_of(last_run);
    id = session.identity();
    reply = dispatch(session, "delete_forward", {
        {"doc_id", id.doc_id}, {"base_version", id.version}, {"client_op_id", "del"},
        {"node_id", last}, {"offset", doc.run_length(last_run)},
        {"count", 4000000000000000000LL}});
    ASSERT_EQ(reply.status, ReplyStatus::ok);
    EXPECT_EQ(session.text(), text);
}

// -- Render failure -----------------------------------------------------------

TEST(Session, render_failure_is_reported_after_the_edit_applied) {
    auto engine = std::make_shared<FlakyEngine>();
    auto session = Session{engine};
    auto address = address_at(session, 0);
    auto request = current(session, "br");

    engine->fail_render = true;
    auto reply = session.insert_break(request, Caret{address, 5});
    EXPECT_EQ(reply.status, ReplyStatus::render_failure);
    auto body = body_of(reply);
    EXPECT_EQ(body["error"], "render_failure");
    EXPECT_EQ(body["version"], request.base_version + 1);
    EXPECT_EQ(session.snapshot().paragraph_count(), 4u);

    EXPECT_EQ(session.render().status, ReplyStatus::render_failure);

    // Failures are not cached: the retry is checked against the new version.
    engine->fail_render = false;
    auto retry = session.insert_break(request, Caret{address, 5});
    EXPECT_EQ(retry.status, ReplyStatus::conflict);
    EXPECT_EQ(body_of(retry)["error"], "version_conflict");
}
