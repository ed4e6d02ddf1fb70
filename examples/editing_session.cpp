// editing_session - one client editing a document through a Session
//
// Demonstrates: init, insert_text, partial-range styling, paragraph breaks,
//               backspace across paragraphs, undo/redo, paragraph patches

#include <docspan-cpp/docspan.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace ds = docspan_cpp;

namespace {

auto request(const ds::Session& session, const std::string& op) -> ds::VersionedRequest {
    auto id = session.identity();
    return ds::VersionedRequest{id.doc_id, id.version, op};
}

void show(const char* label, const ds::Reply& reply) {
    auto body = nlohmann::json::parse(reply.body);
    std::printf("%-14s status=%s version=%s",
                label, std::string{ds::to_string_view(reply.status)}.c_str(),
                body.contains("version") ? body["version"].dump().c_str() : "-");
    if (body.contains("patches")) {
        std::printf(" patches=%zu", body["patches"].size());
    } else if (body.contains("html")) {
        std::printf(" html=%zu bytes", body["html"].get<std::string>().size());
    }
    if (body.contains("selection")) {
        std::printf(" caret=%s", body["selection"]["anchor"].dump().c_str());
    }
    std::printf("\n");
}

auto first_address(const ds::Session& session, std::size_t paragraph) -> ds::Address {
    auto doc = session.snapshot();
    return *doc.addresses().address_of(doc.paragraphs().at(paragraph).runs.front());
}

}  // anonymous namespace

int main() {
    auto session = ds::Session{};
    show("init", session.init());

    // Typing at the start of the first paragraph: the inserted text takes
    // over the run's address, so the caret keeps pointing at it.
    auto address = first_address(session, 0);
    show("insert", session.insert_text(request(session, "op-1"), ds::Caret{address, 0},
                                       "Welcome! ", std::nullopt));

    // Colour just the word we typed.
    auto red = ds::StyleUpdate{};
    red.color = "#cc0000";
    red.bold = true;
    show("style", session.update_node_style(request(session, "op-2"), address, 0, 8, red));

    // Split the second paragraph, then join it back with a backspace.
    auto second = first_address(session, 1);
    show("break", session.insert_break(request(session, "op-3"), ds::Caret{second, 8}));
    show("backspace", session.delete_backward(request(session, "op-4"), ds::Caret{second, 0}));

    std::printf("\nText now:\n%s\n\n", session.text().c_str());

    // Retrying a request returns the very same reply.
    auto retry = request(session, "op-5");
    auto first = session.delete_forward(retry, ds::Caret{address, 0}, 3);
    auto again = session.delete_forward(retry, ds::Caret{address, 0}, 3);
    std::printf("retried reply identical: %s\n", first == again ? "yes" : "no");

    show("undo", session.undo(request(session, "op-6")));
    show("undo", session.undo(request(session, "op-7")));
    show("redo", session.redo(request(session, "op-8")));

    auto info = session.history_info();
    std::printf("\nHistory: undo=%zu redo=%zu\n", info.undo_depth, info.redo_depth);

    auto html = nlohmann::json::parse(session.render().body)["html"].get<std::string>();
    std::printf("\nRendered page 1:\n%s\n", html.c_str());
    return 0;
}
