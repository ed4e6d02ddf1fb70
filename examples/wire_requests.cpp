// wire_requests - driving a session with JSON requests
//
// Demonstrates: dispatch_text with snake_case request bodies, configuration
//               from JSON, plain-text upload, export to the native format
//
// Usage: wire_requests [config.json]

#include <docspan-cpp/docspan.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

namespace ds = docspan_cpp;
using json = nlohmann::json;

namespace {

auto envelope(const ds::Session& session, const std::string& op) -> json {
    auto id = session.identity();
    return json{{"doc_id", id.doc_id}, {"base_version", id.version}, {"client_op_id", op}};
}

void send(ds::Session& session, const char* action, const json& request) {
    auto text = request.dump();
    auto reply = ds::dispatch_text(session, action, text);
    auto body = json::parse(reply.body);
    body.erase("html");
    std::printf(">> %s %s\n<< %s %s\n\n", action, text.c_str(),
                std::string{ds::to_string_view(reply.status)}.c_str(), body.dump().c_str());
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto config = ds::Config{};
    if (argc > 1) {
        try {
            config = ds::load_config(argv[1]);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "%s\n", e.what());
            return 1;
        }
    }
    std::printf("config: %s\n\n", json{{"session", config.session}, {"engine", config.engine}}.dump().c_str());

    auto session = ds::Session{std::make_shared<ds::NativeEngine>(config.engine), config.session};

    // Upload a plain-text document; every line becomes a paragraph.
    auto upload = std::string{"Quarterly report\nRevenue grew in every region.\nCosts stayed flat."};
    auto bytes = std::vector<std::byte>{};
    for (auto c : upload) bytes.push_back(static_cast<std::byte>(c));
    auto id = session.identity();
    auto loaded = session.load_document(ds::VersionedRequest{id.doc_id, id.version, "upload"}, bytes);
    std::printf("upload: %s, %zu page(s)\n\n",
                std::string{ds::to_string_view(loaded.status)}.c_str(), session.page_count());

    auto doc = session.snapshot();
    auto title = *doc.addresses().address_of(doc.paragraphs()[0].runs[0]);

    auto center = envelope(session, "op-1");
    center["start_node_id"] = title;
    center["start_offset"] = 0;
    center["end_node_id"] = title;
    center["end_offset"] = 16;
    center["style"] = {{"alignment", "center"}, {"font_size", 20}, {"bold", true}};
    send(session, "update_range", center);

    auto insert = envelope(session, "op-2");
    insert["node_id"] = title;
    insert["offset"] = 16;
    insert["text"] = " (draft)";
    insert["style"] = {{"italic", true}, {"color", "#777777"}};
    send(session, "insert_text", insert);

    send(session, "undo", envelope(session, "op-3"));
    send(session, "bogus", envelope(session, "op-4"));

    auto exported = session.export_document();
    std::printf("native export: %s\n",
                std::string{reinterpret_cast<const char*>(exported.data()), exported.size()}.c_str());
    return 0;
}
