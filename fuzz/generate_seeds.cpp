// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <docspan-cpp/docspan.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace ds = docspan_cpp;

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    write_seed(path, std::string_view{reinterpret_cast<const char*>(data.data()), data.size()});
}

int main() {
    namespace fs = std::filesystem;
    const auto load_dir = std::string{"fuzz/corpus/load"};
    const auto dispatch_dir = std::string{"fuzz/corpus/dispatch"};
    fs::create_directories(load_dir);
    fs::create_directories(dispatch_dir);

    const auto engine = ds::NativeEngine{};
    auto minter = ds::AddressMinter{1};

    // Load seed 1: the default document, addressed
    {
        auto doc = engine.default_document();
        doc.readdress_all_runs(minter);
        write_seed(load_dir + "/seed_default.json", engine.serialize(doc));
    }

    // Load seed 2: mixed formatting across runs and paragraphs
    {
        auto doc = ds::Document{};
        auto p = doc.append_paragraph(ds::ParagraphFormat{ds::Alignment::center, 12.0});
        doc.append_run(p, "Bold ", ds::RunFormat{"Arial", 14.0, ds::Color{200, 0, 0}, true, false});
        doc.append_run(p, "italic", ds::RunFormat{"Georgia", 11.0, ds::Color{}, false, true});
        doc.append_run(doc.append_paragraph(), "plain", ds::RunFormat{});
        doc.readdress_all_runs(minter);
        write_seed(load_dir + "/seed_formatted.json", engine.serialize(doc));
    }

    // Load seed 3: plain text
    write_seed(load_dir + "/seed_plain.txt", std::string_view{"first line\r\nsecond line\n\nfourth"});

    // Dispatch seeds: first byte selects the action (high bit patches identity)
    {
        auto session = ds::Session{};
        auto doc = session.snapshot();
        auto address = *doc.addresses().address_of(doc.paragraphs()[0].runs[0]);

        auto insert = nlohmann::json{{"client_op_id", "seed"}, {"node_id", address},
                                     {"offset", 3}, {"text", "abc"}, {"style", {{"bold", true}}}};
        write_seed(dispatch_dir + "/seed_insert.bin", std::string{char(0x80 | 5)} + insert.dump());

        auto range = nlohmann::json{{"client_op_id", "seed"}, {"start_node_id", address},
                                    {"start_offset", 0}, {"end_node_id", address},
                                    {"end_offset", 5}, {"style", {{"color", "#00ff00"}}}};
        write_seed(dispatch_dir + "/seed_range.bin", std::string{char(0x80 | 4)} + range.dump());

        auto backspace = nlohmann::json{{"client_op_id", "seed"}, {"node_id", address},
                                        {"offset", 0}, {"count", 2}};
        write_seed(dispatch_dir + "/seed_backspace.bin", std::string{char(0x80 | 7)} + backspace.dump());
    }

    return 0;
}
