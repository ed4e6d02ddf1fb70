#include <docspan-cpp/engine.hpp>

#include "encoding/utf8.hpp"
#include "executor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <string_view>

namespace docspan_cpp {

namespace {

constexpr auto native_format_tag = std::string_view{"docspan"};
constexpr auto native_format_version = 1;

constexpr auto default_paragraphs = std::array{
    std::string_view{"Hello, this is a prototype document."},
    std::string_view{"You can change the font style of this text using the controls on the right."},
    std::string_view{"Every edit is applied on the server and can be undone."},
};

auto as_chars(std::span<const std::byte> bytes) -> std::string_view {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>(text.size());
    std::ranges::transform(text, result.begin(),
                           [](char c) { return static_cast<std::byte>(c); });
    return result;
}

// -- Native JSON format -------------------------------------------------------

auto run_to_json(const Run& run, const AddressIndex& addresses) -> nlohmann::json {
    auto j = nlohmann::json{
        {"text", run.text},
        {"fontName", run.format.font_name},
        {"fontSize", run.format.font_size},
        {"color", to_hex(run.format.color)},
        {"bold", run.format.bold},
        {"italic", run.format.italic},
    };
    if (auto address = addresses.address_of(run.id)) {
        j["address"] = *address;
    }
    return j;
}

auto run_format_from_json(const nlohmann::json& j) -> std::optional<RunFormat> {
    auto format = RunFormat{};
    format.font_name = j.value("fontName", format.font_name);
    format.font_size = j.value("fontSize", format.font_size);
    format.bold = j.value("bold", false);
    format.italic = j.value("italic", false);
    if (j.contains("color")) {
        auto color = parse_color(j.at("color").get<std::string>());
        if (!color) return std::nullopt;
        format.color = *color;
    }
    if (format.font_size <= 0.0) return std::nullopt;
    return format;
}

auto paragraph_format_from_json(const nlohmann::json& j) -> std::optional<ParagraphFormat> {
    auto format = ParagraphFormat{};
    if (j.contains("alignment")) {
        auto alignment = parse_alignment(j.at("alignment").get<std::string>());
        if (!alignment) return std::nullopt;
        format.alignment = *alignment;
    }
    format.first_line_indent = j.value("firstLineIndent", 0.0);
    return format;
}

// Zero (take a fresh id) when absent or out of range.
auto paragraph_id_from_json(const nlohmann::json& j) -> ParagraphId {
    if (!j.contains("id") || !j.at("id").is_number_unsigned()) return 0;
    auto raw = j.at("id").get<std::uint64_t>();
    if (raw >= std::numeric_limits<ParagraphId>::max()) return 0;
    return static_cast<ParagraphId>(raw);
}

// Throws nlohmann::json::exception on mistyped fields; the caller maps that
// to "not a document".
auto document_from_json(const nlohmann::json& j) -> std::optional<Document> {
    if (!j.is_object()) return std::nullopt;
    if (j.value("format", std::string{}) != native_format_tag) return std::nullopt;
    if (j.value("version", 0) != native_format_version) return std::nullopt;

    const auto& paragraphs = j.at("paragraphs");
    if (!paragraphs.is_array()) return std::nullopt;

    auto doc = Document{};
    for (const auto& jp : paragraphs) {
        auto pformat = paragraph_format_from_json(jp);
        if (!pformat) return std::nullopt;
        auto pid = doc.append_paragraph_as(paragraph_id_from_json(jp), *pformat);

        const auto& runs = jp.value("runs", nlohmann::json::array());
        if (!runs.is_array()) return std::nullopt;
        for (const auto& jr : runs) {
            auto text = jr.at("text").get<std::string>();
            if (!encoding::utf8_valid(text)) return std::nullopt;
            auto rformat = run_format_from_json(jr);
            if (!rformat) return std::nullopt;
            auto rid = doc.append_run(pid, std::move(text), std::move(*rformat));

            // A duplicated address stays with its first run; the session
            // mints fresh ones for whatever is left unbound.
            if (jr.contains("address")) {
                auto address = jr.at("address").get<std::string>();
                if (!address.empty() && !doc.addresses().contains(address)) {
                    doc.addresses().bind(rid, std::move(address));
                }
            }
        }
    }
    return doc;
}

// -- Plain text import --------------------------------------------------------

auto document_from_text(std::string_view text) -> std::optional<Document> {
    if (text.empty() || !encoding::utf8_valid(text)) return std::nullopt;
    if (text.find('\0') != std::string_view::npos) return std::nullopt;

    auto doc = Document{};
    while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        if (line.ends_with('\r')) line.remove_suffix(1);
        doc.append_run(doc.append_paragraph(), std::string{line}, RunFormat{});
        if (eol == std::string_view::npos) break;
        text.remove_prefix(eol + 1);
    }
    return doc;
}

// -- HTML ---------------------------------------------------------------------

auto run_html(const Run& run, const AddressIndex& addresses) -> std::string {
    const auto& f = run.format;
    auto style = fmt::format("font-family:{};font-size:{:g}pt;color:{}",
                             escape_html(f.font_name), f.font_size, to_hex(f.color));
    if (f.bold) style += ";font-weight:bold";
    if (f.italic) style += ";font-style:italic";

    auto text = escape_html(run.text);
    if (auto address = addresses.address_of(run.id)) {
        return fmt::format("<span style=\"{}\"><a name=\"{}\">{}</a></span>",
                           style, escape_html(*address), text);
    }
    return fmt::format("<span style=\"{}\">{}</span>", style, text);
}

auto paragraph_html(const Document& doc, const Paragraph& p) -> std::string {
    auto html = fmt::format("<p data-paragraph=\"{}\" style=\"text-align:{};text-indent:{:g}pt\">",
                            p.id, to_string_view(p.format.alignment),
                            p.format.first_line_indent);
    for (auto rid : p.runs) {
        if (const auto* run = doc.run(rid)) {
            html += run_html(*run, doc.addresses());
        }
    }
    html += "</p>";
    return html;
}

}  // anonymous namespace

auto escape_html(std::string_view text) -> std::string {
    auto result = std::string{};
    result.reserve(text.size());
    for (auto c : text) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default:   result.push_back(c); break;
        }
    }
    return result;
}

NativeEngine::NativeEngine(EngineOptions options) : options_{options} {}

auto NativeEngine::default_document() const -> Document {
    auto doc = Document{};
    for (auto line : default_paragraphs) {
        doc.append_run(doc.append_paragraph(), std::string{line}, RunFormat{});
    }
    return doc;
}

auto NativeEngine::serialize(const Document& doc) const -> std::vector<std::byte> {
    auto paragraphs = nlohmann::json::array();
    for (const auto& p : doc.paragraphs()) {
        auto runs = nlohmann::json::array();
        for (auto rid : p.runs) {
            if (const auto* run = doc.run(rid)) {
                runs.push_back(run_to_json(*run, doc.addresses()));
            }
        }
        paragraphs.push_back({
            {"id", p.id},
            {"alignment", std::string{to_string_view(p.format.alignment)}},
            {"firstLineIndent", p.format.first_line_indent},
            {"runs", std::move(runs)},
        });
    }
    auto j = nlohmann::json{
        {"format", std::string{native_format_tag}},
        {"version", native_format_version},
        {"paragraphs", std::move(paragraphs)},
    };
    return to_bytes(j.dump());
}

auto NativeEngine::load(std::span<const std::byte> bytes) const -> std::optional<Document> {
    auto text = as_chars(bytes);
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos || text[first] != '{') {
        return document_from_text(text);
    }

    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    try {
        return document_from_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("rejected native document: {}", e.what());
        return std::nullopt;
    }
}

auto NativeEngine::page_count(const Document& doc) const -> std::size_t {
    const auto per_page = options_.paragraphs_per_page;
    if (per_page == 0 || doc.paragraph_count() == 0) return 1;
    return (doc.paragraph_count() + per_page - 1) / per_page;
}

auto NativeEngine::render_html(const Document& doc, std::optional<std::size_t> page) const
    -> std::optional<std::string> {

    const auto& paragraphs = doc.paragraphs();
    auto first = std::size_t{0};
    auto last = paragraphs.size();
    if (page && options_.paragraphs_per_page > 0) {
        if (*page == 0 || *page > page_count(doc)) return std::nullopt;
        first = (*page - 1) * options_.paragraphs_per_page;
        last = std::min(last, first + options_.paragraphs_per_page);
    }

    const auto count = last - first;
    auto fragments = std::vector<std::string>(count);
    const auto threshold = options_.parallel_render_threshold;
    if (threshold > 0 && count >= threshold) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, [&](std::size_t i) {
            fragments[i] = paragraph_html(doc, paragraphs[first + i]);
        });
        detail::global_executor().run(taskflow).wait();
    } else {
        for (std::size_t i = 0; i < count; ++i) {
            fragments[i] = paragraph_html(doc, paragraphs[first + i]);
        }
    }

    auto html = std::string{};
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) html.push_back('\n');
        html += fragments[i];
    }
    return html;
}

auto NativeEngine::render_paragraph(const Document& doc, ParagraphId paragraph) const
    -> std::optional<std::string> {
    const auto* p = doc.paragraph(paragraph);
    if (!p) return std::nullopt;
    return paragraph_html(doc, *p);
}

}  // namespace docspan_cpp
