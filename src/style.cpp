#include <docspan-cpp/style.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace docspan_cpp {

namespace {

auto hex_nibble(char c) -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

auto hex_byte(std::string_view two) -> std::optional<std::uint8_t> {
    auto hi = hex_nibble(two[0]);
    auto lo = hex_nibble(two[1]);
    if (!hi || !lo) return std::nullopt;
    return static_cast<std::uint8_t>((*hi << 4) | *lo);
}

}  // anonymous namespace

auto parse_color(std::string_view hex) -> std::optional<Color> {
    if (hex.size() != 7 || hex[0] != '#') return std::nullopt;
    auto r = hex_byte(hex.substr(1, 2));
    auto g = hex_byte(hex.substr(3, 2));
    auto b = hex_byte(hex.substr(5, 2));
    if (!r || !g || !b) return std::nullopt;
    return Color{*r, *g, *b};
}

auto to_hex(const Color& color) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{"#"};
    for (auto channel : std::array{color.r, color.g, color.b}) {
        result.push_back(hex_chars[channel >> 4]);
        result.push_back(hex_chars[channel & 0x0F]);
    }
    return result;
}

auto parse_alignment(std::string_view name) -> std::optional<Alignment> {
    if (name == "left") return Alignment::left;
    if (name == "center") return Alignment::center;
    if (name == "right") return Alignment::right;
    if (name == "justify") return Alignment::justify;
    return std::nullopt;
}

void apply_style(RunFormat& format, const StyleUpdate& style) {
    if (style.font_name && !style.font_name->empty()) {
        format.font_name = *style.font_name;
    }
    if (style.font_size && *style.font_size > 0.0) {
        format.font_size = *style.font_size;
    }
    if (style.color) {
        if (auto parsed = parse_color(*style.color)) {
            format.color = *parsed;
        } else {
            spdlog::warn("ignoring unparsable color '{}'", *style.color);
        }
    }
    if (style.bold) format.bold = *style.bold;
    if (style.italic) format.italic = *style.italic;
}

void apply_style(ParagraphFormat& format, const StyleUpdate& style) {
    if (style.alignment) format.alignment = *style.alignment;
    if (style.first_line_indent) format.first_line_indent = *style.first_line_indent;
}

}  // namespace docspan_cpp
