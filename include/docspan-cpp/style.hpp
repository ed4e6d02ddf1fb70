/// @file style.hpp
/// @brief Character and paragraph formatting, and partial style updates.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docspan_cpp {

/// An RGB color.
struct Color {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    auto operator==(const Color&) const -> bool = default;
};

/// Parse a `#RRGGBB` hex color. Case-insensitive.
/// @return The color, or nullopt if the string is not exactly `#RRGGBB`.
auto parse_color(std::string_view hex) -> std::optional<Color>;

/// Format a color as lowercase `#rrggbb`.
auto to_hex(const Color& color) -> std::string;

/// Paragraph alignment.
enum class Alignment : std::uint8_t {
    left,
    center,
    right,
    justify,
};

/// Convert an Alignment to its string representation.
constexpr auto to_string_view(Alignment alignment) noexcept -> std::string_view {
    switch (alignment) {
        case Alignment::left:    return "left";
        case Alignment::center:  return "center";
        case Alignment::right:   return "right";
        case Alignment::justify: return "justify";
    }
    return "left";
}

/// Parse an alignment name (`left`, `center`, `right`, `justify`).
auto parse_alignment(std::string_view name) -> std::optional<Alignment>;

/// Uniform character formatting of a Run.
struct RunFormat {
    std::string font_name{"Times New Roman"};  ///< Font family.
    double font_size{12.0};                    ///< Size in points.
    Color color{};                             ///< Text color.
    bool bold{false};
    bool italic{false};

    auto operator==(const RunFormat&) const -> bool = default;
};

/// Block-level formatting of a Paragraph.
struct ParagraphFormat {
    Alignment alignment{Alignment::left};
    double first_line_indent{0.0};  ///< First line indent in points.

    auto operator==(const ParagraphFormat&) const -> bool = default;
};

/// A partial style update. Every field is optional; an absent field means
/// "leave unchanged", never "clear".
///
/// @code
/// auto style = StyleUpdate{};
/// style.color = "#ff0000";
/// style.bold = true;
/// @endcode
struct StyleUpdate {
    std::optional<std::string> font_name;
    std::optional<double> font_size;          ///< Ignored unless > 0.
    std::optional<std::string> color;         ///< `#RRGGBB`; ignored if unparsable.
    std::optional<Alignment> alignment;
    std::optional<double> first_line_indent;
    std::optional<bool> bold;
    std::optional<bool> italic;

    /// True if any character-level field is present.
    auto has_run_fields() const -> bool {
        return font_name || font_size || color || bold || italic;
    }

    /// True if any paragraph-level field is present.
    auto has_paragraph_fields() const -> bool {
        return alignment.has_value() || first_line_indent.has_value();
    }

    auto operator==(const StyleUpdate&) const -> bool = default;
};

/// Apply the character-level fields of an update to a run format.
void apply_style(RunFormat& format, const StyleUpdate& style);

/// Apply the paragraph-level fields of an update to a paragraph format.
void apply_style(ParagraphFormat& format, const StyleUpdate& style);

}  // namespace docspan_cpp
