/// @file error.hpp
/// @brief Error types for the docspan-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace docspan_cpp {

/// Categories of errors that can occur while serving an edit.
enum class ErrorKind : std::uint8_t {
    doc_conflict,             ///< The request names a document identity that was replaced.
    version_conflict,         ///< The request was built against a stale version.
    address_not_found,        ///< A referenced stable address has no bound run.
    invalid_document_format,  ///< Loaded bytes could not be parsed.
    render_failure,           ///< The engine failed to render the document.
    invalid_request,          ///< A wire request is missing or mistypes a field.
};

/// Convert an ErrorKind to its string representation.
///
/// These strings are also the `error` values used in reply payloads.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::doc_conflict:            return "doc_conflict";
        case ErrorKind::version_conflict:        return "version_conflict";
        case ErrorKind::address_not_found:       return "address_not_found";
        case ErrorKind::invalid_document_format: return "invalid_document_format";
        case ErrorKind::render_failure:          return "render_failure";
        case ErrorKind::invalid_request:         return "invalid_request";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace docspan_cpp
