/// @file options.hpp
/// @brief Session and engine configuration.

#pragma once

#include <docspan-cpp/engine.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace docspan_cpp {

/// Per-session tuning.
struct SessionOptions {
    std::size_t history_capacity{50};                       ///< Depth of each history stack.
    std::chrono::milliseconds coalesce_window{2500};        ///< Insert coalescing window.
    std::size_t op_cache_capacity{5000};                    ///< Cached replies kept per session.
    bool strict_addressing{false};                          ///< Reject edits on unbound addresses.
    bool patches_enabled{true};                             ///< Reply with paragraph patches when possible.

    auto operator==(const SessionOptions&) const -> bool = default;
};

/// Everything a host application configures.
struct Config {
    SessionOptions session;
    EngineOptions engine;

    auto operator==(const Config&) const -> bool = default;
};

/// Parse a JSON configuration document.
///
/// Recognized keys (all optional, camelCase): `historyCapacity`,
/// `coalesceWindowMs`, `opCacheCapacity`, `strictAddressing`,
/// `patchesEnabled`, `paragraphsPerPage`, `parallelRenderThreshold`.
/// Missing keys keep their defaults.
/// @throws std::runtime_error if the text is not JSON or a key has the wrong type.
auto parse_config(std::string_view text) -> Config;

/// Read and parse a JSON configuration file.
/// @throws std::runtime_error if the file cannot be read or parsed.
auto load_config(const std::filesystem::path& path) -> Config;

}  // namespace docspan_cpp
