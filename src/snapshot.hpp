#pragma once

// History snapshot codec: engine serialization wrapped in raw DEFLATE.
//
// Internal header — not installed.

#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/history.hpp>

#include "storage/compression.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

namespace docspan_cpp::detail {

// A failed compression yields an empty snapshot, which never restores.
inline auto capture_snapshot(const DocumentEngine& engine, const Document& doc) -> HistorySnapshot {
    auto compressed = storage::deflate_compress(engine.serialize(doc));
    if (!compressed) {
        spdlog::error("snapshot compression failed; history entry will not restore");
        return HistorySnapshot{};
    }
    return HistorySnapshot{std::move(*compressed)};
}

inline auto restore_snapshot(const DocumentEngine& engine, const HistorySnapshot& snapshot)
    -> std::optional<Document> {
    auto bytes = storage::deflate_decompress(snapshot.bytes);
    if (!bytes) {
        spdlog::error("undecodable history snapshot ({} bytes)", snapshot.bytes.size());
        return std::nullopt;
    }
    auto doc = engine.load(*bytes);
    if (!doc) {
        spdlog::error("history snapshot does not load as a document");
        return std::nullopt;
    }
    return doc;
}

}  // namespace docspan_cpp::detail
