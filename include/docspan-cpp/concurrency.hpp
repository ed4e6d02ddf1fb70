/// @file concurrency.hpp
/// @brief Optimistic locking and the idempotent reply cache.

#pragma once

#include <docspan-cpp/error.hpp>
#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace docspan_cpp {

/// Outcome class of a session reply, mirroring an HTTP status.
enum class ReplyStatus : std::uint8_t {
    ok,
    conflict,
    bad_request,
    render_failure,
};

/// Convert a ReplyStatus to its string representation.
constexpr auto to_string_view(ReplyStatus status) noexcept -> std::string_view {
    switch (status) {
        case ReplyStatus::ok:             return "ok";
        case ReplyStatus::conflict:       return "conflict";
        case ReplyStatus::bad_request:    return "bad_request";
        case ReplyStatus::render_failure: return "render_failure";
    }
    return "unknown";
}

/// A reply: status plus the serialized JSON payload.
struct Reply {
    ReplyStatus status{ReplyStatus::ok};
    std::string body;

    auto operator==(const Reply&) const -> bool = default;
};

/// The triple every mutating call carries: lock token and idempotency key.
struct VersionedRequest {
    std::string doc_id;          ///< Identity the client believes is current.
    std::uint64_t base_version{0};  ///< Version the client last observed.
    std::string client_op_id;    ///< Client-chosen operation id.

    auto operator==(const VersionedRequest&) const -> bool = default;
};

/// Key of a cached reply: the request triple plus the page as requested.
struct OpKey {
    std::string doc_id;
    std::uint64_t base_version{0};
    std::string client_op_id;
    std::size_t page{0};

    auto operator==(const OpKey&) const -> bool = default;
};

struct OpKeyHash {
    auto operator()(const OpKey& key) const noexcept -> std::size_t;
};

/// Bounded FIFO cache of replies.
///
/// First write wins: storing under an existing key keeps the original reply.
/// Past capacity the oldest entry is evicted.
class OpCache {
public:
    explicit OpCache(std::size_t capacity = 5000) : capacity_{capacity} {}

    /// The reply stored under `key`, if any.
    auto find(const OpKey& key) const -> std::optional<Reply>;

    /// Store a reply.
    /// @return False if the key was already present (nothing stored).
    auto store(const OpKey& key, Reply reply) -> bool;

    auto contains(const OpKey& key) const -> bool { return entries_.contains(key); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto capacity() const -> std::size_t { return capacity_; }
    void clear();

private:
    std::size_t capacity_;
    std::deque<OpKey> order_;
    std::unordered_map<OpKey, Reply, OpKeyHash> entries_;
};

/// Per-document optimistic concurrency state: identity, version counter
/// and the reply cache.
///
/// Not synchronized; Session holds its lock around the whole
/// check-validate-apply-bump-cache sequence.
class ConcurrencyController {
public:
    explicit ConcurrencyController(std::size_t cache_capacity = 5000)
        : cache_{cache_capacity} {}

    auto doc_id() const -> const std::string& { return doc_id_; }
    auto version() const -> std::uint64_t { return version_; }
    auto identity() const -> DocIdentity { return DocIdentity{doc_id_, version_}; }

    /// Check a request's identity and base version against the current ones.
    /// @return nullopt if current, else doc_conflict or version_conflict.
    auto validate(std::string_view doc_id, std::uint64_t base_version) const
        -> std::optional<ErrorKind>;

    /// The reply previously cached for this request and page, if any.
    auto lookup_cached(const VersionedRequest& request, std::size_t page) const
        -> std::optional<Reply>;

    /// Cache a reply under the request's own key (first write wins).
    auto cache_reply(const VersionedRequest& request, std::size_t page, Reply reply) -> bool;

    /// Advance the version by one.
    /// @return The new version.
    auto bump_version() -> std::uint64_t { return ++version_; }

    /// Adopt a new document identity. The version counter keeps running.
    void reset_doc_id(std::string doc_id) { doc_id_ = std::move(doc_id); }

    auto cache() const -> const OpCache& { return cache_; }

private:
    std::string doc_id_;
    std::uint64_t version_{0};
    OpCache cache_;
};

}  // namespace docspan_cpp
