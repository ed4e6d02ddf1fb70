#include <docspan-cpp/concurrency.hpp>

#include <functional>

namespace docspan_cpp {

auto OpKeyHash::operator()(const OpKey& key) const noexcept -> std::size_t {
    auto h = std::hash<std::string>{}(key.doc_id);
    auto mix = [&h](std::size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
    mix(std::hash<std::uint64_t>{}(key.base_version));
    mix(std::hash<std::string>{}(key.client_op_id));
    mix(std::hash<std::size_t>{}(key.page));
    return h;
}

auto OpCache::find(const OpKey& key) const -> std::optional<Reply> {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

auto OpCache::store(const OpKey& key, Reply reply) -> bool {
    if (capacity_ == 0 || entries_.contains(key)) return false;
    entries_.emplace(key, std::move(reply));
    order_.push_back(key);
    while (order_.size() > capacity_) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

void OpCache::clear() {
    order_.clear();
    entries_.clear();
}

auto ConcurrencyController::validate(std::string_view doc_id, std::uint64_t base_version) const
    -> std::optional<ErrorKind> {
    if (doc_id != doc_id_) return ErrorKind::doc_conflict;
    if (base_version != version_) return ErrorKind::version_conflict;
    return std::nullopt;
}

auto ConcurrencyController::lookup_cached(const VersionedRequest& request, std::size_t page) const
    -> std::optional<Reply> {
    return cache_.find(OpKey{request.doc_id, request.base_version, request.client_op_id, page});
}

auto ConcurrencyController::cache_reply(const VersionedRequest& request, std::size_t page, Reply reply)
    -> bool {
    return cache_.store(OpKey{request.doc_id, request.base_version, request.client_op_id, page},
                        std::move(reply));
}

}  // namespace docspan_cpp
