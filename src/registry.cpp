#include <docspan-cpp/registry.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace docspan_cpp {

SessionRegistry::SessionRegistry(std::shared_ptr<const DocumentEngine> engine, SessionOptions options)
    : engine_{std::move(engine)}, options_{options} {
    if (!engine_) throw std::invalid_argument{"SessionRegistry requires a document engine"};
}

auto SessionRegistry::open(std::string_view name) -> std::shared_ptr<Session> {
    auto lock = std::lock_guard{mutex_};
    if (auto it = sessions_.find(name); it != sessions_.end()) return it->second;

    auto session = std::make_shared<Session>(engine_, options_);
    sessions_.emplace(std::string{name}, session);
    spdlog::info("opened session '{}' ({} open)", name, sessions_.size());
    return session;
}

auto SessionRegistry::find(std::string_view name) const -> std::shared_ptr<Session> {
    auto lock = std::lock_guard{mutex_};
    auto it = sessions_.find(name);
    return it != sessions_.end() ? it->second : nullptr;
}

auto SessionRegistry::close(std::string_view name) -> bool {
    auto lock = std::lock_guard{mutex_};
    auto it = sessions_.find(name);
    if (it == sessions_.end()) return false;
    sessions_.erase(it);
    spdlog::info("closed session '{}'", name);
    return true;
}

auto SessionRegistry::size() const -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    return sessions_.size();
}

}  // namespace docspan_cpp
