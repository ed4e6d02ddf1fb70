/// @file registry.hpp
/// @brief SessionRegistry -- independent sessions keyed by document name.

#pragma once

#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/options.hpp>
#include <docspan-cpp/session.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace docspan_cpp {

/// Owns one Session per document name.
///
/// Sessions are independent: each has its own lock, and no operation ever
/// spans two of them. All sessions share one engine. The registry itself is
/// thread-safe; a Session handed out stays valid for as long as the caller
/// holds it, even after close().
class SessionRegistry {
public:
    explicit SessionRegistry(std::shared_ptr<const DocumentEngine> engine = std::make_shared<NativeEngine>(),
                             SessionOptions options = {});

    /// Get the session for `name`, creating it if needed.
    auto open(std::string_view name) -> std::shared_ptr<Session>;

    /// Get the session for `name`, or nullptr if none is open.
    auto find(std::string_view name) const -> std::shared_ptr<Session>;

    /// Drop the session for `name`.
    /// @return False if no such session was open.
    auto close(std::string_view name) -> bool;

    /// Number of open sessions.
    auto size() const -> std::size_t;

private:
    std::shared_ptr<const DocumentEngine> engine_;
    SessionOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions_;
};

}  // namespace docspan_cpp
