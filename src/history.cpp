#include <docspan-cpp/history.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace docspan_cpp {

History::History(std::size_t capacity, std::chrono::milliseconds coalesce_window, Clock clock)
    : capacity_{capacity},
      window_{coalesce_window},
      clock_{clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }}} {}

void History::push_bounded(std::deque<HistorySnapshot>& stack, HistorySnapshot snapshot) {
    stack.push_back(std::move(snapshot));
    while (stack.size() > capacity_) {
        stack.pop_front();
    }
}

auto History::record_change(ChangeKind kind, const Capture& capture) -> bool {
    const auto now = clock_();
    if (kind == ChangeKind::insert && last_insert_ && !undo_.empty()
        && now - *last_insert_ <= window_) {
        last_insert_ = now;
        spdlog::debug("coalesced insert into undo step {}", undo_.size());
        return false;
    }

    push_bounded(undo_, capture());
    redo_.clear();
    last_insert_ = kind == ChangeKind::insert ? std::optional{now} : std::nullopt;
    return true;
}

auto History::undo(const Capture& capture, const Restore& restore) -> bool {
    if (undo_.empty()) return false;
    auto current = capture();
    if (!restore(undo_.back())) return false;
    undo_.pop_back();
    push_bounded(redo_, std::move(current));
    last_insert_.reset();
    return true;
}

auto History::redo(const Capture& capture, const Restore& restore) -> bool {
    if (redo_.empty()) return false;
    auto current = capture();
    if (!restore(redo_.back())) return false;
    redo_.pop_back();
    push_bounded(undo_, std::move(current));
    last_insert_.reset();
    return true;
}

void History::clear() {
    undo_.clear();
    redo_.clear();
    last_insert_.reset();
}

void History::reset_to(HistorySnapshot pre_load) {
    clear();
    push_bounded(undo_, std::move(pre_load));
}

auto History::info() const -> HistoryInfo {
    return HistoryInfo{
        .can_undo = can_undo(),
        .can_redo = can_redo(),
        .undo_depth = undo_.size(),
        .redo_depth = redo_.size(),
    };
}

}  // namespace docspan_cpp
