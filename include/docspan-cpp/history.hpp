/// @file history.hpp
/// @brief Bounded undo/redo snapshot stacks with insert coalescing.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace docspan_cpp {

/// An opaque, self-contained capture of document state. Immutable once
/// pushed onto a history stack.
struct HistorySnapshot {
    std::vector<std::byte> bytes;  ///< Encoded document state.

    auto operator==(const HistorySnapshot&) const -> bool = default;
};

/// The kind of change being recorded; only `insert` coalesces.
enum class ChangeKind : std::uint8_t {
    edit,    ///< Any change that always gets its own undo step.
    insert,  ///< Text insertion; bursts within the window share one step.
};

/// Undo/redo availability as reported to clients.
struct HistoryInfo {
    bool can_undo{false};
    bool can_redo{false};
    std::size_t undo_depth{0};
    std::size_t redo_depth{0};

    auto operator==(const HistoryInfo&) const -> bool = default;
};

/// Two bounded snapshot stacks (undo, redo).
///
/// Every mutation calls record_change() *before* editing, pushing the
/// pre-edit state and clearing redo. Consecutive `insert` changes that
/// arrive within the coalescing window of the previous one do not push,
/// so a burst of typing collapses into a single undo step. Past capacity
/// the oldest entry of a stack is dropped.
///
/// Snapshots are produced lazily through capture callbacks so coalesced
/// changes and empty-stack undos never pay for serialization.
class History {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Capture = std::function<HistorySnapshot()>;
    using Restore = std::function<bool(const HistorySnapshot&)>;

    /// @param capacity Maximum depth of each stack.
    /// @param coalesce_window Maximum gap between coalesced inserts.
    /// @param clock Time source; defaults to steady_clock::now.
    explicit History(std::size_t capacity = 50,
                     std::chrono::milliseconds coalesce_window = std::chrono::milliseconds{2500},
                     Clock clock = {});

    /// Record the state before a change.
    /// @return True if a snapshot was pushed, false if the change coalesced.
    auto record_change(ChangeKind kind, const Capture& capture) -> bool;

    /// Step back. Captures the current state onto redo and restores the
    /// newest undo snapshot. Nothing changes if the stack is empty or the
    /// restore fails.
    /// @return True if the state was restored.
    auto undo(const Capture& capture, const Restore& restore) -> bool;

    /// Step forward; the mirror image of undo().
    auto redo(const Capture& capture, const Restore& restore) -> bool;

    /// Drop both stacks and reset coalescing.
    void clear();

    /// Clear, then make `pre_load` the single undo entry so a document
    /// replacement is itself undoable.
    void reset_to(HistorySnapshot pre_load);

    auto can_undo() const -> bool { return !undo_.empty(); }
    auto can_redo() const -> bool { return !redo_.empty(); }
    auto undo_depth() const -> std::size_t { return undo_.size(); }
    auto redo_depth() const -> std::size_t { return redo_.size(); }
    auto capacity() const -> std::size_t { return capacity_; }

    /// Snapshot of the stack depths for responses.
    auto info() const -> HistoryInfo;

private:
    void push_bounded(std::deque<HistorySnapshot>& stack, HistorySnapshot snapshot);

    std::deque<HistorySnapshot> undo_;
    std::deque<HistorySnapshot> redo_;
    std::size_t capacity_;
    std::chrono::milliseconds window_;
    Clock clock_;
    std::optional<std::chrono::steady_clock::time_point> last_insert_;
};

}  // namespace docspan_cpp
