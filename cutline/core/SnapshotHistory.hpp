#pragma once

#include <array>
#include <cstddef>

namespace cutline {

/**
 * @brief Bounded linear undo history of state snapshots
 *
 * Fixed-capacity ring buffer plus a cursor. Each entry is the state as it was
 * *before* a committed mutation; undo hands back the entry under the cursor and
 * steps the cursor back.
 *
 * Pushing after an undo discards every entry after the cursor first (no redo
 * branch). When full, the oldest entry is dropped.
 *
 * Usage:
 * ```cpp
 * SnapshotHistory<EditorState, 10> history;
 * history.push(captureState());   // before mutating
 * mutate();
 * ...
 * if (auto* previous = history.stepBack())
 *     restoreState(*previous);
 * ```
 */
template <typename StateT, size_t Capacity> class SnapshotHistory {
    static_assert(Capacity > 0, "SnapshotHistory needs room for at least one entry");

  public:
    static constexpr size_t capacity() {
        return Capacity;
    }

    /**
     * @brief Record a snapshot, truncating any undone entries first
     */
    void push(const StateT& snapshot) {
        size_ = static_cast<size_t>(cursor_ + 1);

        if (size_ == Capacity) {
            head_ = (head_ + 1) % Capacity;
            --size_;
        }

        entries_[physicalIndex(size_)] = snapshot;
        ++size_;
        cursor_ = static_cast<int>(size_) - 1;
    }

    /**
     * @brief Snapshot to restore for one undo step
     * @return nullptr when there is nothing to undo
     */
    const StateT* stepBack() {
        if (cursor_ < 0) {
            return nullptr;
        }
        const StateT* entry = &entries_[physicalIndex(static_cast<size_t>(cursor_))];
        --cursor_;
        return entry;
    }

    bool canUndo() const {
        return cursor_ >= 0;
    }

    /** Index of the next entry undo would restore, -1 when there is none */
    int getIndex() const {
        return cursor_;
    }

    /** Number of retained entries, including undone ones not yet truncated */
    size_t size() const {
        return size_;
    }

    bool isEmpty() const {
        return size_ == 0;
    }

    void clear() {
        head_ = 0;
        size_ = 0;
        cursor_ = -1;
    }

  private:
    size_t physicalIndex(size_t logicalIndex) const {
        return (head_ + logicalIndex) % Capacity;
    }

    std::array<StateT, Capacity> entries_{};
    size_t head_ = 0;  // Physical slot of the oldest entry
    size_t size_ = 0;
    int cursor_ = -1;
};

}  // namespace cutline
