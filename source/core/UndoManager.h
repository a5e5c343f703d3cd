#pragma once

// ============================================================================
// UndoManager - Bounded history of mask snapshots
// ============================================================================
// Each entry is a full copy of the mask layer taken right before a stroke or
// a clear. When the history is full the oldest snapshot is released first.
//
// Memory bound: capacity × mask size. At the default 1000x1000 working size
// and 20 entries that is ~80MB worst case.
//
// History is one-directional: there is no redo.
// ============================================================================

#include "PixelBuffer.h"

#include <deque>
#include <optional>

class UndoManager {
public:
    /// CUSTOMIZABLE: Default number of snapshots kept (range: 1-200)
    static constexpr int DEFAULT_CAPACITY = 20;

    explicit UndoManager(int capacity = DEFAULT_CAPACITY);

    /**
     * @brief Push a deep copy of @p buffer.
     *
     * If the stack is at capacity, the oldest snapshot is dropped before
     * the push, so size() never exceeds capacity().
     */
    void snapshot(const PixelBuffer& buffer);

    /**
     * @brief Pop the most recent snapshot.
     * @return The snapshot, or std::nullopt if there is nothing to undo.
     */
    std::optional<PixelBuffer> undo();

    bool canUndo() const { return !m_snapshots.empty(); }
    int size() const { return static_cast<int>(m_snapshots.size()); }
    int capacity() const { return m_capacity; }

    /**
     * @brief Change the capacity (minimum 1), trimming the oldest entries if needed.
     */
    void setCapacity(int capacity);

    /**
     * @brief Release every snapshot.
     */
    void clear() { m_snapshots.clear(); }

private:
    void trim();

    std::deque<PixelBuffer> m_snapshots;   ///< front = oldest, back = newest
    int m_capacity = DEFAULT_CAPACITY;
};
