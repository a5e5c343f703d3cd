// ============================================================================
// UndoManager - Implementation
// ============================================================================

#include "UndoManager.h"

#include <QtGlobal>

UndoManager::UndoManager(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

void UndoManager::snapshot(const PixelBuffer& buffer)
{
    // Evict before pushing so the stack never holds capacity + 1 buffers,
    // even transiently
    while (static_cast<int>(m_snapshots.size()) >= m_capacity) {
        m_snapshots.pop_front();
    }
    m_snapshots.push_back(buffer.clone());
}

std::optional<PixelBuffer> UndoManager::undo()
{
    if (m_snapshots.empty()) {
        return std::nullopt;
    }
    PixelBuffer top = std::move(m_snapshots.back());
    m_snapshots.pop_back();
    return top;
}

void UndoManager::setCapacity(int capacity)
{
    m_capacity = qMax(1, capacity);
    trim();
}

void UndoManager::trim()
{
    while (static_cast<int>(m_snapshots.size()) > m_capacity) {
        m_snapshots.pop_front();
    }
}
