// ============================================================================
// DamageTracker - Implementation
// ============================================================================

#include "DamageTracker.h"

void DamageTracker::setBounds(const QRect& bounds)
{
    m_bounds = bounds;
    m_damage = clamp(m_damage);
}

void DamageTracker::accumulate(const QRect& rect)
{
    const QRect clamped = clamp(rect.normalized());
    if (clamped.isEmpty()) {
        return;
    }
    m_damage = m_damage.isEmpty() ? clamped : m_damage.united(clamped);
}

QRect DamageTracker::flushAndClear()
{
    const QRect result = m_damage;
    m_damage = QRect();
    return result;
}

QRect DamageTracker::clamp(const QRect& rect) const
{
    if (rect.isEmpty()) {
        return QRect();
    }
    if (m_bounds.isNull()) {
        return rect;
    }
    return rect.intersected(m_bounds);
}
