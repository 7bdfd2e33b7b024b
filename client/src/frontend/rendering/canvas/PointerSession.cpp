#include "frontend/rendering/canvas/PointerSession.h"

PointerSession::Target PointerSession::target() const {
    return m_target;
}

QString PointerSession::targetId() const {
    return m_targetId;
}

QPointF PointerSession::grabOffset() const {
    return m_grabOffset;
}

QPointF PointerSession::originFor(const QPointF& pointer) const {
    return pointer - m_grabOffset;
}

void PointerSession::begin(Target target, const QString& targetId, const QPointF& pointer, const QPointF& origin) {
    m_target = target;
    m_targetId = targetId;
    m_grabOffset = pointer - origin;
}

void PointerSession::clear() {
    m_target = Target::None;
    m_targetId.clear();
    m_grabOffset = QPointF();
}

bool PointerSession::active() const {
    return m_target != Target::None;
}
