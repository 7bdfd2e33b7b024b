#include "frontend/rendering/canvas/InputArbiter.h"

bool InputArbiter::isIdle() const {
    return m_mode == Mode::Idle;
}

InputArbiter::Mode InputArbiter::mode() const {
    return m_mode;
}

bool InputArbiter::beginDrag(const QString& targetId) {
    if (targetId.isEmpty()) {
        return false;
    }
    return begin(Mode::Drag, targetId);
}

bool InputArbiter::beginResize(const QString& imageId) {
    if (imageId.isEmpty()) {
        return false;
    }
    return begin(Mode::Resize, imageId);
}

bool InputArbiter::endDrag(const QString& targetId) {
    if (m_mode != Mode::Drag || targetId.isEmpty() || m_targetId != targetId) {
        return false;
    }
    reset();
    return true;
}

bool InputArbiter::endResize(const QString& imageId) {
    if (m_mode != Mode::Resize || imageId.isEmpty() || m_targetId != imageId) {
        return false;
    }
    reset();
    return true;
}

QString InputArbiter::activeTargetId() const {
    return m_targetId;
}

void InputArbiter::reset() {
    m_mode = Mode::Idle;
    m_targetId.clear();
}

bool InputArbiter::begin(Mode requestedMode, const QString& targetId) {
    if (m_mode == Mode::Idle) {
        m_mode = requestedMode;
        m_targetId = targetId;
        return true;
    }
    // Re-entering the running gesture on the same target is a no-op success
    return m_mode == requestedMode && m_targetId == targetId;
}
