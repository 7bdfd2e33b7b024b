#include "frontend/rendering/canvas/CanvasInteraction.h"
#include "backend/domain/scene/SceneStore.h"
#include "backend/rendering/FontRegistry.h"
#include "backend/rendering/TextLayerGeometry.h"

#include <QDebug>
#include <algorithm>

CanvasInteraction::CanvasInteraction(SceneStore& store, FontRegistry& fonts)
    : m_store(store)
    , m_fonts(fonts)
{
}

bool CanvasInteraction::freePlacementActive() const {
    return m_store.scene().parameters().mode == LayoutMode::FreePlacement;
}

bool CanvasInteraction::withinResizeTolerance(const QRectF& rect, const QPointF& pos, qreal tolerance) {
    const QPointF corner = rect.bottomRight();
    return pos.x() >= corner.x() - tolerance && pos.x() <= corner.x() + tolerance
        && pos.y() >= corner.y() - tolerance && pos.y() <= corner.y() + tolerance;
}

QString CanvasInteraction::textAt(const QPointF& pos) const {
    const QVector<TextItem>& texts = m_store.scene().texts();
    for (int i = texts.size() - 1; i >= 0; --i) {
        if (TextLayerGeometry::contains(m_fonts, texts.at(i), pos)) {
            return texts.at(i).id;
        }
    }
    return QString();
}

QString CanvasInteraction::imageAt(const QPointF& pos) const {
    const QVector<ImageItem> ordered = m_store.scene().freeformStackingOrder();
    for (auto it = ordered.crbegin(); it != ordered.crend(); ++it) {
        const QRectF r = it->freeform->rect();
        // Strict bounds: the outline itself is not part of the body
        if (pos.x() > r.left() && pos.x() < r.right() && pos.y() > r.top() && pos.y() < r.bottom()) {
            return it->id;
        }
    }
    return QString();
}

bool CanvasInteraction::isOnResizeHandle(const QPointF& pos) const {
    const QString selectedId = m_store.selection().selectedImageId();
    if (selectedId.isEmpty()) {
        return false;
    }
    const ImageItem* image = m_store.scene().findImage(selectedId);
    if (!image || !image->freeform) {
        return false;
    }
    return withinResizeTolerance(image->freeform->rect(), pos, m_resizeTolerance);
}

void CanvasInteraction::pointerDown(const QPointF& pos) {
    if (!m_arbiter.isIdle()) {
        endGesture();
    }
    if (!freePlacementActive()) {
        m_store.clearSelection();
        return;
    }

    const QString textId = textAt(pos);
    if (!textId.isEmpty()) {
        const TextItem* layer = m_store.scene().findText(textId);
        const QPointF origin(layer->x, layer->y);
        m_store.selectImage(QString());
        m_store.selectText(textId);
        if (m_arbiter.beginDrag(textId)) {
            m_session.begin(PointerSession::Target::Text, textId, pos, origin);
        }
        return;
    }

    if (isOnResizeHandle(pos)) {
        const QString imageId = m_store.selection().selectedImageId();
        const FreeformGeometry geometry = *m_store.scene().findImage(imageId)->freeform;
        m_store.selectText(QString());
        if (m_arbiter.beginResize(imageId)) {
            m_session.begin(PointerSession::Target::Image, imageId, pos, QPointF(geometry.x, geometry.y));
        }
        return;
    }

    const QString imageId = imageAt(pos);
    if (imageId.isEmpty()) {
        m_store.clearSelection();
        return;
    }

    const FreeformGeometry geometry = *m_store.scene().findImage(imageId)->freeform;
    m_store.selectText(QString());
    // Raises the image as well (bring-to-front on grab)
    m_store.selectImage(imageId);
    if (m_arbiter.beginDrag(imageId)) {
        m_session.begin(PointerSession::Target::Image, imageId, pos, QPointF(geometry.x, geometry.y));
    }
}

void CanvasInteraction::pointerMove(const QPointF& pos) {
    if (m_arbiter.isIdle() || !m_session.active()) {
        return;
    }

    const QString targetId = m_session.targetId();
    if (m_arbiter.mode() == InputArbiter::Mode::Resize) {
        const ImageItem* image = m_store.scene().findImage(targetId);
        if (!image || !image->freeform) {
            endGesture();
            return;
        }
        m_store.resizeImage(targetId, pos.x() - image->freeform->x, pos.y() - image->freeform->y);
        return;
    }

    const QPointF origin = m_session.originFor(pos);
    const bool applied = (m_session.target() == PointerSession::Target::Text)
        ? m_store.moveTextLayer(targetId, origin)
        : m_store.moveImageTo(targetId, origin);
    if (!applied) {
        // Target removed mid-gesture
        qDebug() << "CanvasInteraction: Drag target" << targetId << "no longer exists";
        endGesture();
    }
}

void CanvasInteraction::pointerUp() {
    endGesture();
}

void CanvasInteraction::pointerLeave() {
    endGesture();
}

void CanvasInteraction::endGesture() {
    const QString targetId = m_arbiter.activeTargetId();
    switch (m_arbiter.mode()) {
        case InputArbiter::Mode::Drag:
            m_arbiter.endDrag(targetId);
            break;
        case InputArbiter::Mode::Resize:
            m_arbiter.endResize(targetId);
            break;
        case InputArbiter::Mode::Idle:
            break;
    }
    m_session.clear();
}

CanvasInteraction::CursorShape CanvasInteraction::cursorAt(const QPointF& pos) const {
    switch (m_arbiter.mode()) {
        case InputArbiter::Mode::Drag:
            return CursorShape::Grabbing;
        case InputArbiter::Mode::Resize:
            return CursorShape::Resize;
        case InputArbiter::Mode::Idle:
            break;
    }
    if (!freePlacementActive()) {
        return CursorShape::Arrow;
    }
    return isOnResizeHandle(pos) ? CursorShape::Resize : CursorShape::Grab;
}

CanvasInteraction::CursorShape CanvasInteraction::restingCursor() const {
    return freePlacementActive() ? CursorShape::Grab : CursorShape::Arrow;
}
