#ifndef CANVASINTERACTION_H
#define CANVASINTERACTION_H

#include <QPointF>
#include <QRectF>
#include <QString>

#include "frontend/rendering/canvas/InputArbiter.h"
#include "frontend/rendering/canvas/PointerSession.h"

class SceneStore;
class FontRegistry;

/**
 * CanvasInteraction
 *
 * Pointer state machine of the composition canvas (Idle, Drag, Resize).
 * Works in preview coordinates and edits free-placement geometry and text
 * positions through the SceneStore. Outside free-placement mode a press only
 * clears the selection.
 *
 * Hit testing is recomputed from the current scene on every call:
 * text layers front to back, then the resize affordance of the selected
 * image, then image bodies from the highest zIndex down.
 */
class CanvasInteraction {
public:
    enum class CursorShape {
        Arrow,
        Grab,
        Grabbing,
        Resize
    };

    static constexpr qreal kDefaultResizeTolerance = 12.0;

    CanvasInteraction(SceneStore& store, FontRegistry& fonts);

    void setResizeTolerance(qreal tolerance) { m_resizeTolerance = tolerance; }
    qreal resizeTolerance() const { return m_resizeTolerance; }

    void pointerDown(const QPointF& pos);
    // Applies one (already coalesced) move to the active gesture.
    void pointerMove(const QPointF& pos);
    void pointerUp();
    void pointerLeave();

    InputArbiter::Mode mode() const { return m_arbiter.mode(); }
    const PointerSession& session() const { return m_session; }

    // Cursor feedback for `pos`; depends on the mode, never changes it.
    CursorShape cursorAt(const QPointF& pos) const;
    // Cursor once a gesture ends: Grab in free-placement mode, Arrow otherwise.
    CursorShape restingCursor() const;

    // Hit tests, preview coordinates. Empty id when nothing is hit.
    QString textAt(const QPointF& pos) const;
    QString imageAt(const QPointF& pos) const;
    bool isOnResizeHandle(const QPointF& pos) const;

    // Inclusive tolerance square centered on the bottom-right corner of `rect`.
    static bool withinResizeTolerance(const QRectF& rect, const QPointF& pos, qreal tolerance);

private:
    bool freePlacementActive() const;
    void endGesture();

    SceneStore& m_store;
    FontRegistry& m_fonts;
    InputArbiter m_arbiter;
    PointerSession m_session;
    qreal m_resizeTolerance = kDefaultResizeTolerance;
};

#endif // CANVASINTERACTION_H
