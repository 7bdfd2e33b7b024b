#ifndef COMPOSITIONCANVAS_H
#define COMPOSITIONCANVAS_H

#include <QWidget>
#include <QPointF>

#include "backend/rendering/CompositionPainter.h"
#include "backend/rendering/FontRegistry.h"
#include "frontend/rendering/canvas/CanvasInteraction.h"

class SceneStore;
class DecodedImageCache;
class SettingsManager;
class PointerMoveThrottle;
class QMouseEvent;
class QPaintEvent;

/**
 * CompositionCanvas
 *
 * Interactive preview of the composition. Paints the scene at the widget's
 * own pixel size (identity scale), so every geometry value stored in the
 * scene is in this widget's coordinates. Mouse input drives
 * CanvasInteraction; moves are coalesced to one per frame.
 */
class CompositionCanvas : public QWidget {
    Q_OBJECT
public:
    CompositionCanvas(SceneStore* store, DecodedImageCache* cache, QWidget* parent = nullptr);
    ~CompositionCanvas() override;

    // Resize glyph size and hit tolerance follow the settings.
    void bindSettings(SettingsManager* settings);

    CanvasInteraction& interaction() { return m_interaction; }
    PointerMoveThrottle* moveThrottle() const { return m_moveThrottle; }
    FontRegistry& fonts() { return m_fonts; }

    // Current preview dimensions, handed to the export path.
    QSize previewSize() const { return size(); }

    // Renders exactly what paintEvent shows into an image of the widget's size.
    QImage grabComposition();

    static Qt::CursorShape toQtCursor(CanvasInteraction::CursorShape shape);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void onCoalescedMove(const QPointF& pos);
    void updateCursor(const QPointF& pos);
    PaintOptions paintOptions() const;

    SceneStore* m_store;
    DecodedImageCache* m_cache;
    FontRegistry m_fonts;
    CompositionPainter m_painter;
    CanvasInteraction m_interaction;
    PointerMoveThrottle* m_moveThrottle;
    qreal m_handleSize = 10.0;
};

#endif // COMPOSITIONCANVAS_H
