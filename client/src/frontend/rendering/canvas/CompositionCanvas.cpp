#include "frontend/rendering/canvas/CompositionCanvas.h"
#include "frontend/rendering/canvas/PointerMoveThrottle.h"
#include "backend/domain/scene/SceneStore.h"
#include "backend/files/DecodedImageCache.h"
#include "frontend/ui/theme/AppColors.h"
#include "managers/app/SettingsManager.h"

#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QDebug>

CompositionCanvas::CompositionCanvas(SceneStore* store, DecodedImageCache* cache, QWidget* parent)
    : QWidget(parent)
    , m_store(store)
    , m_cache(cache)
    , m_painter(m_fonts)
    , m_interaction(*store, m_fonts)
    , m_moveThrottle(new PointerMoveThrottle(this))
{
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMinimumSize(200, 150);
    m_cache->bindStore(m_store);

    connect(m_store, &SceneStore::sceneChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_store, &SceneStore::selectionChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_cache, &DecodedImageCache::imageDecoded, this, QOverload<>::of(&QWidget::update));
    connect(m_moveThrottle, &PointerMoveThrottle::moveReady, this, &CompositionCanvas::onCoalescedMove);
    connect(m_store, &SceneStore::sceneChanged, this, [this]() {
        if (m_interaction.mode() == InputArbiter::Mode::Idle) {
            setCursor(toQtCursor(m_interaction.restingCursor()));
        }
    });

    setCursor(toQtCursor(m_interaction.restingCursor()));
}

CompositionCanvas::~CompositionCanvas() = default;

void CompositionCanvas::bindSettings(SettingsManager* settings) {
    if (!settings) {
        return;
    }
    auto apply = [this, settings]() {
        m_handleSize = settings->getResizeHandleSize();
        m_interaction.setResizeTolerance(settings->getResizeHitTolerance());
        update();
    };
    apply();
    connect(settings, &SettingsManager::settingsChanged, this, apply);
}

Qt::CursorShape CompositionCanvas::toQtCursor(CanvasInteraction::CursorShape shape) {
    switch (shape) {
        case CanvasInteraction::CursorShape::Grab:
            return Qt::OpenHandCursor;
        case CanvasInteraction::CursorShape::Grabbing:
            return Qt::ClosedHandCursor;
        case CanvasInteraction::CursorShape::Resize:
            return Qt::SizeFDiagCursor;
        case CanvasInteraction::CursorShape::Arrow:
            break;
    }
    return Qt::ArrowCursor;
}

PaintOptions CompositionCanvas::paintOptions() const {
    PaintOptions options;
    options.showEmptyPrompt = true;
    options.selection.selectedImageId = m_store->selection().selectedImageId();
    options.selection.handleSize = m_handleSize;
    options.selection.outlineWidth = AppColors::gSelectionOutlineWidth;
    return options;
}

void CompositionCanvas::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    const SceneModel& scene = m_store->scene();
    m_painter.paint(painter, QSizeF(size()), scene, m_cache->pixelSources(scene), paintOptions());
}

QImage CompositionCanvas::grabComposition() {
    QImage image(size(), QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    const SceneModel& scene = m_store->scene();
    if (!m_painter.render(image, scene, m_cache->pixelSources(scene), paintOptions())) {
        qWarning() << "CompositionCanvas: Could not render composition at" << size();
        return QImage();
    }
    return image;
}

void CompositionCanvas::mousePressEvent(QMouseEvent* event) {
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    m_moveThrottle->discard();
    const QPointF pos = event->position();
    m_interaction.pointerDown(pos);
    updateCursor(pos);
    event->accept();
}

void CompositionCanvas::mouseMoveEvent(QMouseEvent* event) {
    m_moveThrottle->schedule(event->position());
    event->accept();
}

void CompositionCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() != Qt::LeftButton) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    m_moveThrottle->discard();
    m_interaction.pointerUp();
    setCursor(toQtCursor(m_interaction.restingCursor()));
    event->accept();
}

void CompositionCanvas::leaveEvent(QEvent* event) {
    m_moveThrottle->discard();
    m_interaction.pointerLeave();
    setCursor(toQtCursor(m_interaction.restingCursor()));
    QWidget::leaveEvent(event);
}

void CompositionCanvas::onCoalescedMove(const QPointF& pos) {
    m_interaction.pointerMove(pos);
    updateCursor(pos);
}

void CompositionCanvas::updateCursor(const QPointF& pos) {
    setCursor(toQtCursor(m_interaction.cursorAt(pos)));
}
