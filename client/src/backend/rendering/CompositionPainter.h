#ifndef COMPOSITIONPAINTER_H
#define COMPOSITIONPAINTER_H

#include <QHash>
#include <QImage>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>

#include "backend/domain/layout/LayoutEngine.h"
#include "backend/domain/scene/SceneModel.h"
#include "backend/rendering/RenderScale.h"

class FontRegistry;
class QPainter;
class QPainterPath;

// Decoded pixels the painter reads, keyed by scene identity. A null image
// means the decode is still pending (or failed) and the element is skipped.
struct PixelSourceSet {
    QHash<QString, QImage> images;
    QImage watermark;
    QImage background;

    QImage image(const QString& id) const { return images.value(id); }

    // Independent copies of every bitmap, safe to hand to another thread.
    PixelSourceSet detached() const;
};

struct SelectionOverlay {
    QString selectedImageId;
    qreal handleSize = 10.0;
    qreal outlineWidth = 2.0;
};

struct PaintOptions {
    RenderScale scale;
    // Interactive canvas only: draws the upload prompt on an empty scene.
    bool showEmptyPrompt = false;
    SelectionOverlay selection;
};

/**
 * CompositionPainter
 *
 * Turns a SceneModel into QPainter calls, in five fixed stages: background,
 * images, watermark, text layers, selection overlay. Every linear quantity
 * stored in the scene is in preview pixels and multiplied by the
 * RenderScale of the pass, so the preview widget and the export task run
 * the same code with different numbers.
 *
 * Elements whose pixels are missing are skipped for the pass and counted;
 * nothing in here throws or fails the whole paint.
 */
class CompositionPainter {
public:
    explicit CompositionPainter(FontRegistry& fonts);

    // Opens a QPainter on `target` and paints the scene over its full size.
    // Returns false when the surface cannot be painted on.
    bool render(QImage& target, const SceneModel& scene, const PixelSourceSet& pixels, const PaintOptions& options);

    // Paints onto an already active painter whose device is `targetSize` pixels.
    void paint(QPainter& painter, const QSizeF& targetSize, const SceneModel& scene,
               const PixelSourceSet& pixels, const PaintOptions& options);

    // Elements skipped in the last pass because their pixels were not decoded.
    int skippedCount() const { return m_skipped.size(); }
    QStringList skippedIds() const { return m_skipped; }

    static LayoutRequest layoutRequest(const SceneModel& scene, const PixelSourceSet& pixels,
                                       const QSizeF& targetSize, const RenderScale& scale);

    // Watermark destination: width is sizePercent of the target width, height
    // follows the source aspect ratio, corners are inset by the margins.
    static QRectF watermarkRect(const WatermarkItem& watermark, const QSizeF& sourceSize,
                                const QSizeF& targetSize, qreal marginX, qreal marginY);

    // Standard deviation of the text drop shadow before scaling.
    static constexpr qreal kTextShadowBlur = 10.0;
    static constexpr qreal kTextShadowOffset = 5.0;

private:
    void paintBackground(QPainter& painter, const QRectF& bounds, const BackgroundSpec& background,
                         const PixelSourceSet& pixels);
    void paintImages(QPainter& painter, const QSizeF& targetSize, const QVector<Placement>& placements,
                     const LayoutParameters& parameters, const PixelSourceSet& pixels, const RenderScale& scale);
    void paintBackdrop(QPainter& painter, const QSizeF& targetSize, const QVector<Placement>& placements,
                       const LayoutParameters& parameters, const PixelSourceSet& pixels, const RenderScale& scale);
    void paintWatermark(QPainter& painter, const QSizeF& targetSize, const SceneModel& scene,
                        const PixelSourceSet& pixels, const RenderScale& scale);
    void paintTextLayer(QPainter& painter, const TextItem& layer, const RenderScale& scale);
    void paintTextShadow(QPainter& painter, const QPainterPath& path, const RenderScale& scale);
    void paintSelection(QPainter& painter, const QVector<Placement>& placements,
                        const SelectionOverlay& selection, const RenderScale& scale);
    void paintEmptyPrompt(QPainter& painter, const QRectF& bounds);

    FontRegistry& m_fonts;
    QStringList m_skipped;
};

#endif // COMPOSITIONPAINTER_H
