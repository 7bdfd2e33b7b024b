#include "backend/rendering/CompositionPainter.h"
#include "backend/rendering/FontRegistry.h"
#include "backend/rendering/ImageEffects.h"
#include "frontend/ui/theme/AppColors.h"

#include <QDebug>
#include <QFont>
#include <QPainter>
#include <QObject>
#include <QPainterPath>
#include <QPen>
#include <QTransform>
#include <cmath>

PixelSourceSet PixelSourceSet::detached() const {
    PixelSourceSet copy;
    for (auto it = images.constBegin(); it != images.constEnd(); ++it) {
        copy.images.insert(it.key(), it.value().copy());
    }
    copy.watermark = watermark.copy();
    copy.background = background.copy();
    return copy;
}

CompositionPainter::CompositionPainter(FontRegistry& fonts)
    : m_fonts(fonts)
{
}

bool CompositionPainter::render(QImage& target, const SceneModel& scene, const PixelSourceSet& pixels,
                                const PaintOptions& options) {
    if (target.isNull()) {
        qWarning() << "CompositionPainter: Cannot render onto a null image";
        return false;
    }
    QPainter painter;
    if (!painter.begin(&target)) {
        qWarning() << "CompositionPainter: QPainter::begin failed for" << target.size();
        return false;
    }
    paint(painter, QSizeF(target.size()), scene, pixels, options);
    painter.end();
    return true;
}

void CompositionPainter::paint(QPainter& painter, const QSizeF& targetSize, const SceneModel& scene,
                               const PixelSourceSet& pixels, const PaintOptions& options) {
    m_skipped.clear();
    const QRectF bounds(QPointF(0.0, 0.0), targetSize);
    const RenderScale& scale = options.scale;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    paintBackground(painter, bounds, scene.background(), pixels);

    if (options.showEmptyPrompt && scene.isEmpty()) {
        paintEmptyPrompt(painter, bounds);
        painter.restore();
        return;
    }

    for (const ImageItem& image : scene.images()) {
        if (pixels.image(image.id).isNull()) {
            m_skipped.append(image.id);
        }
    }

    const QVector<Placement> placements = LayoutEngine::compute(layoutRequest(scene, pixels, targetSize, scale));
    paintImages(painter, targetSize, placements, scene.parameters(), pixels, scale);
    paintWatermark(painter, targetSize, scene, pixels, scale);
    for (const TextItem& layer : scene.texts()) {
        paintTextLayer(painter, layer, scale);
    }
    if (scene.parameters().mode == LayoutMode::FreePlacement && !options.selection.selectedImageId.isEmpty()) {
        paintSelection(painter, placements, options.selection, scale);
    }

    painter.restore();
}

LayoutRequest CompositionPainter::layoutRequest(const SceneModel& scene, const PixelSourceSet& pixels,
                                                const QSizeF& targetSize, const RenderScale& scale) {
    LayoutRequest request;
    request.canvasSize = targetSize;
    request.parameters = scene.parameters();
    request.gapX = scale.horizontal(scene.parameters().gap);
    request.gapY = scale.vertical(scene.parameters().gap);
    request.geometryScale = QPointF(scale.x, scale.y);
    request.images.reserve(scene.images().size());
    for (const ImageItem& image : scene.images()) {
        if (!pixels.image(image.id).isNull()) {
            request.images.append(image);
        }
    }
    return request;
}

QRectF CompositionPainter::watermarkRect(const WatermarkItem& watermark, const QSizeF& sourceSize,
                                         const QSizeF& targetSize, qreal marginX, qreal marginY) {
    if (sourceSize.width() <= 0.0 || sourceSize.height() <= 0.0) {
        return QRectF();
    }
    const qreal w = targetSize.width() * watermark.sizePercent / 100.0;
    const qreal h = w * sourceSize.height() / sourceSize.width();
    const qreal W = targetSize.width();
    const qreal H = targetSize.height();

    switch (watermark.anchor) {
        case WatermarkAnchor::TopLeft:
            return QRectF(marginX, marginY, w, h);
        case WatermarkAnchor::TopRight:
            return QRectF(W - w - marginX, marginY, w, h);
        case WatermarkAnchor::BottomLeft:
            return QRectF(marginX, H - h - marginY, w, h);
        case WatermarkAnchor::BottomRight:
            return QRectF(W - w - marginX, H - h - marginY, w, h);
        case WatermarkAnchor::Center:
            return QRectF((W - w) / 2.0, (H - h) / 2.0, w, h);
    }
    return QRectF();
}

void CompositionPainter::paintBackground(QPainter& painter, const QRectF& bounds, const BackgroundSpec& background,
                                         const PixelSourceSet& pixels) {
    painter.save();
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(bounds, Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    if (background.kind == BackgroundSpec::Kind::Image) {
        if (!pixels.background.isNull()) {
            painter.drawImage(bounds, pixels.background);
            painter.restore();
            return;
        }
        m_skipped.append(background.imageId);
        painter.fillRect(bounds, AppColors::gCanvasDefaultBackground);
    } else {
        painter.fillRect(bounds, colorFromCss(background.color, AppColors::gCanvasDefaultBackground));
    }
    painter.restore();
}

void CompositionPainter::paintImages(QPainter& painter, const QSizeF& targetSize, const QVector<Placement>& placements,
                                     const LayoutParameters& parameters, const PixelSourceSet& pixels,
                                     const RenderScale& scale) {
    paintBackdrop(painter, targetSize, placements, parameters, pixels, scale);

    for (const Placement& placement : placements) {
        if (placement.role == PlacementRole::Backdrop) {
            continue;
        }
        const QImage image = pixels.image(placement.imageId);
        if (image.isNull() || placement.rect.width() <= 0.0 || placement.rect.height() <= 0.0) {
            continue;
        }

        if (placement.role == PlacementRole::Freeform) {
            painter.drawImage(placement.rect, image);
            continue;
        }

        const QRectF dest = LayoutEngine::fitRect(QSizeF(image.size()), placement.rect, parameters.fit,
                                                  parameters.globalZoom * placement.extraZoom);
        if (dest.isNull()) {
            continue;
        }
        painter.save();
        painter.setClipRect(placement.rect, Qt::IntersectClip);
        painter.drawImage(dest, image);
        painter.restore();
    }
}

void CompositionPainter::paintBackdrop(QPainter& painter, const QSizeF& targetSize, const QVector<Placement>& placements,
                                       const LayoutParameters& parameters, const PixelSourceSet& pixels,
                                       const RenderScale& scale) {
    bool hasBackdrop = false;
    for (const Placement& placement : placements) {
        if (placement.role == PlacementRole::Backdrop) {
            hasBackdrop = true;
            break;
        }
    }
    const QSize layerSize = targetSize.toSize();
    if (!hasBackdrop || layerSize.isEmpty()) {
        return;
    }

    QImage layer(layerSize, QImage::Format_ARGB32_Premultiplied);
    layer.fill(Qt::transparent);
    {
        QPainter layerPainter(&layer);
        layerPainter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        for (const Placement& placement : placements) {
            if (placement.role != PlacementRole::Backdrop) {
                continue;
            }
            const QImage image = pixels.image(placement.imageId);
            if (image.isNull() || placement.rect.width() <= 0.0 || placement.rect.height() <= 0.0) {
                continue;
            }
            layerPainter.drawImage(placement.rect, image);
        }
    }

    const QImage blurred = ImageEffects::gaussianBlur(layer, scale.horizontal(parameters.backdropBlur));
    painter.save();
    painter.setOpacity(parameters.backdropOpacity);
    painter.drawImage(QPointF(0.0, 0.0), blurred);
    painter.restore();
}

void CompositionPainter::paintWatermark(QPainter& painter, const QSizeF& targetSize, const SceneModel& scene,
                                        const PixelSourceSet& pixels, const RenderScale& scale) {
    if (!scene.watermark()) {
        return;
    }
    const WatermarkItem& watermark = *scene.watermark();
    if (pixels.watermark.isNull()) {
        m_skipped.append(watermark.id);
        return;
    }
    const QRectF dest = watermarkRect(watermark, QSizeF(pixels.watermark.size()), targetSize,
                                      scale.horizontal(scene.parameters().gap),
                                      scale.vertical(scene.parameters().gap));
    if (dest.isEmpty()) {
        return;
    }
    painter.save();
    painter.setOpacity(watermark.opacity);
    painter.drawImage(dest, pixels.watermark);
    painter.restore();
}

void CompositionPainter::paintTextLayer(QPainter& painter, const TextItem& layer, const RenderScale& scale) {
    if (layer.text.isEmpty()) {
        return;
    }
    const qreal fontSize = scale.vertical(layer.fontSize);
    const qreal padding = scale.vertical(layer.padding);
    const qreal textWidth = m_fonts.textWidth(layer.text, layer.fontFamily, fontSize);

    painter.save();
    painter.translate(scale.point(QPointF(layer.x, layer.y)));
    painter.rotate(layer.rotation);

    if (layer.backgroundOpacity > 0.0) {
        const QRectF box(-textWidth / 2.0 - padding, -fontSize / 2.0 - padding,
                         textWidth + padding * 2.0, fontSize + padding * 2.0);
        painter.setOpacity(layer.backgroundOpacity);
        painter.fillRect(box, colorFromCss(layer.backgroundColor, AppColors::gTextFallback));
        painter.setOpacity(1.0);
    }

    // Baseline placed so the em box (ascent + descent) is centered on the origin
    const qreal baseline = (m_fonts.ascent(layer.fontFamily, fontSize)
                            - m_fonts.descent(layer.fontFamily, fontSize)) / 2.0;
    const QPainterPath path = m_fonts.textPath(layer.text, layer.fontFamily, fontSize)
                                  .translated(-textWidth / 2.0, baseline);

    if (layer.shadow) {
        paintTextShadow(painter, path, scale);
    }
    painter.fillPath(path, colorFromCss(layer.color, AppColors::gTextFallback));
    painter.restore();
}

void CompositionPainter::paintTextShadow(QPainter& painter, const QPainterPath& path, const RenderScale& scale) {
    const qreal sigma = scale.vertical(kTextShadowBlur) / 2.0;
    const QPainterPath devicePath = painter.worldTransform().map(path);
    const qreal margin = std::ceil(sigma * 3.0);
    const QRect area = devicePath.boundingRect().adjusted(-margin, -margin, margin, margin).toAlignedRect();
    if (area.isEmpty()) {
        return;
    }

    QImage mask(area.size(), QImage::Format_ARGB32_Premultiplied);
    mask.fill(Qt::transparent);
    {
        QPainter maskPainter(&mask);
        maskPainter.setRenderHint(QPainter::Antialiasing, true);
        maskPainter.translate(-area.topLeft());
        maskPainter.fillPath(devicePath, Qt::black);
    }
    const QImage shadow = ImageEffects::tintedShadow(mask, AppColors::gTextShadow, sigma);

    // Offset is in device space and does not rotate with the text
    painter.save();
    painter.resetTransform();
    painter.drawImage(QPointF(area.topLeft()) + QPointF(scale.horizontal(kTextShadowOffset),
                                                        scale.vertical(kTextShadowOffset)),
                      shadow);
    painter.restore();
}

void CompositionPainter::paintSelection(QPainter& painter, const QVector<Placement>& placements,
                                        const SelectionOverlay& selection, const RenderScale& scale) {
    for (const Placement& placement : placements) {
        if (placement.imageId != selection.selectedImageId) {
            continue;
        }
        const QRectF rect = placement.rect;
        painter.save();
        QPen pen(AppColors::gSelectionOutline);
        pen.setWidthF(scale.horizontal(selection.outlineWidth));
        pen.setJoinStyle(Qt::MiterJoin);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(rect);

        const qreal glyphW = scale.horizontal(selection.handleSize);
        const qreal glyphH = scale.vertical(selection.handleSize);
        painter.fillRect(QRectF(rect.right() - glyphW / 2.0, rect.bottom() - glyphH / 2.0, glyphW, glyphH),
                         AppColors::gSelectionOutline);
        painter.restore();
        return;
    }
}

void CompositionPainter::paintEmptyPrompt(QPainter& painter, const QRectF& bounds) {
    painter.save();
    QFont font = painter.font();
    font.setPixelSize(AppColors::gCanvasPromptFontSizePx);
    painter.setFont(font);
    painter.setPen(AppColors::gCanvasPromptText);
    painter.drawText(bounds, Qt::AlignCenter, QObject::tr("Upload images to begin"));
    painter.restore();
}
