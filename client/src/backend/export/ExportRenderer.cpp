#include "backend/export/ExportRenderer.h"
#include "backend/rendering/FontRegistry.h"

#include <QBuffer>
#include <QDebug>
#include <QElapsedTimer>
#include <exception>

ExportResult ExportRenderer::renderExport(ExportRequest request) {
    try {
        if (request.targetSurface.isNull()) {
            qWarning() << "ExportRenderer: Target surface is null";
            return ExportResult::failure(ExportErrors::SURFACE_UNAVAILABLE);
        }

        QElapsedTimer timer;
        timer.start();

        const RenderScale scale = RenderScale::between(QSizeF(request.previewSize),
                                                       QSizeF(request.targetSurface.size()));
        FontRegistry fonts;
        const int fontPairs = prepareFonts(fonts, request.scene, scale);

        PaintOptions options;
        options.scale = scale;
        CompositionPainter painter(fonts);
        if (!painter.render(request.targetSurface, request.scene, request.pixels, options)) {
            return ExportResult::failure(ExportErrors::SURFACE_UNAVAILABLE);
        }
        for (const QString& id : painter.skippedIds()) {
            qDebug() << "ExportRenderer: Skipped" << id << "(pixels not decoded)";
        }

        bool encoded = false;
        ExportResult result;
        result.encodedImage = encodePng(request.targetSurface, &encoded);
        if (!encoded) {
            return ExportResult::failure(ExportErrors::ENCODE_FAILED);
        }
        result.success = true;
        result.skippedIds = painter.skippedIds();
        qDebug() << "ExportRenderer: Rendered" << request.targetSurface.size()
                 << "scale" << scale.x << scale.y << "fonts" << fontPairs
                 << "in" << timer.elapsed() << "ms," << result.encodedImage.size() << "bytes";
        return result;
    } catch (const std::exception& e) {
        qWarning() << "ExportRenderer: Export task failed:" << e.what();
        return ExportResult::failure(QString::fromUtf8(e.what()));
    }
}

int ExportRenderer::prepareFonts(FontRegistry& fonts, const SceneModel& scene, const RenderScale& scale) {
    for (const TextItem& layer : scene.texts()) {
        fonts.prepare(layer.fontFamily, scale.vertical(layer.fontSize));
    }
    return fonts.preparedCount();
}

QByteArray ExportRenderer::encodePng(const QImage& image, bool* ok) {
    QByteArray bytes;
    QBuffer buffer(&bytes);
    bool saved = false;
    if (buffer.open(QIODevice::WriteOnly)) {
        saved = image.save(&buffer, "PNG");
        buffer.close();
    }
    if (!saved) {
        qWarning() << "ExportRenderer: PNG encoding failed for" << image.size();
        bytes.clear();
    }
    if (ok) {
        *ok = saved;
    }
    return bytes;
}
