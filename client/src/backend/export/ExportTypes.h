#ifndef EXPORTTYPES_H
#define EXPORTTYPES_H

#include <QByteArray>
#include <QImage>
#include <QSize>
#include <QString>
#include <QStringList>

#include "backend/domain/scene/SceneModel.h"
#include "backend/rendering/CompositionPainter.h"

// Human-readable failure reasons of the export path.
namespace ExportErrors {
    inline const QString SURFACE_UNAVAILABLE = QStringLiteral("Could not acquire drawing surface");
    inline const QString ENCODE_FAILED = QStringLiteral("Could not encode image");
    inline const QString ALREADY_IN_PROGRESS = QStringLiteral("Export already in progress");
}

// Everything the export task needs, owned by the task once dispatched.
struct ExportRequest {
    QImage targetSurface;      // fixed-resolution surface painted on
    QSize previewSize;         // size of the interactive canvas the scene was edited on
    SceneModel scene;          // geometry, styling and parameters only
    PixelSourceSet pixels;     // detached copies, never shared with the GUI thread
};

struct ExportResult {
    bool success = false;
    QByteArray encodedImage;   // PNG when success
    QString reason;            // set when !success
    QStringList skippedIds;    // elements painted without pixels

    static ExportResult failure(const QString& reason) {
        ExportResult r;
        r.reason = reason;
        return r;
    }
};

#endif // EXPORTTYPES_H
