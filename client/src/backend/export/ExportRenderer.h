#ifndef EXPORTRENDERER_H
#define EXPORTRENDERER_H

#include "backend/export/ExportTypes.h"

class FontRegistry;

/**
 * ExportRenderer
 *
 * Body of the isolated export task. Runs on a pool thread with no access to
 * GUI-thread state: it derives the preview-to-target scale, resolves every
 * font the text layers need, paints the scene with the same pipeline as the
 * interactive canvas and encodes the result as PNG.
 * Always returns exactly one result; nothing escapes as an exception.
 */
class ExportRenderer {
public:
    static ExportResult renderExport(ExportRequest request);

    // Resolves each distinct (family, scaled pixel size) pair once. Returns the number of pairs.
    static int prepareFonts(FontRegistry& fonts, const SceneModel& scene, const RenderScale& scale);

    static QByteArray encodePng(const QImage& image, bool* ok);
};

#endif // EXPORTRENDERER_H
