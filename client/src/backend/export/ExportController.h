#ifndef EXPORTCONTROLLER_H
#define EXPORTCONTROLLER_H

#include <QObject>
#include <QSize>
#include <QString>

#include "backend/export/ExportTypes.h"

template <typename T> class QFutureWatcher;
class SceneStore;
class DecodedImageCache;
class SettingsManager;

/**
 * ExportController
 *
 * GUI-thread side of the export. Snapshots the current scene and detached
 * copies of the decoded pixels, dispatches ExportRenderer::renderExport on
 * the global thread pool and reports exactly one terminal signal per
 * accepted request. Only one export runs at a time; there is no timeout and
 * no cancellation.
 */
class ExportController : public QObject {
    Q_OBJECT
public:
    ExportController(SceneStore* store, DecodedImageCache* cache, QObject* parent = nullptr);
    ~ExportController() override;

    void setTargetSize(const QSize& size);
    QSize targetSize() const { return m_targetSize; }

    void setFileName(const QString& fileName);
    QString fileName() const { return m_fileName; }

    // Picks up export size and file name from the settings and follows later changes.
    void bindSettings(SettingsManager* settings);

    // Returns false (and dispatches nothing) while an export is in flight or
    // when the preview size is empty.
    bool requestExport(const QSize& previewSize);
    bool isExporting() const { return m_watcher != nullptr; }

signals:
    void exportStarted();
    void exportSucceeded(const QByteArray& encodedImage, const QString& fileName);
    void exportFailed(const QString& reason);

private:
    void onExportFinished();

    SceneStore* m_store;
    DecodedImageCache* m_cache;
    QSize m_targetSize;
    QString m_fileName;
    QFutureWatcher<ExportResult>* m_watcher = nullptr;
};

#endif // EXPORTCONTROLLER_H
