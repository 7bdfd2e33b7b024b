#include "backend/export/ExportController.h"
#include "backend/export/ExportRenderer.h"
#include "backend/domain/scene/SceneStore.h"
#include "backend/files/DecodedImageCache.h"
#include "managers/app/SettingsManager.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>
#include <utility>

ExportController::ExportController(SceneStore* store, DecodedImageCache* cache, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_cache(cache)
    , m_targetSize(2000, 1500)
    , m_fileName("mockup.png")
{
}

ExportController::~ExportController() {
    if (m_watcher) {
        // The task owns its request; wait so it does not outlive the receiver.
        disconnect(m_watcher, nullptr, this, nullptr);
        m_watcher->waitForFinished();
    }
}

void ExportController::setTargetSize(const QSize& size) {
    if (size.isEmpty()) {
        qWarning() << "ExportController: Ignoring empty target size" << size;
        return;
    }
    m_targetSize = size;
}

void ExportController::setFileName(const QString& fileName) {
    if (!fileName.trimmed().isEmpty()) {
        m_fileName = fileName.trimmed();
    }
}

void ExportController::bindSettings(SettingsManager* settings) {
    if (!settings) {
        return;
    }
    setTargetSize(settings->getExportSize());
    setFileName(settings->getExportFileName());
    connect(settings, &SettingsManager::settingsChanged, this, [this, settings]() {
        setTargetSize(settings->getExportSize());
        setFileName(settings->getExportFileName());
    });
}

bool ExportController::requestExport(const QSize& previewSize) {
    if (m_watcher) {
        qWarning() << "ExportController:" << ExportErrors::ALREADY_IN_PROGRESS;
        return false;
    }
    if (!m_store || !m_cache) {
        qWarning() << "ExportController: No scene store or image cache attached";
        return false;
    }
    if (previewSize.isEmpty()) {
        qWarning() << "ExportController: Invalid preview size" << previewSize;
        return false;
    }

    const SceneModel& scene = m_store->scene();
    const QStringList pending = m_cache->pendingIds(scene);
    if (!pending.isEmpty()) {
        qWarning() << "ExportController: Exporting without pixels for" << pending.size()
                   << "pending elements:" << pending;
    }

    ExportRequest request;
    request.previewSize = previewSize;
    request.scene = scene;
    request.pixels = m_cache->pixelSources(scene).detached();
    request.targetSurface = QImage(m_targetSize, QImage::Format_ARGB32_Premultiplied);
    if (!request.targetSurface.isNull()) {
        request.targetSurface.fill(Qt::transparent);
    }

    qDebug() << "ExportController: Dispatching export" << previewSize << "->" << m_targetSize
             << "mode" << layoutModeToString(scene.parameters().mode)
             << "images" << request.pixels.images.size();

    m_watcher = new QFutureWatcher<ExportResult>(this);
    connect(m_watcher, &QFutureWatcher<ExportResult>::finished, this, &ExportController::onExportFinished);
    m_watcher->setFuture(QtConcurrent::run(&ExportRenderer::renderExport, std::move(request)));
    emit exportStarted();
    return true;
}

void ExportController::onExportFinished() {
    QFutureWatcher<ExportResult>* watcher = m_watcher;
    m_watcher = nullptr;
    const ExportResult result = watcher->result();
    watcher->deleteLater();

    if (result.success) {
        qDebug() << "ExportController: Export finished," << result.encodedImage.size() << "bytes";
        emit exportSucceeded(result.encodedImage, m_fileName);
    } else {
        qWarning() << "ExportController: Export failed:" << result.reason;
        emit exportFailed(result.reason);
    }
}
