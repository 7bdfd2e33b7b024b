#include "backend/domain/scene/SceneStore.h"
#include "managers/app/SettingsManager.h"

#include <QDebug>

SceneStore::SceneStore(QObject* parent)
    : QObject(parent)
{
}

void SceneStore::setScene(const SceneModel& scene) {
    install(scene);
    bool selectionDropped = false;
    if (!m_selection.selectedImageId().isEmpty() && !m_scene.findImage(m_selection.selectedImageId())) {
        m_selection.setSelectedImageId(QString());
        selectionDropped = true;
    }
    if (!m_selection.selectedTextId().isEmpty() && !m_scene.findText(m_selection.selectedTextId())) {
        m_selection.setSelectedTextId(QString());
        selectionDropped = true;
    }
    if (selectionDropped) {
        emit selectionChanged();
    }
}

void SceneStore::bindSettings(SettingsManager* settings) {
    if (m_settings) {
        disconnect(m_settings, nullptr, this, nullptr);
    }
    m_settings = settings;
    if (!settings) {
        return;
    }
    auto apply = [this, settings]() {
        m_defaultParameters = settings->getDefaultLayoutParameters();
        m_defaultBackgroundColor = settings->getBackgroundColor();
    };
    apply();
    connect(settings, &SettingsManager::settingsChanged, this, apply);

    if (m_scene.isEmpty()) {
        SceneModel seeded = seededScene();
        // Keep a background image the user already chose
        if (m_scene.background().kind == BackgroundSpec::Kind::Image) {
            seeded.setBackgroundImage(m_scene.background().imageId);
        }
        install(seeded);
        qDebug() << "SceneStore: Seeded empty scene from settings," << layoutModeToString(m_defaultParameters.mode);
    }
}

void SceneStore::newScene() {
    clearSelection();
    setScene(seededScene());
}

SceneModel SceneStore::seededScene() const {
    SceneModel scene;
    scene.setParameters(m_defaultParameters);
    scene.setBackgroundColor(m_defaultBackgroundColor);
    return scene;
}

void SceneStore::install(const SceneModel& scene) {
    m_scene = scene;
    emit sceneChanged();
}

QStringList SceneStore::addImages(int count) {
    if (count <= 0) {
        return {};
    }
    SceneModel next = m_scene;
    const QStringList ids = next.addImages(count);
    install(next);
    qDebug() << "SceneStore: Added" << ids.size() << "images";
    return ids;
}

bool SceneStore::removeImage(const QString& id) {
    SceneModel next = m_scene;
    if (!next.removeImage(id)) {
        return false;
    }
    install(next);
    if (m_selection.selectedImageId() == id) {
        m_selection.setSelectedImageId(QString());
        emit selectionChanged();
    }
    emit imageRemoved(id);
    return true;
}

bool SceneStore::moveImage(const QString& draggedId, const QString& targetId) {
    SceneModel next = m_scene;
    if (!next.moveImage(draggedId, targetId)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::setImageGeometry(const QString& id, const FreeformGeometry& geometry) {
    SceneModel next = m_scene;
    if (!next.setImageGeometry(id, geometry)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::moveImageTo(const QString& id, const QPointF& topLeft) {
    SceneModel next = m_scene;
    if (!next.moveImageTo(id, topLeft)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::resizeImage(const QString& id, qreal width, qreal height) {
    SceneModel next = m_scene;
    if (!next.resizeImage(id, width, height)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::bringToFront(const QString& id) {
    SceneModel next = m_scene;
    if (!next.bringToFront(id)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::sendToBack(const QString& id) {
    SceneModel next = m_scene;
    if (!next.sendToBack(id)) {
        return false;
    }
    install(next);
    return true;
}

QString SceneStore::addTextLayer(const QPointF& center) {
    SceneModel next = m_scene;
    const QString id = next.addTextLayer(center);
    install(next);
    m_selection.setSelectedTextId(id);
    emit selectionChanged();
    return id;
}

bool SceneStore::updateTextLayer(const TextItem& item) {
    SceneModel next = m_scene;
    if (!next.updateTextLayer(item)) {
        return false;
    }
    install(next);
    return true;
}

bool SceneStore::removeTextLayer(const QString& id) {
    SceneModel next = m_scene;
    if (!next.removeTextLayer(id)) {
        return false;
    }
    install(next);
    if (m_selection.selectedTextId() == id) {
        m_selection.setSelectedTextId(QString());
        emit selectionChanged();
    }
    return true;
}

bool SceneStore::moveTextLayer(const QString& id, const QPointF& position) {
    SceneModel next = m_scene;
    if (!next.moveTextLayer(id, position)) {
        return false;
    }
    install(next);
    return true;
}

void SceneStore::setWatermark(const QString& imageId) {
    SceneModel next = m_scene;
    next.setWatermark(imageId);
    install(next);
}

bool SceneStore::updateWatermark(const WatermarkItem& item) {
    SceneModel next = m_scene;
    if (!next.updateWatermark(item)) {
        return false;
    }
    install(next);
    return true;
}

void SceneStore::clearWatermark() {
    if (!m_scene.watermark()) {
        return;
    }
    SceneModel next = m_scene;
    next.clearWatermark();
    install(next);
}

void SceneStore::setBackgroundColor(const QString& css) {
    SceneModel next = m_scene;
    next.setBackgroundColor(css);
    install(next);
}

void SceneStore::setBackgroundImage(const QString& imageId) {
    SceneModel next = m_scene;
    next.setBackgroundImage(imageId);
    install(next);
}

void SceneStore::setParameters(const LayoutParameters& parameters) {
    SceneModel next = m_scene;
    next.setParameters(parameters);
    install(next);
}

void SceneStore::setLayoutMode(LayoutMode mode) {
    if (m_scene.parameters().mode == mode) {
        return;
    }
    SceneModel next = m_scene;
    next.setLayoutMode(mode);
    install(next);
    qDebug() << "SceneStore: Layout mode" << layoutModeToString(mode);
}

bool SceneStore::selectImage(const QString& id) {
    if (id.isEmpty()) {
        if (!m_selection.selectedImageId().isEmpty()) {
            m_selection.setSelectedImageId(QString());
            emit selectionChanged();
        }
        return true;
    }
    if (!m_scene.findImage(id)) {
        return false;
    }
    if (m_scene.parameters().mode == LayoutMode::FreePlacement) {
        bringToFront(id);
    }
    if (m_selection.selectedImageId() != id) {
        m_selection.setSelectedImageId(id);
        emit selectionChanged();
    }
    return true;
}

bool SceneStore::selectText(const QString& id) {
    if (id.isEmpty()) {
        if (!m_selection.selectedTextId().isEmpty()) {
            m_selection.setSelectedTextId(QString());
            emit selectionChanged();
        }
        return true;
    }
    if (!m_scene.findText(id)) {
        return false;
    }
    if (m_selection.selectedTextId() != id) {
        m_selection.setSelectedTextId(id);
        emit selectionChanged();
    }
    return true;
}

void SceneStore::clearSelection() {
    if (m_selection.isEmpty()) {
        return;
    }
    m_selection.clear();
    emit selectionChanged();
}
