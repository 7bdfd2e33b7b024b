#ifndef SCENESTORE_H
#define SCENESTORE_H

#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QString>
#include <QStringList>

#include "backend/domain/scene/SceneModel.h"
#include "backend/domain/scene/SelectionStore.h"

class SettingsManager;

/**
 * SceneStore
 *
 * Owns the current SceneModel and the selection. Every edit copies the
 * model, applies the change to the copy and installs it wholesale, then
 * announces it with sceneChanged(). Edits that target an unknown identity
 * return false and leave the scene untouched.
 */
class SceneStore : public QObject {
    Q_OBJECT
public:
    explicit SceneStore(QObject* parent = nullptr);
    ~SceneStore() override = default;

    const SceneModel& scene() const { return m_scene; }
    void setScene(const SceneModel& scene);

    // Takes layout parameters and background color for new scenes from the
    // settings. The current scene is seeded too while it is still empty.
    void bindSettings(SettingsManager* settings);
    // Replaces the scene with an empty one carrying the default parameters
    // and background color, and clears the selection.
    void newScene();

    // Images
    QStringList addImages(int count);
    bool removeImage(const QString& id);
    bool moveImage(const QString& draggedId, const QString& targetId);
    bool setImageGeometry(const QString& id, const FreeformGeometry& geometry);
    bool moveImageTo(const QString& id, const QPointF& topLeft);
    bool resizeImage(const QString& id, qreal width, qreal height);
    bool bringToFront(const QString& id);
    bool sendToBack(const QString& id);

    // Text layers
    QString addTextLayer(const QPointF& center);
    bool updateTextLayer(const TextItem& item);
    bool removeTextLayer(const QString& id);
    bool moveTextLayer(const QString& id, const QPointF& position);

    // Watermark / background / parameters
    void setWatermark(const QString& imageId);
    bool updateWatermark(const WatermarkItem& item);
    void clearWatermark();
    void setBackgroundColor(const QString& css);
    void setBackgroundImage(const QString& imageId);
    void setParameters(const LayoutParameters& parameters);
    void setLayoutMode(LayoutMode mode);

    // Selection
    const SelectionStore& selection() const { return m_selection; }
    // An empty id clears that part of the selection. Selecting an image in
    // free-placement mode also raises it to the front.
    bool selectImage(const QString& id);
    bool selectText(const QString& id);
    void clearSelection();

signals:
    void sceneChanged();
    void selectionChanged();
    void imageRemoved(const QString& id);

private:
    void install(const SceneModel& scene);
    SceneModel seededScene() const;

    SceneModel m_scene;
    SelectionStore m_selection;

    QPointer<SettingsManager> m_settings;
    LayoutParameters m_defaultParameters;
    QString m_defaultBackgroundColor = SceneDefaults::BACKGROUND_COLOR;
};

#endif // SCENESTORE_H
