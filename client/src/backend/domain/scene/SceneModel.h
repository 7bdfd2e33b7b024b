#ifndef SCENEMODEL_H
#define SCENEMODEL_H

#include <QVector>
#include <QString>
#include <QStringList>
#include <QPointF>
#include <optional>

#include "backend/domain/scene/SceneTypes.h"

// Defaults applied when new scene entries are created.
namespace SceneDefaults {
    inline const QString BACKGROUND_COLOR = QStringLiteral("#F3F4F6");

    inline const QString TEXT_CONTENT = QStringLiteral("New Text");
    inline const QString TEXT_FONT_FAMILY = QStringLiteral("Montserrat");
    inline const QString TEXT_COLOR = QStringLiteral("#FFFFFF");
    inline const QString TEXT_BACKGROUND_COLOR = QStringLiteral("#000000");
    constexpr qreal TEXT_FONT_SIZE = 48.0;
    constexpr qreal TEXT_BACKGROUND_OPACITY = 0.5;
    constexpr qreal TEXT_PADDING = 10.0;
    constexpr bool TEXT_SHADOW = true;

    constexpr qreal WATERMARK_OPACITY = 0.5;
    constexpr qreal WATERMARK_SIZE_PERCENT = 20.0;

    // Free-placement geometry for the k-th image of an upload batch
    constexpr qreal FREEFORM_ORIGIN = 50.0;
    constexpr qreal FREEFORM_STEP = 30.0;
    constexpr qreal FREEFORM_WIDTH = 300.0;
    constexpr qreal FREEFORM_HEIGHT = 200.0;
}

/**
 * SceneModel
 *
 * Renderer-agnostic description of everything the compositor draws: images,
 * text layers, the optional watermark, the background and the layout parameters.
 * It is a plain value: holders never patch a published instance in place, they
 * copy it, edit the copy and install the result wholesale (see SceneStore).
 * No pixel data lives here; images, watermark and background reference their
 * decoded pixels by identity.
 */
class SceneModel {
public:
    const QVector<ImageItem>& images() const { return m_images; }
    const QVector<TextItem>& texts() const { return m_texts; }
    const std::optional<WatermarkItem>& watermark() const { return m_watermark; }
    const BackgroundSpec& background() const { return m_background; }
    const LayoutParameters& parameters() const { return m_parameters; }

    // True when there is nothing but the background to draw.
    bool isEmpty() const;

    // Images
    QStringList addImages(int count);
    QString addImage(const QString& id = QString());
    bool removeImage(const QString& id);
    bool moveImage(const QString& draggedId, const QString& targetId);
    const ImageItem* findImage(const QString& id) const;
    int indexOfImage(const QString& id) const;

    // Free-placement geometry edits. Width/height never drop below kMinFreeformSize.
    bool setImageGeometry(const QString& id, const FreeformGeometry& geometry);
    bool moveImageTo(const QString& id, const QPointF& topLeft);
    bool resizeImage(const QString& id, qreal width, qreal height);
    bool bringToFront(const QString& id);
    bool sendToBack(const QString& id);
    // Ascending zIndex, ties broken by insertion order. Images without geometry are omitted.
    QVector<ImageItem> freeformStackingOrder() const;

    // Text layers; array order is paint order
    QString addTextLayer(const QPointF& center);
    bool updateTextLayer(const TextItem& item);
    bool removeTextLayer(const QString& id);
    bool moveTextLayer(const QString& id, const QPointF& position);
    const TextItem* findText(const QString& id) const;

    void setWatermark(const QString& imageId);
    bool updateWatermark(const WatermarkItem& item);
    void clearWatermark();

    void setBackgroundColor(const QString& css);
    void setBackgroundImage(const QString& imageId);

    void setParameters(const LayoutParameters& parameters);
    void setLayoutMode(LayoutMode mode);

private:
    ImageItem* findImageMutable(const QString& id);
    TextItem* findTextMutable(const QString& id);
    int maxZIndex() const;
    int minZIndex() const;
    void ensureFreeformGeometry();

    QVector<ImageItem> m_images;
    QVector<TextItem> m_texts;
    std::optional<WatermarkItem> m_watermark;
    BackgroundSpec m_background{BackgroundSpec::Kind::Color, SceneDefaults::BACKGROUND_COLOR, QString()};
    LayoutParameters m_parameters;
    int m_nextInsertionOrder = 0;
};

#endif // SCENEMODEL_H
