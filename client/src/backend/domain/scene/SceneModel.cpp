#include "backend/domain/scene/SceneModel.h"

#include <QUuid>
#include <algorithm>

namespace {

QString newIdentity() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

FreeformGeometry defaultGeometry(int batchIndex, int zIndex) {
    FreeformGeometry g;
    g.x = SceneDefaults::FREEFORM_ORIGIN + batchIndex * SceneDefaults::FREEFORM_STEP;
    g.y = SceneDefaults::FREEFORM_ORIGIN + batchIndex * SceneDefaults::FREEFORM_STEP;
    g.width = SceneDefaults::FREEFORM_WIDTH;
    g.height = SceneDefaults::FREEFORM_HEIGHT;
    g.zIndex = zIndex;
    return g;
}

} // namespace

bool SceneModel::isEmpty() const {
    return m_images.isEmpty() && m_texts.isEmpty() && !m_watermark.has_value();
}

QStringList SceneModel::addImages(int count) {
    QStringList ids;
    const int baseZ = maxZIndex();
    for (int k = 0; k < count; ++k) {
        ImageItem item;
        item.id = newIdentity();
        item.insertionOrder = m_nextInsertionOrder++;
        item.freeform = defaultGeometry(k, baseZ + k + 1);
        m_images.append(item);
        ids.append(item.id);
    }
    return ids;
}

QString SceneModel::addImage(const QString& id) {
    ImageItem item;
    item.id = id.isEmpty() ? newIdentity() : id;
    item.insertionOrder = m_nextInsertionOrder++;
    item.freeform = defaultGeometry(0, maxZIndex() + 1);
    m_images.append(item);
    return item.id;
}

bool SceneModel::removeImage(const QString& id) {
    const int index = indexOfImage(id);
    if (index < 0) {
        return false;
    }
    m_images.removeAt(index);
    if (m_background.kind == BackgroundSpec::Kind::Image && m_background.imageId == id) {
        m_background.kind = BackgroundSpec::Kind::Color;
        m_background.imageId.clear();
    }
    return true;
}

bool SceneModel::moveImage(const QString& draggedId, const QString& targetId) {
    const int from = indexOfImage(draggedId);
    const int to = indexOfImage(targetId);
    if (from < 0 || to < 0) {
        return false;
    }
    if (from != to) {
        m_images.move(from, to);
    }
    return true;
}

const ImageItem* SceneModel::findImage(const QString& id) const {
    const int index = indexOfImage(id);
    return index >= 0 ? &m_images.at(index) : nullptr;
}

int SceneModel::indexOfImage(const QString& id) const {
    for (int i = 0; i < m_images.size(); ++i) {
        if (m_images.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

bool SceneModel::setImageGeometry(const QString& id, const FreeformGeometry& geometry) {
    ImageItem* item = findImageMutable(id);
    if (!item) {
        return false;
    }
    FreeformGeometry clamped = geometry;
    clamped.width = std::max(kMinFreeformSize, geometry.width);
    clamped.height = std::max(kMinFreeformSize, geometry.height);
    item->freeform = clamped;
    return true;
}

bool SceneModel::moveImageTo(const QString& id, const QPointF& topLeft) {
    ImageItem* item = findImageMutable(id);
    if (!item || !item->freeform) {
        return false;
    }
    item->freeform->x = topLeft.x();
    item->freeform->y = topLeft.y();
    return true;
}

bool SceneModel::resizeImage(const QString& id, qreal width, qreal height) {
    ImageItem* item = findImageMutable(id);
    if (!item || !item->freeform) {
        return false;
    }
    // Width and height are independent: no aspect lock.
    item->freeform->width = std::max(kMinFreeformSize, width);
    item->freeform->height = std::max(kMinFreeformSize, height);
    return true;
}

bool SceneModel::bringToFront(const QString& id) {
    ImageItem* item = findImageMutable(id);
    if (!item) {
        return false;
    }
    const int top = std::max(0, maxZIndex()) + 1;
    if (!item->freeform) {
        item->freeform = defaultGeometry(0, top);
    } else {
        item->freeform->zIndex = top;
    }
    return true;
}

bool SceneModel::sendToBack(const QString& id) {
    ImageItem* item = findImageMutable(id);
    if (!item) {
        return false;
    }
    const int bottom = std::min(0, minZIndex()) - 1;
    if (!item->freeform) {
        item->freeform = defaultGeometry(0, bottom);
    } else {
        item->freeform->zIndex = bottom;
    }
    return true;
}

QVector<ImageItem> SceneModel::freeformStackingOrder() const {
    QVector<ImageItem> ordered;
    ordered.reserve(m_images.size());
    for (const ImageItem& item : m_images) {
        if (item.freeform) {
            ordered.append(item);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ImageItem& a, const ImageItem& b) {
        if (a.freeform->zIndex != b.freeform->zIndex) {
            return a.freeform->zIndex < b.freeform->zIndex;
        }
        return a.insertionOrder < b.insertionOrder;
    });
    return ordered;
}

QString SceneModel::addTextLayer(const QPointF& center) {
    TextItem item;
    item.id = newIdentity();
    item.text = SceneDefaults::TEXT_CONTENT;
    item.x = center.x();
    item.y = center.y();
    item.fontSize = SceneDefaults::TEXT_FONT_SIZE;
    item.fontFamily = SceneDefaults::TEXT_FONT_FAMILY;
    item.color = SceneDefaults::TEXT_COLOR;
    item.rotation = 0.0;
    item.shadow = SceneDefaults::TEXT_SHADOW;
    item.backgroundColor = SceneDefaults::TEXT_BACKGROUND_COLOR;
    item.backgroundOpacity = SceneDefaults::TEXT_BACKGROUND_OPACITY;
    item.padding = SceneDefaults::TEXT_PADDING;
    m_texts.append(item);
    return item.id;
}

bool SceneModel::updateTextLayer(const TextItem& item) {
    TextItem* existing = findTextMutable(item.id);
    if (!existing) {
        return false;
    }
    *existing = item;
    return true;
}

bool SceneModel::removeTextLayer(const QString& id) {
    for (int i = 0; i < m_texts.size(); ++i) {
        if (m_texts.at(i).id == id) {
            m_texts.removeAt(i);
            return true;
        }
    }
    return false;
}

bool SceneModel::moveTextLayer(const QString& id, const QPointF& position) {
    TextItem* item = findTextMutable(id);
    if (!item) {
        return false;
    }
    item->x = position.x();
    item->y = position.y();
    return true;
}

const TextItem* SceneModel::findText(const QString& id) const {
    for (const TextItem& item : m_texts) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

void SceneModel::setWatermark(const QString& imageId) {
    WatermarkItem item;
    item.id = imageId;
    item.opacity = SceneDefaults::WATERMARK_OPACITY;
    item.sizePercent = SceneDefaults::WATERMARK_SIZE_PERCENT;
    item.anchor = WatermarkAnchor::BottomRight;
    m_watermark = item;
}

bool SceneModel::updateWatermark(const WatermarkItem& item) {
    if (!m_watermark || m_watermark->id != item.id) {
        return false;
    }
    m_watermark = item;
    return true;
}

void SceneModel::clearWatermark() {
    m_watermark.reset();
}

void SceneModel::setBackgroundColor(const QString& css) {
    m_background.kind = BackgroundSpec::Kind::Color;
    m_background.color = css;
    m_background.imageId.clear();
}

void SceneModel::setBackgroundImage(const QString& imageId) {
    m_background.kind = BackgroundSpec::Kind::Image;
    m_background.imageId = imageId;
}

void SceneModel::setParameters(const LayoutParameters& parameters) {
    m_parameters = parameters;
    if (m_parameters.mode == LayoutMode::FreePlacement) {
        ensureFreeformGeometry();
    }
}

void SceneModel::setLayoutMode(LayoutMode mode) {
    m_parameters.mode = mode;
    if (mode == LayoutMode::FreePlacement) {
        ensureFreeformGeometry();
    }
}

ImageItem* SceneModel::findImageMutable(const QString& id) {
    const int index = indexOfImage(id);
    return index >= 0 ? &m_images[index] : nullptr;
}

TextItem* SceneModel::findTextMutable(const QString& id) {
    for (TextItem& item : m_texts) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

int SceneModel::maxZIndex() const {
    int result = 0;
    bool any = false;
    for (const ImageItem& item : m_images) {
        if (!item.freeform) continue;
        result = any ? std::max(result, item.freeform->zIndex) : item.freeform->zIndex;
        any = true;
    }
    return result;
}

int SceneModel::minZIndex() const {
    int result = 0;
    bool any = false;
    for (const ImageItem& item : m_images) {
        if (!item.freeform) continue;
        result = any ? std::min(result, item.freeform->zIndex) : item.freeform->zIndex;
        any = true;
    }
    return result;
}

void SceneModel::ensureFreeformGeometry() {
    int batchIndex = 0;
    const int baseZ = maxZIndex();
    for (ImageItem& item : m_images) {
        if (!item.freeform) {
            item.freeform = defaultGeometry(batchIndex, baseZ + batchIndex + 1);
            ++batchIndex;
        }
    }
}
