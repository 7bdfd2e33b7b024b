#include "backend/files/DecodedImageCache.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>

DecodedImageCache::DecodedImageCache(QObject* parent)
    : QObject(parent)
{
}

void DecodedImageCache::registerBytes(const QString& id, const QByteArray& bytes) {
    if (id.isEmpty()) {
        qWarning() << "DecodedImageCache::registerBytes: empty id";
        return;
    }

    Entry& entry = m_entries[id];
    entry.bytes = QSharedPointer<QByteArray>::create(bytes);
    entry.image = QImage();
    entry.state = State::Pending;
    entry.generation = m_nextGeneration++;
    qDebug() << "DecodedImageCache: Registered" << id << "(" << bytes.size() << "bytes), decoding";

    const quint64 generation = entry.generation;
    auto* watcher = new QFutureWatcher<QImage>(this);
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, watcher, id, generation]() {
        const QImage img = watcher->result();
        watcher->deleteLater();
        onDecodeFinished(id, generation, img);
    });

    watcher->setFuture(QtConcurrent::run([data = entry.bytes]() {
        QImage decoded = QImage::fromData(*data);
        if (decoded.isNull()) {
            return decoded;
        }
        return decoded.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    }));
}

void DecodedImageCache::registerDecoded(const QString& id, const QImage& image) {
    if (id.isEmpty()) {
        qWarning() << "DecodedImageCache::registerDecoded: empty id";
        return;
    }
    Entry& entry = m_entries[id];
    entry.generation = m_nextGeneration++;
    if (image.isNull()) {
        entry.image = QImage();
        entry.state = State::Failed;
        qWarning() << "DecodedImageCache: Null image registered for" << id;
        emit decodeFailed(id);
        return;
    }
    entry.image = image.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    entry.state = State::Ready;
    emit imageDecoded(id);
}

void DecodedImageCache::onDecodeFinished(const QString& id, quint64 generation, const QImage& image) {
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->generation != generation) {
        // Released or re-registered while decoding
        return;
    }
    if (image.isNull()) {
        it->state = State::Failed;
        qWarning() << "DecodedImageCache: Failed to decode" << id;
        emit decodeFailed(id);
        return;
    }
    it->image = image;
    it->state = State::Ready;
    qDebug() << "DecodedImageCache: Decoded" << id << image.size();
    emit imageDecoded(id);
}

void DecodedImageCache::release(const QString& id) {
    if (m_entries.remove(id)) {
        qDebug() << "DecodedImageCache: Released" << id;
    }
}

void DecodedImageCache::clear() {
    qDebug() << "DecodedImageCache: Clearing cache (" << m_entries.size() << "entries)";
    m_entries.clear();
}

void DecodedImageCache::bindStore(SceneStore* store) {
    if (m_store) {
        disconnect(m_store, nullptr, this, nullptr);
    }
    m_store = store;
    m_referencedIds.clear();
    if (!store) {
        return;
    }
    m_referencedIds = referencedIds(store->scene());
    connect(store, &SceneStore::sceneChanged, this, &DecodedImageCache::onSceneChanged);
}

void DecodedImageCache::onSceneChanged() {
    if (!m_store) {
        return;
    }
    const QSet<QString> current = referencedIds(m_store->scene());
    const QSet<QString> dropped = m_referencedIds - current;
    for (const QString& id : dropped) {
        release(id);
    }
    m_referencedIds = current;
}

QSet<QString> DecodedImageCache::referencedIds(const SceneModel& scene) {
    QSet<QString> ids;
    for (const ImageItem& item : scene.images()) {
        ids.insert(item.id);
    }
    if (scene.watermark()) {
        ids.insert(scene.watermark()->id);
    }
    if (scene.background().kind == BackgroundSpec::Kind::Image) {
        ids.insert(scene.background().imageId);
    }
    return ids;
}

QImage DecodedImageCache::image(const QString& id) const {
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd() || it->state != State::Ready) {
        return QImage();
    }
    return it->image;
}

QSharedPointer<QByteArray> DecodedImageCache::bytes(const QString& id) const {
    return m_entries.value(id).bytes;
}

DecodedImageCache::State DecodedImageCache::state(const QString& id) const {
    auto it = m_entries.constFind(id);
    return it == m_entries.constEnd() ? State::Missing : it->state;
}

int DecodedImageCache::pendingCount() const {
    int pending = 0;
    for (const Entry& entry : m_entries) {
        if (entry.state == State::Pending) {
            ++pending;
        }
    }
    return pending;
}

PixelSourceSet DecodedImageCache::pixelSources(const SceneModel& scene) const {
    PixelSourceSet pixels;
    for (const ImageItem& item : scene.images()) {
        const QImage img = image(item.id);
        if (!img.isNull()) {
            pixels.images.insert(item.id, img);
        }
    }
    if (scene.watermark()) {
        pixels.watermark = image(scene.watermark()->id);
    }
    if (scene.background().kind == BackgroundSpec::Kind::Image) {
        pixels.background = image(scene.background().imageId);
    }
    return pixels;
}

QStringList DecodedImageCache::pendingIds(const SceneModel& scene) const {
    QStringList ids;
    for (const ImageItem& item : scene.images()) {
        ids.append(item.id);
    }
    if (scene.watermark()) {
        ids.append(scene.watermark()->id);
    }
    if (scene.background().kind == BackgroundSpec::Kind::Image) {
        ids.append(scene.background().imageId);
    }

    QStringList pending;
    for (const QString& id : ids) {
        const State s = state(id);
        if (s == State::Pending || s == State::Missing) {
            pending.append(id);
        }
    }
    return pending;
}
