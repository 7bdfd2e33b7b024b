#ifndef DECODEDIMAGECACHE_H
#define DECODEDIMAGECACHE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QHash>
#include <QPointer>
#include <QSet>
#include <QSharedPointer>
#include <QByteArray>
#include <QImage>

#include "backend/domain/scene/SceneStore.h"
#include "backend/rendering/CompositionPainter.h"

/**
 * DecodedImageCache
 *
 * Upload boundary of the compositor. Holds, per scene identity, the raw
 * encoded bytes handed over by the shell and the decoded QImage the painter
 * reads.
 *
 * Responsibilities:
 * - Decode registered bytes on the global thread pool, off the GUI thread
 * - Report completion (imageDecoded) or failure (decodeFailed) per identity
 * - Hand the painters a PixelSourceSet for a scene
 * - Free bytes and pixels when an identity is released, or, once bound to a
 *   SceneStore, when the scene stops referencing it
 *
 * An identity that is pending or failed yields a null image, which the
 * draw pipeline skips.
 */
class DecodedImageCache : public QObject {
    Q_OBJECT
public:
    enum class State {
        Missing,
        Pending,
        Ready,
        Failed
    };

    explicit DecodedImageCache(QObject* parent = nullptr);
    ~DecodedImageCache() override = default;

    // Stores the bytes and starts decoding them. Re-registering an identity
    // supersedes any decode still in flight for it.
    void registerBytes(const QString& id, const QByteArray& bytes);

    // Stores pixels that were decoded elsewhere.
    void registerDecoded(const QString& id, const QImage& image);

    void release(const QString& id);
    void clear();

    // Releases identities the store's scene stops referencing: removed images,
    // replaced or cleared watermarks and backgrounds.
    void bindStore(SceneStore* store);

    QImage image(const QString& id) const;
    QSharedPointer<QByteArray> bytes(const QString& id) const;
    State state(const QString& id) const;
    bool isDecoded(const QString& id) const { return state(id) == State::Ready; }

    int count() const { return m_entries.size(); }
    int pendingCount() const;

    // Pixels for every image, the watermark and the background of `scene`.
    PixelSourceSet pixelSources(const SceneModel& scene) const;

    // Identities referenced by `scene` whose decode has not finished.
    QStringList pendingIds(const SceneModel& scene) const;

signals:
    void imageDecoded(const QString& id);
    void decodeFailed(const QString& id);

private:
    struct Entry {
        QSharedPointer<QByteArray> bytes;
        QImage image;
        State state = State::Missing;
        quint64 generation = 0;
    };

    void onDecodeFinished(const QString& id, quint64 generation, const QImage& image);
    void onSceneChanged();
    static QSet<QString> referencedIds(const SceneModel& scene);

    QHash<QString, Entry> m_entries;  // id -> bytes + pixels
    quint64 m_nextGeneration = 1;
    QPointer<SceneStore> m_store;
    QSet<QString> m_referencedIds;        // ids the bound scene referenced last time
};

#endif // DECODEDIMAGECACHE_H
