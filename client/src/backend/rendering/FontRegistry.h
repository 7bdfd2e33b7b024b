#ifndef FONTREGISTRY_H
#define FONTREGISTRY_H

#include <QFont>
#include <QFontMetricsF>
#include <QHash>
#include <QPainterPath>
#include <QSet>
#include <QSharedPointer>
#include <QString>

/**
 * FontRegistry
 *
 * Resolves each font family once, at a fixed reference pixel size, and
 * derives every other size by exact scaling of its unhinted outlines and
 * advances. Fractional sizes (a 13px layer exported at 2.5x is 32.5px) keep
 * their exact proportion, so measuring and painting agree at any scale.
 * Not thread-safe: the interactive canvas and every export task own a
 * separate registry.
 */
class FontRegistry {
public:
    static constexpr qreal kReferencePixelSize = 100.0;

    // Resolves the pair ahead of the first paint. Returns false when the family
    // is unknown to the font database and a fallback will be used.
    bool prepare(const QString& family, qreal pixelSize);

    qreal textWidth(const QString& text, const QString& family, qreal pixelSize);
    qreal ascent(const QString& family, qreal pixelSize);
    qreal descent(const QString& family, qreal pixelSize);

    // Glyph outlines of `text` at `pixelSize`, left end of the baseline at (0, 0).
    QPainterPath textPath(const QString& text, const QString& family, qreal pixelSize);

    // Distinct (family, pixel size) pairs prepared so far.
    int preparedCount() const { return m_prepared.size(); }
    int resolvedFamilyCount() const { return m_entries.size(); }
    void clear();

private:
    struct Entry {
        explicit Entry(const QFont& f) : font(f), metrics(f) {}
        QFont font;               // at kReferencePixelSize
        QFontMetricsF metrics;
        bool exactMatch = true;
    };

    Entry& entry(const QString& family);
    static qreal factor(qreal pixelSize);

    QHash<QString, QSharedPointer<Entry>> m_entries; // lower-case family -> resolved font
    QSet<QString> m_prepared;                         // "family|px"
};

#endif // FONTREGISTRY_H
