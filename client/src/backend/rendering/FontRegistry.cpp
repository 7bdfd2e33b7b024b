#include "backend/rendering/FontRegistry.h"

#include <QDebug>
#include <QFontInfo>
#include <QTransform>
#include <QtGlobal>

bool FontRegistry::prepare(const QString& family, qreal pixelSize) {
    m_prepared.insert(family.toLower() + QLatin1Char('|') + QString::number(pixelSize, 'g', 10));
    return entry(family).exactMatch;
}

qreal FontRegistry::factor(qreal pixelSize) {
    return qMax<qreal>(0.0, pixelSize) / kReferencePixelSize;
}

qreal FontRegistry::textWidth(const QString& text, const QString& family, qreal pixelSize) {
    return entry(family).metrics.horizontalAdvance(text) * factor(pixelSize);
}

qreal FontRegistry::ascent(const QString& family, qreal pixelSize) {
    return entry(family).metrics.ascent() * factor(pixelSize);
}

qreal FontRegistry::descent(const QString& family, qreal pixelSize) {
    return entry(family).metrics.descent() * factor(pixelSize);
}

QPainterPath FontRegistry::textPath(const QString& text, const QString& family, qreal pixelSize) {
    QPainterPath path;
    path.addText(QPointF(0.0, 0.0), entry(family).font, text);
    const qreal k = factor(pixelSize);
    return QTransform::fromScale(k, k).map(path);
}

void FontRegistry::clear() {
    m_entries.clear();
    m_prepared.clear();
}

FontRegistry::Entry& FontRegistry::entry(const QString& family) {
    const QString k = family.toLower();
    auto it = m_entries.find(k);
    if (it != m_entries.end()) {
        return *it.value();
    }

    QFont f(family);
    f.setPixelSize(static_cast<int>(kReferencePixelSize));
    // Unhinted outlines keep advances proportional to the pixel size
    f.setHintingPreference(QFont::PreferNoHinting);

    auto resolved = QSharedPointer<Entry>::create(f);
    resolved->exactMatch = QFontInfo(f).family().compare(family, Qt::CaseInsensitive) == 0;
    if (!resolved->exactMatch) {
        qWarning() << "FontRegistry: Font family" << family << "unavailable, using" << QFontInfo(f).family();
    }
    m_entries.insert(k, resolved);
    return *resolved;
}
