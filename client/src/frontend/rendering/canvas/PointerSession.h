#ifndef POINTERSESSION_H
#define POINTERSESSION_H

#include <QPointF>
#include <QString>

// What the current gesture acts on, and where it was grabbed.
class PointerSession {
public:
    enum class Target {
        None,
        Image,
        Text
    };

    Target target() const;
    QString targetId() const;

    // pointer - element origin, captured at gesture start
    QPointF grabOffset() const;

    // Where the element's origin goes for a pointer at `pointer`.
    QPointF originFor(const QPointF& pointer) const;

    void begin(Target target, const QString& targetId, const QPointF& pointer, const QPointF& origin);
    void clear();

    bool active() const;

private:
    Target m_target = Target::None;
    QString m_targetId;
    QPointF m_grabOffset;
};

#endif // POINTERSESSION_H
