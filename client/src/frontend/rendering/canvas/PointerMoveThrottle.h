#ifndef POINTERMOVETHROTTLE_H
#define POINTERMOVETHROTTLE_H

#include <QObject>
#include <QPointF>

class QTimer;

/**
 * PointerMoveThrottle
 *
 * Coalesces pointer moves to one per display frame. Every move overwrites
 * the pending position; when the frame timer fires, only the latest
 * position is delivered through moveReady(). Ending a gesture discards
 * whatever is still pending.
 */
class PointerMoveThrottle : public QObject {
    Q_OBJECT
public:
    static constexpr int kFrameIntervalMs = 16;

    explicit PointerMoveThrottle(QObject* parent = nullptr);
    ~PointerMoveThrottle() override = default;

    void schedule(const QPointF& position);
    // Delivers the pending position now, if any.
    void flush();
    void discard();

    bool hasPending() const { return m_hasPending; }
    QPointF pendingPosition() const { return m_pending; }

    void setInterval(int ms);

signals:
    void moveReady(const QPointF& position);

private:
    QTimer* m_timer = nullptr;
    QPointF m_pending;
    bool m_hasPending = false;
};

#endif // POINTERMOVETHROTTLE_H
