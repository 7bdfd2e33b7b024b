#include "frontend/rendering/canvas/PointerMoveThrottle.h"

#include <QTimer>

PointerMoveThrottle::PointerMoveThrottle(QObject* parent)
    : QObject(parent)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    m_timer->setInterval(kFrameIntervalMs);
    m_timer->setTimerType(Qt::PreciseTimer);
    connect(m_timer, &QTimer::timeout, this, &PointerMoveThrottle::flush);
}

void PointerMoveThrottle::schedule(const QPointF& position) {
    m_pending = position;
    m_hasPending = true;
    if (!m_timer->isActive()) {
        m_timer->start();
    }
}

void PointerMoveThrottle::flush() {
    m_timer->stop();
    if (!m_hasPending) {
        return;
    }
    m_hasPending = false;
    emit moveReady(m_pending);
}

void PointerMoveThrottle::discard() {
    m_timer->stop();
    m_hasPending = false;
}

void PointerMoveThrottle::setInterval(int ms) {
    m_timer->setInterval(qMax(0, ms));
}
