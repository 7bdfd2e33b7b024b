#ifndef RENDERSCALE_H
#define RENDERSCALE_H

#include <QPointF>
#include <QSizeF>

// Per-axis factor between the preview canvas (where every scene quantity is
// expressed) and the surface being painted. Identity for the interactive canvas.
struct RenderScale {
    qreal x = 1.0;
    qreal y = 1.0;

    static RenderScale between(const QSizeF& previewSize, const QSizeF& targetSize) {
        RenderScale s;
        if (previewSize.width() > 0.0) s.x = targetSize.width() / previewSize.width();
        if (previewSize.height() > 0.0) s.y = targetSize.height() / previewSize.height();
        return s;
    }

    qreal horizontal(qreal value) const { return value * x; }
    qreal vertical(qreal value) const { return value * y; }
    QPointF point(const QPointF& p) const { return QPointF(p.x() * x, p.y() * y); }
    bool isIdentity() const { return x == 1.0 && y == 1.0; }
};

#endif // RENDERSCALE_H
