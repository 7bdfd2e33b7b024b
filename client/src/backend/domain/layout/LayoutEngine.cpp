#include "backend/domain/layout/LayoutEngine.h"

#include <algorithm>
#include <cmath>

namespace {

Placement makePlacement(const ImageItem& image, const QRectF& rect, PlacementRole role, qreal extraZoom = 1.0) {
    Placement p;
    p.imageId = image.id;
    p.rect = rect;
    p.role = role;
    p.extraZoom = extraZoom;
    return p;
}

} // namespace

GridDimensions LayoutEngine::gridDimensions(int count) {
    GridDimensions dims;
    if (count <= 0) {
        return dims;
    }
    dims.cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(count))));
    // Guard against sqrt rounding just above an exact square
    while (dims.cols > 1 && (dims.cols - 1) * (dims.cols - 1) >= count) {
        --dims.cols;
    }
    dims.rows = (count + dims.cols - 1) / dims.cols;
    return dims;
}

QVector<QRectF> LayoutEngine::tileCells(const QRectF& area, int count, qreal gapX, qreal gapY) {
    QVector<QRectF> cells;
    const GridDimensions dims = gridDimensions(count);
    if (dims.cols == 0) {
        return cells;
    }
    cells.reserve(count);
    const qreal cellW = (area.width() - (dims.cols - 1) * gapX) / dims.cols;
    const qreal cellH = (area.height() - (dims.rows - 1) * gapY) / dims.rows;
    for (int i = 0; i < count; ++i) {
        const int col = i % dims.cols;
        const int row = i / dims.cols;
        cells.append(QRectF(area.x() + col * (cellW + gapX),
                            area.y() + row * (cellH + gapY),
                            cellW, cellH));
    }
    return cells;
}

QRectF LayoutEngine::focusBox(const QSizeF& canvasSize) {
    const qreal w = canvasSize.width() * kFocusWidthRatio;
    const qreal h = canvasSize.height() * kFocusHeightRatio;
    return QRectF((canvasSize.width() - w) / 2.0, (canvasSize.height() - h) / 2.0, w, h);
}

QVector<Placement> LayoutEngine::compute(const LayoutRequest& request) {
    if (request.images.isEmpty()) {
        return {};
    }
    switch (request.parameters.mode) {
        case LayoutMode::Grid:
            return computeGrid(request);
        case LayoutMode::LeftBig:
            return computeSideBig(request, true);
        case LayoutMode::RightBig:
            return computeSideBig(request, false);
        case LayoutMode::TopBig:
            return computeStackedBig(request, true);
        case LayoutMode::BottomBig:
            return computeStackedBig(request, false);
        case LayoutMode::SingleFocus:
            return computeSingleFocus(request);
        case LayoutMode::FreePlacement:
            return computeFreePlacement(request);
    }
    return {};
}

QVector<Placement> LayoutEngine::computeGrid(const LayoutRequest& request) {
    const qreal W = request.canvasSize.width();
    const qreal H = request.canvasSize.height();
    const qreal gx = request.gapX;
    const qreal gy = request.gapY;
    const QRectF area(gx, gy, W - 2.0 * gx, H - 2.0 * gy);
    const QVector<QRectF> cells = tileCells(area, request.images.size(), gx, gy);

    QVector<Placement> placements;
    placements.reserve(cells.size());
    for (int i = 0; i < cells.size(); ++i) {
        placements.append(makePlacement(request.images.at(i), cells.at(i), PlacementRole::Cell));
    }
    return placements;
}

QVector<Placement> LayoutEngine::computeSideBig(const LayoutRequest& request, bool bigOnLeft) {
    const qreal W = request.canvasSize.width();
    const qreal H = request.canvasSize.height();
    const qreal gx = request.gapX;
    const qreal gy = request.gapY;
    const qreal halfColumnW = W / 2.0 - gx * 1.5;
    const qreal leftX = gx;
    const qreal rightX = W / 2.0 + gx / 2.0;

    QVector<Placement> placements;
    placements.reserve(request.images.size());
    placements.append(makePlacement(request.images.first(),
                                    QRectF(bigOnLeft ? leftX : rightX, gy, halfColumnW, H - 2.0 * gy),
                                    PlacementRole::Cell));

    const int rest = request.images.size() - 1;
    if (rest <= 0) {
        return placements;
    }
    const QRectF area(bigOnLeft ? rightX : leftX, gy, halfColumnW, H - 2.0 * gy);
    const QVector<QRectF> cells = tileCells(area, rest, gx, gy);
    for (int i = 0; i < cells.size(); ++i) {
        placements.append(makePlacement(request.images.at(i + 1), cells.at(i), PlacementRole::Cell));
    }
    return placements;
}

QVector<Placement> LayoutEngine::computeStackedBig(const LayoutRequest& request, bool bigOnTop) {
    const qreal W = request.canvasSize.width();
    const qreal H = request.canvasSize.height();
    const qreal gx = request.gapX;
    const qreal gy = request.gapY;
    const qreal halfRowH = H / 2.0 - gy * 1.5;
    const qreal topY = gy;
    const qreal bottomY = H / 2.0 + gy / 2.0;

    QVector<Placement> placements;
    placements.reserve(request.images.size());
    placements.append(makePlacement(request.images.first(),
                                    QRectF(gx, bigOnTop ? topY : bottomY, W - 2.0 * gx, halfRowH),
                                    PlacementRole::Cell));

    const int rest = request.images.size() - 1;
    if (rest <= 0) {
        return placements;
    }
    const QRectF area(gx, bigOnTop ? bottomY : topY, W - 2.0 * gx, halfRowH);
    const QVector<QRectF> cells = tileCells(area, rest, gx, gy);
    for (int i = 0; i < cells.size(); ++i) {
        placements.append(makePlacement(request.images.at(i + 1), cells.at(i), PlacementRole::Cell));
    }
    return placements;
}

QVector<Placement> LayoutEngine::computeSingleFocus(const LayoutRequest& request) {
    QVector<Placement> placements;
    placements.reserve(request.images.size());

    // Backdrop: every image but the first, gap-free over the whole canvas
    const int rest = request.images.size() - 1;
    if (rest > 0) {
        const QRectF area(QPointF(0.0, 0.0), request.canvasSize);
        const QVector<QRectF> cells = tileCells(area, rest, 0.0, 0.0);
        for (int i = 0; i < cells.size(); ++i) {
            placements.append(makePlacement(request.images.at(i + 1), cells.at(i), PlacementRole::Backdrop));
        }
    }

    placements.append(makePlacement(request.images.first(), focusBox(request.canvasSize),
                                    PlacementRole::Focus, request.parameters.focalZoom));
    return placements;
}

QVector<Placement> LayoutEngine::computeFreePlacement(const LayoutRequest& request) {
    QVector<ImageItem> ordered;
    ordered.reserve(request.images.size());
    for (const ImageItem& image : request.images) {
        if (image.freeform) {
            ordered.append(image);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ImageItem& a, const ImageItem& b) {
        if (a.freeform->zIndex != b.freeform->zIndex) {
            return a.freeform->zIndex < b.freeform->zIndex;
        }
        return a.insertionOrder < b.insertionOrder;
    });

    const qreal sx = request.geometryScale.x();
    const qreal sy = request.geometryScale.y();
    QVector<Placement> placements;
    placements.reserve(ordered.size());
    for (const ImageItem& image : ordered) {
        const FreeformGeometry& g = *image.freeform;
        placements.append(makePlacement(image, QRectF(g.x * sx, g.y * sy, g.width * sx, g.height * sy),
                                        PlacementRole::Freeform));
    }
    return placements;
}

QRectF LayoutEngine::fitRect(const QSizeF& sourceSize, const QRectF& cell, FitPolicy fit, qreal zoom) {
    if (sourceSize.width() <= 0.0 || sourceSize.height() <= 0.0
        || cell.width() <= 0.0 || cell.height() <= 0.0) {
        return QRectF();
    }
    const qreal imgRatio = sourceSize.width() / sourceSize.height();
    const qreal cellRatio = cell.width() / cell.height();
    const bool fitByHeight = (fit == FitPolicy::Cover) ? (imgRatio > cellRatio) : (imgRatio < cellRatio);

    qreal renderW = 0.0;
    qreal renderH = 0.0;
    if (fitByHeight) {
        renderH = cell.height() * zoom;
        renderW = renderH * imgRatio;
    } else {
        renderW = cell.width() * zoom;
        renderH = renderW / imgRatio;
    }
    return QRectF(cell.x() + (cell.width() - renderW) / 2.0,
                  cell.y() + (cell.height() - renderH) / 2.0,
                  renderW, renderH);
}
