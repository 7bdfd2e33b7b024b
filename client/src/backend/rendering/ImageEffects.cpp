#include "backend/rendering/ImageEffects.h"

#include <QPainter>
#include <QVector>
#include <algorithm>
#include <array>
#include <cmath>

namespace {

// Box widths whose successive application approximates a Gaussian of `sigma`
// (three passes, see W. Jarosz, "Fast Image Convolutions").
std::array<int, 3> boxRadiiForGaussian(qreal sigma) {
    constexpr int passes = 3;
    const qreal idealWidth = std::sqrt((12.0 * sigma * sigma / passes) + 1.0);
    int lower = static_cast<int>(std::floor(idealWidth));
    if (lower % 2 == 0) {
        --lower;
    }
    const int upper = lower + 2;
    const qreal idealCount = (12.0 * sigma * sigma - passes * lower * lower - 4.0 * passes * lower - 3.0 * passes)
                             / (-4.0 * lower - 4.0);
    const int lowerCount = static_cast<int>(std::round(idealCount));

    std::array<int, 3> radii{};
    for (int i = 0; i < passes; ++i) {
        const int width = (i < lowerCount) ? lower : upper;
        radii[i] = std::max(0, (width - 1) / 2);
    }
    return radii;
}

} // namespace

QImage ImageEffects::gaussianBlur(const QImage& source, qreal sigma) {
    QImage result = source.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    if (result.isNull() || sigma <= 0.0) {
        return result;
    }
    for (int radius : boxRadiiForGaussian(sigma)) {
        if (radius <= 0) {
            continue;
        }
        boxBlurHorizontal(result, radius);
        boxBlurVertical(result, radius);
    }
    return result;
}

QImage ImageEffects::tintedShadow(const QImage& source, const QColor& color, qreal sigma) {
    QImage shadow = gaussianBlur(source, sigma);
    if (shadow.isNull()) {
        return shadow;
    }
    QPainter painter(&shadow);
    painter.setCompositionMode(QPainter::CompositionMode_SourceIn);
    painter.fillRect(shadow.rect(), color);
    painter.end();
    return shadow;
}

void ImageEffects::boxBlurHorizontal(QImage& image, int radius) {
    const int width = image.width();
    const int height = image.height();
    const int window = 2 * radius + 1;
    QVector<QRgb> line(width);

    for (int y = 0; y < height; ++y) {
        QRgb* row = reinterpret_cast<QRgb*>(image.scanLine(y));
        std::copy(row, row + width, line.begin());

        int sumA = 0, sumR = 0, sumG = 0, sumB = 0;
        // Prime the window for x = 0: samples [-radius, radius]
        for (int i = 0; i <= radius && i < width; ++i) {
            const QRgb px = line[i];
            sumA += qAlpha(px); sumR += qRed(px); sumG += qGreen(px); sumB += qBlue(px);
        }
        for (int x = 0; x < width; ++x) {
            row[x] = qRgba((sumR + radius) / window, (sumG + radius) / window, (sumB + radius) / window,
                           (sumA + radius) / window);

            const int incoming = x + radius + 1;
            if (incoming < width) {
                const QRgb px = line[incoming];
                sumA += qAlpha(px); sumR += qRed(px); sumG += qGreen(px); sumB += qBlue(px);
            }
            const int outgoing = x - radius;
            if (outgoing >= 0) {
                const QRgb px = line[outgoing];
                sumA -= qAlpha(px); sumR -= qRed(px); sumG -= qGreen(px); sumB -= qBlue(px);
            }
        }
    }
}

void ImageEffects::boxBlurVertical(QImage& image, int radius) {
    const int width = image.width();
    const int height = image.height();
    const int window = 2 * radius + 1;
    QVector<QRgb> column(height);

    for (int x = 0; x < width; ++x) {
        for (int y = 0; y < height; ++y) {
            column[y] = reinterpret_cast<const QRgb*>(image.constScanLine(y))[x];
        }

        int sumA = 0, sumR = 0, sumG = 0, sumB = 0;
        for (int i = 0; i <= radius && i < height; ++i) {
            const QRgb px = column[i];
            sumA += qAlpha(px); sumR += qRed(px); sumG += qGreen(px); sumB += qBlue(px);
        }
        for (int y = 0; y < height; ++y) {
            reinterpret_cast<QRgb*>(image.scanLine(y))[x] =
                qRgba((sumR + radius) / window, (sumG + radius) / window, (sumB + radius) / window,
                      (sumA + radius) / window);

            const int incoming = y + radius + 1;
            if (incoming < height) {
                const QRgb px = column[incoming];
                sumA += qAlpha(px); sumR += qRed(px); sumG += qGreen(px); sumB += qBlue(px);
            }
            const int outgoing = y - radius;
            if (outgoing >= 0) {
                const QRgb px = column[outgoing];
                sumA -= qAlpha(px); sumR -= qRed(px); sumG -= qGreen(px); sumB -= qBlue(px);
            }
        }
    }
}
