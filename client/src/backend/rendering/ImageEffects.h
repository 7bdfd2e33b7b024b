#ifndef IMAGEEFFECTS_H
#define IMAGEEFFECTS_H

#include <QImage>
#include <QColor>

// Raster effects the QPainter API does not provide on its own.
class ImageEffects {
public:
    // Approximates a Gaussian blur of standard deviation `sigma` with three
    // successive box blurs. Pixels outside the image count as transparent, so
    // edges fade out. Returns a Format_ARGB32_Premultiplied image of the same size.
    static QImage gaussianBlur(const QImage& source, qreal sigma);

    // Blurs the alpha coverage of `source` and fills it with `color`
    // (color alpha multiplies the coverage). Used for text drop shadows.
    static QImage tintedShadow(const QImage& source, const QColor& color, qreal sigma);

private:
    static void boxBlurHorizontal(QImage& image, int radius);
    static void boxBlurVertical(QImage& image, int radius);
};

#endif // IMAGEEFFECTS_H
