#include <gtest/gtest.h>

#include "backend/rendering/CompositionPainter.h"
#include "backend/rendering/FontRegistry.h"
#include "backend/rendering/TextLayerGeometry.h"
#include "frontend/ui/theme/AppColors.h"
#include "TestHelpers.h"

using TestHelpers::colorDistance;

namespace {

const QColor kBackground(0xF3, 0xF4, 0xF6);

QColor blend(const QColor& top, qreal alpha, const QColor& bottom) {
    return QColor::fromRgbF(top.redF() * alpha + bottom.redF() * (1 - alpha),
                            top.greenF() * alpha + bottom.greenF() * (1 - alpha),
                            top.blueF() * alpha + bottom.blueF() * (1 - alpha));
}

QImage renderScene(const SceneModel& scene, const PixelSourceSet& pixels, const QSize& size,
                   const PaintOptions& options = PaintOptions(), CompositionPainter** out = nullptr) {
    static FontRegistry fonts;
    static CompositionPainter painter(fonts);
    QImage target(size, QImage::Format_ARGB32_Premultiplied);
    target.fill(Qt::transparent);
    EXPECT_TRUE(painter.render(target, scene, pixels, options));
    if (out) {
        *out = &painter;
    }
    return target;
}

} // namespace

TEST(CompositionPainterTest, RenderFailsOnNullSurface) {
    FontRegistry fonts;
    CompositionPainter painter(fonts);
    QImage nothing;
    EXPECT_FALSE(painter.render(nothing, SceneModel(), PixelSourceSet(), PaintOptions()));
}

TEST(CompositionPainterTest, BackgroundColorAndFallback) {
    SceneModel scene;
    scene.setBackgroundColor("#336699");
    QImage image = renderScene(scene, PixelSourceSet(), QSize(100, 80));
    EXPECT_EQ(image.pixelColor(50, 40), QColor(0x33, 0x66, 0x99));

    scene.setBackgroundColor("bogus");
    image = renderScene(scene, PixelSourceSet(), QSize(100, 80));
    EXPECT_EQ(image.pixelColor(50, 40), kBackground);
}

TEST(CompositionPainterTest, BackgroundImageStretchesOrFallsBackWhilePending) {
    SceneModel scene;
    scene.setBackgroundImage("bg");
    PixelSourceSet pixels;

    CompositionPainter* painter = nullptr;
    QImage image = renderScene(scene, pixels, QSize(100, 80), PaintOptions(), &painter);
    EXPECT_EQ(image.pixelColor(10, 10), kBackground);
    EXPECT_TRUE(painter->skippedIds().contains("bg"));

    pixels.background = TestHelpers::solidImage(10, 10, Qt::magenta);
    image = renderScene(scene, pixels, QSize(100, 80), PaintOptions(), &painter);
    EXPECT_EQ(image.pixelColor(0, 0), QColor(Qt::magenta));
    EXPECT_EQ(image.pixelColor(99, 79), QColor(Qt::magenta));
    EXPECT_EQ(painter->skippedCount(), 0);
}

TEST(CompositionPainterTest, GridCellsAreFilledAndClipped) {
    PixelSourceSet pixels;
    const SceneModel scene = TestHelpers::sceneWithImages(4, LayoutMode::Grid, pixels);
    const QImage image = renderScene(scene, pixels, QSize(800, 600));

    EXPECT_EQ(image.pixelColor(204, 154), QColor(Qt::red));
    EXPECT_EQ(image.pixelColor(596, 154), QColor(Qt::green));
    EXPECT_EQ(image.pixelColor(204, 446), QColor(Qt::blue));
    EXPECT_EQ(image.pixelColor(596, 446), QColor(Qt::yellow));
    // Gaps keep the background; cover overflow does not bleed out of the cell
    EXPECT_EQ(image.pixelColor(400, 300), kBackground);
    EXPECT_EQ(image.pixelColor(204, 14), kBackground);
    EXPECT_EQ(image.pixelColor(204, 294), kBackground);
}

TEST(CompositionPainterTest, ContainLetterboxesInsideCell) {
    PixelSourceSet pixels;
    SceneModel scene = TestHelpers::sceneWithImages(1, LayoutMode::Grid, pixels, {Qt::red}, QSize(100, 100));
    LayoutParameters params = scene.parameters();
    params.fit = FitPolicy::Contain;
    scene.setParameters(params);

    // Cell is (16, 16, 768, 568); square image is 568 x 568 centered
    const QImage image = renderScene(scene, pixels, QSize(800, 600));
    EXPECT_EQ(image.pixelColor(400, 300), QColor(Qt::red));
    EXPECT_EQ(image.pixelColor(50, 300), kBackground);
    EXPECT_EQ(image.pixelColor(750, 300), kBackground);
}

TEST(CompositionPainterTest, SingleFocusPaintsBlurredBackdropBehindFocus) {
    PixelSourceSet pixels;
    const SceneModel scene = TestHelpers::sceneWithImages(3, LayoutMode::SingleFocus, pixels);
    const QImage image = renderScene(scene, pixels, QSize(1000, 800));

    EXPECT_EQ(image.pixelColor(500, 400), QColor(Qt::red));
    // Left backdrop cell is green at 30% over the background
    EXPECT_LE(colorDistance(image.pixelColor(50, 400), blend(Qt::green, 0.3, kBackground)), 3);
    EXPECT_LE(colorDistance(image.pixelColor(950, 400), blend(Qt::blue, 0.3, kBackground)), 3);
}

TEST(CompositionPainterTest, FreePlacementHonorsZOrder) {
    PixelSourceSet pixels;
    SceneModel scene = TestHelpers::sceneWithImages(2, LayoutMode::FreePlacement, pixels);
    const QString first = scene.images()[0].id;
    const QString second = scene.images()[1].id;
    scene.setImageGeometry(first, FreeformGeometry{100, 100, 200, 200, 1});
    scene.setImageGeometry(second, FreeformGeometry{200, 200, 200, 200, 2});

    QImage image = renderScene(scene, pixels, QSize(800, 600));
    EXPECT_EQ(image.pixelColor(250, 250), QColor(Qt::green));
    // Exact rectangle, stretched without fit
    EXPECT_EQ(image.pixelColor(101, 101), QColor(Qt::red));
    EXPECT_EQ(image.pixelColor(399, 399), QColor(Qt::green));

    scene.bringToFront(first);
    image = renderScene(scene, pixels, QSize(800, 600));
    EXPECT_EQ(image.pixelColor(250, 250), QColor(Qt::red));
}

TEST(CompositionPainterTest, SelectionOutlineAndResizeGlyph) {
    PixelSourceSet pixels;
    SceneModel scene = TestHelpers::sceneWithImages(1, LayoutMode::FreePlacement, pixels, {Qt::blue});
    const QString id = scene.images()[0].id;
    scene.setImageGeometry(id, FreeformGeometry{100, 100, 200, 150, 1});

    PaintOptions options;
    options.selection.selectedImageId = id;
    const QImage image = renderScene(scene, pixels, QSize(800, 600), options);

    EXPECT_EQ(image.pixelColor(100, 170), AppColors::gSelectionOutline);
    EXPECT_EQ(image.pixelColor(300, 250), AppColors::gSelectionOutline);
    EXPECT_EQ(image.pixelColor(303, 253), AppColors::gSelectionOutline);
    EXPECT_EQ(image.pixelColor(200, 170), QColor(Qt::blue));

    const QImage plain = renderScene(scene, pixels, QSize(800, 600));
    EXPECT_EQ(plain.pixelColor(303, 253), kBackground);
}

TEST(CompositionPainterTest, SelectionIsOnlyDrawnInFreePlacement) {
    PixelSourceSet pixels;
    const SceneModel scene = TestHelpers::sceneWithImages(1, LayoutMode::Grid, pixels, {Qt::blue});
    PaintOptions options;
    options.selection.selectedImageId = scene.images()[0].id;
    const QImage image = renderScene(scene, pixels, QSize(800, 600), options);
    // The cell edge would carry the outline if it were drawn
    EXPECT_EQ(image.pixelColor(16, 300), QColor(Qt::blue));
}

TEST(CompositionPainterTest, PendingImagesAreSkippedNotFatal) {
    PixelSourceSet pixels;
    SceneModel scene = TestHelpers::sceneWithImages(2, LayoutMode::Grid, pixels);
    const QString pending = scene.images()[1].id;
    pixels.images.remove(pending);

    CompositionPainter* painter = nullptr;
    const QImage image = renderScene(scene, pixels, QSize(800, 600), PaintOptions(), &painter);
    ASSERT_EQ(painter->skippedCount(), 1);
    EXPECT_EQ(painter->skippedIds().first(), pending);
    // The remaining image lays out alone
    EXPECT_EQ(image.pixelColor(400, 300), QColor(Qt::red));
}

TEST(CompositionPainterTest, WatermarkRectPerAnchor) {
    WatermarkItem watermark;
    watermark.sizePercent = 20;
    const QSizeF source(100, 50);
    const QSizeF target(800, 600);

    watermark.anchor = WatermarkAnchor::TopLeft;
    EXPECT_EQ(CompositionPainter::watermarkRect(watermark, source, target, 16, 12), QRectF(16, 12, 160, 80));
    watermark.anchor = WatermarkAnchor::TopRight;
    EXPECT_EQ(CompositionPainter::watermarkRect(watermark, source, target, 16, 12), QRectF(624, 12, 160, 80));
    watermark.anchor = WatermarkAnchor::BottomLeft;
    EXPECT_EQ(CompositionPainter::watermarkRect(watermark, source, target, 16, 12), QRectF(16, 508, 160, 80));
    watermark.anchor = WatermarkAnchor::BottomRight;
    EXPECT_EQ(CompositionPainter::watermarkRect(watermark, source, target, 16, 12), QRectF(624, 508, 160, 80));
    watermark.anchor = WatermarkAnchor::Center;
    EXPECT_EQ(CompositionPainter::watermarkRect(watermark, source, target, 16, 12), QRectF(320, 260, 160, 80));
}

TEST(CompositionPainterTest, WatermarkPaintedAtItsOpacity) {
    SceneModel scene;
    scene.setWatermark("wm");
    PixelSourceSet pixels;
    pixels.watermark = TestHelpers::solidImage(100, 50, Qt::blue);

    const QImage image = renderScene(scene, pixels, QSize(800, 600));
    // Bottom-right, inset by the 16 px gap: (624, 504, 160, 80)
    EXPECT_LE(colorDistance(image.pixelColor(704, 544), blend(Qt::blue, 0.5, kBackground)), 2);
    EXPECT_EQ(image.pixelColor(610, 544), kBackground);
}

TEST(CompositionPainterTest, TextBackgroundBoxUsesLayerOpacity) {
    SceneModel scene;
    const QString id = scene.addTextLayer(QPointF(400, 300));
    TextItem layer = *scene.findText(id);
    layer.text = "Hello";
    layer.shadow = false;
    scene.updateTextLayer(layer);

    FontRegistry fonts;
    const QSizeF box = TextLayerGeometry::boxSize(fonts, layer);
    const QImage image = renderScene(scene, PixelSourceSet(), QSize(800, 600));

    // Inside the padding, left of the glyphs
    const QPoint padding(qRound(400 - box.width() / 2.0 + 4), 300);
    EXPECT_LE(colorDistance(image.pixelColor(padding), blend(Qt::black, 0.5, kBackground)), 2);
    // Outside the box
    EXPECT_EQ(image.pixelColor(qRound(400 - box.width() / 2.0 - 6), 300), kBackground);
}

TEST(CompositionPainterTest, TextShadowChangesOutput) {
    SceneModel scene;
    const QString id = scene.addTextLayer(QPointF(400, 300));
    TextItem layer = *scene.findText(id);
    layer.backgroundOpacity = 0;
    layer.shadow = false;
    scene.updateTextLayer(layer);
    const QImage plain = renderScene(scene, PixelSourceSet(), QSize(800, 600));

    layer.shadow = true;
    scene.updateTextLayer(layer);
    const QImage shadowed = renderScene(scene, PixelSourceSet(), QSize(800, 600));
    EXPECT_NE(plain, shadowed);
}

TEST(CompositionPainterTest, EmptyPromptOnlyWhenRequested) {
    PaintOptions preview;
    preview.showEmptyPrompt = true;
    const QImage withPrompt = renderScene(SceneModel(), PixelSourceSet(), QSize(800, 600), preview);
    const QImage withoutPrompt = renderScene(SceneModel(), PixelSourceSet(), QSize(800, 600));

    EXPECT_NE(withPrompt, withoutPrompt);
    for (int x = 0; x < 800; x += 7) {
        EXPECT_EQ(withoutPrompt.pixelColor(x, 300), kBackground);
    }
}
