#include <gtest/gtest.h>

#include "backend/domain/scene/SceneModel.h"

#include <QSet>
#include <algorithm>

TEST(SceneModelTest, AddImagesAssignsDefaultsPerBatchIndex) {
    SceneModel scene;
    const QStringList ids = scene.addImages(3);
    ASSERT_EQ(ids.size(), 3);
    EXPECT_EQ(QSet<QString>(ids.begin(), ids.end()).size(), 3);

    for (int k = 0; k < 3; ++k) {
        const ImageItem* image = scene.findImage(ids[k]);
        ASSERT_NE(image, nullptr);
        ASSERT_TRUE(image->freeform.has_value());
        EXPECT_DOUBLE_EQ(image->freeform->x, 50 + 30 * k);
        EXPECT_DOUBLE_EQ(image->freeform->y, 50 + 30 * k);
        EXPECT_DOUBLE_EQ(image->freeform->width, 300);
        EXPECT_DOUBLE_EQ(image->freeform->height, 200);
        EXPECT_EQ(image->freeform->zIndex, k + 1);
        EXPECT_EQ(image->insertionOrder, k);
    }
}

TEST(SceneModelTest, SecondBatchStacksAboveFirst) {
    SceneModel scene;
    const QStringList first = scene.addImages(2);
    scene.bringToFront(first[0]); // z = 3
    const QStringList second = scene.addImages(2);
    EXPECT_EQ(scene.findImage(second[0])->freeform->zIndex, 4);
    EXPECT_EQ(scene.findImage(second[1])->freeform->zIndex, 5);
    // Batch index restarts per batch
    EXPECT_DOUBLE_EQ(scene.findImage(second[0])->freeform->x, 50);
}

TEST(SceneModelTest, BringToFrontExceedsEveryOtherZ) {
    SceneModel scene;
    const QStringList ids = scene.addImages(4);
    scene.sendToBack(ids[3]);
    for (const QString& id : ids) {
        ASSERT_TRUE(scene.bringToFront(id));
        const int z = scene.findImage(id)->freeform->zIndex;
        for (const ImageItem& other : scene.images()) {
            if (other.id != id) {
                EXPECT_GT(z, other.freeform->zIndex);
            }
        }
    }
}

TEST(SceneModelTest, SendToBackIsBelowEveryOtherZ) {
    SceneModel scene;
    const QStringList ids = scene.addImages(4);
    for (const QString& id : ids) {
        ASSERT_TRUE(scene.sendToBack(id));
        const int z = scene.findImage(id)->freeform->zIndex;
        for (const ImageItem& other : scene.images()) {
            if (other.id != id) {
                EXPECT_LT(z, other.freeform->zIndex);
            }
        }
    }
    // min(0, all) - 1 keeps going below zero
    EXPECT_LT(scene.findImage(ids.last())->freeform->zIndex, 0);
}

TEST(SceneModelTest, ZOrderOnUnknownIdFails) {
    SceneModel scene;
    scene.addImages(1);
    EXPECT_FALSE(scene.bringToFront("missing"));
    EXPECT_FALSE(scene.sendToBack("missing"));
}

TEST(SceneModelTest, ResizeNeverDropsBelowMinimum) {
    SceneModel scene;
    const QString id = scene.addImage();
    const qreal samples[] = {-1000.0, -1.0, 0.0, 5.0, 19.999, 20.0, 20.5, 640.0};
    for (qreal w : samples) {
        for (qreal h : samples) {
            ASSERT_TRUE(scene.resizeImage(id, w, h));
            const FreeformGeometry& g = *scene.findImage(id)->freeform;
            EXPECT_GE(g.width, kMinFreeformSize);
            EXPECT_GE(g.height, kMinFreeformSize);
            EXPECT_DOUBLE_EQ(g.width, std::max(20.0, w));
            EXPECT_DOUBLE_EQ(g.height, std::max(20.0, h));
        }
    }
}

TEST(SceneModelTest, SetImageGeometryClampsSize) {
    SceneModel scene;
    const QString id = scene.addImage();
    ASSERT_TRUE(scene.setImageGeometry(id, FreeformGeometry{1, 2, 3, 4, 9}));
    const FreeformGeometry& g = *scene.findImage(id)->freeform;
    EXPECT_DOUBLE_EQ(g.x, 1);
    EXPECT_DOUBLE_EQ(g.width, 20);
    EXPECT_DOUBLE_EQ(g.height, 20);
    EXPECT_EQ(g.zIndex, 9);
}

TEST(SceneModelTest, MoveImageReordersList) {
    SceneModel scene;
    const QStringList ids = scene.addImages(4);
    ASSERT_TRUE(scene.moveImage(ids[0], ids[2]));
    EXPECT_EQ(scene.indexOfImage(ids[0]), 2);
    EXPECT_EQ(scene.indexOfImage(ids[1]), 0);
    EXPECT_EQ(scene.indexOfImage(ids[2]), 1);
    EXPECT_FALSE(scene.moveImage(ids[0], "missing"));
}

TEST(SceneModelTest, RemovingBackgroundImageRestoresColor) {
    SceneModel scene;
    const QString id = scene.addImage();
    scene.setBackgroundImage(id);
    EXPECT_EQ(scene.background().kind, BackgroundSpec::Kind::Image);
    ASSERT_TRUE(scene.removeImage(id));
    EXPECT_EQ(scene.background().kind, BackgroundSpec::Kind::Color);
    EXPECT_FALSE(scene.removeImage(id));
}

TEST(SceneModelTest, TextLayerDefaults) {
    SceneModel scene;
    const QString id = scene.addTextLayer(QPointF(400, 300));
    const TextItem* text = scene.findText(id);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "New Text");
    EXPECT_DOUBLE_EQ(text->x, 400);
    EXPECT_DOUBLE_EQ(text->y, 300);
    EXPECT_DOUBLE_EQ(text->fontSize, 48);
    EXPECT_EQ(text->fontFamily, "Montserrat");
    EXPECT_EQ(text->color, "#FFFFFF");
    EXPECT_DOUBLE_EQ(text->rotation, 0);
    EXPECT_TRUE(text->shadow);
    EXPECT_EQ(text->backgroundColor, "#000000");
    EXPECT_DOUBLE_EQ(text->backgroundOpacity, 0.5);
    EXPECT_DOUBLE_EQ(text->padding, 10);
}

TEST(SceneModelTest, UpdateAndRemoveTextLayer) {
    SceneModel scene;
    const QString id = scene.addTextLayer(QPointF());
    TextItem edited = *scene.findText(id);
    edited.text = "Hello";
    edited.rotation = 45;
    ASSERT_TRUE(scene.updateTextLayer(edited));
    EXPECT_EQ(scene.findText(id)->text, "Hello");
    EXPECT_DOUBLE_EQ(scene.findText(id)->rotation, 45);

    TextItem unknown;
    unknown.id = "missing";
    EXPECT_FALSE(scene.updateTextLayer(unknown));

    ASSERT_TRUE(scene.removeTextLayer(id));
    EXPECT_EQ(scene.findText(id), nullptr);
    EXPECT_FALSE(scene.removeTextLayer(id));
}

TEST(SceneModelTest, WatermarkDefaultsAndClear) {
    SceneModel scene;
    EXPECT_TRUE(scene.isEmpty());
    scene.setWatermark("wm");
    ASSERT_TRUE(scene.watermark().has_value());
    EXPECT_DOUBLE_EQ(scene.watermark()->opacity, 0.5);
    EXPECT_DOUBLE_EQ(scene.watermark()->sizePercent, 20);
    EXPECT_EQ(scene.watermark()->anchor, WatermarkAnchor::BottomRight);
    EXPECT_FALSE(scene.isEmpty());

    WatermarkItem moved = *scene.watermark();
    moved.anchor = WatermarkAnchor::Center;
    EXPECT_TRUE(scene.updateWatermark(moved));
    EXPECT_EQ(scene.watermark()->anchor, WatermarkAnchor::Center);

    scene.clearWatermark();
    EXPECT_FALSE(scene.watermark().has_value());
    EXPECT_TRUE(scene.isEmpty());
}

TEST(SceneModelTest, ModeSwitchKeepsStoredGeometry) {
    SceneModel scene;
    const QStringList ids = scene.addImages(2);
    scene.setLayoutMode(LayoutMode::FreePlacement);
    ASSERT_TRUE(scene.moveImageTo(ids[1], QPointF(123, 45)));
    const FreeformGeometry moved = *scene.findImage(ids[1])->freeform;

    scene.setLayoutMode(LayoutMode::Grid);
    scene.setLayoutMode(LayoutMode::FreePlacement);
    EXPECT_EQ(*scene.findImage(ids[1])->freeform, moved);
    EXPECT_EQ(scene.parameters().mode, LayoutMode::FreePlacement);
}

TEST(SceneTypesTest, EnumStringsRoundTripAndAcceptLegacyNames) {
    EXPECT_EQ(layoutModeFromString("single-blur"), LayoutMode::SingleFocus);
    EXPECT_EQ(layoutModeFromString("freeform"), LayoutMode::FreePlacement);
    EXPECT_FALSE(layoutModeFromString("mosaic").has_value());
    EXPECT_EQ(fitPolicyFromString(fitPolicyToString(FitPolicy::Contain)), FitPolicy::Contain);
    EXPECT_EQ(watermarkAnchorFromString(watermarkAnchorToString(WatermarkAnchor::TopRight)),
              WatermarkAnchor::TopRight);
}

TEST(SceneTypesTest, CssColorsIncludingTrailingAlpha) {
    EXPECT_EQ(colorFromCss("#84CC16", Qt::black), QColor(0x84, 0xCC, 0x16));
    const QColor translucent = colorFromCss("#FF000080", Qt::black);
    EXPECT_EQ(translucent.red(), 255);
    EXPECT_EQ(translucent.alpha(), 0x80);
    EXPECT_EQ(colorFromCss("not-a-color", Qt::blue), QColor(Qt::blue));
    EXPECT_EQ(colorFromCss("", Qt::blue), QColor(Qt::blue));
}
