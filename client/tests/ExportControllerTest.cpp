#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "backend/domain/scene/SceneStore.h"
#include "backend/export/ExportController.h"
#include "backend/export/ExportRenderer.h"
#include "backend/files/DecodedImageCache.h"
#include "managers/app/SettingsManager.h"

#include <QSettings>
#include <limits>

namespace {

struct Outcome {
    int started = 0;
    int succeeded = 0;
    int failed = 0;
    QByteArray bytes;
    QString fileName;
    QString reason;

    int terminal() const { return succeeded + failed; }
};

void observe(ExportController& controller, Outcome& outcome) {
    QObject::connect(&controller, &ExportController::exportStarted, [&outcome]() { ++outcome.started; });
    QObject::connect(&controller, &ExportController::exportSucceeded,
                     [&outcome](const QByteArray& bytes, const QString& fileName) {
                         ++outcome.succeeded;
                         outcome.bytes = bytes;
                         outcome.fileName = fileName;
                     });
    QObject::connect(&controller, &ExportController::exportFailed, [&outcome](const QString& reason) {
        ++outcome.failed;
        outcome.reason = reason;
    });
}

class ExportControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ids = store.addImages(2);
        cache.registerDecoded(ids[0], TestHelpers::solidImage(400, 300, Qt::red));
        cache.registerDecoded(ids[1], TestHelpers::solidImage(400, 300, Qt::blue));
        observe(controller, outcome);
    }

    SceneStore store;
    DecodedImageCache cache;
    ExportController controller{&store, &cache};
    Outcome outcome;
    QStringList ids;
};

} // namespace

TEST_F(ExportControllerTest, ProducesPngAtTargetResolution) {
    ASSERT_TRUE(controller.requestExport(QSize(800, 600)));
    EXPECT_TRUE(controller.isExporting());
    EXPECT_EQ(outcome.started, 1);

    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() > 0; }, 20000));
    EXPECT_EQ(outcome.succeeded, 1);
    EXPECT_EQ(outcome.failed, 0);
    EXPECT_EQ(outcome.fileName, "mockup.png");
    EXPECT_FALSE(controller.isExporting());

    const QImage exported = QImage::fromData(outcome.bytes, "PNG");
    ASSERT_FALSE(exported.isNull());
    EXPECT_EQ(exported.size(), QSize(2000, 1500));
    // Two-image grid: left cell red, right cell blue
    EXPECT_LE(TestHelpers::colorDistance(exported.pixelColor(500, 750), Qt::red), 2);
    EXPECT_LE(TestHelpers::colorDistance(exported.pixelColor(1500, 750), Qt::blue), 2);
}

TEST_F(ExportControllerTest, SecondRequestWhileBusyIsRejected) {
    ASSERT_TRUE(controller.requestExport(QSize(800, 600)));
    EXPECT_FALSE(controller.requestExport(QSize(800, 600)));
    EXPECT_EQ(outcome.started, 1);

    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() > 0; }, 20000));
    TestHelpers::waitUntil([]() { return false; }, 100);
    EXPECT_EQ(outcome.terminal(), 1);

    // Accepted again once the first one settled
    EXPECT_TRUE(controller.requestExport(QSize(800, 600)));
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() == 2; }, 20000));
}

TEST_F(ExportControllerTest, EmptyPreviewIsRejected) {
    EXPECT_FALSE(controller.requestExport(QSize()));
    EXPECT_FALSE(controller.requestExport(QSize(0, 600)));
    EXPECT_EQ(outcome.started, 0);
    EXPECT_FALSE(controller.isExporting());
}

TEST_F(ExportControllerTest, UnallocatableSurfaceFails) {
    controller.setTargetSize(QSize(std::numeric_limits<int>::max() / 2, 1));
    ASSERT_TRUE(controller.requestExport(QSize(800, 600)));

    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() > 0; }, 20000));
    EXPECT_EQ(outcome.failed, 1);
    EXPECT_EQ(outcome.reason, ExportErrors::SURFACE_UNAVAILABLE);
    EXPECT_FALSE(controller.isExporting());
}

TEST_F(ExportControllerTest, PendingPixelsAreSkippedNotAwaited) {
    const QStringList added = store.addImages(1);
    cache.registerBytes(added[0], QByteArray("still arriving"));

    ASSERT_TRUE(controller.requestExport(QSize(800, 600)));
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() > 0; }, 20000));
    EXPECT_EQ(outcome.succeeded, 1);
}

TEST_F(ExportControllerTest, FileNameAndSizeComeFromSettings) {
    const QString organization = QStringLiteral("MontageTests");
    const QString application = QStringLiteral("ExportControllerTest");
    QSettings(organization, application).clear();

    SettingsManager settings(organization, application);
    controller.bindSettings(&settings);
    EXPECT_EQ(controller.targetSize(), QSize(2000, 1500));

    settings.setExportSize(QSize(400, 300));
    settings.setExportFileName("poster.png");
    EXPECT_EQ(controller.targetSize(), QSize(400, 300));
    EXPECT_EQ(controller.fileName(), "poster.png");

    ASSERT_TRUE(controller.requestExport(QSize(800, 600)));
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return outcome.terminal() > 0; }, 20000));
    EXPECT_EQ(outcome.fileName, "poster.png");
    EXPECT_EQ(QImage::fromData(outcome.bytes, "PNG").size(), QSize(400, 300));

    QSettings(organization, application).clear();
}

TEST(ExportRendererTest, NullSurfaceIsReported) {
    ExportRequest request;
    request.previewSize = QSize(800, 600);
    const ExportResult result = ExportRenderer::renderExport(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, ExportErrors::SURFACE_UNAVAILABLE);
    EXPECT_TRUE(result.encodedImage.isEmpty());
}

TEST(ExportRendererTest, ReportsSkippedElements) {
    ExportRequest request;
    request.previewSize = QSize(400, 300);
    request.targetSurface = QImage(800, 600, QImage::Format_ARGB32_Premultiplied);
    request.targetSurface.fill(Qt::transparent);
    const QStringList ids = request.scene.addImages(1);
    request.scene.setBackgroundImage("missing-background");

    const ExportResult result = ExportRenderer::renderExport(request);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.skippedIds.contains("missing-background"));

    const QImage decoded = QImage::fromData(result.encodedImage, "PNG");
    ASSERT_EQ(decoded.size(), QSize(800, 600));
    // Fallback fill while the background image is missing
    EXPECT_LE(TestHelpers::colorDistance(decoded.pixelColor(400, 300), QColor("#F3F4F6")), 2);
}
