#include <gtest/gtest.h>
#include "../src/slideexporter.h"
#include "test_helpers.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

class SlideExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.isValid());
        wide = testimages::writeImage(temp_dir.path(), "wide.png", testimages::gradient(320, 180, true));
        tall = testimages::writeImage(temp_dir.path(), "tall.jpg", testimages::gradient(180, 320, false));
    }

    QTemporaryDir temp_dir;
    QString wide;
    QString tall;
};

TEST_F(SlideExporterTest, ExportNamesAreNumberedAndKeepExtension) {
    EXPECT_EQ(SlideExporter::exportFileName(1, "/frames/slide_000004.png"), "slide_001.png");
    EXPECT_EQ(SlideExporter::exportFileName(12, "shot.jpg"), "slide_012.jpg");
    EXPECT_EQ(SlideExporter::exportFileName(3, "noextension"), "slide_003.png");
}

TEST_F(SlideExporterTest, DefaultPathsSitNextToTheVideo) {
    EXPECT_EQ(SlideExporter::defaultPdfPath("/videos/week1.lecture.mp4"),
              "/videos/week1.lecture_extracted-slides.pdf");
    EXPECT_EQ(SlideExporter::defaultExportFolder("/videos/intro.mkv"),
              "/videos/intro_extracted-slides");
}

TEST_F(SlideExporterTest, ExportImagesCopiesInOrder) {
    QString dest = temp_dir.filePath("out/nested");
    QString error;

    int written = SlideExporter::exportImages(QStringList() << tall << wide, dest, &error);

    EXPECT_EQ(written, 2);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(QFileInfo(QDir(dest).filePath("slide_001.jpg")).size(), QFileInfo(tall).size());
    EXPECT_EQ(QFileInfo(QDir(dest).filePath("slide_002.png")).size(), QFileInfo(wide).size());
}

TEST_F(SlideExporterTest, ExportImagesReplacesExistingFiles) {
    QString dest = temp_dir.filePath("out");
    QDir().mkpath(dest);
    testimages::writeGarbage(dest, "slide_001.png");

    EXPECT_EQ(SlideExporter::exportImages(QStringList() << wide, dest), 1);
    EXPECT_EQ(QFileInfo(QDir(dest).filePath("slide_001.png")).size(), QFileInfo(wide).size());
}

TEST_F(SlideExporterTest, EmptySelectionIsRefused) {
    QString error;

    EXPECT_EQ(SlideExporter::exportImages(QStringList(), temp_dir.filePath("out"), &error), -1);
    EXPECT_EQ(error, "No images selected.");

    error.clear();
    EXPECT_FALSE(SlideExporter::buildPdf(QStringList(), temp_dir.filePath("x.pdf"), 20.0, &error));
    EXPECT_EQ(error, "No images selected.");
}

TEST_F(SlideExporterTest, ImageIsScaledToFitAndCentred) {
    QRectF rect = SlideExporter::fitImageRect(QSizeF(1920, 1080), QSizeF(800, 600), 20.0);

    EXPECT_NEAR(rect.width(), 760.0, 1e-6);
    EXPECT_NEAR(rect.height(), 427.5, 1e-6);
    EXPECT_NEAR(rect.left(), 20.0, 1e-6);
    EXPECT_NEAR(rect.top(), 86.25, 1e-6);

    QRectF upscaled = SlideExporter::fitImageRect(QSizeF(100, 200), QSizeF(800, 600), 0.0);
    EXPECT_NEAR(upscaled.height(), 600.0, 1e-6);
    EXPECT_NEAR(upscaled.left(), 250.0, 1e-6);

    EXPECT_TRUE(SlideExporter::fitImageRect(QSizeF(), QSizeF(800, 600), 20.0).isNull());
}

TEST_F(SlideExporterTest, BuildsPdfDocument) {
    QString pdfPath = temp_dir.filePath("slides.pdf");
    QString error;

    ASSERT_TRUE(SlideExporter::buildPdf(QStringList() << wide << tall, pdfPath, 20.0, &error))
        << error.toStdString();

    QFile pdf(pdfPath);
    ASSERT_TRUE(pdf.open(QIODevice::ReadOnly));
    EXPECT_TRUE(pdf.read(5).startsWith("%PDF"));
}

TEST_F(SlideExporterTest, UnreadableImageFailsPdf) {
    QString broken = testimages::writeGarbage(temp_dir.path(), "broken.png");
    QString error;

    EXPECT_FALSE(SlideExporter::buildPdf(QStringList() << wide << broken,
                                         temp_dir.filePath("slides.pdf"), 20.0, &error));
    EXPECT_TRUE(error.startsWith("Failed to load image"));
}
