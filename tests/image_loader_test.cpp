#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include <opencv2/imgcodecs.hpp>

#include "Errors.h"
#include "ImageLoader.h"
#include "SyntheticDiagrams.h"

using namespace graphscan;

class ImageLoaderTest : public ::testing::Test {
protected:
    std::string pathOf(const char *name) const { return tmp.filePath(QString::fromUtf8(name)).toStdString(); }

    QTemporaryDir tmp;
    ImageLoader loader;
};

TEST_F(ImageLoaderTest, LoadsColorPng)
{
    const cv::Mat image = fixtures::twoCirclesJoined();
    ASSERT_TRUE(cv::imwrite(pathOf("diagram.png"), image));

    const cv::Mat loaded = loader.loadImage(pathOf("diagram.png"));
    EXPECT_EQ(loaded.type(), CV_8UC3);
    EXPECT_EQ(cv::norm(loaded, image, cv::NORM_INF), 0.0);
}

TEST_F(ImageLoaderTest, GrayscaleFilesComeBackAsBgr)
{
    cv::Mat gray;
    cv::cvtColor(fixtures::twoCirclesJoined(), gray, cv::COLOR_BGR2GRAY);
    ASSERT_TRUE(cv::imwrite(pathOf("gray.png"), gray));
    EXPECT_EQ(loader.loadImage(pathOf("gray.png")).type(), CV_8UC3);
}

TEST_F(ImageLoaderTest, SixteenBitIsScaledToEightBit)
{
    cv::Mat deep(50, 50, CV_16UC1, cv::Scalar(1000));
    deep(cv::Rect(10, 10, 20, 20)).setTo(cv::Scalar(60000));
    ASSERT_TRUE(cv::imwrite(pathOf("deep.png"), deep));

    const cv::Mat loaded = loader.loadImage(pathOf("deep.png"));
    EXPECT_EQ(loaded.depth(), CV_8U);
    EXPECT_EQ(loaded.at<cv::Vec3b>(20, 20), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(loaded.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
}

TEST_F(ImageLoaderTest, DecodesInMemoryBuffers)
{
    std::vector<uchar> encoded;
    ASSERT_TRUE(cv::imencode(".png", fixtures::twoCirclesArrow(), encoded));
    const QByteArray bytes(reinterpret_cast<const char *>(encoded.data()), static_cast<int>(encoded.size()));

    const cv::Mat decoded = loader.decodeImage(bytes);
    EXPECT_EQ(decoded.size(), cv::Size(fixtures::kWidth, fixtures::kHeight));
    EXPECT_THROW(loader.decodeImage(QByteArray()), InvalidImage);
    EXPECT_THROW(loader.decodeImage(QByteArrayLiteral("definitely not an image")), InvalidImage);
}

TEST_F(ImageLoaderTest, GathersSupportedFilesSorted)
{
    ASSERT_TRUE(cv::imwrite(pathOf("b.png"), fixtures::blank(20, 20)));
    ASSERT_TRUE(cv::imwrite(pathOf("a.JPG"), fixtures::blank(20, 20)));
    QFile notes(tmp.filePath(QStringLiteral("notes.txt")));
    ASSERT_TRUE(notes.open(QIODevice::WriteOnly));
    notes.close();

    const auto files = loader.gatherImageFiles(tmp.path().toStdString());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], pathOf("a.JPG"));
    EXPECT_EQ(files[1], pathOf("b.png"));
}

TEST_F(ImageLoaderTest, MissingInputsThrow)
{
    EXPECT_THROW(loader.loadImage(pathOf("absent.png")), InvalidImage);
    EXPECT_THROW(loader.gatherImageFiles(pathOf("no-such-dir")), InvalidImage);
}
