#include "visnir/errors.hpp"
#include "visnir/mask_ops.hpp"
#include "visnir/nir_mapper.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <cmath>

using namespace VisNir;

namespace {

cv::Mat visPlantMask() {
    cv::Mat mask = cv::Mat::zeros(2056, 2454, CV_8UC1);
    cv::rectangle(mask, cv::Rect(900, 900, 200, 200), cv::Scalar(255), cv::FILLED);
    return mask;
}

cv::Point onlyPixel(const cv::Mat& mask) {
    std::vector<cv::Point> points;
    cv::findNonZero(mask, points);
    return points.size() == 1 ? points[0] : cv::Point(-1, -1);
}

} // namespace

TEST(CropMarginsTest, OddDifferenceGoesToTrailingSide) {
    CropMargins m = NirMaskMapper::cropMargins(101, 100, "width");
    EXPECT_EQ(m.leading, 0);
    EXPECT_EQ(m.trailing, 1);
}

TEST(CropMarginsTest, EvenDifferenceSplitsEqually) {
    CropMargins m = NirMaskMapper::cropMargins(100, 96, "height");
    EXPECT_EQ(m.leading, 2);
    EXPECT_EQ(m.trailing, 2);

    CropMargins same = NirMaskMapper::cropMargins(100, 100, "height");
    EXPECT_EQ(same.leading, 0);
    EXPECT_EQ(same.trailing, 0);
}

TEST(CropMarginsTest, SmallerSourceIsAnAlignmentError) {
    EXPECT_THROW(NirMaskMapper::cropMargins(99, 100, "width"), AlignmentError);
}

TEST(CropSidesEquallyTest, DropsTrailingColumnOnOddDifference) {
    cv::Mat mask = cv::Mat::zeros(100, 101, CV_8UC1);
    mask.col(0).setTo(255);
    mask.col(100).setTo(255);

    cv::Mat cropped = NirMaskMapper::cropSidesEqually(mask, cv::Size(100, 100));

    ASSERT_EQ(cropped.size(), cv::Size(100, 100));
    EXPECT_EQ(cv::countNonZero(cropped.col(0)), 100);
    EXPECT_EQ(cv::countNonZero(cropped), 100);
}

TEST(CropSidesEquallyTest, EvenDifferenceShiftsContent) {
    cv::Mat mask = cv::Mat::zeros(100, 100, CV_8UC1);
    mask.at<uchar>(2, 2) = 255;

    cv::Mat cropped = NirMaskMapper::cropSidesEqually(mask, cv::Size(96, 96));

    EXPECT_EQ(cropped.size(), cv::Size(96, 96));
    EXPECT_EQ(onlyPixel(cropped), cv::Point(0, 0));
}

TEST(ConversionRatioTest, DefaultSensorsGiveReferenceRatio) {
    ConversionRatio ratio = conversionRatio(SensorGeometry());
    EXPECT_NEAR(ratio.x, 606.0 / 2454.0 * 1.125, 1e-12);
    EXPECT_NEAR(ratio.y, 508.0 / 2056.0 * 1.125, 1e-12);
}

TEST(ConversionRatioTest, RatScalesBothAxes) {
    SensorGeometry sensors;
    sensors.rat = 2.0;
    ConversionRatio ratio = conversionRatio(sensors);
    EXPECT_NEAR(ratio.x, 2.0 * conversionRatio(SensorGeometry()).x, 1e-12);
    EXPECT_NEAR(ratio.y, 2.0 * conversionRatio(SensorGeometry()).y, 1e-12);
}

TEST(NirMaskMapperTest, ScaleProducesRatioSizedBinaryMask) {
    NirMaskMapper mapper;
    cv::Mat scaled = mapper.scaleToNir(visPlantMask());

    EXPECT_NEAR(scaled.cols, 2454 * mapper.ratio().x, 1.0);
    EXPECT_NEAR(scaled.rows, 2056 * mapper.ratio().y, 1.0);
    EXPECT_TRUE(MaskOps::isBinary(scaled));
}

TEST(PositionMaskTest, DefaultOffsetMovesContentUpOneRow) {
    cv::Mat mask = cv::Mat::zeros(20, 20, CV_8UC1);
    mask.at<uchar>(10, 10) = 255;

    cv::Mat positioned = NirMaskMapper::positionMask(mask, cv::Size(20, 20), PositionOffset());

    EXPECT_EQ(onlyPixel(positioned), cv::Point(10, 9));
}

TEST(PositionMaskTest, AnchorsPadTheirOwnSide) {
    cv::Mat mask = cv::Mat::zeros(20, 20, CV_8UC1);
    mask.at<uchar>(10, 10) = 255;
    cv::Size target(20, 20);

    // x = 3 rows: two-row shift along the vertical anchor
    PositionOffset bottom{3, 0, VerticalAnchor::BOTTOM, HorizontalAnchor::RIGHT};
    EXPECT_EQ(onlyPixel(NirMaskMapper::positionMask(mask, target, bottom)), cv::Point(10, 8));

    PositionOffset top{3, 0, VerticalAnchor::TOP, HorizontalAnchor::RIGHT};
    EXPECT_EQ(onlyPixel(NirMaskMapper::positionMask(mask, target, top)), cv::Point(10, 12));

    // y = 3 columns: two-column shift along the horizontal anchor
    PositionOffset right{0, 3, VerticalAnchor::BOTTOM, HorizontalAnchor::RIGHT};
    EXPECT_EQ(onlyPixel(NirMaskMapper::positionMask(mask, target, right)), cv::Point(8, 10));

    PositionOffset left{0, 3, VerticalAnchor::BOTTOM, HorizontalAnchor::LEFT};
    EXPECT_EQ(onlyPixel(NirMaskMapper::positionMask(mask, target, left)), cv::Point(12, 10));
}

TEST(PositionMaskTest, OffsetOfOneLeavesMaskInPlace) {
    cv::Mat mask = cv::Mat::zeros(20, 20, CV_8UC1);
    mask.at<uchar>(10, 10) = 255;

    PositionOffset one{1, 1, VerticalAnchor::TOP, HorizontalAnchor::LEFT};
    EXPECT_EQ(onlyPixel(NirMaskMapper::positionMask(mask, cv::Size(20, 20), one)), cv::Point(10, 10));
}

TEST(PositionMaskTest, ContentPushedOffFrameIsDropped) {
    cv::Mat mask = cv::Mat::zeros(10, 10, CV_8UC1);
    mask.row(0).setTo(255);

    cv::Mat positioned = NirMaskMapper::positionMask(mask, cv::Size(10, 10), PositionOffset());

    EXPECT_EQ(positioned.size(), cv::Size(10, 10));
    EXPECT_EQ(cv::countNonZero(positioned), 0);
}

TEST(NirMaskMapperTest, MapLandsPlantOnNirFrame) {
    NirMaskMapper mapper;
    cv::Mat nir_mask = mapper.map(visPlantMask(), cv::Size(640, 480));

    ASSERT_EQ(nir_mask.size(), cv::Size(640, 480));
    EXPECT_TRUE(MaskOps::isBinary(nir_mask));

    int area = cv::countNonZero(nir_mask);
    EXPECT_GT(area, 2500);
    EXPECT_LT(area, 4500);

    cv::Moments m = cv::moments(nir_mask, true);
    ASSERT_GT(m.m00, 0.0);
    // Scaled centre, less the crop margin; the default mount offset lifts the mask one row
    double expected_x = 999.5 * mapper.ratio().x - 21.0;
    double expected_y = 999.5 * mapper.ratio().y - std::floor((2056 * mapper.ratio().y - 480.0) / 2.0) - 1.0;
    EXPECT_NEAR(m.m10 / m.m00, expected_x, 3.0);
    EXPECT_NEAR(m.m01 / m.m00, expected_y, 3.0);
}

TEST(NirMaskMapperTest, OversizedNirFrameIsAnAlignmentError) {
    NirMaskMapper mapper;
    EXPECT_THROW(mapper.map(visPlantMask(), cv::Size(800, 600)), AlignmentError);
}
