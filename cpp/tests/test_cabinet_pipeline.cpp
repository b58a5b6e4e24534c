#include "visnir/cabinet_pipeline.hpp"
#include "visnir/errors.hpp"
#include "visnir/mask_ops.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <fstream>

using namespace VisNir;
namespace fs = std::filesystem;

namespace {

const cv::Size VIS_FRAME(2454, 2056);
const cv::Rect PLANT_SQUARE(900, 900, 200, 200);

cv::Mat plantMask() {
    cv::Mat mask = cv::Mat::zeros(VIS_FRAME, CV_8UC1);
    cv::rectangle(mask, PLANT_SQUARE, cv::Scalar(255), cv::FILLED);
    return mask;
}

// Neutral gray background sits between both green-magenta thresholds
cv::Mat cabinetImage() {
    return cv::Mat(VIS_FRAME, CV_8UC3, cv::Scalar(128, 128, 128));
}

cv::Mat cabinetImageWithPlant() {
    cv::Mat image = cabinetImage();
    image(PLANT_SQUARE).setTo(cv::Scalar(0, 255, 0));
    return image;
}

size_t lineCount(const fs::path& path) {
    std::ifstream in(path);
    size_t count = 0;
    for (std::string line; std::getline(in, line);) ++count;
    return count;
}

class CabinetPipelineFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("visnir_pipeline_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);

        output.result_path = (dir / "result.txt").string();
        output.coresult_path = (dir / "coresult.txt").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string writeImage(const std::string& name, const cv::Mat& image) {
        std::string path = (dir / name).string();
        EXPECT_TRUE(cv::imwrite(path, image));
        return path;
    }

    fs::path dir;
    OutputOptions output;
};

} // namespace

TEST(CabinetPipelineTest, PlantAwayFromFixturesIsKeptExactly) {
    CabinetPipeline pipeline;
    cv::Mat mask = plantMask();

    cv::Mat clean = pipeline.removeFixtures(mask, true);
    EXPECT_EQ(cv::countNonZero(clean != mask), 0);

    std::optional<PlantRegion> plant = pipeline.selectPlantRegion(clean);
    ASSERT_TRUE(plant.has_value());
    EXPECT_EQ(cv::countNonZero(plant->mask != mask), 0);
    EXPECT_FALSE(plant->contour.empty());
}

TEST(CabinetPipelineTest, PlantInsideFixtureRoiIsSuppressed) {
    PipelineConfig config;
    // Stopper ROI spanning (800,800)..(1200,1200) around the square
    config.cabinet.stopper = {800, 800, -1249, -851};
    CabinetPipeline pipeline(config);

    cv::Mat clean = pipeline.removeFixtures(plantMask(), false);

    EXPECT_EQ(cv::countNonZero(clean), 0);
    EXPECT_FALSE(pipeline.selectPlantRegion(clean).has_value());
}

TEST(CabinetPipelineTest, EmptyMaskHasNoPlant) {
    CabinetPipeline pipeline;
    cv::Mat empty = cv::Mat::zeros(VIS_FRAME, CV_8UC1);

    std::optional<PlantRegion> plant;
    EXPECT_NO_THROW(plant = pipeline.selectPlantRegion(empty));
    EXPECT_FALSE(plant.has_value());
}

TEST(CabinetPipelineTest, ObjectOutsidePlantRoiIsDropped) {
    CabinetPipeline pipeline;
    cv::Mat mask = cv::Mat::zeros(VIS_FRAME, CV_8UC1);
    cv::rectangle(mask, cv::Rect(100, 1900, 100, 100), cv::Scalar(255), cv::FILLED);

    EXPECT_FALSE(pipeline.selectPlantRegion(mask).has_value());
}

TEST(CabinetPipelineTest, SegmentsGreenPlantFromCabinetImage) {
    CabinetPipeline pipeline;
    VisSegmentation segmentation = pipeline.segmentVis(cabinetImageWithPlant());

    EXPECT_EQ(cv::countNonZero(segmentation.coarse_mask), 0);
    ASSERT_TRUE(segmentation.plant.has_value());
    EXPECT_TRUE(MaskOps::isBinary(segmentation.plant->mask));

    // Median smoothing rounds off a few corner pixels
    int area = cv::countNonZero(segmentation.plant->mask);
    EXPECT_GE(area, 39900);
    EXPECT_LE(area, 40000);
    EXPECT_EQ(cv::countNonZero(segmentation.plant->mask(PLANT_SQUARE)), area);
}

TEST(CabinetPipelineTest, GreenNoiseOnStopperIsRemoved) {
    cv::Mat image = cabinetImage();
    image(cv::Rect(1500, 880, 40, 40)).setTo(cv::Scalar(0, 255, 0));

    CabinetPipeline pipeline;
    VisSegmentation segmentation = pipeline.segmentVis(image);

    EXPECT_FALSE(segmentation.plant.has_value());
}

TEST(CabinetPipelineTest, FrameTooSmallForCabinetGeometry) {
    CabinetPipeline pipeline;
    cv::Mat small(400, 400, CV_8UC3, cv::Scalar(128, 128, 128));

    EXPECT_THROW(pipeline.segmentVis(small), RoiError);
    EXPECT_THROW(pipeline.selectPlantRegion(cv::Mat::zeros(400, 400, CV_8UC1)), RoiError);
}

TEST(CabinetPipelineTest, TransferGivesNirSizedPlant) {
    CabinetPipeline pipeline;
    NirTransfer transfer = pipeline.transferToNir(plantMask(), cv::Size(640, 480));

    EXPECT_EQ(transfer.mask.size(), cv::Size(640, 480));
    ASSERT_TRUE(transfer.plant.has_value());
    EXPECT_EQ(transfer.plant->mask.size(), cv::Size(640, 480));
    EXPECT_GT(cv::countNonZero(transfer.plant->mask), 0);
}

TEST(CabinetPipelineTest, TransferOfEmptyMaskHasNoPlant) {
    CabinetPipeline pipeline;
    NirTransfer transfer = pipeline.transferToNir(cv::Mat::zeros(VIS_FRAME, CV_8UC1), cv::Size(640, 480));

    EXPECT_EQ(transfer.mask.size(), cv::Size(640, 480));
    EXPECT_FALSE(transfer.plant.has_value());
}

TEST(CabinetPipelineTest, TransferToOversizedNirFrameFails) {
    CabinetPipeline pipeline;
    EXPECT_THROW(pipeline.transferToNir(plantMask(), cv::Size(800, 600)), AlignmentError);
}

TEST_F(CabinetPipelineFileTest, CompletePairWritesBothResultFiles) {
    std::string vis_path = writeImage("VIS_SV_0_z1000_1.png", cabinetImageWithPlant());
    writeImage("NIR_SV_0_z1000_1.png", cv::Mat(480, 640, CV_8UC1, cv::Scalar(90)));

    CabinetPipeline pipeline;
    PairResult result = pipeline.processPair(vis_path, output);

    EXPECT_EQ(result.status, PipelineStatus::COMPLETE);
    EXPECT_TRUE(result.nir_failure.empty());
    EXPECT_EQ(fs::path(result.nir_path).filename().string(), "NIR_SV_0_z1000_1.png");
    ASSERT_TRUE(result.nir_plant.has_value());
    EXPECT_EQ(result.nir_plant->mask.size(), cv::Size(640, 480));

    EXPECT_EQ(lineCount(output.result_path), 4u);
    EXPECT_EQ(lineCount(output.coresult_path), 4u);
    ASSERT_EQ(result.nir_blocks.size(), 2u);
    EXPECT_EQ(result.nir_blocks[0].data.front(), "NIR_DATA");
}

TEST_F(CabinetPipelineFileTest, MissingNirImageKeepsVisResults) {
    std::string vis_path = writeImage("VIS_SV_0_z1000_2.png", cabinetImageWithPlant());

    CabinetPipeline pipeline;
    PairResult result = pipeline.processPair(vis_path, output);

    EXPECT_EQ(result.status, PipelineStatus::VIS_ONLY);
    EXPECT_FALSE(result.nir_failure.empty());
    EXPECT_TRUE(result.vis_plant.has_value());
    EXPECT_EQ(lineCount(output.result_path), 4u);
    EXPECT_FALSE(fs::exists(output.coresult_path));
}

TEST_F(CabinetPipelineFileTest, EmptyCabinetWritesNothing) {
    std::string vis_path = writeImage("VIS_SV_0_z1000_3.png", cabinetImage());
    writeImage("NIR_SV_0_z1000_3.png", cv::Mat(480, 640, CV_8UC1, cv::Scalar(90)));

    CabinetPipeline pipeline;
    PairResult result = pipeline.processPair(vis_path, output);

    EXPECT_EQ(result.status, PipelineStatus::NO_PLANT_FOUND);
    EXPECT_FALSE(fs::exists(output.result_path));
    EXPECT_FALSE(fs::exists(output.coresult_path));
}

TEST_F(CabinetPipelineFileTest, MissingVisImageThrows) {
    CabinetPipeline pipeline;
    EXPECT_THROW(pipeline.processPair((dir / "VIS_missing.png").string(), output), NotFoundError);
}

TEST_F(CabinetPipelineFileTest, WriteImagesAddsImageRows) {
    std::string vis_path = writeImage("VIS_SV_0_z1000_4.png", cabinetImageWithPlant());
    writeImage("NIR_SV_0_z1000_4.png", cv::Mat(480, 640, CV_8UC1, cv::Scalar(90)));
    output.output_dir = (dir / "out").string();
    output.write_images = true;

    CabinetPipeline pipeline;
    PairResult result = pipeline.processPair(vis_path, output);

    ASSERT_EQ(result.status, PipelineStatus::COMPLETE);
    EXPECT_TRUE(fs::exists(dir / "out" / "VIS_SV_0_z1000_4_shapes.png"));
    EXPECT_TRUE(fs::exists(dir / "out" / "NIR_SV_0_z1000_4_shapes.png"));
    EXPECT_EQ(lineCount(output.result_path), 5u);
    EXPECT_EQ(lineCount(output.coresult_path), 5u);
}

TEST_F(CabinetPipelineFileTest, DebugModeWritesNumberedStages) {
    CabinetPipeline pipeline;
    pipeline.setDebugMode(true, (dir / "debug").string());

    VisSegmentation segmentation = pipeline.segmentVis(cabinetImageWithPlant());
    ASSERT_TRUE(segmentation.plant.has_value());

    EXPECT_TRUE(fs::exists(dir / "debug" / "1_green_channel.png"));
    size_t written = 0;
    for (const auto& entry : fs::directory_iterator(dir / "debug")) {
        if (entry.is_regular_file()) ++written;
    }
    EXPECT_GE(written, 10u);
}
