/******************************************************************************
 * @brief End to end tests of pixel to ground projection.
 *
 * @file test_pixel_to_ground.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/geolocation/algorithms/PixelToGround.hpp"
#include "GeoTestFixtures.hpp"

/// \cond
#include <array>
#include <cmath>
#include <gtest/gtest.h>
#include <variant>

/// \endcond

class PixelToGroundTest : public ::testing::Test
{
    protected:
        CameraIntrinsics stIntrinsics = geotest::MakeIntrinsics();
        CameraPose stNadirPose        = geotest::MakePose(120.0);
        ProjectionStatus eStatus      = ProjectionStatus::eSuccess;
};

TEST_F(PixelToGroundTest, CenterPixelLandsBelowCamera)
{
    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), stNadirPose, stIntrinsics, FlatPlane{0.0}, &eStatus);

    ASSERT_TRUE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eSuccess);
    EXPECT_NEAR(stResult->dLatitude, 40.0, 1e-12);
    EXPECT_NEAR(stResult->dLongitude, 44.5, 1e-12);
    EXPECT_DOUBLE_EQ(stResult->dGroundElevationAMSL, 0.0);
    EXPECT_NEAR(stResult->dSlantRangeMeters, 0.0, 1e-9);
    EXPECT_EQ(stResult->eGroundModel, GroundModel::eFlatPlane);
    EXPECT_TRUE(stResult->bConverged);
    EXPECT_EQ(stResult->nIterations, 0);
}

TEST_F(PixelToGroundTest, OffCenterPixelMovesEast)
{
    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(600.0, 500.0), stNadirPose, stIntrinsics, FlatPlane{0.0}, &eStatus);

    const double dExpectedEast = std::tan(std::atan(100.0 / 1000.0)) * 120.0;
    ASSERT_TRUE(stResult.has_value());
    EXPECT_NEAR(stResult->dSlantRangeMeters, dExpectedEast, 1e-9);
    EXPECT_NEAR(stResult->dLongitude, 44.5 + dExpectedEast / geoops::ComputeMetersPerDegree(40.0).dLongitude, 1e-11);
    EXPECT_NEAR(stResult->dLongitude, 44.500140525381624, 1e-11);
    EXPECT_NEAR(stResult->dLatitude, 40.0, 1e-12);
}

TEST_F(PixelToGroundTest, FlatGroundRoundTripAtAnyElevation)
{
    for (const double dGround : {-20.0, 0.0, 35.0, 119.0})
    {
        std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), stNadirPose, stIntrinsics, FlatPlane{dGround});

        ASSERT_TRUE(stResult.has_value()) << "ground " << dGround;
        EXPECT_NEAR(stResult->dLatitude, stNadirPose.dLatitude, 1e-12);
        EXPECT_NEAR(stResult->dLongitude, stNadirPose.dLongitude, 1e-12);
        EXPECT_DOUBLE_EQ(stResult->dGroundElevationAMSL, dGround);
    }
}

TEST_F(PixelToGroundTest, RangeGrowsWithPitch)
{
    double dPreviousRange = -1.0;
    for (int nPitch = 1; nPitch < 80; ++nPitch)
    {
        CameraPose stPose                        = geotest::MakePose(120.0, 0.0, nPitch, 0.0);
        std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(600.0, 500.0), stPose, stIntrinsics, FlatPlane{0.0});

        ASSERT_TRUE(stResult.has_value()) << "pitch " << nPitch;
        EXPECT_GT(stResult->dSlantRangeMeters, dPreviousRange) << "pitch " << nPitch;
        dPreviousRange = stResult->dSlantRangeMeters;
    }
}

TEST_F(PixelToGroundTest, HorizonRayIsParallel)
{
    std::optional<ProjectionResult> stResult =
        PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), geotest::MakePose(120.0, 0.0, 90.0, 0.0), stIntrinsics, FlatPlane{0.0}, &eStatus);

    EXPECT_FALSE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayParallelToGround);
}

TEST_F(PixelToGroundTest, SkywardRayPointsAway)
{
    std::optional<ProjectionResult> stResult =
        PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), geotest::MakePose(120.0, 0.0, 120.0, 0.0), stIntrinsics, FlatPlane{0.0}, &eStatus);

    EXPECT_FALSE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayPointsAway);
}

TEST_F(PixelToGroundTest, MissingGPSIsReported)
{
    CameraPose stNoFix;
    stNoFix.dAltitudeAMSL = 120.0;

    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), stNoFix, stIntrinsics, FlatPlane{0.0}, &eStatus);

    EXPECT_FALSE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eMissingGPS);
}

TEST_F(PixelToGroundTest, InvalidIntrinsicsAreReported)
{
    stIntrinsics.dFx = 0.0;

    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(500.0, 500.0), stNadirPose, stIntrinsics, FlatPlane{0.0}, &eStatus);

    EXPECT_FALSE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eInvalidIntrinsics);
}

TEST_F(PixelToGroundTest, DEMGroundUsesTerrain)
{
    DEMGround stGround{geotest::MakeDEM([](double, double) { return 20.0; }), 0.0};

    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(600.0, 500.0), stNadirPose, stIntrinsics, stGround, &eStatus);

    ASSERT_TRUE(stResult.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eSuccess);
    EXPECT_EQ(stResult->eGroundModel, GroundModel::eDigitalElevationModel);
    EXPECT_NEAR(stResult->dGroundElevationAMSL, 20.0, 1e-6);
    EXPECT_NEAR(stResult->dSlantRangeMeters, 10.0, 1e-6);
    EXPECT_TRUE(stResult->bConverged);
    EXPECT_GT(stResult->nIterations, 0);
}

TEST_F(PixelToGroundTest, DEMGroundWithoutDEMUsesFallbackPlane)
{
    DEMGround stGround{nullptr, 20.0};

    std::optional<ProjectionResult> stResult = PixelToGround::ProjectPixel(cv::Point2d(600.0, 500.0), stNadirPose, stIntrinsics, stGround, &eStatus);

    ASSERT_TRUE(stResult.has_value());
    EXPECT_EQ(stResult->eGroundModel, GroundModel::eFlatPlane);
    EXPECT_DOUBLE_EQ(stResult->dGroundElevationAMSL, 20.0);
    EXPECT_NEAR(stResult->dSlantRangeMeters, 10.0, 1e-9);
}

TEST_F(PixelToGroundTest, NadirFootprintIsSymmetric)
{
    std::array<std::optional<ProjectionResult>, 4> aCorners = PixelToGround::ComputeFootprint(stNadirPose, stIntrinsics, FlatPlane{0.0});

    for (const std::optional<ProjectionResult>& stCorner : aCorners)
    {
        ASSERT_TRUE(stCorner.has_value());
        EXPECT_NEAR(stCorner->dSlantRangeMeters, 120.0 * std::sqrt(0.5), 1e-9);
    }

    // Clockwise from the top left: NW, NE, SE, SW.
    EXPECT_GT(aCorners[0]->dLatitude, 40.0);
    EXPECT_LT(aCorners[0]->dLongitude, 44.5);
    EXPECT_GT(aCorners[1]->dLatitude, 40.0);
    EXPECT_GT(aCorners[1]->dLongitude, 44.5);
    EXPECT_LT(aCorners[2]->dLatitude, 40.0);
    EXPECT_GT(aCorners[2]->dLongitude, 44.5);
    EXPECT_LT(aCorners[3]->dLatitude, 40.0);
    EXPECT_LT(aCorners[3]->dLongitude, 44.5);
}

TEST_F(PixelToGroundTest, ObliqueFootprintLosesCornersAboveHorizon)
{
    std::array<std::optional<ProjectionResult>, 4> aCorners = PixelToGround::ComputeFootprint(geotest::MakePose(120.0, 0.0, 80.0, 0.0), stIntrinsics, FlatPlane{0.0});

    EXPECT_FALSE(aCorners[0].has_value());
    EXPECT_FALSE(aCorners[1].has_value());
    EXPECT_TRUE(aCorners[2].has_value());
    EXPECT_TRUE(aCorners[3].has_value());
}

TEST_F(PixelToGroundTest, GroundReferenceFollowsToggle)
{
    std::shared_ptr<const DigitalElevationModel> pDEM = geotest::MakeDEM([](double, double) { return 20.0; });

    EXPECT_TRUE(std::holds_alternative<DEMGround>(PixelToGround::SelectGroundReference(5.0, pDEM, true)));
    EXPECT_TRUE(std::holds_alternative<FlatPlane>(PixelToGround::SelectGroundReference(5.0, pDEM, false)));
    EXPECT_TRUE(std::holds_alternative<FlatPlane>(PixelToGround::SelectGroundReference(5.0, nullptr, true)));
    EXPECT_DOUBLE_EQ(std::get<DEMGround>(PixelToGround::SelectGroundReference(5.0, pDEM, true)).dFallbackElevationAMSL, 5.0);
}

TEST_F(PixelToGroundTest, SampleGroundUnderCamera)
{
    std::shared_ptr<const DigitalElevationModel> pDEM = geotest::MakeDEM([](double, double) { return 42.0; });
    DEMSampler::DEMSampleStatus eSampleStatus          = DEMSampler::DEMSampleStatus::eSuccess;

    std::optional<double> dGround = PixelToGround::SampleGroundUnderCamera(stNadirPose, *pDEM, &eSampleStatus);
    ASSERT_TRUE(dGround.has_value());
    EXPECT_NEAR(*dGround, 42.0, 1e-6);

    EXPECT_FALSE(PixelToGround::SampleGroundUnderCamera(CameraPose(), *pDEM, &eSampleStatus).has_value());
}
