/******************************************************************************
 * @brief Unit tests for the GeolocationSession class and scenario loading.
 *
 * @file test_geolocation_session.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/geolocation/session/GeolocationSession.h"
#include "GeoTestFixtures.hpp"

/// \cond
#include <array>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

/// \endcond

class GeolocationSessionTest : public ::testing::Test
{
    protected:
        const std::string szExampleScenario = std::string(GEO_CONFIG_DIR) + "/scenario_example.yaml";
        std::filesystem::path szTestDir;

        void SetUp() override
        {
            // Per test folder.
            szTestDir = std::filesystem::temp_directory_path() / "rovesogeo_session_test" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
            std::filesystem::create_directories(szTestDir);
        }

        void TearDown() override { std::filesystem::remove_all(szTestDir); }

        std::string WriteScenario(const std::string& szName, const std::string& szBody)
        {
            const std::filesystem::path szPath = szTestDir / szName;
            std::ofstream fsScenario(szPath);
            fsScenario << "%YAML:1.0\n---\n" << szBody;
            fsScenario.close();
            return szPath.string();
        }
};

TEST_F(GeolocationSessionTest, LoadsExampleScenario)
{
    GeolocationScenario stScenario = GeolocationSession::LoadScenario(szExampleScenario);

    EXPECT_DOUBLE_EQ(stScenario.stPose.dLatitude, 37.9510);
    EXPECT_DOUBLE_EQ(stScenario.stPose.dLongitude, -91.7710);
    EXPECT_DOUBLE_EQ(stScenario.stPose.dAltitudeAMSL, 487.5);
    EXPECT_DOUBLE_EQ(stScenario.stPose.dPitch, 20.0);
    EXPECT_DOUBLE_EQ(stScenario.dGroundElevationAMSL, 360.0);
    EXPECT_EQ(stScenario.stHints.nImageWidth, 6000);
    EXPECT_EQ(stScenario.stHints.szCameraModel, "ILCE-6000");
    EXPECT_TRUE(stScenario.bAutoSampleDEM);
    EXPECT_FALSE(stScenario.szDEMPath.empty());
    ASSERT_EQ(stScenario.vPixels.size(), 3u);
    EXPECT_DOUBLE_EQ(stScenario.vPixels[2].x, 500.0);
    EXPECT_DOUBLE_EQ(stScenario.vPixels[2].y, 3900.0);
}

TEST_F(GeolocationSessionTest, BuildsSessionFromScenario)
{
    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(GeolocationSession::LoadScenario(szExampleScenario));

    ASSERT_NE(pSession, nullptr);
    EXPECT_TRUE(pSession->HasDEM());
    EXPECT_TRUE(pSession->GetAutoSampleDEM());
    EXPECT_NEAR(pSession->GetIntrinsics().dFx, 16.0 * 6000.0 / 23.5, 1e-9);
    EXPECT_NEAR(pSession->GetAltitudeAboveGround(), 127.5, 1e-9);
}

TEST_F(GeolocationSessionTest, RelinkFollowsTerrainUnderCamera)
{
    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(GeolocationSession::LoadScenario(szExampleScenario));

    DEMSampler::DEMSampleStatus eStatus = DEMSampler::DEMSampleStatus::eReadFailure;
    std::optional<double> dGround       = pSession->RelinkGroundWithDEM(&eStatus);

    ASSERT_TRUE(dGround.has_value());
    EXPECT_EQ(eStatus, DEMSampler::DEMSampleStatus::eSuccess);
    EXPECT_NEAR(*dGround, 367.5, 1e-3);
    EXPECT_NEAR(pSession->GetGroundElevationAMSL(), 367.5, 1e-3);
    EXPECT_NEAR(pSession->GetAltitudeAboveGround(), 120.0, 1e-3);
}

TEST_F(GeolocationSessionTest, ProjectsScenarioPixels)
{
    GeolocationScenario stScenario               = GeolocationSession::LoadScenario(szExampleScenario);
    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(stScenario);

    for (const cv::Point2d& cvPixel : stScenario.vPixels)
    {
        ProjectionStatus eStatus              = ProjectionStatus::eInvalidIntrinsics;
        std::optional<ProjectionResult> stHit = pSession->ProjectPixel(cvPixel, &eStatus);
        ASSERT_TRUE(stHit.has_value());
        EXPECT_EQ(eStatus, ProjectionStatus::eSuccess);
        EXPECT_GT(stHit->dSlantRangeMeters, 0.0);
    }
}

TEST_F(GeolocationSessionTest, SamplerOffsetAppliesToEveryDEMPath)
{
    const std::string szScenario = WriteScenario("offset.yaml",
                                                 "camera:\n"
                                                 "   latitude: 37.9510\n"
                                                 "   longitude: -91.7710\n"
                                                 "   altitude_amsl: 487.5\n"
                                                 "   pitch: 20.0\n"
                                                 "   ground_elevation_amsl: 360.0\n"
                                                 "intrinsics:\n"
                                                 "   width: 6000\n"
                                                 "   height: 4000\n"
                                                 "   focal_length_mm: 16.0\n"
                                                 "   sensor_width_mm: 23.5\n"
                                                 "dem:\n"
                                                 "   path: \"" +
                                                     std::string(GEO_CONFIG_DIR) +
                                                     "/example_dem.yaml\"\n"
                                                     "   auto_sample: 1\n"
                                                     "   vertical_offset: 30.0\n");

    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(GeolocationSession::LoadScenario(szScenario));

    // Raw DEM value under the camera is 367.5 m.
    std::optional<double> dGround = pSession->RelinkGroundWithDEM();
    ASSERT_TRUE(dGround.has_value());
    EXPECT_NEAR(*dGround, 397.5, 1e-3);
    EXPECT_NEAR(pSession->GetAltitudeAboveGround(), 90.0, 1e-3);

    // Footprint corners agree with single pixel projections under the same sampler settings.
    const std::array<cv::Point2d, 4> aCorners                       = {cv::Point2d(0.0, 0.0), cv::Point2d(6000.0, 0.0), cv::Point2d(6000.0, 4000.0), cv::Point2d(0.0, 4000.0)};
    const std::array<std::optional<ProjectionResult>, 4> aFootprint = pSession->ComputeFootprint();
    ASSERT_TRUE(aFootprint[2].has_value());
    for (size_t siIdx = 0; siIdx < aCorners.size(); ++siIdx)
    {
        std::optional<ProjectionResult> stHit = pSession->ProjectPixel(aCorners[siIdx]);
        ASSERT_EQ(aFootprint[siIdx].has_value(), stHit.has_value());
        if (stHit.has_value())
        {
            EXPECT_DOUBLE_EQ(aFootprint[siIdx]->dLatitude, stHit->dLatitude);
            EXPECT_DOUBLE_EQ(aFootprint[siIdx]->dLongitude, stHit->dLongitude);
            EXPECT_DOUBLE_EQ(aFootprint[siIdx]->dGroundElevationAMSL, stHit->dGroundElevationAMSL);
        }
    }
}

TEST_F(GeolocationSessionTest, ToggleFlipsTerrainFollowing)
{
    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(GeolocationSession::LoadScenario(szExampleScenario));

    EXPECT_FALSE(pSession->ToggleAutoSampleDEM());
    EXPECT_FALSE(pSession->GetAutoSampleDEM());
    EXPECT_TRUE(pSession->ToggleAutoSampleDEM());
}

TEST_F(GeolocationSessionTest, AutoFixAppliesCorrectionToPose)
{
    GeolocationSession stSession(geotest::MakePose(100.0, 15.0, -30.0, 5.0), geotest::MakeIntrinsics(), 0.0);

    ProjectionStatus eStatus = ProjectionStatus::ePoseAmbiguous;
    std::optional<PoseAutoCorrector::PoseCorrection> stCorrection = stSession.AutoFixPose(&eStatus);

    ASSERT_TRUE(stCorrection.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eSuccess);
    const CameraPose stPose = stSession.GetPose();
    EXPECT_DOUBLE_EQ(stPose.dYaw, stCorrection->dYaw);
    EXPECT_DOUBLE_EQ(stPose.dPitch, stCorrection->dPitch);
    EXPECT_DOUBLE_EQ(stPose.dRoll, stCorrection->dRoll);
    EXPECT_DOUBLE_EQ(std::abs(stPose.dPitch), 30.0);
    EXPECT_TRUE(stSession.ProjectPixel(cv::Point2d(500.0, 500.0)).has_value());
}

TEST_F(GeolocationSessionTest, AutoFixFollowsPoseEditedDuringSearch)
{
    // Coarse DEM over the camera with slow reads, so the search takes a while.
    std::shared_ptr<DigitalElevationModel> pDEM = std::make_shared<DigitalElevationModel>();
    pDEM->pRaster                                = std::make_shared<geotest::SlowElevationRaster>(std::chrono::milliseconds(20));
    pDEM->nWidth                                 = 10;
    pDEM->nHeight                                = 10;
    pDEM->dOriginLon                             = 44.45;
    pDEM->dOriginLat                             = 40.05;
    pDEM->dResLon                                = 0.01;
    pDEM->dResLat                                = -0.01;
    pDEM->bCoordinateReferenceIsGeographic       = true;
    pDEM->szSourcePath                           = "slow";

    GeolocationSession stSession(geotest::MakePose(110.0, 0.0, -30.0, 0.0), geotest::MakeIntrinsics(), 10.0, pDEM, true);
    const CameraPose stEditedPose = geotest::MakePose(150.0, 10.0, -25.0, 0.0);

    std::optional<PoseAutoCorrector::PoseCorrection> stCorrection;
    std::thread thAutoFix([&stSession, &stCorrection]() { stCorrection = stSession.AutoFixPose(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    stSession.SetPose(stEditedPose);
    thAutoFix.join();

    // Whenever the edit landed, the result is a sign flip of the edited attitude.
    const CameraPose stPose = stSession.GetPose();
    EXPECT_DOUBLE_EQ(stPose.dAltitudeAMSL, 150.0);
    EXPECT_DOUBLE_EQ(std::abs(stPose.dYaw), 10.0);
    EXPECT_DOUBLE_EQ(std::abs(stPose.dPitch), 25.0);
    EXPECT_DOUBLE_EQ(stPose.dRoll, 0.0);
    EXPECT_TRUE(stCorrection.has_value());
}

TEST_F(GeolocationSessionTest, RelinkWithoutDEMLeavesGround)
{
    GeolocationSession stSession(geotest::MakePose(100.0), geotest::MakeIntrinsics(), 12.0);

    DEMSampler::DEMSampleStatus eStatus = DEMSampler::DEMSampleStatus::eSuccess;
    EXPECT_FALSE(stSession.RelinkGroundWithDEM(&eStatus).has_value());
    EXPECT_EQ(eStatus, DEMSampler::DEMSampleStatus::eReadFailure);
    EXPECT_DOUBLE_EQ(stSession.GetGroundElevationAMSL(), 12.0);
    EXPECT_FALSE(stSession.HasDEM());
}

TEST_F(GeolocationSessionTest, ScenarioWithoutGPSReportsMissingFix)
{
    const std::string szScenario = WriteScenario("no_gps.yaml",
                                                 "camera:\n"
                                                 "   altitude_amsl: 150.0\n"
                                                 "   ground_elevation_amsl: 30.0\n"
                                                 "intrinsics:\n"
                                                 "   width: 1000\n"
                                                 "   height: 800\n"
                                                 "   horizontal_fov_deg: 90.0\n");

    GeolocationScenario stScenario = GeolocationSession::LoadScenario(szScenario);
    EXPECT_TRUE(std::isnan(stScenario.stPose.dLatitude));
    EXPECT_TRUE(stScenario.szDEMPath.empty());
    EXPECT_TRUE(stScenario.vPixels.empty());

    std::unique_ptr<GeolocationSession> pSession = GeolocationSession::FromScenario(stScenario);
    EXPECT_NEAR(pSession->GetIntrinsics().dFx, 500.0, 1e-9);

    ProjectionStatus eStatus = ProjectionStatus::eSuccess;
    EXPECT_FALSE(pSession->ProjectPixel(cv::Point2d(500.0, 400.0), &eStatus).has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eMissingGPS);
}

TEST_F(GeolocationSessionTest, RejectsMalformedScenarios)
{
    EXPECT_THROW(GeolocationSession::LoadScenario((szTestDir / "missing.yaml").string()), std::runtime_error);

    const std::string szNoCamera = WriteScenario("no_camera.yaml", "intrinsics:\n   width: 100\n   height: 100\n");
    EXPECT_THROW(GeolocationSession::LoadScenario(szNoCamera), std::invalid_argument);

    const std::string szNoAltitude = WriteScenario("no_altitude.yaml",
                                                   "camera:\n   latitude: 40.0\n   longitude: 44.5\n"
                                                   "intrinsics:\n   width: 100\n   height: 100\n");
    EXPECT_THROW(GeolocationSession::LoadScenario(szNoAltitude), std::invalid_argument);

    const std::string szBadWidth = WriteScenario("bad_width.yaml",
                                                 "camera:\n   altitude_amsl: 10.0\n"
                                                 "intrinsics:\n   width: -4\n   height: 100\n");
    EXPECT_THROW(GeolocationSession::LoadScenario(szBadWidth), std::invalid_argument);

    const std::string szOddPixels = WriteScenario("odd_pixels.yaml",
                                                  "camera:\n   altitude_amsl: 10.0\n"
                                                  "intrinsics:\n   width: 100\n   height: 100\n"
                                                  "pixels: [ 1.0, 2.0, 3.0 ]\n");
    EXPECT_THROW(GeolocationSession::LoadScenario(szOddPixels), std::invalid_argument);
}

TEST_F(GeolocationSessionTest, ConcurrentProjectionsDuringPoseEdits)
{
    GeolocationSession stSession(geotest::MakePose(100.0), geotest::MakeIntrinsics(), 0.0);

    std::thread thEditor(
        [&stSession]()
        {
            for (int nIter = 0; nIter < 200; ++nIter)
            {
                stSession.SetPose(geotest::MakePose(100.0, 0.0, static_cast<double>(nIter % 30), 0.0));
            }
        });

    int nHits = 0;
    for (int nIter = 0; nIter < 200; ++nIter)
    {
        std::optional<ProjectionResult> stHit = stSession.ProjectPixel(cv::Point2d(500.0, 500.0));
        if (stHit.has_value() && stHit->dSlantRangeMeters >= 0.0)
        {
            ++nHits;
        }
    }
    thEditor.join();

    // Every pitch in [0, 30) hits flat ground 100 m below.
    EXPECT_EQ(nHits, 200);
}
