/******************************************************************************
 * @brief Unit tests for the IntrinsicsResolver functions.
 *
 * @file test_intrinsics_resolver.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/geolocation/algorithms/IntrinsicsResolver.hpp"

/// \cond
#include <cmath>
#include <gtest/gtest.h>

/// \endcond

class IntrinsicsResolverTest : public ::testing::Test
{
    protected:
        IntrinsicsResolver::IntrinsicsHints stHints;
        IntrinsicsResolver::IntrinsicsSource eSource = IntrinsicsResolver::IntrinsicsSource::eDirect;

        void SetUp() override
        {
            stHints.nImageWidth  = 6000;
            stHints.nImageHeight = 4000;
        }
};

TEST_F(IntrinsicsResolverTest, DirectFocalLengthWins)
{
    stHints.dFx            = 5000.0;
    stHints.dFocalLengthMM = 16.0;

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eDirect);
    EXPECT_DOUBLE_EQ(stIntrinsics.dFx, 5000.0);
    EXPECT_DOUBLE_EQ(stIntrinsics.dFy, 5000.0);
    EXPECT_DOUBLE_EQ(stIntrinsics.dCx, 3000.0);
    EXPECT_DOUBLE_EQ(stIntrinsics.dCy, 2000.0);
}

TEST_F(IntrinsicsResolverTest, FocalLengthUsesModelSensorWidth)
{
    stHints.dFocalLengthMM = 16.0;
    stHints.szCameraModel  = " ilce-6000 ";

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFocalLength);
    EXPECT_NEAR(stIntrinsics.dFx, 16.0 * 6000.0 / 23.5, 1e-9);
    EXPECT_DOUBLE_EQ(stIntrinsics.dFy, stIntrinsics.dFx);
}

TEST_F(IntrinsicsResolverTest, FocalLengthUsesHintedSensorWidth)
{
    stHints.dFocalLengthMM = 8.8;
    stHints.dSensorWidthMM = 13.2;

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_NEAR(stIntrinsics.dFx, 8.8 * 6000.0 / 13.2, 1e-9);
}

TEST_F(IntrinsicsResolverTest, EquivalentFocalLengthIsSensorIndependent)
{
    stHints.dFocalLength35mm = 24.0;
    CameraIntrinsics stFullFrame = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);
    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFocalLength35mm);
    EXPECT_NEAR(stFullFrame.dFx, 4000.0, 1e-9);

    stHints.szCameraModel    = "ILCE-6000";
    CameraIntrinsics stCrop  = IntrinsicsResolver::ResolveIntrinsics(stHints);
    EXPECT_NEAR(stCrop.dFx, 4000.0, 1e-9);
}

TEST_F(IntrinsicsResolverTest, CalibrationPresetIsScaled)
{
    stHints.nImageWidth   = 3000;
    stHints.nImageHeight  = 2000;
    stHints.szCameraModel = "ILCE-5100";

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eCalibrationPreset);
    EXPECT_EQ(stIntrinsics.nImageWidth, 3000);
    EXPECT_NEAR(stIntrinsics.dFx, 6398.08616 / 2.0, 1e-9);
    EXPECT_NEAR(stIntrinsics.dFy, 6432.14696 / 2.0, 1e-9);
    EXPECT_NEAR(stIntrinsics.dCx, 2959.871024 / 2.0, 1e-9);
    EXPECT_NEAR(stIntrinsics.dCy, 1963.453368 / 2.0, 1e-9);
    EXPECT_DOUBLE_EQ(stIntrinsics.dK1, -0.0232568293);
    EXPECT_DOUBLE_EQ(stIntrinsics.dK3, 2.41647816);
}

TEST_F(IntrinsicsResolverTest, HintsOverridePresetPrincipalPointAndDistortion)
{
    stHints.szCameraModel = "ILCE-5100";
    stHints.dCx           = 3010.0;
    stHints.dK1           = 0.1;

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints);

    EXPECT_DOUBLE_EQ(stIntrinsics.dCx, 3010.0);
    EXPECT_NEAR(stIntrinsics.dCy, 1963.453368, 1e-9);
    EXPECT_DOUBLE_EQ(stIntrinsics.dK1, 0.1);
    EXPECT_DOUBLE_EQ(stIntrinsics.dK2, 0.0);
    EXPECT_DOUBLE_EQ(stIntrinsics.dK3, 0.0);
    EXPECT_DOUBLE_EQ(stIntrinsics.dP1, 0.0);
}

TEST_F(IntrinsicsResolverTest, PresetOnlyForMatchingModel)
{
    stHints.szCameraModel = "ILCE-6000";

    IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFieldOfView);
}

TEST_F(IntrinsicsResolverTest, FieldOfViewHint)
{
    stHints.dHorizontalFOVDeg = 90.0;

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFieldOfView);
    EXPECT_NEAR(stIntrinsics.dFx, 3000.0, 1e-9);
    EXPECT_DOUBLE_EQ(stIntrinsics.dFy, stIntrinsics.dFx);
}

TEST_F(IntrinsicsResolverTest, NothingKnownFallsBackToDefaultFieldOfView)
{
    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFieldOfView);
    EXPECT_NEAR(stIntrinsics.dFx, 3000.0 / std::tan(54.55 / 2.0 * CV_PI / 180.0), 1e-9);
    EXPECT_FALSE(CameraModel::HasDistortion(stIntrinsics));
}

TEST_F(IntrinsicsResolverTest, NonPositiveHintsAreIgnored)
{
    stHints.dFx            = 0.0;
    stHints.dFocalLengthMM = -4.0;
    stHints.dHorizontalFOVDeg = 90.0;

    CameraIntrinsics stIntrinsics = IntrinsicsResolver::ResolveIntrinsics(stHints, &eSource);

    EXPECT_EQ(eSource, IntrinsicsResolver::IntrinsicsSource::eFieldOfView);
    EXPECT_NEAR(stIntrinsics.dFx, 3000.0, 1e-9);
}
