/******************************************************************************
 * @brief Unit tests for the Orientation functions.
 *
 * @file test_orientation.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/geolocation/algorithms/Orientation.hpp"

/// \cond
#include <cmath>
#include <gtest/gtest.h>

/// \endcond

class OrientationTest : public ::testing::Test
{
    protected:
        cv::Vec3d OpticalAxis(const double dYaw, const double dPitch, const double dRoll)
        {
            return Orientation::CameraRayToENU(Orientation::ComposeRotation(dYaw, dPitch, dRoll), cv::Vec3d(0.0, 0.0, 1.0));
        }
};

TEST_F(OrientationTest, RotationIsOrthonormal)
{
    cv::Mat cvRotation = Orientation::ComposeRotation(37.0, 21.0, -8.0);
    cv::Mat cvIdentity = cvRotation.t() * cvRotation;

    EXPECT_LT(cv::norm(cvIdentity - cv::Mat::eye(3, 3, CV_64F)), 1e-12);
    EXPECT_NEAR(cv::determinant(cvRotation), 1.0, 1e-12);
}

TEST_F(OrientationTest, ZeroAttitudeLooksAtNadir)
{
    cv::Vec3d cvAxis = OpticalAxis(0.0, 0.0, 0.0);

    EXPECT_NEAR(cvAxis[0], 0.0, 1e-12);
    EXPECT_NEAR(cvAxis[1], 0.0, 1e-12);
    EXPECT_NEAR(cvAxis[2], -1.0, 1e-12);
}

TEST_F(OrientationTest, ImageRightIsEastAndImageTopIsNorth)
{
    cv::Mat cvRotation = Orientation::ComposeRotation(0.0, 0.0, 0.0);

    cv::Vec3d cvRight = Orientation::CameraRayToENU(cvRotation, cv::Vec3d(1.0, 0.0, 0.0));
    cv::Vec3d cvUp    = Orientation::CameraRayToENU(cvRotation, cv::Vec3d(0.0, -1.0, 0.0));

    EXPECT_NEAR(cvRight[0], 1.0, 1e-12);
    EXPECT_NEAR(cvUp[1], 1.0, 1e-12);
}

TEST_F(OrientationTest, PositivePitchTiltsTowardNorth)
{
    cv::Vec3d cvAxis = OpticalAxis(0.0, 30.0, 0.0);

    EXPECT_NEAR(cvAxis[0], 0.0, 1e-12);
    EXPECT_NEAR(cvAxis[1], std::sin(30.0 * CV_PI / 180.0), 1e-12);
    EXPECT_NEAR(cvAxis[2], -std::cos(30.0 * CV_PI / 180.0), 1e-12);
}

TEST_F(OrientationTest, YawTurnsCounterClockwiseAboutUp)
{
    // Pitched forward and yawed -90 degrees the camera looks east.
    cv::Vec3d cvAxis = OpticalAxis(-90.0, 30.0, 0.0);
    EXPECT_NEAR(cvAxis[0], std::sin(30.0 * CV_PI / 180.0), 1e-12);
    EXPECT_NEAR(cvAxis[1], 0.0, 1e-12);

    cvAxis = OpticalAxis(90.0, 30.0, 0.0);
    EXPECT_NEAR(cvAxis[0], -std::sin(30.0 * CV_PI / 180.0), 1e-12);
}

TEST_F(OrientationTest, PositiveRollTiltsTowardEast)
{
    cv::Vec3d cvAxis = OpticalAxis(0.0, 0.0, 20.0);

    EXPECT_NEAR(cvAxis[0], std::sin(20.0 * CV_PI / 180.0), 1e-12);
    EXPECT_NEAR(cvAxis[1], 0.0, 1e-12);
    EXPECT_LT(cvAxis[2], 0.0);
}

TEST_F(OrientationTest, OutputIsUnitLength)
{
    cv::Vec3d cvRay = Orientation::CameraRayToENU(Orientation::ComposeRotation(12.0, 45.0, 3.0), cv::Vec3d(0.3, -0.2, 1.0));

    EXPECT_NEAR(cv::norm(cvRay), 1.0, 1e-12);
}
