/******************************************************************************
 * @brief Unit tests for the GroundIntersection functions.
 *
 * @file test_ground_intersection.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/geolocation/algorithms/GroundIntersection.hpp"

/// \cond
#include <cmath>
#include <gtest/gtest.h>

/// \endcond

class GroundIntersectionTest : public ::testing::Test
{
    protected:
        ProjectionStatus eStatus = ProjectionStatus::eSuccess;
};

TEST_F(GroundIntersectionTest, NadirRayLandsBelowCamera)
{
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cv::Vec3d(0.0, 0.0, -1.0), 120.0, 0.0, &eStatus);

    ASSERT_TRUE(stOffset.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eSuccess);
    EXPECT_DOUBLE_EQ(stOffset->dEastMeters, 0.0);
    EXPECT_DOUBLE_EQ(stOffset->dNorthMeters, 0.0);
}

TEST_F(GroundIntersectionTest, SlantedRayScalesByHeight)
{
    const cv::Vec3d cvDirection = cv::normalize(cv::Vec3d(0.1, 0.2, -1.0));
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cvDirection, 150.0, 50.0);

    ASSERT_TRUE(stOffset.has_value());
    EXPECT_NEAR(stOffset->dEastMeters, 10.0, 1e-9);
    EXPECT_NEAR(stOffset->dNorthMeters, 20.0, 1e-9);
}

TEST_F(GroundIntersectionTest, HorizontalRayIsParallel)
{
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cv::Vec3d(1.0, 0.0, 0.0), 120.0, 0.0, &eStatus);

    EXPECT_FALSE(stOffset.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayParallelToGround);
}

TEST_F(GroundIntersectionTest, NearlyHorizontalRayIsParallel)
{
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cv::Vec3d(1.0, 0.0, -5e-7), 120.0, 0.0, &eStatus);

    EXPECT_FALSE(stOffset.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayParallelToGround);
}

TEST_F(GroundIntersectionTest, UpwardRayPointsAway)
{
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cv::normalize(cv::Vec3d(0.0, 1.0, 1.0)), 120.0, 0.0, &eStatus);

    EXPECT_FALSE(stOffset.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayPointsAway);
}

TEST_F(GroundIntersectionTest, GroundAboveCameraPointsAway)
{
    std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cv::Vec3d(0.0, 0.0, -1.0), 100.0, 250.0, &eStatus);

    EXPECT_FALSE(stOffset.has_value());
    EXPECT_EQ(eStatus, ProjectionStatus::eRayPointsAway);
}
