/******************************************************************************
 * @brief Defines the camera and projection data types shared by the
 *      geolocation pipeline.
 *
 * @file CameraModels.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef CAMERA_MODELS_HPP
#define CAMERA_MODELS_HPP

/// \cond
#include <cmath>
#include <limits>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Why a projection did or did not produce a ground point.
 ******************************************************************************/
enum class ProjectionStatus
{
    eSuccess,
    eRayParallelToGround,    // Up component of the ray is below the parallel epsilon.
    eRayPointsAway,          // Ground is behind the camera along the ray.
    eMissingGPS,             // Camera pose has no usable latitude/longitude.
    eInvalidIntrinsics,      // Image size or focal lengths are not positive.
    ePoseAmbiguous           // No yaw/pitch/roll sign combination reaches the ground.
};

/******************************************************************************
 * @brief Which ground model answered a projection.
 ******************************************************************************/
enum class GroundModel
{
    eFlatPlane,
    eDigitalElevationModel
};

/******************************************************************************
 * @brief Pinhole intrinsics plus Brown-Conrady distortion coefficients.
 *      Focal lengths and principal point are in pixels of the image described
 *      by nImageWidth x nImageHeight. Distortion coefficients are resolution
 *      independent.
 ******************************************************************************/
struct CameraIntrinsics
{
    public:
        int nImageWidth  = 0;
        int nImageHeight = 0;
        double dFx       = 0.0;
        double dFy       = 0.0;
        double dCx       = 0.0;
        double dCy       = 0.0;
        double dK1       = 0.0;    // Radial.
        double dK2       = 0.0;
        double dK3       = 0.0;
        double dP1       = 0.0;    // Tangential.
        double dP2       = 0.0;
};

/******************************************************************************
 * @brief Camera position and attitude. Angles are in degrees. Yaw is 0 at
 *      North, pitch positive tilts the lens down from the base attitude and
 *      roll positive puts the right side down.
 ******************************************************************************/
struct CameraPose
{
    public:
        double dLatitude     = std::numeric_limits<double>::quiet_NaN();
        double dLongitude    = std::numeric_limits<double>::quiet_NaN();
        double dAltitudeAMSL = 0.0;    // Meters.
        double dYaw          = 0.0;
        double dPitch        = 0.0;
        double dRoll         = 0.0;

        /******************************************************************************
         * @brief Check that the pose carries a real GPS fix.
         *
         * @return true - Latitude and longitude are finite and inside WGS84 range.
         * @return false - The pose has no usable position.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-28
         ******************************************************************************/
        bool HasValidPosition() const
        {
            return std::isfinite(dLatitude) && std::isfinite(dLongitude) && std::abs(dLatitude) <= 90.0 && std::abs(dLongitude) <= 180.0 &&
                   std::isfinite(dAltitudeAMSL);
        }
};

/******************************************************************************
 * @brief The geographic point a pixel lands on.
 ******************************************************************************/
struct ProjectionResult
{
    public:
        double dLatitude            = 0.0;
        double dLongitude           = 0.0;
        double dGroundElevationAMSL = 0.0;
        double dSlantRangeMeters    = 0.0;    // Horizontal distance from the point below the camera.
        bool bConverged             = true;   // False when the DEM refinement ran out of iterations.
        int nIterations             = 0;      // DEM refinement iterations used. Zero for flat ground.
        GroundModel eGroundModel    = GroundModel::eFlatPlane;
};

/******************************************************************************
 * @brief Human readable name for a projection status.
 *
 * @param eStatus - The status to describe.
 * @return std::string - Text used in log messages and the results file.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
inline std::string ProjectionStatusToString(const ProjectionStatus eStatus)
{
    switch (eStatus)
    {
        case ProjectionStatus::eSuccess: return "SUCCESS";
        case ProjectionStatus::eRayParallelToGround: return "RAY_PARALLEL_TO_GROUND";
        case ProjectionStatus::eRayPointsAway: return "RAY_POINTS_AWAY";
        case ProjectionStatus::eMissingGPS: return "MISSING_GPS";
        case ProjectionStatus::eInvalidIntrinsics: return "INVALID_INTRINSICS";
        case ProjectionStatus::ePoseAmbiguous: return "POSE_AMBIGUOUS";
        default: return "UNKNOWN";
    }
}

#endif    // CAMERA_MODELS_HPP
