/******************************************************************************
 * @brief Atomic functional library for intersecting an ENU ray with a
 *      horizontal ground plane.
 *
 * @file GroundIntersection.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GROUND_INTERSECTION_HPP
#define GROUND_INTERSECTION_HPP

#include "../../Constants.h"
#include "../../util/geo/GeoOperations.hpp"
#include "../../util/vision/CameraModels.hpp"

/// \cond
#include <cmath>
#include <opencv2/core.hpp>
#include <optional>

/// \endcond

namespace GroundIntersection
{
    /******************************************************************************
     * @brief Ray parameter at which the ray reaches a given elevation.
     *
     * @param cvDirectionENU - Ray direction (East, North, Up).
     * @param dCameraAltitudeAMSL - Ray origin altitude in meters.
     * @param dElevationAMSL - Target elevation in meters.
     * @return double - t with origin + t * direction at the target elevation. Not range checked.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline double ComputeRayParameter(const cv::Vec3d& cvDirectionENU, const double dCameraAltitudeAMSL, const double dElevationAMSL)
    {
        return (dElevationAMSL - dCameraAltitudeAMSL) / cvDirectionENU[2];
    }

    /******************************************************************************
     * @brief East/North displacement of the point at ray parameter t.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline geoops::GroundOffset OffsetAtParameter(const cv::Vec3d& cvDirectionENU, const double dT)
    {
        geoops::GroundOffset stOffset;
        stOffset.dEastMeters  = dT * cvDirectionENU[0];
        stOffset.dNorthMeters = dT * cvDirectionENU[1];
        return stOffset;
    }

    /******************************************************************************
     * @brief Closed form intersection of a ray with the plane z = dGroundElevationAMSL.
     *
     * @param cvDirectionENU - Ray direction (East, North, Up).
     * @param dCameraAltitudeAMSL - Camera altitude in meters.
     * @param dGroundElevationAMSL - Ground plane elevation in meters.
     * @param peStatus - (Optional) Receives eRayParallelToGround, eRayPointsAway or eSuccess.
     * @return std::optional<geoops::GroundOffset> - Offset from the point below the camera.
     *      Nullopt if the ray is parallel to the plane or the plane is behind the camera.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<geoops::GroundOffset> IntersectFlatGround(const cv::Vec3d& cvDirectionENU,
                                                                   const double dCameraAltitudeAMSL,
                                                                   const double dGroundElevationAMSL,
                                                                   ProjectionStatus* peStatus = nullptr)
    {
        if (std::abs(cvDirectionENU[2]) < constants::RAY_PARALLEL_EPSILON)
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eRayParallelToGround;
            }
            return std::nullopt;
        }

        const double dT = ComputeRayParameter(cvDirectionENU, dCameraAltitudeAMSL, dGroundElevationAMSL);
        if (!std::isfinite(dT) || dT < 0.0)
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eRayPointsAway;
            }
            return std::nullopt;
        }

        if (peStatus != nullptr)
        {
            *peStatus = ProjectionStatus::eSuccess;
        }
        return OffsetAtParameter(cvDirectionENU, dT);
    }
}    // namespace GroundIntersection

#endif    // GROUND_INTERSECTION_HPP
