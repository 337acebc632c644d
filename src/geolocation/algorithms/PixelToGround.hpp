/******************************************************************************
 * @brief Atomic functional library for projecting image pixels to geographic
 *      ground coordinates. Chains the camera model, orientation composer and
 *      the flat plane or DEM intersection into single calls.
 *
 * @file PixelToGround.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef PIXEL_TO_GROUND_HPP
#define PIXEL_TO_GROUND_HPP

#include "../../Logging.h"
#include "../../util/geo/ElevationModels.hpp"
#include "../../util/geo/GeoOperations.hpp"
#include "../../util/vision/CameraModels.hpp"
#include "./CameraModel.hpp"
#include "./DEMRefiner.hpp"
#include "./DEMSampler.hpp"
#include "./GroundIntersection.hpp"
#include "./Orientation.hpp"

/// \cond
#include <array>
#include <cmath>
#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <variant>

/// \endcond

namespace PixelToGround
{
    /******************************************************************************
     * @brief Intersect an ENU ray from the camera with the active ground model.
     *
     * @param cvDirectionENU - Unit ray direction (East, North, Up).
     * @param stPose - Camera pose. Position is assumed valid.
     * @param stGround - Flat plane or DEM ground.
     * @param peStatus - (Optional) Receives the failure reason.
     * @param stSamplerConfig - (Optional) DEM sampler tunables.
     * @return std::optional<ProjectionResult> - Ground point, or nullopt if the ray misses the ground.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<ProjectionResult> ProjectRay(const cv::Vec3d& cvDirectionENU,
                                                      const CameraPose& stPose,
                                                      const GroundReference& stGround,
                                                      ProjectionStatus* peStatus                           = nullptr,
                                                      const DEMSampler::DEMSamplerConfig& stSamplerConfig = DEMSampler::DEMSamplerConfig())
    {
        const geoops::GeoCoordinate stCamera{stPose.dLatitude, stPose.dLongitude};

        // Terrain following path.
        const DEMGround* pDEMGround = std::get_if<DEMGround>(&stGround);
        if (pDEMGround != nullptr && pDEMGround->pDEM != nullptr)
        {
            std::optional<DEMRefiner::DEMRefinementResult> stRefined = DEMRefiner::RefineAgainstDEM(cvDirectionENU, stPose, *pDEMGround, peStatus, stSamplerConfig);
            if (!stRefined.has_value())
            {
                return std::nullopt;
            }

            ProjectionResult stResult;
            stResult.dLatitude            = stRefined->stPoint.dLatitude;
            stResult.dLongitude           = stRefined->stPoint.dLongitude;
            stResult.dGroundElevationAMSL = stRefined->dGroundElevationAMSL;
            stResult.dSlantRangeMeters    = stRefined->dRangeMeters;
            stResult.bConverged           = stRefined->bConverged;
            stResult.nIterations          = stRefined->nIterations;
            stResult.eGroundModel         = GroundModel::eDigitalElevationModel;
            return stResult;
        }

        // Flat plane path. A DEM ground without a DEM degrades to its fallback plane.
        double dPlaneElevation = 0.0;
        if (pDEMGround != nullptr)
        {
            LOG_WARNING(logging::g_qSharedLogger, "PixelToGround: DEM ground requested but no DEM is loaded. Using flat ground at {:.2f} m.", pDEMGround->dFallbackElevationAMSL);
            dPlaneElevation = pDEMGround->dFallbackElevationAMSL;
        }
        else
        {
            dPlaneElevation = std::get<FlatPlane>(stGround).dElevationAMSL;
        }

        std::optional<geoops::GroundOffset> stOffset = GroundIntersection::IntersectFlatGround(cvDirectionENU, stPose.dAltitudeAMSL, dPlaneElevation, peStatus);
        if (!stOffset.has_value())
        {
            return std::nullopt;
        }

        geoops::GeoCoordinate stPoint = geoops::OffsetToGeographic(stCamera, *stOffset);

        ProjectionResult stResult;
        stResult.dLatitude            = stPoint.dLatitude;
        stResult.dLongitude           = stPoint.dLongitude;
        stResult.dGroundElevationAMSL = dPlaneElevation;
        stResult.dSlantRangeMeters    = std::hypot(stOffset->dEastMeters, stOffset->dNorthMeters);
        stResult.bConverged           = true;
        stResult.nIterations          = 0;
        stResult.eGroundModel         = GroundModel::eFlatPlane;
        return stResult;
    }

    /******************************************************************************
     * @brief Project one pixel onto the ground. The pose and intrinsics are
     *      validated first so a missing GPS fix or an unresolved focal length is
     *      reported instead of producing NaN coordinates.
     *
     * @param cvPixel - Pixel (u, v) in sensor orientation.
     * @param stPose - Camera pose.
     * @param stIntrinsics - Resolved intrinsics.
     * @param stGround - Flat plane or DEM ground.
     * @param peStatus - (Optional) Receives eSuccess or the failure reason.
     * @param stSamplerConfig - (Optional) DEM sampler tunables.
     * @return std::optional<ProjectionResult> - Ground point, or nullopt with the reason in peStatus.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<ProjectionResult> ProjectPixel(const cv::Point2d& cvPixel,
                                                        const CameraPose& stPose,
                                                        const CameraIntrinsics& stIntrinsics,
                                                        const GroundReference& stGround,
                                                        ProjectionStatus* peStatus                           = nullptr,
                                                        const DEMSampler::DEMSamplerConfig& stSamplerConfig = DEMSampler::DEMSamplerConfig())
    {
        if (!stPose.HasValidPosition())
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eMissingGPS;
            }
            return std::nullopt;
        }
        if (!CameraModel::IsValid(stIntrinsics))
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eInvalidIntrinsics;
            }
            return std::nullopt;
        }

        cv::Vec3d cvCameraRay    = CameraModel::PixelToCameraRay(cvPixel, stIntrinsics);
        cv::Mat cvRotation       = Orientation::ComposeRotation(stPose.dYaw, stPose.dPitch, stPose.dRoll);
        cv::Vec3d cvDirectionENU = Orientation::CameraRayToENU(cvRotation, cvCameraRay);

        LOG_DEBUG(logging::g_qSharedLogger,
                  "PixelToGround: Pixel ({:.1f}, {:.1f}) -> ENU ray ({:.5f}, {:.5f}, {:.5f}).",
                  cvPixel.x,
                  cvPixel.y,
                  cvDirectionENU[0],
                  cvDirectionENU[1],
                  cvDirectionENU[2]);

        return ProjectRay(cvDirectionENU, stPose, stGround, peStatus, stSamplerConfig);
    }

    /******************************************************************************
     * @brief Project the four image corners, clockwise from the top left.
     *      Corners above the horizon come back empty.
     *
     * @param stPose - Camera pose.
     * @param stIntrinsics - Resolved intrinsics.
     * @param stGround - Flat plane or DEM ground.
     * @param stSamplerConfig - (Optional) DEM sampler settings, used with DEM ground.
     * @return std::array<std::optional<ProjectionResult>, 4> - (0,0), (W,0), (W,H), (0,H).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::array<std::optional<ProjectionResult>, 4> ComputeFootprint(const CameraPose& stPose,
                                                                           const CameraIntrinsics& stIntrinsics,
                                                                           const GroundReference& stGround,
                                                                           const DEMSampler::DEMSamplerConfig& stSamplerConfig = DEMSampler::DEMSamplerConfig())
    {
        const double dW                            = stIntrinsics.nImageWidth;
        const double dH                            = stIntrinsics.nImageHeight;
        const std::array<cv::Point2d, 4> aCorners  = {cv::Point2d(0.0, 0.0), cv::Point2d(dW, 0.0), cv::Point2d(dW, dH), cv::Point2d(0.0, dH)};

        std::array<std::optional<ProjectionResult>, 4> aFootprint;
        for (size_t nIdx = 0; nIdx < aCorners.size(); ++nIdx)
        {
            aFootprint[nIdx] = ProjectPixel(aCorners[nIdx], stPose, stIntrinsics, stGround, nullptr, stSamplerConfig);
        }

        return aFootprint;
    }

    /******************************************************************************
     * @brief DEM elevation directly below the camera. Used to tie the camera's
     *      AMSL altitude to its height above ground.
     *
     * @param stPose - Camera pose.
     * @param stDEM - The elevation model.
     * @param peStatus - (Optional) Receives the sampler status.
     * @param stSamplerConfig - (Optional) Vertical offset, no-data policy and read budget.
     * @return std::optional<double> - Ground elevation AMSL below the camera.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<double> SampleGroundUnderCamera(const CameraPose& stPose,
                                                         const DigitalElevationModel& stDEM,
                                                         DEMSampler::DEMSampleStatus* peStatus                = nullptr,
                                                         const DEMSampler::DEMSamplerConfig& stSamplerConfig = DEMSampler::DEMSamplerConfig())
    {
        if (!stPose.HasValidPosition())
        {
            LOG_WARNING(logging::g_qSharedLogger, "PixelToGround: Cannot sample ground under the camera without a GPS position.");
            if (peStatus != nullptr)
            {
                *peStatus = DEMSampler::DEMSampleStatus::eOutOfBounds;
            }
            return std::nullopt;
        }

        return DEMSampler::SampleElevation(stDEM, stPose.dLatitude, stPose.dLongitude, peStatus, stSamplerConfig);
    }

    /******************************************************************************
     * @brief Pick the ground model for a projection.
     *
     * @param dFlatElevationAMSL - Operator ground elevation.
     * @param pDEM - Loaded DEM, may be null.
     * @param bAutoSampleDEM - Operator toggle for terrain following.
     * @return GroundReference - DEM ground when a DEM is loaded and enabled, else the flat plane.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline GroundReference SelectGroundReference(const double dFlatElevationAMSL, const std::shared_ptr<const DigitalElevationModel>& pDEM, const bool bAutoSampleDEM)
    {
        if (pDEM != nullptr && bAutoSampleDEM)
        {
            return DEMGround{pDEM, dFlatElevationAMSL};
        }

        return FlatPlane{dFlatElevationAMSL};
    }

    /******************************************************************************
     * @brief Write one projection to the results file and the shared log.
     *
     * @param cvPixel - The projected pixel.
     * @param eStatus - Outcome of the projection.
     * @param stResult - The ground point when eStatus is eSuccess.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline void RecordProjection(const cv::Point2d& cvPixel, const ProjectionStatus eStatus, const std::optional<ProjectionResult>& stResult)
    {
        if (!stResult.has_value())
        {
            LOG_ERROR(logging::g_qSharedLogger, "Pixel ({:.1f}, {:.1f}): ray didn't hit ground ({}).", cvPixel.x, cvPixel.y, ProjectionStatusToString(eStatus));
            LOG_INFO(logging::g_qResultsLogger, "{:.3f},{:.3f},{},,,,,,,", cvPixel.x, cvPixel.y, ProjectionStatusToString(eStatus));
            return;
        }

        const char* szGroundModel = stResult->eGroundModel == GroundModel::eDigitalElevationModel ? "DEM" : "FLAT";
        LOG_INFO(logging::g_qSharedLogger,
                 "Pixel ({:.1f}, {:.1f}) -> lat {:.7f} lon {:.7f} ground {:.2f} m range {:.2f} m [{}{}]",
                 cvPixel.x,
                 cvPixel.y,
                 stResult->dLatitude,
                 stResult->dLongitude,
                 stResult->dGroundElevationAMSL,
                 stResult->dSlantRangeMeters,
                 szGroundModel,
                 stResult->bConverged ? "" : ", NOT CONVERGED");
        LOG_INFO(logging::g_qResultsLogger,
                 "{:.3f},{:.3f},{},{:.8f},{:.8f},{:.3f},{:.3f},{},{},{}",
                 cvPixel.x,
                 cvPixel.y,
                 ProjectionStatusToString(eStatus),
                 stResult->dLatitude,
                 stResult->dLongitude,
                 stResult->dGroundElevationAMSL,
                 stResult->dSlantRangeMeters,
                 szGroundModel,
                 stResult->bConverged ? 1 : 0,
                 stResult->nIterations);
    }
}    // namespace PixelToGround

#endif    // PIXEL_TO_GROUND_HPP
