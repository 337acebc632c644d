/******************************************************************************
 * @brief Atomic functional library for intersecting an ENU ray with terrain
 *      described by a DEM, by repeatedly re-solving the flat plane intersection
 *      at the elevation found under the previous estimate.
 *
 * @file DEMRefiner.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef DEM_REFINER_HPP
#define DEM_REFINER_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/geo/ElevationModels.hpp"
#include "../../util/geo/GeoOperations.hpp"
#include "../../util/vision/CameraModels.hpp"
#include "./DEMSampler.hpp"
#include "./GroundIntersection.hpp"

/// \cond
#include <cmath>
#include <opencv2/core.hpp>
#include <optional>

/// \endcond

namespace DEMRefiner
{
    /******************************************************************************
     * @brief Terrain intersection found by RefineAgainstDEM.
     ******************************************************************************/
    struct DEMRefinementResult
    {
        public:
            geoops::GeoCoordinate stPoint;
            double dGroundElevationAMSL = 0.0;
            double dRangeMeters         = 0.0;    // Horizontal distance from the point below the camera.
            bool bConverged             = false;
            int nIterations             = 0;
    };

    /******************************************************************************
     * @brief Follow a ray down onto DEM terrain.
     *
     *      The ray parameter t is seeded from the flat plane at the fallback
     *      elevation (t = 1 when that seed is behind the camera). Each iteration
     *      places a candidate at t, samples the DEM there (the fallback elevation
     *      stands in when the DEM has no answer) and solves for the t that reaches
     *      the sampled elevation. The meters to degrees scale is re-centred on the
     *      previous candidate every iteration. The loop accepts once t moves less
     *      than constants::DEM_REFINE_CONVERGENCE_METERS.
     *
     *      If the iteration budget runs out, or a step lands behind the camera,
     *      the point at the last accepted t is returned with bConverged false. If
     *      the very first step already lands behind the camera there is no usable
     *      estimate and nullopt is returned. Cliffs and overhangs may oscillate.
     *
     * @param cvDirectionENU - Unit ray direction (East, North, Up).
     * @param stPose - Camera pose, position must be valid.
     * @param stGround - DEM and fallback elevation.
     * @param peStatus - (Optional) Receives eRayParallelToGround, eRayPointsAway or eSuccess.
     * @param stSamplerConfig - (Optional) DEM sampler tunables.
     * @return std::optional<DEMRefinementResult> - The terrain point, or nullopt if the ray never reaches the ground.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<DEMRefinementResult> RefineAgainstDEM(const cv::Vec3d& cvDirectionENU,
                                                               const CameraPose& stPose,
                                                               const DEMGround& stGround,
                                                               ProjectionStatus* peStatus                           = nullptr,
                                                               const DEMSampler::DEMSamplerConfig& stSamplerConfig = DEMSampler::DEMSamplerConfig())
    {
        const double dDz = cvDirectionENU[2];
        if (std::abs(dDz) < constants::RAY_PARALLEL_EPSILON)
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eRayParallelToGround;
            }
            return std::nullopt;
        }

        const geoops::GeoCoordinate stCamera{stPose.dLatitude, stPose.dLongitude};

        // Seed from the flat plane under the camera.
        double dT = GroundIntersection::ComputeRayParameter(cvDirectionENU, stPose.dAltitudeAMSL, stGround.dFallbackElevationAMSL);
        if (!std::isfinite(dT) || dT < 0.0)
        {
            dT = 1.0;
        }

        double dScaleLatitude = stPose.dLatitude;
        int nIterations       = 0;
        bool bHaveEstimate    = false;
        for (int nIter = 0; nIter < constants::DEM_REFINE_MAX_ITERATIONS; ++nIter)
        {
            nIterations = nIter + 1;

            geoops::GroundOffset stOffset    = GroundIntersection::OffsetAtParameter(cvDirectionENU, dT);
            geoops::GeoCoordinate stCandidate = geoops::OffsetToGeographic(stCamera, stOffset, dScaleLatitude);

            double dElevation = stGround.dFallbackElevationAMSL;
            if (stGround.pDEM != nullptr)
            {
                DEMSampler::DEMSampleStatus eSampleStatus = DEMSampler::DEMSampleStatus::eSuccess;
                std::optional<double> dSample = DEMSampler::SampleElevation(*stGround.pDEM, stCandidate.dLatitude, stCandidate.dLongitude, &eSampleStatus, stSamplerConfig);
                if (dSample.has_value())
                {
                    dElevation = *dSample;
                }
                else
                {
                    LOG_DEBUG(logging::g_qSharedLogger,
                              "DEMRefiner: No DEM elevation at ({:.7f}, {:.7f}) ({}). Using fallback {:.2f} m.",
                              stCandidate.dLatitude,
                              stCandidate.dLongitude,
                              DEMSampler::DEMSampleStatusToString(eSampleStatus),
                              dElevation);
                }
            }
            if (!std::isfinite(dElevation))
            {
                break;
            }

            const double dTNext = GroundIntersection::ComputeRayParameter(cvDirectionENU, stPose.dAltitudeAMSL, dElevation);
            LOG_TRACEL3(logging::g_qSharedLogger, "DEMRefiner: Iteration {} t={:.4f} elevation={:.3f} t_next={:.4f}", nIterations, dT, dElevation, dTNext);
            if (!std::isfinite(dTNext) || dTNext < 0.0)
            {
                break;
            }
            bHaveEstimate = true;

            if (std::abs(dTNext - dT) < constants::DEM_REFINE_CONVERGENCE_METERS)
            {
                DEMRefinementResult stResult;
                stResult.stPoint              = stCandidate;
                stResult.dGroundElevationAMSL = dElevation;
                stResult.dRangeMeters         = std::hypot(stOffset.dEastMeters, stOffset.dNorthMeters);
                stResult.bConverged           = true;
                stResult.nIterations          = nIterations;

                if (peStatus != nullptr)
                {
                    *peStatus = ProjectionStatus::eSuccess;
                }
                return stResult;
            }

            dT             = dTNext;
            dScaleLatitude = stCandidate.dLatitude;
        }

        if (!bHaveEstimate)
        {
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::eRayPointsAway;
            }
            return std::nullopt;
        }

        // Best effort answer from the last accepted ray parameter.
        geoops::GroundOffset stOffset = GroundIntersection::OffsetAtParameter(cvDirectionENU, dT);

        DEMRefinementResult stResult;
        stResult.stPoint              = geoops::OffsetToGeographic(stCamera, stOffset, dScaleLatitude);
        stResult.dGroundElevationAMSL = stPose.dAltitudeAMSL + dT * dDz;
        stResult.dRangeMeters         = std::hypot(stOffset.dEastMeters, stOffset.dNorthMeters);
        stResult.bConverged           = false;
        stResult.nIterations          = nIterations;

        LOG_WARNING(logging::g_qSharedLogger,
                    "DEMRefiner: Terrain intersection did not converge after {} iterations. Returning best effort point ({:.7f}, {:.7f}).",
                    nIterations,
                    stResult.stPoint.dLatitude,
                    stResult.stPoint.dLongitude);

        if (peStatus != nullptr)
        {
            *peStatus = ProjectionStatus::eSuccess;
        }
        return stResult;
    }
}    // namespace DEMRefiner

#endif    // DEM_REFINER_HPP
