/******************************************************************************
 * @brief Atomic functional library for resolving sign ambiguity in metadata
 *      yaw, pitch and roll by scoring every sign combination.
 *
 * @file PoseAutoCorrector.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef POSE_AUTO_CORRECTOR_HPP
#define POSE_AUTO_CORRECTOR_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/geo/ElevationModels.hpp"
#include "../../util/vision/CameraModels.hpp"
#include "./Orientation.hpp"
#include "./PixelToGround.hpp"

/// \cond
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <opencv2/core.hpp>
#include <optional>

/// \endcond

namespace PoseAutoCorrector
{
    // Projects the image centre for a candidate pose.
    using ProjectionFunction = std::function<std::optional<ProjectionResult>(const CameraPose&)>;

    /******************************************************************************
     * @brief The winning sign combination.
     ******************************************************************************/
    struct PoseCorrection
    {
        public:
            double dYaw   = 0.0;
            double dPitch = 0.0;
            double dRoll  = 0.0;
            double dScore = std::numeric_limits<double>::infinity();
            ProjectionResult stCenterProjection;
    };

    /******************************************************************************
     * @brief Score a candidate attitude. Lower is better. Long ranges and
     *      near-horizontal optical axes are both penalized.
     *
     *      score = max(1, range) + weight / (|Up component of the optical axis| + eps)
     *
     * @param stPose - Candidate pose.
     * @param stProjection - Projection of the image centre under that pose.
     * @return double - The score, +infinity when there is no ground intersection.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline double ScoreCandidate(const CameraPose& stPose, const std::optional<ProjectionResult>& stProjection)
    {
        if (!stProjection.has_value() || !std::isfinite(stProjection->dSlantRangeMeters))
        {
            return std::numeric_limits<double>::infinity();
        }

        // Up component of R * (0, 0, 1).
        cv::Mat cvRotation    = Orientation::ComposeRotation(stPose.dYaw, stPose.dPitch, stPose.dRoll);
        const double dAxisUp  = std::abs(cvRotation.at<double>(2, 2));

        return std::max(1.0, stProjection->dSlantRangeMeters) + constants::AUTOFIX_HORIZON_WEIGHT / (dAxisUp + constants::AUTOFIX_VERTICAL_EPSILON);
    }

    /******************************************************************************
     * @brief Try all eight sign combinations of yaw, pitch and roll and keep the
     *      lowest score. Candidates are enumerated yaw, then pitch, then roll,
     *      positive sign first, and ties keep the earliest candidate. The input
     *      pose is taken by value and never modified.
     *
     * @param stPose - Pose with possibly wrong angle signs.
     * @param fnProject - Projection of the image centre for a candidate pose.
     * @param peStatus - (Optional) Receives eSuccess or ePoseAmbiguous.
     * @return std::optional<PoseCorrection> - Best attitude, or nullopt if no candidate reaches the ground.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<PoseCorrection> AutoFixPose(const CameraPose stPose, const ProjectionFunction& fnProject, ProjectionStatus* peStatus = nullptr)
    {
        PoseCorrection stBest;
        bool bFound = false;

        for (const double dYawSign : {1.0, -1.0})
        {
            for (const double dPitchSign : {1.0, -1.0})
            {
                for (const double dRollSign : {1.0, -1.0})
                {
                    CameraPose stCandidate = stPose;
                    stCandidate.dYaw       = dYawSign * stPose.dYaw;
                    stCandidate.dPitch     = dPitchSign * stPose.dPitch;
                    stCandidate.dRoll      = dRollSign * stPose.dRoll;

                    std::optional<ProjectionResult> stProjection = fnProject(stCandidate);
                    const double dScore                          = ScoreCandidate(stCandidate, stProjection);

                    LOG_TRACEL2(logging::g_qSharedLogger,
                                "PoseAutoCorrector: yaw {:.2f} pitch {:.2f} roll {:.2f} -> score {:.3f}",
                                stCandidate.dYaw,
                                stCandidate.dPitch,
                                stCandidate.dRoll,
                                dScore);

                    if (std::isfinite(dScore) && dScore < stBest.dScore)
                    {
                        stBest.dYaw               = stCandidate.dYaw;
                        stBest.dPitch             = stCandidate.dPitch;
                        stBest.dRoll              = stCandidate.dRoll;
                        stBest.dScore             = dScore;
                        stBest.stCenterProjection = *stProjection;
                        bFound                    = true;
                    }
                }
            }
        }

        if (!bFound)
        {
            LOG_WARNING(logging::g_qSharedLogger, "PoseAutoCorrector: No valid ground intersection for any sign combination. Pose left unchanged.");
            if (peStatus != nullptr)
            {
                *peStatus = ProjectionStatus::ePoseAmbiguous;
            }
            return std::nullopt;
        }

        if (peStatus != nullptr)
        {
            *peStatus = ProjectionStatus::eSuccess;
        }
        return stBest;
    }

    /******************************************************************************
     * @brief AutoFixPose scoring the projection of the image centre pixel onto
     *      the given ground model.
     *
     * @param stPose - Pose with possibly wrong angle signs.
     * @param stIntrinsics - Resolved intrinsics.
     * @param stGround - Flat plane or DEM ground.
     * @param peStatus - (Optional) Receives eSuccess or ePoseAmbiguous.
     * @return std::optional<PoseCorrection> - Best attitude, or nullopt.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<PoseCorrection> AutoFixPose(const CameraPose& stPose,
                                                     const CameraIntrinsics& stIntrinsics,
                                                     const GroundReference& stGround,
                                                     ProjectionStatus* peStatus = nullptr)
    {
        const cv::Point2d cvCenter(stIntrinsics.nImageWidth / 2.0, stIntrinsics.nImageHeight / 2.0);

        return AutoFixPose(
            stPose,
            [&](const CameraPose& stCandidate) { return PixelToGround::ProjectPixel(cvCenter, stCandidate, stIntrinsics, stGround); },
            peStatus);
    }
}    // namespace PoseAutoCorrector

#endif    // POSE_AUTO_CORRECTOR_HPP
