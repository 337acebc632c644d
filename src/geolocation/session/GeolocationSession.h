/******************************************************************************
 * @brief Defines the GeolocationSession class.
 *
 * @file GeolocationSession.h
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GEOLOCATION_SESSION_H
#define GEOLOCATION_SESSION_H

#include "../../util/geo/ElevationModels.hpp"
#include "../../util/vision/CameraModels.hpp"
#include "../algorithms/DEMSampler.hpp"
#include "../algorithms/IntrinsicsResolver.hpp"
#include "../algorithms/PoseAutoCorrector.hpp"

/// \cond
#include <array>
#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Everything a scenario file describes.
 ******************************************************************************/
struct GeolocationScenario
{
    public:
        CameraPose stPose;
        double dGroundElevationAMSL = 0.0;
        IntrinsicsResolver::IntrinsicsHints stHints;
        std::string szDEMPath = "";    // Resolved against the scenario file's folder.
        bool bAutoSampleDEM   = false;
        std::optional<double> dVerticalOffset;
        std::vector<cv::Point2d> vPixels;
};

/******************************************************************************
 * @brief Holds the operator editable state for one photograph (pose, ground
 *  elevation, intrinsics, DEM and the DEM toggle) and answers projection
 *  requests against it. Every projection reads a snapshot taken under a shared
 *  lock, so projections may run from several threads while the operator edits
 *  the pose. Pose changes take the unique lock.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
class GeolocationSession
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        GeolocationSession(const CameraPose& stPose,
                           const CameraIntrinsics& stIntrinsics,
                           const double dGroundElevationAMSL,
                           std::shared_ptr<const DigitalElevationModel> pDEM = nullptr,
                           const bool bAutoSampleDEM                         = false);
        static GeolocationScenario LoadScenario(const std::string& szScenarioPath);
        static std::unique_ptr<GeolocationSession> FromScenario(const GeolocationScenario& stScenario);

        std::optional<ProjectionResult> ProjectPixel(const cv::Point2d& cvPixel, ProjectionStatus* peStatus = nullptr) const;
        std::array<std::optional<ProjectionResult>, 4> ComputeFootprint() const;
        std::optional<PoseAutoCorrector::PoseCorrection> AutoFixPose(ProjectionStatus* peStatus = nullptr);
        std::optional<double> RelinkGroundWithDEM(DEMSampler::DEMSampleStatus* peStatus = nullptr);
        bool ToggleAutoSampleDEM();

        /////////////////////////////////////////
        // Setters.
        /////////////////////////////////////////

        void SetPose(const CameraPose& stPose);
        void SetGroundElevationAMSL(const double dGroundElevationAMSL);
        void SetSamplerConfig(const DEMSampler::DEMSamplerConfig& stSamplerConfig);

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        CameraPose GetPose() const;
        CameraIntrinsics GetIntrinsics() const;
        double GetGroundElevationAMSL() const;
        double GetAltitudeAboveGround() const;
        bool GetAutoSampleDEM() const;
        bool HasDEM() const;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        CameraPose m_stPose;
        CameraIntrinsics m_stIntrinsics;
        double m_dGroundElevationAMSL;
        std::shared_ptr<const DigitalElevationModel> m_pDEM;
        bool m_bAutoSampleDEM;
        DEMSampler::DEMSamplerConfig m_stSamplerConfig;
        mutable std::shared_mutex m_muStateMutex;

        /////////////////////////////////////////
        // Declare private methods.
        /////////////////////////////////////////

        GroundReference GetGroundReference() const;
};
#endif
