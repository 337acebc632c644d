/******************************************************************************
 * @brief Atomic functional library for turning whatever image metadata offers
 *      (direct calibration, lens focal length, camera model, field of view)
 *      into complete camera intrinsics.
 *
 * @file IntrinsicsResolver.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef INTRINSICS_RESOLVER_HPP
#define INTRINSICS_RESOLVER_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/vision/CameraModels.hpp"
#include "./CameraModel.hpp"

/// \cond
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// \endcond

namespace IntrinsicsResolver
{
    /******************************************************************************
     * @brief Where the resolved focal length came from.
     ******************************************************************************/
    enum class IntrinsicsSource
    {
        eDirect,               // fx (and optionally fy) given outright.
        eFocalLength,          // Lens focal length in mm and sensor width.
        eFocalLength35mm,      // 35mm equivalent focal length.
        eCalibrationPreset,    // Stored calibration for the camera model.
        eFieldOfView           // Horizontal field of view (given or default).
    };

    /******************************************************************************
     * @brief Everything metadata extraction may know about the camera. Any field
     *      except the image size may be missing.
     ******************************************************************************/
    struct IntrinsicsHints
    {
        public:
            int nImageWidth  = 0;
            int nImageHeight = 0;
            std::optional<double> dFx;
            std::optional<double> dFy;
            std::optional<double> dCx;
            std::optional<double> dCy;
            std::optional<double> dK1;
            std::optional<double> dK2;
            std::optional<double> dK3;
            std::optional<double> dP1;
            std::optional<double> dP2;
            std::optional<double> dFocalLengthMM;
            std::optional<double> dFocalLength35mm;
            std::optional<double> dSensorWidthMM;
            std::optional<double> dHorizontalFOVDeg;
            std::string szCameraModel = "";
    };

    inline std::string IntrinsicsSourceToString(const IntrinsicsSource eSource)
    {
        switch (eSource)
        {
            case IntrinsicsSource::eDirect: return "DIRECT";
            case IntrinsicsSource::eFocalLength: return "FOCAL_LENGTH";
            case IntrinsicsSource::eFocalLength35mm: return "FOCAL_LENGTH_35MM";
            case IntrinsicsSource::eCalibrationPreset: return "CALIBRATION_PRESET";
            case IntrinsicsSource::eFieldOfView: return "FIELD_OF_VIEW";
            default: return "UNKNOWN";
        }
    }

    /******************************************************************************
     * @brief Uppercase copy with surrounding whitespace removed, for model lookups.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::string NormalizeModelName(const std::string& szCameraModel)
    {
        const size_t nFirst = szCameraModel.find_first_not_of(" \t\r\n");
        if (nFirst == std::string::npos)
        {
            return "";
        }
        const size_t nLast = szCameraModel.find_last_not_of(" \t\r\n");

        std::string szNormalized = szCameraModel.substr(nFirst, nLast - nFirst + 1);
        std::transform(szNormalized.begin(), szNormalized.end(), szNormalized.begin(), [](unsigned char ucChar) { return static_cast<char>(std::toupper(ucChar)); });
        return szNormalized;
    }

    /******************************************************************************
     * @brief Physical sensor width for known camera models.
     *
     * @param szCameraModel - Camera model string from metadata.
     * @return double - Sensor width in mm, constants::DEFAULT_SENSOR_WIDTH_MM when unknown.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline double LookupSensorWidthMM(const std::string& szCameraModel)
    {
        // APS-C Sony bodies.
        static const std::vector<std::pair<std::string, double>> vSensorWidths = {{"ILCE-5100", 23.5},
                                                                                  {"ILCE-6000", 23.5},
                                                                                  {"ILCE-6100", 23.5},
                                                                                  {"ILCE-6300", 23.5},
                                                                                  {"ILCE-6400", 23.5}};

        const std::string szModel = NormalizeModelName(szCameraModel);
        for (const std::pair<std::string, double>& stEntry : vSensorWidths)
        {
            if (szModel.find(stEntry.first) != std::string::npos)
            {
                return stEntry.second;
            }
        }

        return constants::DEFAULT_SENSOR_WIDTH_MM;
    }

    /******************************************************************************
     * @brief Stored lab calibration for known camera models, at the resolution
     *      it was measured at.
     *
     * @param szCameraModel - Camera model string from metadata.
     * @return std::optional<CameraIntrinsics> - The calibration, or nullopt if the model has none.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<CameraIntrinsics> LookupCalibrationPreset(const std::string& szCameraModel)
    {
        if (NormalizeModelName(szCameraModel).find("ILCE-5100") == std::string::npos)
        {
            return std::nullopt;
        }

        CameraIntrinsics stPreset;
        stPreset.nImageWidth  = 6000;
        stPreset.nImageHeight = 4000;
        stPreset.dFx          = 6398.08616;
        stPreset.dFy          = 6432.14696;
        stPreset.dCx          = 2959.871024;
        stPreset.dCy          = 1963.453368;
        stPreset.dK1          = -0.0232568293;
        stPreset.dK2          = -0.403632348;
        stPreset.dP1          = 0.00123362391;
        stPreset.dP2          = -0.00155940272;
        stPreset.dK3          = 2.41647816;
        return stPreset;
    }

    /******************************************************************************
     * @brief Build complete intrinsics from partial metadata. The focal length
     *      comes from the first available of: direct fx, lens focal length, 35mm
     *      equivalent focal length, the camera model's calibration preset, and the
     *      horizontal field of view (constants::DEFAULT_HORIZONTAL_FOV when absent).
     *      Focal lengths derived from a lens use square pixels. The principal
     *      point defaults to the image centre. Distortion coefficients in the hints
     *      override the preset's.
     *
     * @param stHints - Metadata hints. Image size must be positive.
     * @param peSource - (Optional) Receives where the focal length came from.
     * @return CameraIntrinsics - Resolved intrinsics at the hinted image size.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline CameraIntrinsics ResolveIntrinsics(const IntrinsicsHints& stHints, IntrinsicsSource* peSource = nullptr)
    {
        auto fnPositive = [](const std::optional<double>& dValue) { return dValue.has_value() && std::isfinite(*dValue) && *dValue > 0.0; };

        CameraIntrinsics stIntrinsics;
        stIntrinsics.nImageWidth  = stHints.nImageWidth;
        stIntrinsics.nImageHeight = stHints.nImageHeight;
        stIntrinsics.dCx          = stHints.nImageWidth / 2.0;
        stIntrinsics.dCy          = stHints.nImageHeight / 2.0;

        const double dSensorWidthMM = fnPositive(stHints.dSensorWidthMM) ? *stHints.dSensorWidthMM : LookupSensorWidthMM(stHints.szCameraModel);
        IntrinsicsSource eSource    = IntrinsicsSource::eFieldOfView;

        const std::optional<CameraIntrinsics> stPreset = LookupCalibrationPreset(stHints.szCameraModel);
        if (fnPositive(stHints.dFx))
        {
            eSource          = IntrinsicsSource::eDirect;
            stIntrinsics.dFx = *stHints.dFx;
            stIntrinsics.dFy = fnPositive(stHints.dFy) ? *stHints.dFy : *stHints.dFx;
        }
        else if (fnPositive(stHints.dFocalLengthMM))
        {
            eSource          = IntrinsicsSource::eFocalLength;
            stIntrinsics.dFx = *stHints.dFocalLengthMM * stHints.nImageWidth / dSensorWidthMM;
            stIntrinsics.dFy = stIntrinsics.dFx;
        }
        else if (fnPositive(stHints.dFocalLength35mm))
        {
            // Crop factor relative to a 36 mm wide full frame sensor.
            const double dCropFactor = 36.0 / dSensorWidthMM;
            eSource                  = IntrinsicsSource::eFocalLength35mm;
            stIntrinsics.dFx         = (*stHints.dFocalLength35mm / dCropFactor) * stHints.nImageWidth / dSensorWidthMM;
            stIntrinsics.dFy         = stIntrinsics.dFx;
        }
        else if (stPreset.has_value())
        {
            eSource      = IntrinsicsSource::eCalibrationPreset;
            stIntrinsics = CameraModel::ScaleIntrinsics(*stPreset, stHints.nImageWidth, stHints.nImageHeight);
        }
        else
        {
            const double dFOV = fnPositive(stHints.dHorizontalFOVDeg) ? *stHints.dHorizontalFOVDeg : constants::DEFAULT_HORIZONTAL_FOV;
            stIntrinsics.dFx  = CameraModel::FocalLengthFromFOV(stHints.nImageWidth, dFOV);
            stIntrinsics.dFy  = stIntrinsics.dFx;
        }

        // Explicit principal point and distortion always win.
        if (stHints.dCx.has_value())
        {
            stIntrinsics.dCx = *stHints.dCx;
        }
        if (stHints.dCy.has_value())
        {
            stIntrinsics.dCy = *stHints.dCy;
        }
        const bool bHintedDistortion = stHints.dK1.has_value() || stHints.dK2.has_value() || stHints.dK3.has_value() || stHints.dP1.has_value() || stHints.dP2.has_value();
        if (bHintedDistortion)
        {
            stIntrinsics.dK1 = stHints.dK1.value_or(0.0);
            stIntrinsics.dK2 = stHints.dK2.value_or(0.0);
            stIntrinsics.dK3 = stHints.dK3.value_or(0.0);
            stIntrinsics.dP1 = stHints.dP1.value_or(0.0);
            stIntrinsics.dP2 = stHints.dP2.value_or(0.0);
        }

        LOG_DEBUG(logging::g_qSharedLogger,
                  "IntrinsicsResolver: {}x{} fx={:.2f} fy={:.2f} cx={:.2f} cy={:.2f} from {}.",
                  stIntrinsics.nImageWidth,
                  stIntrinsics.nImageHeight,
                  stIntrinsics.dFx,
                  stIntrinsics.dFy,
                  stIntrinsics.dCx,
                  stIntrinsics.dCy,
                  IntrinsicsSourceToString(eSource));

        if (peSource != nullptr)
        {
            *peSource = eSource;
        }
        return stIntrinsics;
    }
}    // namespace IntrinsicsResolver

#endif    // INTRINSICS_RESOLVER_HPP
