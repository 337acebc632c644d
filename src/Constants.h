/******************************************************************************
 * @brief Declares constants for RoveSoGeo.
 *
 * @file Constants.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GEO_CONSTANTS_H
#define GEO_CONSTANTS_H

/// \cond
#include <chrono>
#include <quill/core/LogLevel.h>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Namespace containing all constants for RoveSoGeo. Tunables for the
 *      projection pipeline live here so every algorithm reads the same values.
 *
 *
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace constants
{
    ///////////////////////////////////////////////////////////////////////////
    //// General Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Logging constants.
    extern const std::string LOGGING_OUTPUT_PATH_ABSOLUTE;
    extern const quill::LogLevel CONSOLE_MIN_LEVEL;
    extern const quill::LogLevel FILE_MIN_LEVEL;
    extern const quill::LogLevel CONSOLE_DEFAULT_LEVEL;
    extern const quill::LogLevel FILE_DEFAULT_LEVEL;

    // Logging color constants.
    extern const std::string szTraceL3Color;
    extern const std::string szTraceL2Color;
    extern const std::string szTraceL1Color;
    extern const std::string szDebugColor;
    extern const std::string szInfoColor;
    extern const std::string szNoticeColor;
    extern const std::string szWarningColor;
    extern const std::string szErrorColor;
    extern const std::string szCriticalColor;
    extern const std::string szBacktraceColor;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Camera Model Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const int UNDISTORT_ITERATIONS;
    extern const double DEFAULT_HORIZONTAL_FOV;
    extern const double FOV_MIN_HALF_ANGLE_TAN;
    extern const double DEFAULT_SENSOR_WIDTH_MM;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Ground Intersection Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const double RAY_PARALLEL_EPSILON;
    extern const int DEM_REFINE_MAX_ITERATIONS;
    extern const double DEM_REFINE_CONVERGENCE_METERS;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// DEM Sampler Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const double DEM_VERTICAL_DATUM_OFFSET;
    extern const std::chrono::milliseconds DEM_READ_TIMEOUT;
    extern const int DEM_READ_MAX_ATTEMPTS;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Pose Auto-Corrector Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const double AUTOFIX_HORIZON_WEIGHT;
    extern const double AUTOFIX_VERTICAL_EPSILON;
    extern const int AUTOFIX_MAX_ATTEMPTS;
    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants

#endif    // GEO_CONSTANTS_H
