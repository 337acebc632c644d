/******************************************************************************
 * @brief Defines constants for RoveSoGeo.
 *
 * @file Constants.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Constants.h"

/******************************************************************************
 * @brief Namespace containing all constants for RoveSoGeo.
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
    const std::string LOGGING_OUTPUT_PATH_ABSOLUTE = "../geo_logs/";              // The absolute path to write output logging and result files to.
    const quill::LogLevel CONSOLE_MIN_LEVEL        = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the console log stream.
    const quill::LogLevel FILE_MIN_LEVEL           = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the file log streams.
    const quill::LogLevel CONSOLE_DEFAULT_LEVEL    = quill::LogLevel::Info;       // The default logging level for console stream.
    const quill::LogLevel FILE_DEFAULT_LEVEL       = quill::LogLevel::TraceL3;    // The default logging level for file streams.

    // Logging color constants.
    const std::string szTraceL3Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL2Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL1Color   = "\033[30m";           // Standard Grey
    const std::string szDebugColor     = "\033[36m";           // Standard Cyan
    const std::string szInfoColor      = "\033[32m";           // Standard Green
    const std::string szNoticeColor    = "\033[97m\033[1m";    // Bright Bold White
    const std::string szWarningColor   = "\033[93m\033[1m";    // Bright Bold Yellow
    const std::string szErrorColor     = "\033[91m\033[1m";    // Bright Bold Red
    const std::string szCriticalColor  = "\033[95m\033[1m";    // Bright Bold Magenta
    const std::string szBacktraceColor = "\033[30m";           // Standard Grey

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Camera Model Constants.
    ///////////////////////////////////////////////////////////////////////////

    const int UNDISTORT_ITERATIONS       = 5;        // Fixed number of fixed-point iterations used to invert the lens distortion.
    const double DEFAULT_HORIZONTAL_FOV  = 54.55;    // Horizontal FOV (degrees) assumed when metadata gives nothing better.
    const double FOV_MIN_HALF_ANGLE_TAN  = 1e-9;     // Lower clamp on tan(fov/2) when deriving a focal length.
    const double DEFAULT_SENSOR_WIDTH_MM = 36.0;     // Full frame sensor width used for unknown camera models.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Ground Intersection Constants.
    ///////////////////////////////////////////////////////////////////////////

    const double RAY_PARALLEL_EPSILON          = 1e-6;    // Rays with a smaller Up component never reach the ground.
    const int DEM_REFINE_MAX_ITERATIONS        = 8;       // Iteration budget for the DEM refinement loop.
    const double DEM_REFINE_CONVERGENCE_METERS = 0.05;    // Accept the DEM intersection once the ray parameter moves less than this.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// DEM Sampler Constants.
    ///////////////////////////////////////////////////////////////////////////

    const double DEM_VERTICAL_DATUM_OFFSET           = 0.0;                                 // Meters added to every DEM sample. Calibrate per deployment.
    const std::chrono::milliseconds DEM_READ_TIMEOUT = std::chrono::milliseconds(2000);    // Max wait for a single raster window read.
    const int DEM_READ_MAX_ATTEMPTS                  = 3;                                   // Number of times a timed out raster read is re-issued.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Pose Auto-Corrector Constants.
    ///////////////////////////////////////////////////////////////////////////

    const double AUTOFIX_HORIZON_WEIGHT   = 50.0;    // Weight of the near-horizontal penalty in the pose score.
    const double AUTOFIX_VERTICAL_EPSILON = 1e-6;    // Keeps the near-horizontal penalty finite.
    const int AUTOFIX_MAX_ATTEMPTS        = 3;       // Searches rerun when the pose is edited mid search.

    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants
