/******************************************************************************
 * @brief Small time helpers used for naming log folders and timing projections.
 *
 * @file TimeOperations.hpp
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef TIME_OPERATIONS_HPP
#define TIME_OPERATIONS_HPP

/// \cond
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions related to operations on time and
 *        date related data types.
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 ******************************************************************************/
namespace timeops
{
    /******************************************************************************
     * @brief Formats the current local time.
     *
     * @param szFormat - std::put_time format string.
     * @return std::string - The formatted time. Used as the per run log folder name.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::string GetTimestamp(const std::string& szFormat = "%Y%m%d-%H%M%S")
    {
        std::time_t tTimeNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        // localtime_r is the thread-safe variant.
        std::tm stLocalTime{};
        localtime_r(&tTimeNow, &stLocalTime);

        std::ostringstream ssTimestamp;
        ssTimestamp << std::put_time(&stLocalTime, szFormat.c_str());
        return ssTimestamp.str();
    }

    /******************************************************************************
     * @brief Milliseconds elapsed on the steady clock since tmStart.
     *
     * @param tmStart - Time point captured with std::chrono::steady_clock::now().
     * @return double - Elapsed time in fractional milliseconds.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    inline double GetElapsedMilliseconds(const std::chrono::steady_clock::time_point& tmStart)
    {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - tmStart).count();
    }
}    // namespace timeops

#endif    // TIME_OPERATIONS_HPP
