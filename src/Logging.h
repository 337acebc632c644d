/******************************************************************************
 * @brief Declares the loggers and custom quill sinks used by RoveSoGeo.
 *
 *        Note: The logger pointers are defined in Logging.cpp. Keeping the
 *              declarations in their own header lets the header-only algorithm
 *              libraries log without pulling in the rest of the program.
 *
 * @file Logging.h
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

/// \cond
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include "quill/backend/PatternFormatter.h"
#include "quill/core/Attributes.h"
#include "quill/core/Common.h"
#include "quill/core/Filesystem.h"

#include "quill/sinks/ConsoleSink.h"
#include "quill/sinks/RotatingFileSink.h"

#include <filesystem>
#include <string>

/// \endcond

#include "./Constants.h"
#include "./util/TimeOperations.hpp"

#ifndef GEO_LOGGING_H
#define GEO_LOGGING_H

/******************************************************************************
 * @brief Logging Levels:
 *
 *        Priority > Level     > Description
 *        Level 1  > TRACE_L3  > Per iteration values of the DEM refiner.
 *        Level 2  > TRACE_L2  > Per candidate scores of the pose auto-corrector.
 *        Level 3  > TRACE_L1  > Raster window reads.
 *        Level 4  > DEBUG     > Intermediate rays, offsets and resolved intrinsics.
 *        Level 5  > INFO      > Projection results, scenario loads, pose corrections.
 *        Level 6  > WARNING   > Degraded output (fallback ground, missing intrinsics, nodata).
 *        Level 7  > ERROR     > A request could not be answered (ray misses ground, bad DEM).
 *        Level 8  > CRITICAL  > Program cannot continue.
 *
 *        Note: When a level is set only messages of that level or higher priority
 *              are written to the matching sink.
 *
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 ******************************************************************************/
namespace logging
{
    //////////////////////////////////////////
    // Declare namespace external variables and objects.
    /////////////////////////////////////////

    extern quill::Logger* g_qFileLogger;
    extern quill::Logger* g_qConsoleLogger;
    extern quill::Logger* g_qSharedLogger;
    extern quill::Logger* g_qResultsLogger;

    extern quill::LogLevel g_eConsoleLogLevel;
    extern quill::LogLevel g_eFileLogLevel;

    extern std::string g_szProgramStartTimeString;
    extern std::string g_szLoggingOutputPath;

    /////////////////////////////////////////
    // Declare namespace methods.
    /////////////////////////////////////////

    void InitializeLoggers(std::string szLoggingOutputPath, std::string szProgramTimeLogsDir = timeops::GetTimestamp());
    void SetConsoleLogLevel(const quill::LogLevel eLogLevel);
    void FlushLoggers();
    bool ResultsHeaderNeeded(const std::filesystem::path& szResultsPath);

    /////////////////////////////////////////
    // Define namespace file filters.
    /////////////////////////////////////////

    /******************************************************************************
     * @brief Per sink level filter. Several sinks share the same logger so the
     *      logger level alone can't keep TraceL3 refiner chatter out of the console.
     *
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    class LoggingFilter : public quill::Filter
    {
        private:
            // Declare private member variables.
            quill::LogLevel m_eMinLogLevel;

        public:
            /******************************************************************************
             * @brief Construct a new Logging Filter object.
             *
             * @param szFilterBaseType - Name given to the filter inside quill.
             * @param eMinLogLevel - The lowest level that passes the filter.
             *
             * @author clayjay3 (claytonraycowen@gmail.com)
             * @date 2025-12-28
             ******************************************************************************/
            LoggingFilter(const std::string szFilterBaseType, const quill::LogLevel eMinLogLevel) : quill::Filter(szFilterBaseType)
            {
                // Set member variables.
                m_eMinLogLevel = eMinLogLevel;
            };

            /******************************************************************************
             * @brief Called by the quill backend for every statement routed to a sink.
             *
             * @return QUILL_NODISCARD - Whether or not the statement is written.
             *
             * @author clayjay3 (claytonraycowen@gmail.com)
             * @date 2025-12-28
             ******************************************************************************/
            QUILL_NODISCARD bool filter(const quill::MacroMetadata* /*qLogMetadata*/,
                                        uint64_t /*unLogTimestamp*/,
                                        std::string_view /*szThreadID*/,
                                        std::string_view /*szThreadName*/,
                                        std::string_view /*szLoggerName*/,
                                        quill::LogLevel qLogLevel,
                                        std::string_view /*szLogMessage*/,
                                        std::string_view /*szLogStatement*/) noexcept override
            {
                return qLogLevel >= m_eMinLogLevel;
            }
    };

    /////////////////////////////////////////
    // Define namespace custom sinks
    /////////////////////////////////////////

    /******************************************************************************
     * @brief Console sink that formats with its own pattern and drops anything
     *      below g_eConsoleLogLevel. The level can be changed at runtime from the
     *      operator key loop without touching the file sinks.
     *
     * @see quill::ConsoleSink
     * @see quill::PatternFormatter
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    class GeoConsoleSink : public quill::ConsoleSink
    {
        public:
            /******************************************************************************
             * @brief Constructs a new GeoConsoleSink object.
             *
             * @param qColors - Per level console colors.
             * @param qColorMode - Whether colors are forced, disabled or detected.
             * @param szFormatPattern - The pattern used to format each statement.
             * @param szTimeFormat - The timestamp format.
             * @param qTimestampTimezone - Timezone of the timestamp.
             * @param szStream - Either "stdout" or "stderr".
             *
             * @author Eli Byrd (edbgkk@mst.edu)
             * @date 2025-12-28
             ******************************************************************************/
            GeoConsoleSink(const quill::ConsoleSinkConfig::Colours& qColors,
                           const quill::ConsoleSinkConfig::ColourMode& qColorMode,
                           const std::string& szFormatPattern,
                           const std::string& szTimeFormat,
                           quill::Timezone qTimestampTimezone = quill::Timezone::LocalTime,
                           const std::string& szStream        = "stdout") :
                quill::ConsoleSink(
                    [&]
                    {
                        quill::ConsoleSinkConfig qConsoleConfig;
                        qConsoleConfig.set_stream(szStream);
                        qConsoleConfig.set_colour_mode(qColorMode);
                        qConsoleConfig.set_colours(qColors);
                        qConsoleConfig.set_override_pattern_formatter_options(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone));
                        return qConsoleConfig;
                    }()),
                m_qFormatter(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone))
            {}

            void write_log(const quill::MacroMetadata* qLogMetadata,
                           uint64_t unLogTimestamp,
                           std::string_view szThreadID,
                           std::string_view szThreadName,
                           const std::string& szProcessID,
                           std::string_view szLoggerName,
                           quill::LogLevel qLogLevel,
                           std::string_view szLogLevelDescription,
                           std::string_view szLogLevelShortCode,
                           const std::vector<std::pair<std::string, std::string>>* vNamedArgs,
                           std::string_view szLogMessage,
                           std::string_view) override;

        private:
            quill::PatternFormatter m_qFormatter;
    };

    /******************************************************************************
     * @brief Rotating file sink used for the .log and .csv program logs as well
     *      as the projection results file. Statements below g_eFileLogLevel are
     *      dropped unless bIgnoreLevel is set, which the results file uses so every
     *      projection row lands no matter how quiet the program logs are.
     *
     * @see quill::RotatingFileSink
     * @see quill::PatternFormatter
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    class GeoRotatingFileSink : public quill::RotatingFileSink
    {
        public:
            /******************************************************************************
             * @brief Constructs a new GeoRotatingFileSink object.
             *
             * @param qFilename - The path to the output file.
             * @param qConfig - Rotation configuration.
             * @param szFormatPattern - The pattern used to format each statement.
             * @param szTimeFormat - The timestamp format.
             * @param bIgnoreLevel - Write every statement regardless of g_eFileLogLevel.
             * @param qTimestampTimezone - Timezone of the timestamp.
             * @param qFileEventNotifier - Optional file event callbacks.
             *
             * @author Eli Byrd (edbgkk@mst.edu)
             * @date 2025-12-28
             ******************************************************************************/
            GeoRotatingFileSink(const quill::fs::path& qFilename,
                                const quill::RotatingFileSinkConfig& qConfig,
                                const std::string& szFormatPattern,
                                const std::string& szTimeFormat,
                                const bool bIgnoreLevel                     = false,
                                quill::Timezone qTimestampTimezone          = quill::Timezone::LocalTime,
                                quill::FileEventNotifier qFileEventNotifier = quill::FileEventNotifier{}) :
                quill::RotatingFileSink(qFilename, qConfig, qFileEventNotifier),
                m_qFormatter(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone)),
                m_bIgnoreLevel(bIgnoreLevel)
            {}

            void write_log(const quill::MacroMetadata* qLogMetadata,
                           uint64_t unLogTimestamp,
                           std::string_view szThreadID,
                           std::string_view szThreadName,
                           const std::string& szProcessID,
                           std::string_view szLoggerName,
                           quill::LogLevel qLogLevel,
                           std::string_view szLogLevelDescription,
                           std::string_view szLogLevelShortCode,
                           const std::vector<std::pair<std::string, std::string>>* vNamedArgs,
                           std::string_view szLogMessage,
                           std::string_view) override;

        private:
            quill::PatternFormatter m_qFormatter;
            bool m_bIgnoreLevel;
    };
}    // namespace logging
#endif    // GEO_LOGGING_H
