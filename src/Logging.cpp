/******************************************************************************
 * @brief Sets up the loggers and sinks used project wide.
 *
 * @file Logging.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "Logging.h"

/// \cond
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

/// \endcond

/******************************************************************************
 * @brief Namespace containing the loggers and logging helpers used project wide.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace logging
{
    /////////////////////////////////////////
    // Forward declarations for namespace variables and objects.
    /////////////////////////////////////////
    quill::Logger* g_qFileLogger;
    quill::Logger* g_qConsoleLogger;
    quill::Logger* g_qSharedLogger;
    quill::Logger* g_qResultsLogger;

    quill::LogLevel g_eConsoleLogLevel;
    quill::LogLevel g_eFileLogLevel;

    std::string g_szProgramStartTimeString;
    std::string g_szLoggingOutputPath;

    /******************************************************************************
     * @brief Builds every sink and logger. Program logs go to console_output.log
     *      and console_output.csv, projection rows go to projections.csv, all
     *      inside a folder named after the program start time.
     *
     * @param szLoggingOutputPath - Root folder for all program runs. Must end with a slash.
     * @param szProgramTimeLogsDir - Name of the folder for this run.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void InitializeLoggers(std::string szLoggingOutputPath, std::string szProgramTimeLogsDir)
    {
        // Store start time string in member variable.
        g_szProgramStartTimeString = szProgramTimeLogsDir;

        // Assemble filepath string.
        std::filesystem::path szFilePath = szLoggingOutputPath;
        szFilePath += g_szProgramStartTimeString + "/";
        g_szLoggingOutputPath = szFilePath;

        // Create the run folder. Reusing an existing one is fine, sinks append.
        std::error_code errCode;
        std::filesystem::create_directories(szFilePath, errCode);
        if (errCode)
        {
            std::cerr << "Unable to create the logging output directory " << szFilePath.string() << ": " << errCode.message() << std::endl;
        }

        std::filesystem::path szConsoleOutputPath = szFilePath / "console_output";
        std::filesystem::path szResultsOutputPath = szFilePath / "projections.csv";

        // Set Console Color Profile
        quill::ConsoleSinkConfig::Colours qColors;
        qColors.apply_default_colours();
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL3, constants::szTraceL3Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL2, constants::szTraceL2Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL1, constants::szTraceL1Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::Debug, constants::szDebugColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Info, constants::szInfoColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Notice, constants::szNoticeColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Warning, constants::szWarningColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Error, constants::szErrorColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Critical, constants::szCriticalColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Backtrace, constants::szBacktraceColor);

        // Create Patterns
        std::string szLogFilePattern   = "%(time) %(log_level) [%(thread_id)] [%(file_name):%(line_number)] %(message)";
        std::string szCSVFilePattern   = "%(time),\t%(log_level),\t[%(thread_id)],\t[%(file_name):%(line_number)],\t\"%(message)\"";
        std::string szConsolePattern   = "%(time) %(log_level:9) [%(thread_id)] [%(file_name):%(line_number)] %(message)";
        std::string szResultsPattern   = "%(message)";
        std::string szTimestampPattern = "%Y-%m-%d %H:%M:%S.%Qms";

        // Every file sink appends so a reused run folder keeps its history.
        auto fnAppendConfig = []()
        {
            quill::RotatingFileSinkConfig stConfig;
            stConfig.set_open_mode('a');
            return stConfig;
        };

        // Decide before the sink opens, and so creates, the file.
        const bool bWriteResultsHeader = ResultsHeaderNeeded(szResultsOutputPath);

        // Create Sinks
        std::shared_ptr<quill::Sink> qLogFileSink = quill::Frontend::create_or_get_sink<GeoRotatingFileSink>(std::filesystem::path(szConsoleOutputPath).replace_extension(".log"),
                                                                                                              fnAppendConfig(),
                                                                                                              szLogFilePattern,
                                                                                                              szTimestampPattern);
        std::shared_ptr<quill::Sink> qCSVFileSink = quill::Frontend::create_or_get_sink<GeoRotatingFileSink>(std::filesystem::path(szConsoleOutputPath).replace_extension(".csv"),
                                                                                                              fnAppendConfig(),
                                                                                                              szCSVFilePattern,
                                                                                                              szTimestampPattern);
        std::shared_ptr<quill::Sink> qResultsSink = quill::Frontend::create_or_get_sink<GeoRotatingFileSink>(szResultsOutputPath,
                                                                                                              fnAppendConfig(),
                                                                                                              szResultsPattern,
                                                                                                              szTimestampPattern,
                                                                                                              true);
        std::shared_ptr<quill::Sink> qConsoleSink =
            quill::Frontend::create_or_get_sink<GeoConsoleSink>("ConsoleSink",
                                                                qColors,
                                                                quill::ConsoleSinkConfig::ColourMode::Automatic,    // Detect if console supports colors.
                                                                szConsolePattern,
                                                                szTimestampPattern);

        // Hard floors under the adjustable levels.
        qLogFileSink->add_filter(std::make_unique<LoggingFilter>("LogFileFilter", constants::FILE_MIN_LEVEL));
        qCSVFileSink->add_filter(std::make_unique<LoggingFilter>("CSVFileFilter", constants::FILE_MIN_LEVEL));
        qConsoleSink->add_filter(std::make_unique<LoggingFilter>("ConsoleFilter", constants::CONSOLE_MIN_LEVEL));

        // Start Quill
        quill::BackendOptions qBackendConfig;
        quill::Backend::start(qBackendConfig);

        // Create Loggers
        g_qFileLogger    = quill::Frontend::create_or_get_logger("FILE_LOGGER", {qLogFileSink, qCSVFileSink});
        g_qConsoleLogger = quill::Frontend::create_or_get_logger("CONSOLE_LOGGER", {qConsoleSink});
        g_qSharedLogger  = quill::Frontend::create_or_get_logger("SHARED_LOGGER", {qLogFileSink, qCSVFileSink, qConsoleSink});
        g_qResultsLogger = quill::Frontend::create_or_get_logger("RESULTS_LOGGER", {qResultsSink});

        // Set Internal Logging Level Limiters
        g_eFileLogLevel    = constants::FILE_DEFAULT_LEVEL;
        g_eConsoleLogLevel = constants::CONSOLE_DEFAULT_LEVEL;

        // Set Base Logging Levels
        g_qFileLogger->set_log_level(quill::LogLevel::TraceL3);
        g_qConsoleLogger->set_log_level(quill::LogLevel::TraceL3);
        g_qSharedLogger->set_log_level(quill::LogLevel::TraceL3);
        g_qResultsLogger->set_log_level(quill::LogLevel::Info);

        // Enable Backtrace
        g_qFileLogger->init_backtrace(10, quill::LogLevel::Critical);
        g_qConsoleLogger->init_backtrace(10, quill::LogLevel::Critical);
        g_qSharedLogger->init_backtrace(10, quill::LogLevel::Critical);

        // Header row of the results file. A reused run folder already has one.
        if (bWriteResultsHeader)
        {
            LOG_INFO(g_qResultsLogger, "u,v,status,latitude,longitude,ground_elevation_m,range_m,ground_model,converged,iterations");
        }
    }

    /******************************************************************************
     * @brief Checks whether the results file still needs its header row.
     *
     * @param szResultsPath - Path of projections.csv.
     * @return true - The file is missing or empty.
     * @return false - The file already holds rows.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    bool ResultsHeaderNeeded(const std::filesystem::path& szResultsPath)
    {
        std::error_code errCode;
        const std::uintmax_t unFileSize = std::filesystem::file_size(szResultsPath, errCode);
        return errCode || unFileSize == 0;
    }

    /******************************************************************************
     * @brief Changes the console verbosity at runtime. File sinks are untouched.
     *
     * @param eLogLevel - The new console level.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void SetConsoleLogLevel(const quill::LogLevel eLogLevel)
    {
        g_eConsoleLogLevel = eLogLevel;
    }

    /******************************************************************************
     * @brief Blocks until every queued statement has been written out.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void FlushLoggers()
    {
        g_qFileLogger->flush_log();
        g_qConsoleLogger->flush_log();
        g_qSharedLogger->flush_log();
        g_qResultsLogger->flush_log();
    }

    /******************************************************************************
     * @brief Formats the statement with this sink's pattern and hands it to
     *      quill::ConsoleSink when the level passes g_eConsoleLogLevel. Invoked by
     *      the quill backend thread only.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void GeoConsoleSink::write_log(const quill::MacroMetadata* qLogMetadata,
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
                                   std::string_view)
    {
        // Check if logging level is permitted
        if (static_cast<int>(qLogLevel) < static_cast<int>(g_eConsoleLogLevel))
        {
            return;
        }

        std::string_view szFormattedLogMessage = m_qFormatter.format(unLogTimestamp,
                                                                     szThreadID,
                                                                     szThreadName,
                                                                     szProcessID,
                                                                     szLoggerName,
                                                                     szLogLevelDescription,
                                                                     szLogLevelShortCode,
                                                                     *qLogMetadata,
                                                                     vNamedArgs,
                                                                     szLogMessage);

        quill::ConsoleSink::write_log(qLogMetadata,
                                      unLogTimestamp,
                                      szThreadID,
                                      szThreadName,
                                      szProcessID,
                                      szLoggerName,
                                      qLogLevel,
                                      szLogLevelDescription,
                                      szLogLevelShortCode,
                                      vNamedArgs,
                                      szLogMessage,
                                      szFormattedLogMessage);
    }

    /******************************************************************************
     * @brief Formats the statement with this sink's pattern and hands it to
     *      quill::RotatingFileSink when the level passes g_eFileLogLevel, or always
     *      for sinks built with bIgnoreLevel. Invoked by the quill backend thread only.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void GeoRotatingFileSink::write_log(const quill::MacroMetadata* qLogMetadata,
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
                                        std::string_view)
    {
        // Check if logging level is permitted
        if (!m_bIgnoreLevel && static_cast<int>(qLogLevel) < static_cast<int>(g_eFileLogLevel))
        {
            return;
        }

        std::string_view szFormattedLogMessage = m_qFormatter.format(unLogTimestamp,
                                                                     szThreadID,
                                                                     szThreadName,
                                                                     szProcessID,
                                                                     szLoggerName,
                                                                     szLogLevelDescription,
                                                                     szLogLevelShortCode,
                                                                     *qLogMetadata,
                                                                     vNamedArgs,
                                                                     szLogMessage);

        quill::RotatingFileSink::write_log(qLogMetadata,
                                           unLogTimestamp,
                                           szThreadID,
                                           szThreadName,
                                           szProcessID,
                                           szLoggerName,
                                           qLogLevel,
                                           szLogLevelDescription,
                                           szLogLevelShortCode,
                                           vNamedArgs,
                                           szLogMessage,
                                           szFormattedLogMessage);
    }
}    // namespace logging
