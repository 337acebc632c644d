/******************************************************************************
 * @brief Main program file. Loads a scenario, projects its pixels and runs the
 *      interactive operator loop.
 *
 * @file main.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Logging.h"
#include "geolocation/algorithms/PixelToGround.hpp"
#include "geolocation/session/GeolocationSession.h"

/// \cond
#include <array>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

/// \endcond

// Create a boolean used to handle a SIGINT and exit gracefully.
volatile sig_atomic_t bMainStop = false;
// Store original terminal settings.
struct termios g_stOriginalTermSettings;

/******************************************************************************
 * @brief Help function given to the C++ csignal standard library to run when
 * a CONTROL^C is given from the terminal.
 *
 * @param nSignal - Integer representing the interrupt value.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void SignalHandler(int nSignal)
{
    if (nSignal == SIGINT || nSignal == SIGTERM)
    {
        LOG_INFO(logging::g_qSharedLogger, "Ctrl+C or SIGTERM received. Cleaning up...");
        bMainStop = true;
    }
    // The SIGQUIT signal can be sent to the terminal by pressing CNTL+\.
    else if (nSignal == SIGQUIT)
    {
        LOG_INFO(logging::g_qSharedLogger, "Quit signal key pressed. Cleaning up...");
        bMainStop = true;
    }
}

/******************************************************************************
 * @brief Reset terminal mode to original settings.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void ResetTerminalMode()
{
    tcsetattr(STDIN_FILENO, TCSANOW, &g_stOriginalTermSettings);
}

/******************************************************************************
 * @brief Put the terminal in non-canonical mode so single key presses are read
 *      without waiting for a newline.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void SetNonCanonicalTerminalMode()
{
    struct termios stNewTermSettings;

    tcgetattr(STDIN_FILENO, &g_stOriginalTermSettings);
    std::memcpy(&stNewTermSettings, &g_stOriginalTermSettings, sizeof(struct termios));

    stNewTermSettings.c_lflag &= ~(ICANON | ECHO);
    tcsetattr(STDIN_FILENO, TCSANOW, &stNewTermSettings);
}

/******************************************************************************
 * @brief Check if a key has been pressed in the terminal.
 *
 * @return int - Number of bytes waiting in the terminal buffer.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
int CheckKeyPress()
{
    int nBytesWaiting = 0;
    if (ioctl(STDIN_FILENO, FIONREAD, &nBytesWaiting) != 0)
    {
        return 0;
    }
    return nBytesWaiting;
}

/******************************************************************************
 * @brief Project a pixel through the session and record the outcome.
 *
 * @param stSession - The active session.
 * @param cvPixel - Pixel to project.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void ProjectAndRecord(const GeolocationSession& stSession, const cv::Point2d& cvPixel)
{
    const std::chrono::steady_clock::time_point tmStart = std::chrono::steady_clock::now();
    ProjectionStatus eStatus                            = ProjectionStatus::eSuccess;
    std::optional<ProjectionResult> stResult            = stSession.ProjectPixel(cvPixel, &eStatus);
    LOG_DEBUG(logging::g_qFileLogger, "Projected ({:.1f}, {:.1f}) in {:.3f} ms.", cvPixel.x, cvPixel.y, timeops::GetElapsedMilliseconds(tmStart));
    PixelToGround::RecordProjection(cvPixel, eStatus, stResult);
}

/******************************************************************************
 * @brief Log the four projected image corners.
 *
 * @param stSession - The active session.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void LogFootprint(const GeolocationSession& stSession)
{
    const char* aCornerNames[4]                                  = {"top left", "top right", "bottom right", "bottom left"};
    const std::array<std::optional<ProjectionResult>, 4> aCorners = stSession.ComputeFootprint();

    std::string szFootprint = "\n--------[ Image Footprint ]--------\n";
    for (size_t siIdx = 0; siIdx < aCorners.size(); ++siIdx)
    {
        szFootprint += std::string(aCornerNames[siIdx]) + ": ";
        if (aCorners[siIdx].has_value())
        {
            std::ostringstream ssCorner;
            ssCorner.precision(8);
            ssCorner << aCorners[siIdx]->dLatitude << ", " << aCorners[siIdx]->dLongitude << " (range " << aCorners[siIdx]->dSlantRangeMeters << " m)";
            szFootprint += ssCorner.str() + "\n";
        }
        else
        {
            szFootprint += "above horizon\n";
        }
    }
    szFootprint += "-----------------------------------\n";

    LOG_NOTICE(logging::g_qSharedLogger, "{}", szFootprint);
}

/******************************************************************************
 * @brief  main function.
 *
 * @param argc - Argument count.
 * @param argv - RoveSoGeo <scenario.yaml> [--batch]
 * @return int - Exit status number.
 *
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
int main(int argc, char** argv)
{
    // Initialize Loggers
    logging::InitializeLoggers(constants::LOGGING_OUTPUT_PATH_ABSOLUTE);
    LOG_INFO(logging::g_qSharedLogger, "Logging to {}", logging::g_szLoggingOutputPath);

    if (argc < 2)
    {
        LOG_CRITICAL(logging::g_qSharedLogger, "Usage: {} <scenario.yaml> [--batch]", argv[0]);
        return 1;
    }
    const std::string szScenarioPath = argv[1];
    const bool bBatchMode            = argc > 2 && std::string(argv[2]) == "--batch";

    /////////////////////////////////////////
    // Setup global objects.
    /////////////////////////////////////////
    // Setup signal interrupt handler.
    struct sigaction stSigBreak;
    stSigBreak.sa_handler = SignalHandler;
    stSigBreak.sa_flags   = 0;
    sigemptyset(&stSigBreak.sa_mask);
    sigaction(SIGINT, &stSigBreak, nullptr);
    sigaction(SIGQUIT, &stSigBreak, nullptr);

    // Load the scenario and build the session.
    GeolocationScenario stScenario;
    std::unique_ptr<GeolocationSession> pSession;
    try
    {
        stScenario = GeolocationSession::LoadScenario(szScenarioPath);
        pSession   = GeolocationSession::FromScenario(stScenario);
    }
    catch (const std::exception& stException)
    {
        LOG_CRITICAL(logging::g_qSharedLogger, "Failed to load scenario {}: {}", szScenarioPath, stException.what());
        logging::FlushLoggers();
        return 1;
    }

    // Project every pixel the scenario lists.
    for (const cv::Point2d& cvPixel : stScenario.vPixels)
    {
        ProjectAndRecord(*pSession, cvPixel);
    }

    if (bBatchMode)
    {
        LOG_INFO(logging::g_qSharedLogger, "Batch projection of {} pixel(s) finished. Exiting...", stScenario.vPixels.size());
        logging::FlushLoggers();
        return 0;
    }

    // Set the terminal to non-canonical mode. This allows us to read a single character from the terminal without waiting for a newline.
    SetNonCanonicalTerminalMode();
    atexit(ResetTerminalMode);
    LOG_NOTICE(logging::g_qSharedLogger, "Scenario loaded. Press 'h' for help.");

    /*
        This while loop is the main periodic loop for the RoveSoGeo program.
        Loop until user sends sigkill or sigterm.
    */
    while (!bMainStop)
    {
        if (CheckKeyPress() > 0)
        {
            char chTerminalInput = 0;
            ssize_t nBytesRead   = read(STDIN_FILENO, &chTerminalInput, 1);
            if (nBytesRead <= 0)
            {
                LOG_WARNING(logging::g_qSharedLogger, "Failed to read from terminal input.");
            }
            else if (chTerminalInput == 'h' || chTerminalInput == 'H')
            {
                // Print help message to console.
                LOG_NOTICE(logging::g_qConsoleLogger,
                           "\n--------[ RoveSoGeo Help ]--------\n"
                           "Press 'p' or 'P' to project a pixel (enter u v).\n"
                           "Press 'a' or 'A' to auto-fix the camera attitude signs.\n"
                           "Press 'f' or 'F' to print the image footprint.\n"
                           "Press 'g' or 'G' to set the ground elevation from the DEM under the camera.\n"
                           "Press 'd' or 'D' to toggle DEM terrain following.\n"
                           "Press 'q' or 'Q' to quit the program.\n"
                           "-------------------------------------------\n");
            }
            else if (chTerminalInput == 'q' || chTerminalInput == 'Q')
            {
                LOG_INFO(logging::g_qSharedLogger, "'Q' key pressed. Initiating shutdown...");
                bMainStop = true;
            }
            else if (chTerminalInput == 'p' || chTerminalInput == 'P')
            {
                // Temporarily reset terminal to canonical mode to allow standard user input.
                ResetTerminalMode();

                double dU = 0.0;
                double dV = 0.0;
                std::cout << "Enter pixel u v: ";
                if (std::cin >> dU >> dV)
                {
                    ProjectAndRecord(*pSession, cv::Point2d(dU, dV));
                }
                else
                {
                    LOG_WARNING(logging::g_qSharedLogger, "Expected two numbers for the pixel.");
                    std::cin.clear();
                    std::cin.ignore(1024, '\n');
                }

                // Return terminal to non-canonical mode for main loop execution.
                SetNonCanonicalTerminalMode();
            }
            else if (chTerminalInput == 'a' || chTerminalInput == 'A')
            {
                const CameraPose stBefore = pSession->GetPose();
                ProjectionStatus eStatus  = ProjectionStatus::eSuccess;
                if (pSession->AutoFixPose(&eStatus).has_value())
                {
                    const CameraPose stAfter = pSession->GetPose();
                    LOG_NOTICE(logging::g_qSharedLogger,
                               "Attitude yaw/pitch/roll {:.2f}/{:.2f}/{:.2f} -> {:.2f}/{:.2f}/{:.2f}",
                               stBefore.dYaw,
                               stBefore.dPitch,
                               stBefore.dRoll,
                               stAfter.dYaw,
                               stAfter.dPitch,
                               stAfter.dRoll);
                }
                else
                {
                    LOG_ERROR(logging::g_qSharedLogger, "Auto-fix found no attitude that hits the ground ({}).", ProjectionStatusToString(eStatus));
                }
            }
            else if (chTerminalInput == 'f' || chTerminalInput == 'F')
            {
                LogFootprint(*pSession);
            }
            else if (chTerminalInput == 'g' || chTerminalInput == 'G')
            {
                DEMSampler::DEMSampleStatus eStatus = DEMSampler::DEMSampleStatus::eSuccess;
                if (!pSession->RelinkGroundWithDEM(&eStatus).has_value())
                {
                    LOG_ERROR(logging::g_qSharedLogger, "Could not sample the DEM under the camera ({}).", DEMSampler::DEMSampleStatusToString(eStatus));
                }
            }
            else if (chTerminalInput == 'd' || chTerminalInput == 'D')
            {
                const bool bEnabled = pSession->ToggleAutoSampleDEM();
                LOG_NOTICE(logging::g_qSharedLogger, "DEM terrain following {}.", bEnabled ? "enabled" : "disabled");
            }
        }

        // No need to loop as fast as possible. Sleep...
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    /////////////////////////////////////////
    // Cleanup.
    /////////////////////////////////////////
    // Submit logger message that program is done cleaning up and is now exiting.
    LOG_INFO(logging::g_qSharedLogger, "Clean up finished. Exiting...");
    logging::FlushLoggers();

    // Successful exit.
    return 0;
}
