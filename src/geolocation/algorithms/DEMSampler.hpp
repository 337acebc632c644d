/******************************************************************************
 * @brief Atomic functional library for sampling ground elevation from a
 *      geo-referenced elevation raster.
 *
 * @file DEMSampler.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef DEM_SAMPLER_HPP
#define DEM_SAMPLER_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/geo/ElevationModels.hpp"

/// \cond
#include <array>
#include <chrono>
#include <cmath>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/// \endcond

namespace DEMSampler
{
    /******************************************************************************
     * @brief Why a DEM sample did or did not produce an elevation.
     ******************************************************************************/
    enum class DEMSampleStatus
    {
        eSuccess,
        eWrongCRS,       // Raster is not in geographic coordinates, sampling refused.
        eOutOfBounds,    // The 2x2 interpolation window leaves the raster.
        eNoData,         // All four samples are no-data or non-finite.
        eReadTimeout,    // Every read attempt timed out.
        eReadFailure     // The raster read threw or there is no raster behind the DEM.
    };

    /******************************************************************************
     * @brief How to answer when only some of the four neighbors are valid.
     ******************************************************************************/
    enum class NoDataPolicy
    {
        eNearestValidNeighbor,      // First valid sample in window order.
        eInverseDistanceWeighted    // Valid samples weighted by 1 / distance^2.
    };

    /******************************************************************************
     * @brief Tunables for SampleElevation. Defaults come from the constants namespace.
     ******************************************************************************/
    struct DEMSamplerConfig
    {
        public:
            double dVerticalOffset                 = constants::DEM_VERTICAL_DATUM_OFFSET;
            NoDataPolicy eNoDataPolicy             = NoDataPolicy::eNearestValidNeighbor;
            std::chrono::milliseconds tmReadTimeout = constants::DEM_READ_TIMEOUT;
            int nMaxReadAttempts                   = constants::DEM_READ_MAX_ATTEMPTS;
    };

    /******************************************************************************
     * @brief Human readable name for a sample status.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::string DEMSampleStatusToString(const DEMSampleStatus eStatus)
    {
        switch (eStatus)
        {
            case DEMSampleStatus::eSuccess: return "SUCCESS";
            case DEMSampleStatus::eWrongCRS: return "WRONG_CRS";
            case DEMSampleStatus::eOutOfBounds: return "OUT_OF_BOUNDS";
            case DEMSampleStatus::eNoData: return "NO_DATA";
            case DEMSampleStatus::eReadTimeout: return "READ_TIMEOUT";
            case DEMSampleStatus::eReadFailure: return "READ_FAILURE";
            default: return "UNKNOWN";
        }
    }

    /******************************************************************************
     * @brief Check a single raster value against the no-data sentinel.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline bool IsValidSample(const float fValue, const std::optional<double>& dNoDataValue)
    {
        if (!std::isfinite(fValue))
        {
            return false;
        }
        return !dNoDataValue.has_value() || fValue != static_cast<float>(*dNoDataValue);
    }

    /******************************************************************************
     * @brief Fetch a window through the raster's asynchronous interface. Each
     *      attempt waits at most tmReadTimeout. A timed out read is abandoned and
     *      re-issued until nMaxReadAttempts is used up.
     *
     * @param stDEM - DEM whose raster is read.
     * @param nCol - First column of the 2x2 window.
     * @param nRow - First row of the 2x2 window.
     * @param stConfig - Timeout and attempt budget.
     * @param eStatus - Receives eSuccess, eReadTimeout or eReadFailure.
     * @return std::optional<std::vector<float>> - Four samples in row-major order on success.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<std::vector<float>> ReadNeighborhood(const DigitalElevationModel& stDEM,
                                                              const int nCol,
                                                              const int nRow,
                                                              const DEMSamplerConfig& stConfig,
                                                              DEMSampleStatus& eStatus)
    {
        eStatus = DEMSampleStatus::eReadTimeout;

        for (int nAttempt = 1; nAttempt <= stConfig.nMaxReadAttempts; ++nAttempt)
        {
            std::future<std::vector<float>> fuWindow;
            try
            {
                fuWindow = stDEM.pRaster->RequestWindow(nCol, nRow, nCol + 2, nRow + 2);
            }
            catch (const std::exception& stException)
            {
                // bad_weak_ptr when the raster isn't shared-owned, system_error when no reader thread can start.
                LOG_ERROR(logging::g_qSharedLogger, "DEMSampler: Could not start a read at (col={}, row={}): {}", nCol, nRow, stException.what());
                eStatus = DEMSampleStatus::eReadFailure;
                return std::nullopt;
            }

            if (fuWindow.wait_for(stConfig.tmReadTimeout) != std::future_status::ready)
            {
                LOG_WARNING(logging::g_qSharedLogger,
                            "DEMSampler: Read of window at (col={}, row={}) timed out after {} ms. Attempt {} of {}.",
                            nCol,
                            nRow,
                            stConfig.tmReadTimeout.count(),
                            nAttempt,
                            stConfig.nMaxReadAttempts);
                continue;
            }

            try
            {
                std::vector<float> vWindow = fuWindow.get();
                if (vWindow.size() != 4)
                {
                    LOG_ERROR(logging::g_qSharedLogger, "DEMSampler: Raster returned {} samples for a 2x2 window.", vWindow.size());
                    eStatus = DEMSampleStatus::eReadFailure;
                    return std::nullopt;
                }

                eStatus = DEMSampleStatus::eSuccess;
                return vWindow;
            }
            catch (const std::exception& stException)
            {
                LOG_ERROR(logging::g_qSharedLogger, "DEMSampler: Raster read failed at (col={}, row={}): {}", nCol, nRow, stException.what());
                eStatus = DEMSampleStatus::eReadFailure;
                return std::nullopt;
            }
        }

        return std::nullopt;
    }

    /******************************************************************************
     * @brief Sample the DEM at a geographic position. The four pixels around the
     *      position are bilinearly interpolated when all of them are valid. When
     *      only some are valid the NoDataPolicy decides the answer. The configured
     *      vertical datum offset is added to every returned value.
     *
     *      Pixel (row, col) sits at latitude dOriginLat + row * dResLat and
     *      longitude dOriginLon + col * dResLon, so sampling exactly on a pixel
     *      returns that pixel's value untouched.
     *
     * @param stDEM - The elevation model.
     * @param dLatitude - Latitude in degrees.
     * @param dLongitude - Longitude in degrees.
     * @param peStatus - (Optional) Receives the reason when no value is returned.
     * @param stConfig - (Optional) Offset, no-data policy and read budget.
     * @return std::optional<double> - Elevation AMSL in meters.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline std::optional<double> SampleElevation(const DigitalElevationModel& stDEM,
                                                 const double dLatitude,
                                                 const double dLongitude,
                                                 DEMSampleStatus* peStatus        = nullptr,
                                                 const DEMSamplerConfig& stConfig = DEMSamplerConfig())
    {
        DEMSampleStatus eStatus = DEMSampleStatus::eSuccess;
        auto fnFail             = [&](const DEMSampleStatus eReason) -> std::optional<double>
        {
            if (peStatus != nullptr)
            {
                *peStatus = eReason;
            }
            return std::nullopt;
        };

        // Never report an elevation in the wrong units or datum.
        if (!stDEM.bCoordinateReferenceIsGeographic)
        {
            return fnFail(DEMSampleStatus::eWrongCRS);
        }
        if (stDEM.pRaster == nullptr)
        {
            LOG_ERROR(logging::g_qSharedLogger, "DEMSampler: DEM {} has no raster attached.", stDEM.szSourcePath);
            return fnFail(DEMSampleStatus::eReadFailure);
        }

        const double dCol = (dLongitude - stDEM.dOriginLon) / stDEM.dResLon;
        const double dRow = (dLatitude - stDEM.dOriginLat) / stDEM.dResLat;
        if (!std::isfinite(dCol) || !std::isfinite(dRow))
        {
            return fnFail(DEMSampleStatus::eOutOfBounds);
        }

        // Bounds are checked in floating point before narrowing to int.
        const double dCol0 = std::floor(dCol);
        const double dRow0 = std::floor(dRow);
        if (dRow0 < 0.0 || dRow0 >= stDEM.nHeight - 1 || dCol0 < 0.0 || dCol0 >= stDEM.nWidth - 1)
        {
            return fnFail(DEMSampleStatus::eOutOfBounds);
        }
        const int nCol0 = static_cast<int>(dCol0);
        const int nRow0 = static_cast<int>(dRow0);
        const double dDx = dCol - dCol0;
        const double dDy = dRow - dRow0;

        std::optional<std::vector<float>> vWindow = ReadNeighborhood(stDEM, nCol0, nRow0, stConfig, eStatus);
        if (!vWindow.has_value())
        {
            return fnFail(eStatus);
        }

        // Window order is (r0,c0), (r0,c0+1), (r0+1,c0), (r0+1,c0+1).
        const std::array<double, 4> aCornerDx = {0.0, 1.0, 0.0, 1.0};
        const std::array<double, 4> aCornerDy = {0.0, 0.0, 1.0, 1.0};
        std::array<bool, 4> aValid;
        int nValidCount = 0;
        for (size_t nIdx = 0; nIdx < 4; ++nIdx)
        {
            aValid[nIdx] = IsValidSample((*vWindow)[nIdx], stDEM.dNoDataValue);
            nValidCount += aValid[nIdx] ? 1 : 0;
        }

        if (nValidCount == 0)
        {
            return fnFail(DEMSampleStatus::eNoData);
        }

        double dElevation = 0.0;
        if (nValidCount == 4)
        {
            const double dZ00 = (*vWindow)[0];
            const double dZ10 = (*vWindow)[1];
            const double dZ01 = (*vWindow)[2];
            const double dZ11 = (*vWindow)[3];
            dElevation        = dZ00 * (1.0 - dDx) * (1.0 - dDy) + dZ10 * dDx * (1.0 - dDy) + dZ01 * (1.0 - dDx) * dDy + dZ11 * dDx * dDy;
        }
        else if (stConfig.eNoDataPolicy == NoDataPolicy::eNearestValidNeighbor)
        {
            for (size_t nIdx = 0; nIdx < 4; ++nIdx)
            {
                if (aValid[nIdx])
                {
                    dElevation = (*vWindow)[nIdx];
                    break;
                }
            }
        }
        else
        {
            double dWeightSum   = 0.0;
            double dWeightedSum = 0.0;
            for (size_t nIdx = 0; nIdx < 4; ++nIdx)
            {
                if (!aValid[nIdx])
                {
                    continue;
                }

                const double dDist2 = (dDx - aCornerDx[nIdx]) * (dDx - aCornerDx[nIdx]) + (dDy - aCornerDy[nIdx]) * (dDy - aCornerDy[nIdx]);
                // Sitting on a valid pixel.
                if (dDist2 < 1e-18)
                {
                    dWeightSum   = 1.0;
                    dWeightedSum = (*vWindow)[nIdx];
                    break;
                }

                dWeightSum += 1.0 / dDist2;
                dWeightedSum += (*vWindow)[nIdx] / dDist2;
            }
            dElevation = dWeightedSum / dWeightSum;
        }

        LOG_TRACEL1(logging::g_qSharedLogger,
                    "DEMSampler: ({:.7f}, {:.7f}) -> col {:.3f} row {:.3f}, {} of 4 valid, elevation {:.3f} m.",
                    dLatitude,
                    dLongitude,
                    dCol,
                    dRow,
                    nValidCount,
                    dElevation);

        if (peStatus != nullptr)
        {
            *peStatus = DEMSampleStatus::eSuccess;
        }
        return dElevation + stConfig.dVerticalOffset;
    }
}    // namespace DEMSampler

#endif    // DEM_SAMPLER_HPP
