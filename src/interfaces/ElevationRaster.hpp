/******************************************************************************
 * @brief Defines the ElevationRaster interface class.
 *
 * @file ElevationRaster.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef ELEVATION_RASTER_HPP
#define ELEVATION_RASTER_HPP

/// \cond
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Interface for gridded elevation storage. Implementations only need to
 *      provide a synchronous window read, the asynchronous request is built on
 *      top of it here. Rasters must be owned by a std::shared_ptr so a pending
 *      request can keep its raster alive after the requester gives up waiting.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
class ElevationRaster : public std::enable_shared_from_this<ElevationRaster>
{
    public:
        /******************************************************************************
         * @brief Destroy the Elevation Raster object.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-28
         ******************************************************************************/
        virtual ~ElevationRaster() = default;

        /******************************************************************************
         * @brief Read a rectangular block of elevations. Column and row ends are
         *      exclusive. Values come back row-major as float.
         *
         * @param nColStart - First column.
         * @param nRowStart - First row.
         * @param nColEnd - One past the last column.
         * @param nRowEnd - One past the last row.
         * @return std::vector<float> - (nRowEnd - nRowStart) * (nColEnd - nColStart) samples.
         *
         * @throws std::out_of_range - The window is empty or leaves the raster.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-28
         ******************************************************************************/
        virtual std::vector<float> ReadWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const = 0;

        virtual int GetWidth() const  = 0;
        virtual int GetHeight() const = 0;

        /******************************************************************************
         * @brief Check that a window is non-empty and lies inside the raster.
         *
         * @return true - The window can be read.
         * @return false - ReadWindow would throw.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-28
         ******************************************************************************/
        bool IsValidWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const
        {
            return nColStart >= 0 && nRowStart >= 0 && nColEnd <= this->GetWidth() && nRowEnd <= this->GetHeight() && nColStart < nColEnd && nRowStart < nRowEnd;
        }

        /******************************************************************************
         * @brief Start an asynchronous window read. The read runs on its own
         *      detached thread that holds a reference to this raster, so the caller
         *      may stop waiting on the future at any time. Exceptions thrown by
         *      ReadWindow are delivered through the future.
         *
         * @return std::future<std::vector<float>> - Resolves to the same data ReadWindow returns.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-28
         ******************************************************************************/
        std::future<std::vector<float>> RequestWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const
        {
            std::shared_ptr<std::promise<std::vector<float>>> pWindowPromise = std::make_shared<std::promise<std::vector<float>>>();
            std::future<std::vector<float>> fuWindow                          = pWindowPromise->get_future();
            std::shared_ptr<const ElevationRaster> pSelf                      = this->shared_from_this();

            std::thread thReader(
                [pSelf, pWindowPromise, nColStart, nRowStart, nColEnd, nRowEnd]()
                {
                    try
                    {
                        pWindowPromise->set_value(pSelf->ReadWindow(nColStart, nRowStart, nColEnd, nRowEnd));
                    }
                    catch (...)
                    {
                        // Forward to whoever waits on the future.
                        pWindowPromise->set_exception(std::current_exception());
                    }
                });
            thReader.detach();

            return fuWindow;
        }
};

#endif    // ELEVATION_RASTER_HPP
