/******************************************************************************
 * @brief Implements the MatElevationRaster class.
 *
 * @file MatElevationRaster.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "MatElevationRaster.h"
#include "../../Logging.h"

/// \cond
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

/// \endcond

/******************************************************************************
 * @brief Construct a new Mat Elevation Raster object. Any single channel depth
 *      is accepted and converted to CV_32F.
 *
 * @param cvElevations - Single channel elevation grid, row 0 is the northern edge.
 *
 * @throws std::invalid_argument - The Mat is empty or has more than one channel.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
MatElevationRaster::MatElevationRaster(const cv::Mat& cvElevations)
{
    if (cvElevations.empty() || cvElevations.channels() != 1)
    {
        throw std::invalid_argument("Elevation raster must be a non-empty single channel matrix.");
    }

    // Own a continuous float copy so later changes to the source can't leak in.
    cvElevations.convertTo(m_cvElevations, CV_32F);
}

/******************************************************************************
 * @brief Decode a raster image (GeoTIFF, 16 bit PNG, ...) with OpenCV. Only the
 *      pixel grid is read, geo-referencing comes from the DEM sidecar.
 *
 * @param szRasterPath - Path to the image file.
 * @return std::shared_ptr<MatElevationRaster> - The loaded raster.
 *
 * @throws std::runtime_error - OpenCV could not decode the file.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
std::shared_ptr<MatElevationRaster> MatElevationRaster::FromImageFile(const std::string& szRasterPath)
{
    // IMREAD_UNCHANGED keeps 16 bit and float samples intact.
    cv::Mat cvRaster = cv::imread(szRasterPath, cv::IMREAD_UNCHANGED);
    if (cvRaster.empty())
    {
        throw std::runtime_error("Unable to decode elevation raster " + szRasterPath);
    }
    if (cvRaster.channels() != 1)
    {
        throw std::runtime_error("Elevation raster " + szRasterPath + " has " + std::to_string(cvRaster.channels()) + " channels, expected 1.");
    }

    LOG_INFO(logging::g_qSharedLogger, "Loaded {}x{} elevation raster from {}.", cvRaster.cols, cvRaster.rows, szRasterPath);
    return std::make_shared<MatElevationRaster>(cvRaster);
}

/******************************************************************************
 * @brief Copy a block of elevations out of the Mat.
 *
 * @param nColStart - First column.
 * @param nRowStart - First row.
 * @param nColEnd - One past the last column.
 * @param nRowEnd - One past the last row.
 * @return std::vector<float> - Row-major samples.
 *
 * @throws std::out_of_range - The window is empty or leaves the raster.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
std::vector<float> MatElevationRaster::ReadWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const
{
    if (!this->IsValidWindow(nColStart, nRowStart, nColEnd, nRowEnd))
    {
        throw std::out_of_range("Elevation window out of bounds.");
    }

    std::vector<float> vWindow;
    vWindow.reserve(static_cast<size_t>(nColEnd - nColStart) * static_cast<size_t>(nRowEnd - nRowStart));
    for (int nRow = nRowStart; nRow < nRowEnd; ++nRow)
    {
        const float* pRow = m_cvElevations.ptr<float>(nRow);
        vWindow.insert(vWindow.end(), pRow + nColStart, pRow + nColEnd);
    }

    return vWindow;
}

/******************************************************************************
 * @brief Accessor for the raster width.
 *
 * @return int - Number of columns.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
int MatElevationRaster::GetWidth() const
{
    return m_cvElevations.cols;
}

/******************************************************************************
 * @brief Accessor for the raster height.
 *
 * @return int - Number of rows.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
int MatElevationRaster::GetHeight() const
{
    return m_cvElevations.rows;
}
