/******************************************************************************
 * @brief Defines the MatElevationRaster class.
 *
 * @file MatElevationRaster.h
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef MAT_ELEVATION_RASTER_H
#define MAT_ELEVATION_RASTER_H

#include "../../interfaces/ElevationRaster.hpp"

/// \cond
#include <opencv2/core.hpp>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Elevation raster held fully in memory as a single channel CV_32F
 *  cv::Mat. Used for TIFF DEMs decoded by OpenCV and for rasters built in code.
 *  The Mat is never modified after construction so concurrent reads are safe.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
class MatElevationRaster : public ElevationRaster
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        explicit MatElevationRaster(const cv::Mat& cvElevations);
        static std::shared_ptr<MatElevationRaster> FromImageFile(const std::string& szRasterPath);
        std::vector<float> ReadWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const override;

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        int GetWidth() const override;
        int GetHeight() const override;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        cv::Mat m_cvElevations;
};
#endif
