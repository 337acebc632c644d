/******************************************************************************
 * @brief Defines the MMapElevationRaster class.
 *
 * @file MMapElevationRaster.h
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef MMAP_ELEVATION_RASTER_H
#define MMAP_ELEVATION_RASTER_H

#include "../../interfaces/ElevationRaster.hpp"

/// \cond
#include <cstddef>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Sample types a raw raster file may hold. Files are native endian,
 *      single band, row-major with no header.
 ******************************************************************************/
enum class RasterDataType
{
    eInt16,
    eUInt16,
    eInt32,
    eFloat32,
    eFloat64
};

/******************************************************************************
 * @brief Elevation raster backed by a read-only memory map of a raw binary
 *  file. Pages are only touched when a window is read, so continent sized DEMs
 *  cost nothing until sampled. Movable, not copyable.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
class MMapElevationRaster : public ElevationRaster
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        MMapElevationRaster(const std::string& szRasterPath, const int nWidth, const int nHeight, const RasterDataType eDataType);
        ~MMapElevationRaster();
        MMapElevationRaster(const MMapElevationRaster&)            = delete;
        MMapElevationRaster& operator=(const MMapElevationRaster&) = delete;
        MMapElevationRaster(MMapElevationRaster&& stOther) noexcept;
        MMapElevationRaster& operator=(MMapElevationRaster&& stOther) noexcept;

        std::vector<float> ReadWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const override;

        static RasterDataType ParseDataType(const std::string& szDataType);
        static size_t GetSampleSize(const RasterDataType eDataType);

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        int GetWidth() const override;
        int GetHeight() const override;
        RasterDataType GetDataType() const;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        std::string m_szRasterPath;
        int m_nWidth;
        int m_nHeight;
        RasterDataType m_eDataType;
        void* m_pMappedData;
        size_t m_siMappedSize;
        int m_nFileDescriptor;

        /////////////////////////////////////////
        // Declare private methods.
        /////////////////////////////////////////

        void Release();
        float ReadSample(const size_t siIndex) const;
};
#endif
