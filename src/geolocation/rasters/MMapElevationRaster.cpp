/******************************************************************************
 * @brief Implements the MMapElevationRaster class.
 *
 * @file MMapElevationRaster.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "MMapElevationRaster.h"
#include "../../Logging.h"

/// \cond
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Construct a new MMap Elevation Raster object and map the file.
 *
 * @param szRasterPath - Path to the raw raster file.
 * @param nWidth - Columns in the raster.
 * @param nHeight - Rows in the raster.
 * @param eDataType - Sample type stored in the file.
 *
 * @throws std::invalid_argument - Non-positive dimensions.
 * @throws std::runtime_error - The file can't be opened, is too small, or mmap fails.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
MMapElevationRaster::MMapElevationRaster(const std::string& szRasterPath, const int nWidth, const int nHeight, const RasterDataType eDataType) :
    m_szRasterPath(szRasterPath), m_nWidth(nWidth), m_nHeight(nHeight), m_eDataType(eDataType), m_pMappedData(nullptr), m_siMappedSize(0), m_nFileDescriptor(-1)
{
    if (nWidth <= 0 || nHeight <= 0)
    {
        throw std::invalid_argument("Raster dimensions must be positive for " + szRasterPath);
    }

    m_nFileDescriptor = open(szRasterPath.c_str(), O_RDONLY);
    if (m_nFileDescriptor < 0)
    {
        throw std::runtime_error("Cannot open " + szRasterPath + ": " + std::strerror(errno));
    }

    struct stat stFileStat;
    if (fstat(m_nFileDescriptor, &stFileStat) != 0)
    {
        const std::string szError = std::strerror(errno);
        this->Release();
        throw std::runtime_error("Cannot stat " + szRasterPath + ": " + szError);
    }

    const size_t siExpectedSize = static_cast<size_t>(nWidth) * static_cast<size_t>(nHeight) * GetSampleSize(eDataType);
    if (static_cast<size_t>(stFileStat.st_size) < siExpectedSize)
    {
        this->Release();
        throw std::runtime_error("Raster " + szRasterPath + " holds " + std::to_string(stFileStat.st_size) + " bytes, expected " + std::to_string(siExpectedSize));
    }

    m_siMappedSize = static_cast<size_t>(stFileStat.st_size);
    m_pMappedData  = mmap(nullptr, m_siMappedSize, PROT_READ, MAP_PRIVATE, m_nFileDescriptor, 0);
    if (m_pMappedData == MAP_FAILED)
    {
        const std::string szError = std::strerror(errno);
        m_pMappedData             = nullptr;
        this->Release();
        throw std::runtime_error("mmap failed for " + szRasterPath + ": " + szError);
    }

    // Sampling touches a 2x2 window at a time.
    if (madvise(m_pMappedData, m_siMappedSize, MADV_RANDOM) != 0)
    {
        LOG_DEBUG(logging::g_qSharedLogger, "madvise(MADV_RANDOM) failed for {}: {}", szRasterPath, std::strerror(errno));
    }

    LOG_INFO(logging::g_qSharedLogger, "Memory mapped {}x{} elevation raster {} ({} bytes).", nWidth, nHeight, szRasterPath, m_siMappedSize);
}

/******************************************************************************
 * @brief Destroy the MMap Elevation Raster object, unmapping the file.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
MMapElevationRaster::~MMapElevationRaster()
{
    this->Release();
}

/******************************************************************************
 * @brief Move constructor. The source is left without a mapping.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
MMapElevationRaster::MMapElevationRaster(MMapElevationRaster&& stOther) noexcept :
    ElevationRaster(),
    m_szRasterPath(std::move(stOther.m_szRasterPath)),
    m_nWidth(stOther.m_nWidth),
    m_nHeight(stOther.m_nHeight),
    m_eDataType(stOther.m_eDataType),
    m_pMappedData(stOther.m_pMappedData),
    m_siMappedSize(stOther.m_siMappedSize),
    m_nFileDescriptor(stOther.m_nFileDescriptor)
{
    stOther.m_pMappedData     = nullptr;
    stOther.m_siMappedSize    = 0;
    stOther.m_nFileDescriptor = -1;
    stOther.m_nWidth          = 0;
    stOther.m_nHeight         = 0;
}

/******************************************************************************
 * @brief Move assignment. Releases this raster's mapping first.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
MMapElevationRaster& MMapElevationRaster::operator=(MMapElevationRaster&& stOther) noexcept
{
    if (this != &stOther)
    {
        this->Release();

        m_szRasterPath    = std::move(stOther.m_szRasterPath);
        m_nWidth          = stOther.m_nWidth;
        m_nHeight         = stOther.m_nHeight;
        m_eDataType       = stOther.m_eDataType;
        m_pMappedData     = stOther.m_pMappedData;
        m_siMappedSize    = stOther.m_siMappedSize;
        m_nFileDescriptor = stOther.m_nFileDescriptor;

        stOther.m_pMappedData     = nullptr;
        stOther.m_siMappedSize    = 0;
        stOther.m_nFileDescriptor = -1;
        stOther.m_nWidth          = 0;
        stOther.m_nHeight         = 0;
    }

    return *this;
}

/******************************************************************************
 * @brief Unmap and close whatever this object still owns.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
void MMapElevationRaster::Release()
{
    if (m_pMappedData != nullptr)
    {
        munmap(m_pMappedData, m_siMappedSize);
        m_pMappedData = nullptr;
    }
    if (m_nFileDescriptor >= 0)
    {
        close(m_nFileDescriptor);
        m_nFileDescriptor = -1;
    }
    m_siMappedSize = 0;
}

/******************************************************************************
 * @brief Decode one sample into a float. memcpy avoids unaligned loads.
 *
 * @param siIndex - Linear sample index (row * width + col).
 * @return float - The sample value.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
float MMapElevationRaster::ReadSample(const size_t siIndex) const
{
    const uint8_t* pBase = static_cast<const uint8_t*>(m_pMappedData) + siIndex * GetSampleSize(m_eDataType);

    switch (m_eDataType)
    {
        case RasterDataType::eInt16:
        {
            int16_t nValue;
            std::memcpy(&nValue, pBase, sizeof(nValue));
            return static_cast<float>(nValue);
        }
        case RasterDataType::eUInt16:
        {
            uint16_t unValue;
            std::memcpy(&unValue, pBase, sizeof(unValue));
            return static_cast<float>(unValue);
        }
        case RasterDataType::eInt32:
        {
            int32_t nValue;
            std::memcpy(&nValue, pBase, sizeof(nValue));
            return static_cast<float>(nValue);
        }
        case RasterDataType::eFloat32:
        {
            float fValue;
            std::memcpy(&fValue, pBase, sizeof(fValue));
            return fValue;
        }
        case RasterDataType::eFloat64:
        {
            double dValue;
            std::memcpy(&dValue, pBase, sizeof(dValue));
            return static_cast<float>(dValue);
        }
        default: throw std::logic_error("Unhandled raster data type.");
    }
}

/******************************************************************************
 * @brief Read a block of elevations straight from the mapping.
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
std::vector<float> MMapElevationRaster::ReadWindow(const int nColStart, const int nRowStart, const int nColEnd, const int nRowEnd) const
{
    if (m_pMappedData == nullptr || !this->IsValidWindow(nColStart, nRowStart, nColEnd, nRowEnd))
    {
        throw std::out_of_range("Elevation window out of bounds for " + m_szRasterPath);
    }

    std::vector<float> vWindow;
    vWindow.reserve(static_cast<size_t>(nColEnd - nColStart) * static_cast<size_t>(nRowEnd - nRowStart));
    for (int nRow = nRowStart; nRow < nRowEnd; ++nRow)
    {
        const size_t siRowOffset = static_cast<size_t>(nRow) * static_cast<size_t>(m_nWidth);
        for (int nCol = nColStart; nCol < nColEnd; ++nCol)
        {
            vWindow.push_back(this->ReadSample(siRowOffset + static_cast<size_t>(nCol)));
        }
    }

    return vWindow;
}

/******************************************************************************
 * @brief Parse a sidecar dtype string.
 *
 * @param szDataType - One of int16, uint16, int32, float32, float64.
 * @return RasterDataType - The matching type.
 *
 * @throws std::invalid_argument - Unknown type name.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
RasterDataType MMapElevationRaster::ParseDataType(const std::string& szDataType)
{
    if (szDataType == "int16")
    {
        return RasterDataType::eInt16;
    }
    if (szDataType == "uint16")
    {
        return RasterDataType::eUInt16;
    }
    if (szDataType == "int32")
    {
        return RasterDataType::eInt32;
    }
    if (szDataType == "float32")
    {
        return RasterDataType::eFloat32;
    }
    if (szDataType == "float64")
    {
        return RasterDataType::eFloat64;
    }

    throw std::invalid_argument("Unsupported raster dtype: " + szDataType);
}

/******************************************************************************
 * @brief Bytes per sample for a data type.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
size_t MMapElevationRaster::GetSampleSize(const RasterDataType eDataType)
{
    switch (eDataType)
    {
        case RasterDataType::eInt16:
        case RasterDataType::eUInt16: return 2;
        case RasterDataType::eInt32:
        case RasterDataType::eFloat32: return 4;
        case RasterDataType::eFloat64: return 8;
        default: return 4;
    }
}

int MMapElevationRaster::GetWidth() const
{
    return m_nWidth;
}

int MMapElevationRaster::GetHeight() const
{
    return m_nHeight;
}

RasterDataType MMapElevationRaster::GetDataType() const
{
    return m_eDataType;
}
