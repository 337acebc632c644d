/******************************************************************************
 * @brief Implements the DEM loading functions.
 *
 * @file DEMLoader.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "DEMLoader.h"
#include "../../Logging.h"
#include "./MMapElevationRaster.h"
#include "./MatElevationRaster.h"

/// \cond
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <vector>

/// \endcond

namespace demloader
{
    namespace
    {
        /******************************************************************************
         * @brief Read a required real from the sidecar.
         *
         * @throws std::runtime_error - The key is missing or not a number.
         ******************************************************************************/
        double ReadRequiredReal(const cv::FileStorage& cvSidecar, const std::string& szKey, const std::string& szSidecarPath)
        {
            cv::FileNode cvNode = cvSidecar[szKey];
            if (cvNode.empty() || !(cvNode.isReal() || cvNode.isInt()))
            {
                throw std::runtime_error("DEM sidecar " + szSidecarPath + " is missing numeric key '" + szKey + "'.");
            }
            return static_cast<double>(cvNode);
        }

        int ReadOptionalInt(const cv::FileStorage& cvSidecar, const std::string& szKey, const int nDefault)
        {
            cv::FileNode cvNode = cvSidecar[szKey];
            return (cvNode.empty() || !cvNode.isInt()) ? nDefault : static_cast<int>(cvNode);
        }

        std::string ToLower(std::string szValue)
        {
            std::transform(szValue.begin(), szValue.end(), szValue.begin(), [](unsigned char ucChar) { return static_cast<char>(std::tolower(ucChar)); });
            return szValue;
        }
    }    // namespace

    /******************************************************************************
     * @brief Check whether a CRS string names WGS84 geographic coordinates.
     *
     * @param szCRS - CRS string from the sidecar.
     * @return true - Degrees on WGS84 (EPSG:4326, WGS84, OGC:CRS84).
     * @return false - Anything else, including an empty string.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    bool IsGeographicCRS(const std::string& szCRS)
    {
        std::string szUpper = szCRS;
        std::transform(szUpper.begin(), szUpper.end(), szUpper.begin(), [](unsigned char ucChar) { return static_cast<char>(std::toupper(ucChar)); });
        szUpper.erase(std::remove_if(szUpper.begin(), szUpper.end(), [](unsigned char ucChar) { return std::isspace(ucChar) != 0; }), szUpper.end());

        return szUpper == "EPSG:4326" || szUpper == "WGS84" || szUpper == "OGC:CRS84" || szUpper == "CRS84";
    }

    /******************************************************************************
     * @brief Load a DEM from its sidecar. Raw rasters (.bin, .raw) are memory
     *      mapped, anything else is decoded by OpenCV. The latitude resolution is
     *      forced negative so rows always run southward.
     *
     * @param szSidecarPath - YAML or JSON sidecar.
     * @return std::shared_ptr<const DigitalElevationModel> - The loaded model.
     *
     * @throws std::runtime_error - Unreadable sidecar or raster, missing keys, size mismatch.
     * @throws std::invalid_argument - Unknown dtype or non-positive dimensions.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    std::shared_ptr<const DigitalElevationModel> LoadDigitalElevationModel(const std::string& szSidecarPath)
    {
        cv::FileStorage cvSidecar;
        try
        {
            cvSidecar.open(szSidecarPath, cv::FileStorage::READ);
        }
        catch (const cv::Exception& cvException)
        {
            throw std::runtime_error("Unable to parse DEM sidecar " + szSidecarPath + ": " + cvException.what());
        }
        if (!cvSidecar.isOpened())
        {
            throw std::runtime_error("Unable to open DEM sidecar " + szSidecarPath);
        }

        std::shared_ptr<DigitalElevationModel> pDEM = std::make_shared<DigitalElevationModel>();
        pDEM->szSourcePath                           = szSidecarPath;

        // Geo-referencing from an affine transform or from the four explicit keys.
        cv::FileNode cvTransform = cvSidecar["transform"];
        if (!cvTransform.empty())
        {
            std::vector<double> vTransform;
            cvTransform >> vTransform;
            if (vTransform.size() != 6)
            {
                throw std::runtime_error("DEM sidecar " + szSidecarPath + " transform must have 6 elements.");
            }
            if (vTransform[1] != 0.0 || vTransform[3] != 0.0)
            {
                throw std::runtime_error("DEM sidecar " + szSidecarPath + " has a rotated transform, only north-up rasters are supported.");
            }
            pDEM->dResLon    = vTransform[0];
            pDEM->dOriginLon = vTransform[2];
            pDEM->dResLat    = vTransform[4];
            pDEM->dOriginLat = vTransform[5];
        }
        else
        {
            pDEM->dOriginLon = ReadRequiredReal(cvSidecar, "origin_lon", szSidecarPath);
            pDEM->dOriginLat = ReadRequiredReal(cvSidecar, "origin_lat", szSidecarPath);
            pDEM->dResLon    = ReadRequiredReal(cvSidecar, "res_lon", szSidecarPath);
            pDEM->dResLat    = ReadRequiredReal(cvSidecar, "res_lat", szSidecarPath);
        }

        if (pDEM->dResLon == 0.0 || pDEM->dResLat == 0.0 || !std::isfinite(pDEM->dResLon) || !std::isfinite(pDEM->dResLat))
        {
            throw std::runtime_error("DEM sidecar " + szSidecarPath + " has a zero or non-finite resolution.");
        }
        // North-up: rows run southward.
        pDEM->dResLon = std::abs(pDEM->dResLon);
        pDEM->dResLat = -std::abs(pDEM->dResLat);

        cv::FileNode cvNoData = cvSidecar["nodata"];
        if (!cvNoData.empty() && (cvNoData.isReal() || cvNoData.isInt()))
        {
            pDEM->dNoDataValue = static_cast<double>(cvNoData);
        }

        std::string szCRS;
        cvSidecar["crs"] >> szCRS;
        pDEM->bCoordinateReferenceIsGeographic = IsGeographicCRS(szCRS);
        if (!pDEM->bCoordinateReferenceIsGeographic)
        {
            LOG_WARNING(logging::g_qSharedLogger, "DEM {} has CRS '{}' which is not geographic WGS84. Every sample will be refused.", szSidecarPath, szCRS);
        }

        // Resolve the raster relative to the sidecar.
        std::string szRasterName;
        cvSidecar["raster"] >> szRasterName;
        if (szRasterName.empty())
        {
            throw std::runtime_error("DEM sidecar " + szSidecarPath + " is missing key 'raster'.");
        }
        std::filesystem::path szRasterPath = szRasterName;
        if (szRasterPath.is_relative())
        {
            szRasterPath = std::filesystem::path(szSidecarPath).parent_path() / szRasterPath;
        }

        const int nWidth             = ReadOptionalInt(cvSidecar, "width", 0);
        const int nHeight            = ReadOptionalInt(cvSidecar, "height", 0);
        const std::string szExtension = ToLower(szRasterPath.extension().string());
        if (szExtension == ".bin" || szExtension == ".raw")
        {
            std::string szDataType;
            cvSidecar["dtype"] >> szDataType;
            if (szDataType.empty())
            {
                szDataType = "float32";
            }
            pDEM->pRaster = std::make_shared<MMapElevationRaster>(szRasterPath.string(), nWidth, nHeight, MMapElevationRaster::ParseDataType(szDataType));
        }
        else
        {
            pDEM->pRaster = MatElevationRaster::FromImageFile(szRasterPath.string());
        }

        pDEM->nWidth  = pDEM->pRaster->GetWidth();
        pDEM->nHeight = pDEM->pRaster->GetHeight();
        if ((nWidth > 0 && nWidth != pDEM->nWidth) || (nHeight > 0 && nHeight != pDEM->nHeight))
        {
            throw std::runtime_error("DEM sidecar " + szSidecarPath + " declares " + std::to_string(nWidth) + "x" + std::to_string(nHeight) + " but the raster is " +
                                     std::to_string(pDEM->nWidth) + "x" + std::to_string(pDEM->nHeight) + ".");
        }

        LOG_INFO(logging::g_qSharedLogger,
                 "Loaded DEM {} ({}x{}, origin {:.6f}, {:.6f}, res {:.8f}, {:.8f}, CRS '{}').",
                 szSidecarPath,
                 pDEM->nWidth,
                 pDEM->nHeight,
                 pDEM->dOriginLat,
                 pDEM->dOriginLon,
                 pDEM->dResLat,
                 pDEM->dResLon,
                 szCRS);

        return pDEM;
    }
}    // namespace demloader
