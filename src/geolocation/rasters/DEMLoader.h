/******************************************************************************
 * @brief Declares the DEM loading functions.
 *
 * @file DEMLoader.h
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef DEM_LOADER_H
#define DEM_LOADER_H

#include "../../util/geo/ElevationModels.hpp"

/// \cond
#include <memory>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions that build DigitalElevationModels from
 *      a sidecar metadata file (YAML or JSON) and the raster it points to.
 *
 *      Sidecar keys:
 *          raster       - Raster path, relative to the sidecar.
 *          width/height - Raster size. Required for raw rasters.
 *          origin_lon, origin_lat, res_lon, res_lat
 *                       - Geo-referencing of pixel (0, 0) and per pixel step, or
 *          transform    - [res_lon, 0, origin_lon, 0, res_lat, origin_lat].
 *          nodata       - Optional no-data sentinel.
 *          crs          - Coordinate reference, e.g. EPSG:4326.
 *          dtype        - Sample type of raw (.bin/.raw) rasters.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace demloader
{
    bool IsGeographicCRS(const std::string& szCRS);
    std::shared_ptr<const DigitalElevationModel> LoadDigitalElevationModel(const std::string& szSidecarPath);
}    // namespace demloader

#endif    // DEM_LOADER_H
