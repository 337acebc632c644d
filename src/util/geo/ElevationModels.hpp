/******************************************************************************
 * @brief Defines the ground models a pixel can be projected onto.
 *
 * @file ElevationModels.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef ELEVATION_MODELS_HPP
#define ELEVATION_MODELS_HPP

#include "../../interfaces/ElevationRaster.hpp"

/// \cond
#include <memory>
#include <optional>
#include <string>
#include <variant>

/// \endcond

/******************************************************************************
 * @brief Geo-referencing and access handle for an elevation raster. Pixel
 *      (row, col) covers latitude dOriginLat + row * dResLat and longitude
 *      dOriginLon + col * dResLon. dResLat is negative so rows run southward.
 ******************************************************************************/
struct DigitalElevationModel
{
    public:
        int nWidth                            = 0;
        int nHeight                           = 0;
        double dOriginLon                     = 0.0;
        double dOriginLat                     = 0.0;
        double dResLon                        = 0.0;    // Degrees per column, positive.
        double dResLat                        = 0.0;    // Degrees per row, negative.
        std::optional<double> dNoDataValue    = std::nullopt;
        bool bCoordinateReferenceIsGeographic = false;
        std::string szSourcePath              = "";
        std::shared_ptr<const ElevationRaster> pRaster;
};

/******************************************************************************
 * @brief Horizontal ground plane at a fixed elevation.
 ******************************************************************************/
struct FlatPlane
{
    public:
        double dElevationAMSL = 0.0;
};

/******************************************************************************
 * @brief Terrain from a DEM. dFallbackElevationAMSL is the operator's manual
 *      ground elevation, used to seed refinement and wherever the DEM has no
 *      answer.
 ******************************************************************************/
struct DEMGround
{
    public:
        std::shared_ptr<const DigitalElevationModel> pDEM;
        double dFallbackElevationAMSL = 0.0;
};

// Exactly one ground model is active per projection.
using GroundReference = std::variant<FlatPlane, DEMGround>;

#endif    // ELEVATION_MODELS_HPP
