/******************************************************************************
 * @brief Defines and implements conversions between local East-North-Up
 *      meters and WGS84 degrees within the geoops namespace.
 *
 * @file GeoOperations.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GEO_OPERATIONS_HPP
#define GEO_OPERATIONS_HPP

/// \cond
#include <cmath>
#include <opencv2/core.hpp>

/// \endcond

/******************************************************************************
 * @brief Namespace containing latitude dependent meters/degrees conversions.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace geoops
{
    /******************************************************************************
     * @brief Length of one degree of latitude and longitude at a given latitude.
     ******************************************************************************/
    struct MetersPerDegree
    {
        public:
            double dLatitude  = 0.0;
            double dLongitude = 0.0;
    };

    /******************************************************************************
     * @brief An offset in a local East-North frame.
     ******************************************************************************/
    struct GroundOffset
    {
        public:
            double dEastMeters  = 0.0;
            double dNorthMeters = 0.0;
    };

    /******************************************************************************
     * @brief A WGS84 latitude/longitude pair in degrees.
     ******************************************************************************/
    struct GeoCoordinate
    {
        public:
            double dLatitude  = 0.0;
            double dLongitude = 0.0;
    };

    inline double DegreesToRadians(const double dDegrees)
    {
        return dDegrees * CV_PI / 180.0;
    }

    inline double RadiansToDegrees(const double dRadians)
    {
        return dRadians * 180.0 / CV_PI;
    }

    /******************************************************************************
     * @brief Meters per degree of latitude and longitude on the WGS84 ellipsoid,
     *      from the standard series expansion. Always succeeds.
     *
     * @param dLatitudeDeg - Latitude in degrees.
     * @return MetersPerDegree - Meters spanned by one degree north and one degree east.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline MetersPerDegree ComputeMetersPerDegree(const double dLatitudeDeg)
    {
        const double dL = DegreesToRadians(dLatitudeDeg);

        MetersPerDegree stScale;
        stScale.dLatitude  = 111132.92 - 559.82 * std::cos(2.0 * dL) + 1.175 * std::cos(4.0 * dL) - 0.0023 * std::cos(6.0 * dL);
        stScale.dLongitude = 111412.84 * std::cos(dL) - 93.5 * std::cos(3.0 * dL) + 0.118 * std::cos(5.0 * dL);
        return stScale;
    }

    /******************************************************************************
     * @brief Moves a geographic point by an East/North offset in meters. The
     *      degree scale is evaluated at dScaleLatitudeDeg, which lets iterative
     *      callers re-centre the scale on their latest estimate.
     *
     * @param stOrigin - Point the offset is measured from.
     * @param stOffset - East/North offset in meters.
     * @param dScaleLatitudeDeg - Latitude at which meters per degree is evaluated.
     * @return GeoCoordinate - The offset point.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline GeoCoordinate OffsetToGeographic(const GeoCoordinate& stOrigin, const GroundOffset& stOffset, const double dScaleLatitudeDeg)
    {
        const MetersPerDegree stScale = ComputeMetersPerDegree(dScaleLatitudeDeg);

        GeoCoordinate stPoint;
        stPoint.dLatitude  = stOrigin.dLatitude + stOffset.dNorthMeters / stScale.dLatitude;
        stPoint.dLongitude = stOrigin.dLongitude + stOffset.dEastMeters / stScale.dLongitude;
        return stPoint;
    }

    inline GeoCoordinate OffsetToGeographic(const GeoCoordinate& stOrigin, const GroundOffset& stOffset)
    {
        return OffsetToGeographic(stOrigin, stOffset, stOrigin.dLatitude);
    }

    /******************************************************************************
     * @brief Inverse of OffsetToGeographic using the scale at the origin latitude.
     *
     * @param stOrigin - Reference point.
     * @param stPoint - Point to express relative to the reference.
     * @return GroundOffset - East/North meters from stOrigin to stPoint.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline GroundOffset GeographicToOffset(const GeoCoordinate& stOrigin, const GeoCoordinate& stPoint)
    {
        const MetersPerDegree stScale = ComputeMetersPerDegree(stOrigin.dLatitude);

        GroundOffset stOffset;
        stOffset.dEastMeters  = (stPoint.dLongitude - stOrigin.dLongitude) * stScale.dLongitude;
        stOffset.dNorthMeters = (stPoint.dLatitude - stOrigin.dLatitude) * stScale.dLatitude;
        return stOffset;
    }
}    // namespace geoops

#endif    // GEO_OPERATIONS_HPP
