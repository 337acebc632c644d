/******************************************************************************
 * @brief Atomic functional library for the pinhole camera model with
 *      Brown-Conrady lens distortion. Turns observed pixels into camera space
 *      ray directions.
 *
 * @file CameraModel.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef CAMERA_MODEL_HPP
#define CAMERA_MODEL_HPP

#include "../../Constants.h"
#include "../../util/vision/CameraModels.hpp"

/// \cond
#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>

/// \endcond

namespace CameraModel
{
    /******************************************************************************
     * @brief Check whether any distortion coefficient is non-zero.
     *
     * @param stIntrinsics - Camera intrinsics.
     * @return true - Pixels must be undistorted before ray casting.
     * @return false - Pure pinhole.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline bool HasDistortion(const CameraIntrinsics& stIntrinsics)
    {
        return stIntrinsics.dK1 != 0.0 || stIntrinsics.dK2 != 0.0 || stIntrinsics.dK3 != 0.0 || stIntrinsics.dP1 != 0.0 || stIntrinsics.dP2 != 0.0;
    }

    /******************************************************************************
     * @brief Check that the intrinsics describe a usable camera.
     *
     * @param stIntrinsics - Camera intrinsics.
     * @return true - Image size and focal lengths are positive and finite.
     * @return false - Projection would divide by zero or produce NaN.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline bool IsValid(const CameraIntrinsics& stIntrinsics)
    {
        return stIntrinsics.nImageWidth > 0 && stIntrinsics.nImageHeight > 0 && std::isfinite(stIntrinsics.dFx) && std::isfinite(stIntrinsics.dFy) &&
               stIntrinsics.dFx > 0.0 && stIntrinsics.dFy > 0.0 && std::isfinite(stIntrinsics.dCx) && std::isfinite(stIntrinsics.dCy);
    }

    /******************************************************************************
     * @brief Forward Brown-Conrady distortion of an ideal normalized point.
     *
     * @param cvIdeal - Undistorted normalized coordinates (x, y).
     * @param stIntrinsics - Source of the k1, k2, k3, p1, p2 coefficients.
     * @return cv::Point2d - Where the lens actually images that point, still normalized.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Point2d DistortNormalizedPoint(const cv::Point2d& cvIdeal, const CameraIntrinsics& stIntrinsics)
    {
        const double dX      = cvIdeal.x;
        const double dY      = cvIdeal.y;
        const double dR2     = dX * dX + dY * dY;
        const double dRadial = 1.0 + stIntrinsics.dK1 * dR2 + stIntrinsics.dK2 * dR2 * dR2 + stIntrinsics.dK3 * dR2 * dR2 * dR2;
        const double dXTan   = 2.0 * stIntrinsics.dP1 * dX * dY + stIntrinsics.dP2 * (dR2 + 2.0 * dX * dX);
        const double dYTan   = stIntrinsics.dP1 * (dR2 + 2.0 * dY * dY) + 2.0 * stIntrinsics.dP2 * dX * dY;

        return cv::Point2d(dX * dRadial + dXTan, dY * dRadial + dYTan);
    }

    /******************************************************************************
     * @brief Invert the lens distortion with a fixed number of fixed-point steps.
     *      Starting from the observed point, each step distorts the current
     *      estimate and subtracts the residual against the observation. There is
     *      no convergence check, strong distortion near the image edge may need
     *      more than constants::UNDISTORT_ITERATIONS steps.
     *
     * @param cvObserved - Normalized coordinates ((u - cx) / fx, (v - cy) / fy).
     * @param stIntrinsics - Source of the distortion coefficients.
     * @return cv::Point2d - Estimated ideal normalized coordinates.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Point2d UndistortNormalizedPoint(const cv::Point2d& cvObserved, const CameraIntrinsics& stIntrinsics)
    {
        cv::Point2d cvEstimate = cvObserved;
        for (int nIter = 0; nIter < constants::UNDISTORT_ITERATIONS; ++nIter)
        {
            cvEstimate -= DistortNormalizedPoint(cvEstimate, stIntrinsics) - cvObserved;
        }

        return cvEstimate;
    }

    /******************************************************************************
     * @brief Convert a pixel in sensor orientation to a camera space direction.
     *      The result is (x, y, 1) with +z forward, +x right and +y down in the
     *      image. It is not normalized to unit length. Pixels outside the image
     *      are not rejected.
     *
     * @param cvPixel - Observed pixel (u, v).
     * @param stIntrinsics - Resolved camera intrinsics.
     * @return cv::Vec3d - Camera space direction.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Vec3d PixelToCameraRay(const cv::Point2d& cvPixel, const CameraIntrinsics& stIntrinsics)
    {
        cv::Point2d cvNormalized((cvPixel.x - stIntrinsics.dCx) / stIntrinsics.dFx, (cvPixel.y - stIntrinsics.dCy) / stIntrinsics.dFy);

        if (HasDistortion(stIntrinsics))
        {
            cvNormalized = UndistortNormalizedPoint(cvNormalized, stIntrinsics);
        }

        return cv::Vec3d(cvNormalized.x, cvNormalized.y, 1.0);
    }

    /******************************************************************************
     * @brief Focal length in pixels from a horizontal field of view.
     *
     * @param nImageWidth - Image width in pixels.
     * @param dHorizontalFOVDeg - Full horizontal field of view in degrees.
     * @return double - fx in pixels. The half angle tangent is clamped so a zero FOV stays finite.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline double FocalLengthFromFOV(const int nImageWidth, const double dHorizontalFOVDeg)
    {
        const double dHalfAngleTan = std::tan(dHorizontalFOVDeg / 2.0 * CV_PI / 180.0);
        return (nImageWidth / 2.0) / std::max(dHalfAngleTan, constants::FOV_MIN_HALF_ANGLE_TAN);
    }

    /******************************************************************************
     * @brief Rescale intrinsics calibrated at one resolution to another.
     *      Focal lengths and principal point scale linearly, distortion
     *      coefficients are kept.
     *
     * @param stIntrinsics - Intrinsics at the calibration resolution.
     * @param nNewWidth - Target width in pixels.
     * @param nNewHeight - Target height in pixels.
     * @return CameraIntrinsics - Intrinsics valid at nNewWidth x nNewHeight.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline CameraIntrinsics ScaleIntrinsics(const CameraIntrinsics& stIntrinsics, const int nNewWidth, const int nNewHeight)
    {
        CameraIntrinsics stScaled = stIntrinsics;
        if (stIntrinsics.nImageWidth <= 0 || stIntrinsics.nImageHeight <= 0)
        {
            return stScaled;
        }

        const double dSx = static_cast<double>(nNewWidth) / static_cast<double>(stIntrinsics.nImageWidth);
        const double dSy = static_cast<double>(nNewHeight) / static_cast<double>(stIntrinsics.nImageHeight);

        stScaled.nImageWidth  = nNewWidth;
        stScaled.nImageHeight = nNewHeight;
        stScaled.dFx *= dSx;
        stScaled.dCx *= dSx;
        stScaled.dFy *= dSy;
        stScaled.dCy *= dSy;

        return stScaled;
    }

    /******************************************************************************
     * @brief Build the OpenCV camera matrix K.
     *
     * @param stIntrinsics - Camera intrinsics.
     * @return cv::Mat - 3x3 CV_64F matrix.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Mat ToCameraMatrix(const CameraIntrinsics& stIntrinsics)
    {
        return (cv::Mat_<double>(3, 3) << stIntrinsics.dFx, 0, stIntrinsics.dCx, 0, stIntrinsics.dFy, stIntrinsics.dCy, 0, 0, 1);
    }

    // OpenCV coefficient order is (k1, k2, p1, p2, k3).
    inline cv::Mat ToDistortionCoefficients(const CameraIntrinsics& stIntrinsics)
    {
        return (cv::Mat_<double>(1, 5) << stIntrinsics.dK1, stIntrinsics.dK2, stIntrinsics.dP1, stIntrinsics.dP2, stIntrinsics.dK3);
    }
}    // namespace CameraModel

#endif    // CAMERA_MODEL_HPP
