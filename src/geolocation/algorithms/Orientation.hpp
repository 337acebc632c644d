/******************************************************************************
 * @brief Atomic functional library for composing the camera to East-North-Up
 *      rotation from yaw, pitch and roll.
 *
 * @file Orientation.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef ORIENTATION_HPP
#define ORIENTATION_HPP

/// \cond
#include <cmath>
#include <opencv2/core.hpp>

/// \endcond

namespace Orientation
{
    /******************************************************************************
     * @brief Camera to ENU alignment at zero attitude. The camera looks straight
     *      down with image right pointing East and image down pointing South.
     *
     * @return cv::Mat - diag(1, -1, -1).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Mat BaseAlignment()
    {
        return (cv::Mat_<double>(3, 3) << 1, 0, 0, 0, -1, 0, 0, 0, -1);
    }

    /******************************************************************************
     * @brief Build the rotation taking camera space vectors into ENU.
     *      R = Rz(yaw) * Rx(pitch) * Ry(-roll) * diag(1, -1, -1), with Rz about
     *      Up, Rx about East and Ry about North, all right handed. Roll is negated
     *      so a positive roll drops the right edge of the image.
     *
     * @param dYawDeg - Yaw in degrees.
     * @param dPitchDeg - Pitch in degrees.
     * @param dRollDeg - Roll in degrees.
     * @return cv::Mat - 3x3 CV_64F orthonormal matrix.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Mat ComposeRotation(const double dYawDeg, const double dPitchDeg, const double dRollDeg)
    {
        const double dY = dYawDeg * CV_PI / 180.0;
        const double dP = dPitchDeg * CV_PI / 180.0;
        const double dR = -dRollDeg * CV_PI / 180.0;

        cv::Mat cvRz = (cv::Mat_<double>(3, 3) << std::cos(dY), -std::sin(dY), 0, std::sin(dY), std::cos(dY), 0, 0, 0, 1);
        cv::Mat cvRx = (cv::Mat_<double>(3, 3) << 1, 0, 0, 0, std::cos(dP), -std::sin(dP), 0, std::sin(dP), std::cos(dP));
        cv::Mat cvRy = (cv::Mat_<double>(3, 3) << std::cos(dR), 0, std::sin(dR), 0, 1, 0, -std::sin(dR), 0, std::cos(dR));

        return cvRz * cvRx * cvRy * BaseAlignment();
    }

    /******************************************************************************
     * @brief Rotate a camera space ray into ENU and scale it to unit length.
     *
     * @param cvRotation - Output of ComposeRotation.
     * @param cvCameraRay - Camera space direction, any length.
     * @return cv::Vec3d - Unit (East, North, Up) direction. Zero input stays zero.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    inline cv::Vec3d CameraRayToENU(const cv::Mat& cvRotation, const cv::Vec3d& cvCameraRay)
    {
        cv::Mat cvWorld = cvRotation * cv::Mat(cvCameraRay);
        cv::Vec3d cvDirection(cvWorld.at<double>(0), cvWorld.at<double>(1), cvWorld.at<double>(2));

        const double dNorm = cv::norm(cvDirection);
        if (dNorm > 1e-12)
        {
            cvDirection /= dNorm;
        }

        return cvDirection;
    }
}    // namespace Orientation

#endif    // ORIENTATION_HPP
