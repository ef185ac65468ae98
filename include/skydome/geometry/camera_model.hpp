#pragma once

#include "skydome/core/types.hpp"

#include <optional>

namespace skydome::geometry {

struct CameraIntrinsics {
    int width = 1864;
    int height = 4032;
    double fov_degrees = 75.0;  // horizontal field of view
};

/**
 * Device orientation to world rotation.
 * alpha = yaw about Z, beta = pitch about X, gamma = roll about Y.
 * Composition is R = Rz(alpha) * Ry(gamma) * Rx(beta); recorded rotation
 * metadata depends on this exact order.
 */
RotationMatrix euler_to_rotation(double alpha, double beta, double gamma);

/**
 * Pinhole camera with the principal point at the image center.
 * Maps pixels to world directions and clips them to the dome cap
 * [theta_min, theta_max] (closed interval).
 */
class CameraModel {
public:
    explicit CameraModel(const CameraIntrinsics& intrinsics = CameraIntrinsics(),
                         double theta_min = 0.0,
                         double theta_max = default_theta_max());

    const CameraIntrinsics& intrinsics() const { return intrinsics_; }
    double focal_length() const { return focal_; }
    double cx() const { return cx_; }
    double cy() const { return cy_; }
    double theta_min() const { return theta_min_; }
    double theta_max() const { return theta_max_; }

    // Normalized camera-space ray through pixel (u, v).
    Vector3d pixel_ray(double u, double v) const;

    // Nullopt when the rotated ray leaves the dome cap.
    std::optional<SphericalCoord> pixel_to_spherical(double u, double v,
                                                     const RotationMatrix& rotation) const;

    // Closed-interval dome cap test.
    bool in_dome(double theta) const { return !(theta < theta_min_ || theta > theta_max_); }

    // Direction to (theta, phi) without the dome clip.
    static SphericalCoord direction_to_spherical(const Vector3d& world_dir);

    static double default_theta_max();

private:
    CameraIntrinsics intrinsics_;
    double focal_;
    double cx_;
    double cy_;
    double theta_min_;
    double theta_max_;
};

} // namespace skydome::geometry
