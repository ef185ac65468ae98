#include "skydome/geometry/camera_model.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace skydome::geometry {

RotationMatrix euler_to_rotation(double alpha, double beta, double gamma) {
    const double ca = std::cos(alpha), sa = std::sin(alpha);
    const double cb = std::cos(beta), sb = std::sin(beta);
    const double cg = std::cos(gamma), sg = std::sin(gamma);

    RotationMatrix rx;
    rx << 1.0, 0.0, 0.0,
          0.0, cb, -sb,
          0.0, sb, cb;

    RotationMatrix ry;
    ry << cg, 0.0, sg,
          0.0, 1.0, 0.0,
          -sg, 0.0, cg;

    RotationMatrix rz;
    rz << ca, -sa, 0.0,
          sa, ca, 0.0,
          0.0, 0.0, 1.0;

    return rz * ry * rx;
}

double CameraModel::default_theta_max() {
    return core::kPi / 3.0;
}

CameraModel::CameraModel(const CameraIntrinsics& intrinsics, double theta_min, double theta_max)
    : intrinsics_(intrinsics), theta_min_(theta_min), theta_max_(theta_max) {
    if (intrinsics.width < 1 || intrinsics.height < 1) {
        throw ValidationError("camera dimensions must be positive");
    }
    if (!(intrinsics.fov_degrees > 0.0 && intrinsics.fov_degrees < 180.0)) {
        throw ValidationError("camera fov must be in (0, 180) degrees");
    }
    if (!(theta_min >= 0.0 && theta_min < theta_max && theta_max <= core::kPi)) {
        throw ValidationError("dome theta range must satisfy 0 <= min < max <= pi");
    }
    const double fov_rad = core::deg_to_rad(intrinsics.fov_degrees);
    focal_ = intrinsics.width / (2.0 * std::tan(fov_rad / 2.0));
    cx_ = intrinsics.width / 2.0;
    cy_ = intrinsics.height / 2.0;
}

Vector3d CameraModel::pixel_ray(double u, double v) const {
    Vector3d ray((u - cx_) / focal_, (v - cy_) / focal_, 1.0);
    return ray.normalized();
}

SphericalCoord CameraModel::direction_to_spherical(const Vector3d& world_dir) {
    const double z = std::max(-1.0, std::min(1.0, world_dir.z()));
    const double theta = std::acos(z);
    double phi = std::atan2(world_dir.y(), world_dir.x());
    if (phi < 0.0) {
        phi += 2.0 * core::kPi;
    }
    return {theta, phi};
}

std::optional<SphericalCoord> CameraModel::pixel_to_spherical(double u, double v,
                                                              const RotationMatrix& rotation) const {
    const Vector3d world = rotation * pixel_ray(u, v);
    SphericalCoord sc = direction_to_spherical(world);
    if (!in_dome(sc.theta)) {
        return std::nullopt;
    }
    return sc;
}

} // namespace skydome::geometry
