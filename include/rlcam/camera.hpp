#pragma once

#include <rlcam/types.hpp>
#include <dlg/dlg.hpp>
#include <raylib.h>
#include <cmath>
#include <stdexcept>
#include <type_traits>

// Generic camera value types mirroring raylib's Camera3D and Camera2D.
// The native structs store everything as 32-bit floats, the types
// here are generic over the floating point type used for their vectors.
// Conversion to and from the native structs is always done explicitly,
// field by field (see toNative, fromNative). The structs are never
// reinterpreted in memory, so any floating point type is safe to use;
// precision beyond float is simply lost when handing a camera to raylib.

namespace rlcam {

enum class Projection : int {
	perspective = CAMERA_PERSPECTIVE,
	orthographic = CAMERA_ORTHOGRAPHIC,
};

template<typename T>
class Camera3D {
public:
	static_assert(std::is_floating_point_v<T>,
		"rlcam::Camera3D requires a floating point type");

	Vec3<T> position {}; // position of the camera in world space
	Vec3<T> target {}; // point the camera looks at
	Vec3<T> up {}; // up vector, not required to be normalized
	float fovy {}; // in degrees. Near plane width for orthographic cameras

public:
	// fovy is in degrees.
	// No validation of any of the values is done, they are passed
	// to raylib as they are.
	[[nodiscard]] static Camera3D perspective(Vec3<T> position,
			Vec3<T> target, Vec3<T> up, float fovy) {
		return {position, target, up, fovy, Projection::perspective};
	}

	// fovy is in degrees.
	[[nodiscard]] static Camera3D orthographic(Vec3<T> position,
			Vec3<T> target, Vec3<T> up, float fovy) {
		return {position, target, up, fovy, Projection::orthographic};
	}

	Projection projection() const { return projection_; }

private:
	Camera3D(Vec3<T> pos, Vec3<T> tgt, Vec3<T> u, float fov, Projection proj) :
		position(pos), target(tgt), up(u), fovy(fov), projection_(proj) {}

	Projection projection_;
};

template<typename T> using Camera = Camera3D<T>;

template<typename T>
struct Camera2D {
	static_assert(std::is_floating_point_v<T>,
		"rlcam::Camera2D requires a floating point type");

	Vec2<T> offset {}; // displacement from the target, in screen space
	Vec2<T> target {}; // rotation and zoom origin, in world space
	float rotation {0.f}; // in degrees
	float zoom {1.f};
};

namespace detail {

template<typename T>
float narrow(T val) {
	auto ret = static_cast<float>(val);
	dlg_assertlm(dlg_level_warn, !std::isfinite(val) || std::isfinite(ret),
		"Value {} not representable as float", val);
	return ret;
}

} // namespace detail

// vectors
template<typename T>
[[nodiscard]] ::Vector2 toNative(const Vec2<T>& v) {
	return {detail::narrow(v.x), detail::narrow(v.y)};
}

template<typename T>
[[nodiscard]] ::Vector3 toNative(const Vec3<T>& v) {
	return {detail::narrow(v.x), detail::narrow(v.y), detail::narrow(v.z)};
}

template<typename T>
[[nodiscard]] Vec2<T> fromNative(const ::Vector2& v) {
	return {T(v.x), T(v.y)};
}

template<typename T>
[[nodiscard]] Vec3<T> fromNative(const ::Vector3& v) {
	return {T(v.x), T(v.y), T(v.z)};
}

// cameras
template<typename T>
[[nodiscard]] ::Camera3D toNative(const Camera3D<T>& cam) {
	::Camera3D ret;
	ret.position = toNative(cam.position);
	ret.target = toNative(cam.target);
	ret.up = toNative(cam.up);
	ret.fovy = cam.fovy;
	ret.projection = static_cast<int>(cam.projection());
	return ret;
}

// Throws std::invalid_argument if the native projection is neither
// CAMERA_PERSPECTIVE nor CAMERA_ORTHOGRAPHIC.
template<typename T>
[[nodiscard]] Camera3D<T> fromNative(const ::Camera3D& cam) {
	auto pos = fromNative<T>(cam.position);
	auto target = fromNative<T>(cam.target);
	auto up = fromNative<T>(cam.up);

	switch(cam.projection) {
		case CAMERA_PERSPECTIVE:
			return Camera3D<T>::perspective(pos, target, up, cam.fovy);
		case CAMERA_ORTHOGRAPHIC:
			return Camera3D<T>::orthographic(pos, target, up, cam.fovy);
		default:
			dlg_error("Invalid native camera projection {}", cam.projection);
			throw std::invalid_argument("rlcam::fromNative: invalid camera projection");
	}
}

template<typename T>
[[nodiscard]] ::Camera2D toNative(const Camera2D<T>& cam) {
	::Camera2D ret;
	ret.offset = toNative(cam.offset);
	ret.target = toNative(cam.target);
	ret.rotation = cam.rotation;
	ret.zoom = cam.zoom;
	return ret;
}

template<typename T>
[[nodiscard]] Camera2D<T> fromNative(const ::Camera2D& cam) {
	Camera2D<T> ret;
	ret.offset = fromNative<T>(cam.offset);
	ret.target = fromNative<T>(cam.target);
	ret.rotation = cam.rotation;
	ret.zoom = cam.zoom;
	return ret;
}

} // namespace rlcam
