#pragma once

#include <rlcam/camera.hpp>
#include <rlcam/input.hpp>
#include <rlcam/window.hpp>
#include <raylib.h>
#include <optional>

// Camera controls implemented by raylib's camera module.
// raylib keeps the mode and the key bindings as global state; the
// functions here only forward to it. Everything that needs
// the native context takes a Window&.

namespace rlcam {

/// The camera control key bindings.
/// Defaults match the ones raylib starts with.
struct CameraControls {
	// raylib uses the middle mouse button by default. Only
	// forwarded when set.
	std::optional<Key> pan {};
	Key alt = Key::leftAlt;
	Key smoothZoom = Key::leftControl;

	// movement in first/third person modes
	Key front = Key::w;
	Key back = Key::s;
	Key right = Key::d;
	Key left = Key::a;
	Key up = Key::e;
	Key down = Key::q;
};

namespace detail {

// The raylib entry points the control functions forward to.
struct NativeControls {
	void(*setPan)(int key);
	void(*setAlt)(int key);
	void(*setSmoothZoom)(int key);
	void(*setMove)(int front, int back, int right, int left, int up, int down);
	void(*setMode)(::Camera3D camera, int mode);
};

// The raylib functions themselves.
const NativeControls& raylibControls();

void setCameraPanControl(const NativeControls&, Key pan);
void setCameraAltControl(const NativeControls&, Key alt);
void setCameraSmoothZoomControl(const NativeControls&, Key smoothZoom);
void setCameraMoveControls(const NativeControls&, Key front, Key back,
	Key right, Key left, Key up, Key down);
void apply(const NativeControls&, const CameraControls&);
void setCameraMode(const NativeControls&, const ::Camera3D&, CameraMode);

} // namespace detail

// Sets camera pan key to combine with mouse movement (free camera).
void setCameraPanControl(Window&, Key pan);

// Sets camera alt key to combine with mouse movement (free camera).
void setCameraAltControl(Window&, Key alt);

// Sets camera smooth zoom key to combine with mouse (free camera).
void setCameraSmoothZoomControl(Window&, Key smoothZoom);

// Sets camera move controls (first and third person cameras).
void setCameraMoveControls(Window&, Key front, Key back, Key right,
	Key left, Key up, Key down);

// Forwards all bindings in the given controls. The pan control
// is only forwarded when set.
void apply(Window&, const CameraControls&);

void setCameraMode(Window&, const ::Camera3D&, CameraMode);

// Sets the camera mode. raylib derives its internal control state
// (e.g. the orbit distance) from the given camera.
template<typename T>
void setCameraMode(Window& window, const Camera3D<T>& cam, CameraMode mode) {
	setCameraMode(window, toNative(cam), mode);
}

namespace detail {

using NativeCameraUpdate = void(*)(::Camera3D*);

// Runs the given native update on the camera and copies the
// result back. The projection is always kept.
template<typename T>
void updateWith(Camera3D<T>& cam, NativeCameraUpdate nativeUpdate) {
	dlg_assert(nativeUpdate);
	auto native = toNative(cam);
	nativeUpdate(&native);

	cam.position = fromNative<T>(native.position);
	cam.target = fromNative<T>(native.target);
	cam.up = fromNative<T>(native.up);
	cam.fovy = native.fovy;
}

} // namespace detail

// Updates the camera for the selected mode, using the current
// input state.
template<typename T>
void updateCamera(Window&, Camera3D<T>& cam) {
	detail::updateWith(cam, &::UpdateCamera);
}

// Screen space position for the given world space position.
template<typename T>
[[nodiscard]] Vec2<T> worldToScreen(Window&, const Camera3D<T>& cam,
		const Vec3<T>& pos) {
	return fromNative<T>(::GetWorldToScreen(toNative(pos), toNative(cam)));
}

template<typename T>
[[nodiscard]] Vec2<T> worldToScreen(Window&, const Camera2D<T>& cam,
		const Vec2<T>& pos) {
	return fromNative<T>(::GetWorldToScreen2D(toNative(pos), toNative(cam)));
}

template<typename T>
[[nodiscard]] Vec2<T> screenToWorld(Window&, const Camera2D<T>& cam,
		const Vec2<T>& pos) {
	return fromNative<T>(::GetScreenToWorld2D(toNative(pos), toNative(cam)));
}

} // namespace rlcam
