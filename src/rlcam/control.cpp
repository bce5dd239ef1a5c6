#include <rlcam/control.hpp>
#include <dlg/dlg.hpp>

namespace rlcam {
namespace detail {

const NativeControls& raylibControls() {
	static const NativeControls controls {
		&::SetCameraPanControl,
		&::SetCameraAltControl,
		&::SetCameraSmoothZoomControl,
		&::SetCameraMoveControls,
		&::SetCameraMode,
	};
	return controls;
}

void setCameraPanControl(const NativeControls& native, Key pan) {
	dlg_debug("Camera pan control: {}", name(pan));
	native.setPan(static_cast<int>(pan));
}

void setCameraAltControl(const NativeControls& native, Key alt) {
	dlg_debug("Camera alt control: {}", name(alt));
	native.setAlt(static_cast<int>(alt));
}

void setCameraSmoothZoomControl(const NativeControls& native, Key smoothZoom) {
	dlg_debug("Camera smooth zoom control: {}", name(smoothZoom));
	native.setSmoothZoom(static_cast<int>(smoothZoom));
}

void setCameraMoveControls(const NativeControls& native, Key front, Key back,
		Key right, Key left, Key up, Key down) {
	dlg_debug("Camera move controls: {} {} {} {} {} {}", name(front),
		name(back), name(right), name(left), name(up), name(down));
	native.setMove(
		static_cast<int>(front),
		static_cast<int>(back),
		static_cast<int>(right),
		static_cast<int>(left),
		static_cast<int>(up),
		static_cast<int>(down));
}

void apply(const NativeControls& native, const CameraControls& controls) {
	if(controls.pan) {
		setCameraPanControl(native, *controls.pan);
	}

	setCameraAltControl(native, controls.alt);
	setCameraSmoothZoomControl(native, controls.smoothZoom);
	setCameraMoveControls(native, controls.front, controls.back,
		controls.right, controls.left, controls.up, controls.down);
}

void setCameraMode(const NativeControls& native, const ::Camera3D& cam,
		CameraMode mode) {
	dlg_debug("Camera mode: {}", name(mode));
	native.setMode(cam, static_cast<int>(mode));
}

} // namespace detail

void setCameraPanControl(Window&, Key pan) {
	detail::setCameraPanControl(detail::raylibControls(), pan);
}

void setCameraAltControl(Window&, Key alt) {
	detail::setCameraAltControl(detail::raylibControls(), alt);
}

void setCameraSmoothZoomControl(Window&, Key smoothZoom) {
	detail::setCameraSmoothZoomControl(detail::raylibControls(), smoothZoom);
}

void setCameraMoveControls(Window&, Key front, Key back, Key right,
		Key left, Key up, Key down) {
	detail::setCameraMoveControls(detail::raylibControls(),
		front, back, right, left, up, down);
}

void apply(Window&, const CameraControls& controls) {
	detail::apply(detail::raylibControls(), controls);
}

void setCameraMode(Window&, const ::Camera3D& cam, CameraMode mode) {
	detail::setCameraMode(detail::raylibControls(), cam, mode);
}

} // namespace rlcam
