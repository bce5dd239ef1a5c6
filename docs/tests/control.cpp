#include <rlcam/control.hpp>
#include <rlcam/types.hpp>
#include <dlg/dlg.hpp>
#include "bugged.hpp"
#include <array>
#include <utility>
#include <vector>

// The native update needs a window and input. The tests below substitute
// it via detail::updateWith to check what is copied back.

using namespace rlcam::types;

namespace {

unsigned updateCalls = 0u;

void moveForward(::Camera3D* cam) {
	++updateCalls;
	cam->position.z -= 1.f;
	cam->target.z -= 1.f;
}

void scramble(::Camera3D* cam) {
	++updateCalls;
	cam->position = {7.f, 8.f, 9.f};
	cam->target = {1.f, 1.f, 1.f};
	cam->up = {1.f, 0.f, 0.f};
	cam->fovy = 90.f;
	cam->projection = (cam->projection == CAMERA_PERSPECTIVE) ?
		CAMERA_ORTHOGRAPHIC : CAMERA_PERSPECTIVE;
}

void invalidate(::Camera3D* cam) {
	++updateCalls;
	cam->projection = -1;
}

} // anon namespace

TEST(updateCopiesBack) {
	updateCalls = 0u;
	auto cam = rlcam::Camera3D<float>::perspective({0.f, 1.f, 5.f},
		{0.f, 1.f, 0.f}, {0.f, 1.f, 0.f}, 45.f);

	rlcam::detail::updateWith(cam, &moveForward);
	EXPECT(updateCalls, 1u);
	EXPECT(cam.position.z, 4.f);
	EXPECT(cam.target.z, -1.f);
	EXPECT(cam.position.y, 1.f);
	EXPECT(cam.fovy, 45.f);

	rlcam::detail::updateWith(cam, &scramble);
	EXPECT(updateCalls, 2u);
	EXPECT(cam.position.x, 7.f);
	EXPECT(cam.target.y, 1.f);
	EXPECT(cam.up.x, 1.f);
	EXPECT(cam.fovy, 90.f);
}

TEST(updateKeepsProjection) {
	auto persp = rlcam::Camera3D<float>::perspective({}, {}, {}, 45.f);
	auto ortho = rlcam::Camera3D<double>::orthographic({}, {}, {}, 10.f);

	for(auto i = 0u; i < 3u; ++i) {
		rlcam::detail::updateWith(persp, &scramble);
		rlcam::detail::updateWith(ortho, &scramble);
		EXPECT(persp.projection(), rlcam::Projection::perspective);
		EXPECT(ortho.projection(), rlcam::Projection::orthographic);
	}

	// even invalid native values don't leak into the tag
	rlcam::detail::updateWith(ortho, &invalidate);
	EXPECT(ortho.projection(), rlcam::Projection::orthographic);
	EXPECT(rlcam::toNative(ortho).projection, int(CAMERA_ORTHOGRAPHIC));
}

TEST(updateDouble) {
	auto cam = rlcam::Camera3D<double>::perspective({0.0, 0.0, 2.5},
		{0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, 60.f);
	rlcam::detail::updateWith(cam, &moveForward);
	EXPECT(cam.position.z, 1.5);
	EXPECT(cam.target.z, -1.0);
}

TEST(defaultControls) {
	rlcam::CameraControls controls;
	EXPECT(controls.pan.has_value(), false);
	EXPECT(controls.alt, rlcam::Key::leftAlt);
	EXPECT(controls.smoothZoom, rlcam::Key::leftControl);
	EXPECT(controls.front, rlcam::Key::w);
	EXPECT(controls.back, rlcam::Key::s);
	EXPECT(controls.right, rlcam::Key::d);
	EXPECT(controls.left, rlcam::Key::a);
	EXPECT(controls.up, rlcam::Key::e);
	EXPECT(controls.down, rlcam::Key::q);
}

// Records the bindings that would be forwarded to raylib.
namespace {

struct ForwardedControls {
	std::vector<int> pan;
	std::vector<int> alt;
	std::vector<int> smoothZoom;
	std::vector<std::array<int, 6>> move;
	std::vector<std::pair<float, int>> mode; // (camera fovy, mode)
};

ForwardedControls forwarded;

const rlcam::detail::NativeControls recordingControls {
	[](int key) { forwarded.pan.push_back(key); },
	[](int key) { forwarded.alt.push_back(key); },
	[](int key) { forwarded.smoothZoom.push_back(key); },
	[](int front, int back, int right, int left, int up, int down) {
		forwarded.move.push_back({front, back, right, left, up, down});
	},
	[](::Camera3D cam, int mode) { forwarded.mode.push_back({cam.fovy, mode}); },
};

} // anon namespace

TEST(moveControlsOrder) {
	forwarded = {};
	rlcam::detail::setCameraMoveControls(recordingControls,
		rlcam::Key::up, rlcam::Key::down, rlcam::Key::right,
		rlcam::Key::left, rlcam::Key::pageUp, rlcam::Key::pageDown);

	EXPECT(forwarded.move.size(), 1u);
	auto& keys = forwarded.move.front();
	EXPECT(keys[0], int(KEY_UP));
	EXPECT(keys[1], int(KEY_DOWN));
	EXPECT(keys[2], int(KEY_RIGHT));
	EXPECT(keys[3], int(KEY_LEFT));
	EXPECT(keys[4], int(KEY_PAGE_UP));
	EXPECT(keys[5], int(KEY_PAGE_DOWN));
}

TEST(singleControls) {
	forwarded = {};
	rlcam::detail::setCameraPanControl(recordingControls, rlcam::Key::space);
	rlcam::detail::setCameraAltControl(recordingControls, rlcam::Key::rightAlt);
	rlcam::detail::setCameraSmoothZoomControl(recordingControls, rlcam::Key::z);

	EXPECT(forwarded.pan.size(), 1u);
	EXPECT(forwarded.pan.front(), int(KEY_SPACE));
	EXPECT(forwarded.alt.size(), 1u);
	EXPECT(forwarded.alt.front(), int(KEY_RIGHT_ALT));
	EXPECT(forwarded.smoothZoom.size(), 1u);
	EXPECT(forwarded.smoothZoom.front(), int(KEY_Z));
	EXPECT(forwarded.move.empty(), true);
	EXPECT(forwarded.mode.empty(), true);
}

TEST(applyWithoutPan) {
	forwarded = {};
	rlcam::detail::apply(recordingControls, rlcam::CameraControls{});

	EXPECT(forwarded.pan.empty(), true);
	EXPECT(forwarded.alt.size(), 1u);
	EXPECT(forwarded.alt.front(), int(KEY_LEFT_ALT));
	EXPECT(forwarded.smoothZoom.size(), 1u);
	EXPECT(forwarded.smoothZoom.front(), int(KEY_LEFT_CONTROL));
	EXPECT(forwarded.move.size(), 1u);

	auto& keys = forwarded.move.front();
	EXPECT(keys[0], int(KEY_W));
	EXPECT(keys[1], int(KEY_S));
	EXPECT(keys[2], int(KEY_D));
	EXPECT(keys[3], int(KEY_A));
	EXPECT(keys[4], int(KEY_E));
	EXPECT(keys[5], int(KEY_Q));
}

TEST(applyAll) {
	forwarded = {};
	rlcam::CameraControls controls;
	controls.pan = rlcam::Key::leftShift;
	controls.alt = rlcam::Key::tab;
	controls.smoothZoom = rlcam::Key::rightControl;
	controls.front = rlcam::Key::i;
	controls.back = rlcam::Key::k;
	controls.right = rlcam::Key::l;
	controls.left = rlcam::Key::j;
	controls.up = rlcam::Key::o;
	controls.down = rlcam::Key::u;
	rlcam::detail::apply(recordingControls, controls);

	EXPECT(forwarded.pan.size(), 1u);
	EXPECT(forwarded.pan.front(), int(KEY_LEFT_SHIFT));
	EXPECT(forwarded.alt.front(), int(KEY_TAB));
	EXPECT(forwarded.smoothZoom.front(), int(KEY_RIGHT_CONTROL));
	EXPECT(forwarded.move.size(), 1u);

	auto& keys = forwarded.move.front();
	EXPECT(keys[0], int(KEY_I));
	EXPECT(keys[1], int(KEY_K));
	EXPECT(keys[2], int(KEY_L));
	EXPECT(keys[3], int(KEY_J));
	EXPECT(keys[4], int(KEY_O));
	EXPECT(keys[5], int(KEY_U));
	EXPECT(forwarded.mode.empty(), true);
}

TEST(cameraModeForwarding) {
	forwarded = {};
	auto cam = rlcam::Camera3D<float>::perspective({}, {}, {0.f, 1.f, 0.f}, 50.f);
	rlcam::detail::setCameraMode(recordingControls, rlcam::toNative(cam),
		rlcam::CameraMode::thirdPerson);
	rlcam::detail::setCameraMode(recordingControls, rlcam::toNative(cam),
		rlcam::CameraMode::custom);

	EXPECT(forwarded.mode.size(), 2u);
	EXPECT(forwarded.mode[0].first, 50.f);
	EXPECT(forwarded.mode[0].second, int(CAMERA_THIRD_PERSON));
	EXPECT(forwarded.mode[1].second, int(CAMERA_CUSTOM));
}
