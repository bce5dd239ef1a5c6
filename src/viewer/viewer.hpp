#pragma once

#include <rlcam/control.hpp>
#include <rlcam/window.hpp>
#include <argagg.hpp>

// Small raylib scene to try out the camera modes and key bindings.

class Viewer {
public:
	struct Args {
		rlcam::WindowSettings window;
		rlcam::CameraControls controls;
		rlcam::CameraMode mode {rlcam::CameraMode::free};
		bool ortho {false};
		float fovy {45.f};
		bool scene2D {false};
	};

public:
	// Returns false if the viewer should not be run.
	bool init(int argc, const char** argv);
	void run();

	argagg::parser argParser() const;

	// Returns false (after logging the reason) for invalid arguments.
	bool handleArgs(const argagg::parser_results&, Args& out);
	const Args& args() const { return args_; }

protected:
	void run3D(rlcam::Window&);
	void run2D(rlcam::Window&);

protected:
	Args args_;
};
