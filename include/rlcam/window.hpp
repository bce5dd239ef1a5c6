#pragma once

#include <rlcam/types.hpp>
#include <nytl/nonCopyable.hpp>
#include <dlg/dlg.h>
#include <string>

namespace rlcam {

struct WindowSettings {
	std::string title {"rlcam"};
	Vec2ui size {1280u, 720u};
	unsigned fps {60u}; // target fps, 0 for unlimited
	bool msaa {true};
};

// Owner of the native raylib window and its graphics context.
// raylib only supports a single window, there must never be more
// than one Window object at a time.
// Functions that need an initialized native context (camera modes,
// camera updates, screen-space queries) take a Window& to make sure
// they are never called before the window was created or after
// it was destroyed.
// While the window exists, the raylib trace log is forwarded to dlg.
// raylib does not exit on LOG_FATAL messages when a log callback is set,
// the forwarding callback does so itself (after logging them).
class Window : public nytl::NonMovable {
public:
	// Throws std::runtime_error if the native window could not be created.
	explicit Window(const WindowSettings& = {});
	~Window();

	bool shouldClose() const;
	Vec2ui size() const;
	float frameTime() const;
};

namespace detail {

// The dlg level a raylib trace log level is forwarded with.
// Levels that aren't message levels (LOG_ALL, LOG_NONE) map to info.
dlg_level traceLogLevel(int nativeLevel);

} // namespace detail
} // namespace rlcam
