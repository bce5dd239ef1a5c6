#include <rlcam/window.hpp>
#include <dlg/dlg.hpp>
#include <raylib.h>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace rlcam {
namespace {

bool windowExists = false;

void traceLogHandler(int level, const char* fmt, va_list args) {
	char buf[1024];
	std::vsnprintf(buf, sizeof(buf), fmt, args);

	switch(detail::traceLogLevel(level)) {
		case dlg_level_trace: dlg_trace("raylib: {}", buf); break;
		case dlg_level_debug: dlg_debug("raylib: {}", buf); break;
		case dlg_level_info: dlg_info("raylib: {}", buf); break;
		case dlg_level_warn: dlg_warn("raylib: {}", buf); break;
		case dlg_level_error: dlg_error("raylib: {}", buf); break;
		case dlg_level_fatal: dlg_fatal("raylib: {}", buf); break;
	}

	// raylib skips its own exit for fatal messages when a callback is set
	if(level == LOG_FATAL) {
		std::exit(EXIT_FAILURE);
	}
}

} // anon namespace

dlg_level detail::traceLogLevel(int nativeLevel) {
	switch(nativeLevel) {
		case LOG_TRACE: return dlg_level_trace;
		case LOG_DEBUG: return dlg_level_debug;
		case LOG_INFO: return dlg_level_info;
		case LOG_WARNING: return dlg_level_warn;
		case LOG_ERROR: return dlg_level_error;
		case LOG_FATAL: return dlg_level_fatal;
		default: return dlg_level_info;
	}
}

Window::Window(const WindowSettings& settings) {
	dlg_assertm(!windowExists, "Only a single rlcam::Window may exist");

	// we want all native messages, dlg filters them
	SetTraceLogLevel(LOG_ALL);
	SetTraceLogCallback(&traceLogHandler);

	if(settings.msaa) {
		SetConfigFlags(FLAG_MSAA_4X_HINT);
	}

	InitWindow(int(settings.size.x), int(settings.size.y),
		settings.title.c_str());
	if(!IsWindowReady()) {
		SetTraceLogCallback(nullptr);
		throw std::runtime_error("rlcam::Window: failed to create raylib window");
	}

	SetTargetFPS(int(settings.fps));
	windowExists = true;
	dlg_debug("Created window '{}' ({}x{})", settings.title,
		settings.size.x, settings.size.y);
}

Window::~Window() {
	CloseWindow();
	SetTraceLogCallback(nullptr);
	windowExists = false;
}

bool Window::shouldClose() const {
	return WindowShouldClose();
}

Vec2ui Window::size() const {
	return {unsigned(GetScreenWidth()), unsigned(GetScreenHeight())};
}

float Window::frameTime() const {
	return GetFrameTime();
}

} // namespace rlcam
