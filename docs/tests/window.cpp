#include <rlcam/window.hpp>
#include <raylib.h>
#include "bugged.hpp"

// Creating a window needs a display, only the log forwarding
// is checked here.

TEST(traceLogLevels) {
	using rlcam::detail::traceLogLevel;
	EXPECT(traceLogLevel(LOG_TRACE), dlg_level_trace);
	EXPECT(traceLogLevel(LOG_DEBUG), dlg_level_debug);
	EXPECT(traceLogLevel(LOG_INFO), dlg_level_info);
	EXPECT(traceLogLevel(LOG_WARNING), dlg_level_warn);
	EXPECT(traceLogLevel(LOG_ERROR), dlg_level_error);
	EXPECT(traceLogLevel(LOG_FATAL), dlg_level_fatal);

	EXPECT(traceLogLevel(LOG_ALL), dlg_level_info);
	EXPECT(traceLogLevel(LOG_NONE), dlg_level_info);
	EXPECT(traceLogLevel(1234), dlg_level_info);
}
