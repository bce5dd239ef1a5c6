#include "viewer.hpp"
#include <dlg/dlg.hpp>
#include <cstdlib>
#include <stdexcept>

int main(int argc, const char** argv) {
	Viewer viewer;
	if(!viewer.init(argc, argv)) {
		return EXIT_FAILURE;
	}

	try {
		viewer.run();
	} catch(const std::exception& err) {
		dlg_fatal("Viewer failed: {}", err.what());
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
