#include "viewer.hpp"
#include <rlcam/camera.hpp>
#include <dlg/dlg.hpp>
#include <raylib.h>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace rlcam::types;

bool Viewer::init(int argc, const char** argv) {
	auto parser = argParser();
	auto usage = std::string("Usage: ") + argv[0] + " [options]\n\n";
	argagg::parser_results result;
	try {
		result = parser.parse(argc, argv);
	} catch(const std::exception& error) {
		argagg::fmt_ostream help(std::cerr);
		help << usage << parser << "\n";
		help << "Invalid arguments: " << error.what();
		help << std::endl;
		return false;
	}

	if(result["help"]) {
		argagg::fmt_ostream help(std::cerr);
		help << usage << parser << std::endl;
		return false;
	}

	try {
		if(!handleArgs(result, args_)) {
			argagg::fmt_ostream help(std::cerr);
			help << usage << parser << std::endl;
			return false;
		}
	} catch(const std::exception& error) {
		argagg::fmt_ostream help(std::cerr);
		help << usage << parser << "\n";
		help << "Error parsing arguments: " << error.what();
		help << std::endl;
		return false;
	}

	return true;
}

argagg::parser Viewer::argParser() const {
	return {{
		{
			"help", {"-h", "--help"},
			"Displays help information", 0
		}, {
			"mode", {"-m", "--mode"},
			"Camera mode: custom, free, orbital, first_person or third_person", 1
		}, {
			"ortho", {"--ortho"},
			"Use an orthographic camera", 0
		}, {
			"fovy", {"--fovy"},
			"Vertical field of view in degrees", 1
		}, {
			"pan-key", {"--pan-key"},
			"Key to combine with mouse movement for panning", 1
		}, {
			"alt-key", {"--alt-key"},
			"Key to combine with mouse movement (free camera)", 1
		}, {
			"zoom-key", {"--zoom-key"},
			"Key for smooth zoom (free camera)", 1
		}, {
			"move-keys", {"--move-keys"},
			"Movement keys: front,back,right,left,up,down", 1
		}, {
			"width", {"--width"},
			"Window width", 1
		}, {
			"height", {"--height"},
			"Window height", 1
		}, {
			"fps", {"--fps"},
			"Target fps, 0 for unlimited", 1
		}, {
			"no-msaa", {"--no-msaa"},
			"Disable multisampling", 0
		}, {
			"2d", {"--2d"},
			"Show the 2D camera scene", 0
		}
	}};
}

bool Viewer::handleArgs(const argagg::parser_results& result, Args& args) {
	auto parseKey = [&](const char* opt, rlcam::Key& out) {
		auto& arg = result[opt];
		if(arg.count() == 0) {
			return true;
		}

		auto key = rlcam::keyFromName(arg[0].arg);
		if(!key) {
			dlg_error("Invalid key name for {}: {}", opt, arg[0].arg);
			return false;
		}

		out = *key;
		return true;
	};

	if(auto& mode = result["mode"]; mode.count() > 0) {
		auto parsed = rlcam::cameraModeFromName(mode[0].arg);
		if(!parsed) {
			dlg_error("Invalid camera mode: {}", mode[0].arg);
			return false;
		}
		args.mode = *parsed;
	}

	args.ortho = result["ortho"];
	args.scene2D = result["2d"];
	args.window.msaa = !result["no-msaa"];
	args.fovy = result["fovy"].as<float>(args.fovy);

	auto width = result["width"].as<int>(int(args.window.size.x));
	auto height = result["height"].as<int>(int(args.window.size.y));
	if(width <= 0 || height <= 0) {
		dlg_error("Invalid window size {}x{}", width, height);
		return false;
	}

	auto fps = result["fps"].as<int>(int(args.window.fps));
	if(fps < 0) {
		dlg_error("Invalid target fps {}", fps);
		return false;
	}

	args.window.size = {unsigned(width), unsigned(height)};
	args.window.fps = unsigned(fps);
	args.window.title = "rlcam viewer";

	if(auto& pan = result["pan-key"]; pan.count() > 0) {
		auto key = rlcam::keyFromName(pan[0].arg);
		if(!key) {
			dlg_error("Invalid key name for pan-key: {}", pan[0].arg);
			return false;
		}
		args.controls.pan = *key;
	}

	if(!parseKey("alt-key", args.controls.alt) ||
			!parseKey("zoom-key", args.controls.smoothZoom)) {
		return false;
	}

	if(auto& move = result["move-keys"]; move.count() > 0) {
		auto keys = rlcam::parseKeyList(move[0].arg);
		if(!keys || keys->size() != 6u) {
			dlg_error("Expected 6 valid move keys, got '{}'", move[0].arg);
			return false;
		}

		auto& c = args.controls;
		c.front = (*keys)[0];
		c.back = (*keys)[1];
		c.right = (*keys)[2];
		c.left = (*keys)[3];
		c.up = (*keys)[4];
		c.down = (*keys)[5];
	}

	return true;
}

void Viewer::run() {
	rlcam::Window window(args_.window);
	if(args_.scene2D) {
		run2D(window);
	} else {
		run3D(window);
	}
}

void Viewer::run3D(rlcam::Window& window) {
	auto pos = Vec3f{10.f, 10.f, 10.f};
	auto target = Vec3f{0.f, 0.f, 0.f};
	auto up = Vec3f{0.f, 1.f, 0.f};
	auto cam = args_.ortho ?
		rlcam::Camera3D<float>::orthographic(pos, target, up, args_.fovy) :
		rlcam::Camera3D<float>::perspective(pos, target, up, args_.fovy);

	rlcam::apply(window, args_.controls);
	rlcam::setCameraMode(window, cam, args_.mode);

	auto cubePos = Vec3f{0.f, 1.f, 0.f};
	while(!window.shouldClose()) {
		rlcam::updateCamera(window, cam);
		auto label = rlcam::worldToScreen(window, cam,
			Vec3f{cubePos.x, cubePos.y + 1.5f, cubePos.z});

		BeginDrawing();
		ClearBackground(RAYWHITE);

		BeginMode3D(rlcam::toNative(cam));
		DrawCube(rlcam::toNative(cubePos), 2.f, 2.f, 2.f, RED);
		DrawCubeWires(rlcam::toNative(cubePos), 2.f, 2.f, 2.f, MAROON);
		DrawGrid(20, 1.f);
		EndMode3D();

		DrawText("cube", int(label.x) - 12, int(label.y), 20, DARKGRAY);
		DrawText(TextFormat("mode: %s, %s", rlcam::name(args_.mode).data(),
			cam.projection() == rlcam::Projection::orthographic ?
				"orthographic" : "perspective"), 10, 10, 20, DARKGRAY);
		DrawFPS(10, 40);
		EndDrawing();
	}
}

void Viewer::run2D(rlcam::Window& window) {
	auto size = window.size();
	rlcam::Camera2D<float> cam;
	cam.offset = {0.5f * size.x, 0.5f * size.y};

	auto& c = args_.controls;
	while(!window.shouldClose()) {
		auto dt = window.frameTime();
		auto speed = 200.f * dt;
		if(IsKeyDown(static_cast<int>(c.right))) cam.target.x += speed;
		if(IsKeyDown(static_cast<int>(c.left))) cam.target.x -= speed;
		if(IsKeyDown(static_cast<int>(c.front))) cam.target.y -= speed;
		if(IsKeyDown(static_cast<int>(c.back))) cam.target.y += speed;
		if(IsKeyDown(static_cast<int>(c.up))) cam.rotation += 45.f * dt;
		if(IsKeyDown(static_cast<int>(c.down))) cam.rotation -= 45.f * dt;
		cam.zoom += 0.1f * GetMouseWheelMove();
		cam.zoom = cam.zoom < 0.1f ? 0.1f : cam.zoom;

		auto mpos = GetMousePosition();
		auto world = rlcam::screenToWorld(window, cam, Vec2f{mpos.x, mpos.y});

		BeginDrawing();
		ClearBackground(RAYWHITE);

		BeginMode2D(rlcam::toNative(cam));
		for(auto i = -10; i <= 10; ++i) {
			DrawLine(i * 50, -500, i * 50, 500, LIGHTGRAY);
			DrawLine(-500, i * 50, 500, i * 50, LIGHTGRAY);
		}
		DrawRectangleV(rlcam::toNative(Vec2f{-25.f, -25.f}),
			rlcam::toNative(Vec2f{50.f, 50.f}), RED);
		EndMode2D();

		DrawText(TextFormat("world: %.1f %.1f", world.x, world.y),
			10, 10, 20, DARKGRAY);
		DrawFPS(10, 40);
		EndDrawing();
	}
}
