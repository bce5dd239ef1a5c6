#pragma once

#include <raylib.h>
#include <optional>
#include <string_view>
#include <vector>

// Typesafe mirrors of the raylib input and camera mode enumerations.
// Every value is defined via the native constant, conversion is
// a plain integer cast when forwarding to raylib.

namespace rlcam {

enum class CameraMode : int {
	custom = CAMERA_CUSTOM,
	free = CAMERA_FREE,
	orbital = CAMERA_ORBITAL,
	firstPerson = CAMERA_FIRST_PERSON,
	thirdPerson = CAMERA_THIRD_PERSON,
};

enum class Key : int {
	null = KEY_NULL,

	// alphanumeric
	apostrophe = KEY_APOSTROPHE,
	comma = KEY_COMMA,
	minus = KEY_MINUS,
	period = KEY_PERIOD,
	slash = KEY_SLASH,
	zero = KEY_ZERO,
	one = KEY_ONE,
	two = KEY_TWO,
	three = KEY_THREE,
	four = KEY_FOUR,
	five = KEY_FIVE,
	six = KEY_SIX,
	seven = KEY_SEVEN,
	eight = KEY_EIGHT,
	nine = KEY_NINE,
	semicolon = KEY_SEMICOLON,
	equal = KEY_EQUAL,
	a = KEY_A,
	b = KEY_B,
	c = KEY_C,
	d = KEY_D,
	e = KEY_E,
	f = KEY_F,
	g = KEY_G,
	h = KEY_H,
	i = KEY_I,
	j = KEY_J,
	k = KEY_K,
	l = KEY_L,
	m = KEY_M,
	n = KEY_N,
	o = KEY_O,
	p = KEY_P,
	q = KEY_Q,
	r = KEY_R,
	s = KEY_S,
	t = KEY_T,
	u = KEY_U,
	v = KEY_V,
	w = KEY_W,
	x = KEY_X,
	y = KEY_Y,
	z = KEY_Z,
	leftBracket = KEY_LEFT_BRACKET,
	backslash = KEY_BACKSLASH,
	rightBracket = KEY_RIGHT_BRACKET,
	grave = KEY_GRAVE,

	// function keys
	space = KEY_SPACE,
	escape = KEY_ESCAPE,
	enter = KEY_ENTER,
	tab = KEY_TAB,
	backspace = KEY_BACKSPACE,
	insert = KEY_INSERT,
	del = KEY_DELETE,
	right = KEY_RIGHT,
	left = KEY_LEFT,
	down = KEY_DOWN,
	up = KEY_UP,
	pageUp = KEY_PAGE_UP,
	pageDown = KEY_PAGE_DOWN,
	home = KEY_HOME,
	end = KEY_END,
	capsLock = KEY_CAPS_LOCK,
	scrollLock = KEY_SCROLL_LOCK,
	numLock = KEY_NUM_LOCK,
	printScreen = KEY_PRINT_SCREEN,
	pause = KEY_PAUSE,
	f1 = KEY_F1,
	f2 = KEY_F2,
	f3 = KEY_F3,
	f4 = KEY_F4,
	f5 = KEY_F5,
	f6 = KEY_F6,
	f7 = KEY_F7,
	f8 = KEY_F8,
	f9 = KEY_F9,
	f10 = KEY_F10,
	f11 = KEY_F11,
	f12 = KEY_F12,
	leftShift = KEY_LEFT_SHIFT,
	leftControl = KEY_LEFT_CONTROL,
	leftAlt = KEY_LEFT_ALT,
	leftSuper = KEY_LEFT_SUPER,
	rightShift = KEY_RIGHT_SHIFT,
	rightControl = KEY_RIGHT_CONTROL,
	rightAlt = KEY_RIGHT_ALT,
	rightSuper = KEY_RIGHT_SUPER,
	kbMenu = KEY_KB_MENU,

	// keypad
	kp0 = KEY_KP_0,
	kp1 = KEY_KP_1,
	kp2 = KEY_KP_2,
	kp3 = KEY_KP_3,
	kp4 = KEY_KP_4,
	kp5 = KEY_KP_5,
	kp6 = KEY_KP_6,
	kp7 = KEY_KP_7,
	kp8 = KEY_KP_8,
	kp9 = KEY_KP_9,
	kpDecimal = KEY_KP_DECIMAL,
	kpDivide = KEY_KP_DIVIDE,
	kpMultiply = KEY_KP_MULTIPLY,
	kpSubtract = KEY_KP_SUBTRACT,
	kpAdd = KEY_KP_ADD,
	kpEnter = KEY_KP_ENTER,
	kpEqual = KEY_KP_EQUAL,

	// android
	// raylib reuses keyboard values for some of these: KEY_MENU is the
	// same value as KEY_R, so name(Key::menu) is "r" and both names
	// parse to the same key.
	back = KEY_BACK,
	menu = KEY_MENU,
	volumeUp = KEY_VOLUME_UP,
	volumeDown = KEY_VOLUME_DOWN,
};

// Names are lowercase with '_' as word separator, e.g. "left_alt",
// "kp_add" or "f5". Lookup is case-insensitive.
// Returns an empty string view for values that aren't enumerators.
std::string_view name(Key);
std::optional<Key> keyFromName(std::string_view name);

// "custom", "free", "orbital", "first_person", "third_person"
std::string_view name(CameraMode);
std::optional<CameraMode> cameraModeFromName(std::string_view name);

// Parses a list of key names separated by the given character.
// Whitespace around names is ignored. Returns nullopt if any
// of the names is invalid or empty.
std::optional<std::vector<Key>> parseKeyList(std::string_view list,
	char sep = ',');

} // namespace rlcam
