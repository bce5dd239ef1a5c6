#include <rlcam/input.hpp>
#include <rlcam/util.hpp>
#include <dlg/dlg.hpp>
#include <utility>

namespace rlcam {
namespace {

constexpr std::pair<Key, std::string_view> keyNames[] = {
	{Key::null, "null"},
	{Key::apostrophe, "apostrophe"},
	{Key::comma, "comma"},
	{Key::minus, "minus"},
	{Key::period, "period"},
	{Key::slash, "slash"},
	{Key::zero, "0"},
	{Key::one, "1"},
	{Key::two, "2"},
	{Key::three, "3"},
	{Key::four, "4"},
	{Key::five, "5"},
	{Key::six, "6"},
	{Key::seven, "7"},
	{Key::eight, "8"},
	{Key::nine, "9"},
	{Key::semicolon, "semicolon"},
	{Key::equal, "equal"},
	{Key::a, "a"},
	{Key::b, "b"},
	{Key::c, "c"},
	{Key::d, "d"},
	{Key::e, "e"},
	{Key::f, "f"},
	{Key::g, "g"},
	{Key::h, "h"},
	{Key::i, "i"},
	{Key::j, "j"},
	{Key::k, "k"},
	{Key::l, "l"},
	{Key::m, "m"},
	{Key::n, "n"},
	{Key::o, "o"},
	{Key::p, "p"},
	{Key::q, "q"},
	{Key::r, "r"},
	{Key::s, "s"},
	{Key::t, "t"},
	{Key::u, "u"},
	{Key::v, "v"},
	{Key::w, "w"},
	{Key::x, "x"},
	{Key::y, "y"},
	{Key::z, "z"},
	{Key::leftBracket, "left_bracket"},
	{Key::backslash, "backslash"},
	{Key::rightBracket, "right_bracket"},
	{Key::grave, "grave"},
	{Key::space, "space"},
	{Key::escape, "escape"},
	{Key::enter, "enter"},
	{Key::tab, "tab"},
	{Key::backspace, "backspace"},
	{Key::insert, "insert"},
	{Key::del, "delete"},
	{Key::right, "right"},
	{Key::left, "left"},
	{Key::down, "down"},
	{Key::up, "up"},
	{Key::pageUp, "page_up"},
	{Key::pageDown, "page_down"},
	{Key::home, "home"},
	{Key::end, "end"},
	{Key::capsLock, "caps_lock"},
	{Key::scrollLock, "scroll_lock"},
	{Key::numLock, "num_lock"},
	{Key::printScreen, "print_screen"},
	{Key::pause, "pause"},
	{Key::f1, "f1"},
	{Key::f2, "f2"},
	{Key::f3, "f3"},
	{Key::f4, "f4"},
	{Key::f5, "f5"},
	{Key::f6, "f6"},
	{Key::f7, "f7"},
	{Key::f8, "f8"},
	{Key::f9, "f9"},
	{Key::f10, "f10"},
	{Key::f11, "f11"},
	{Key::f12, "f12"},
	{Key::leftShift, "left_shift"},
	{Key::leftControl, "left_control"},
	{Key::leftAlt, "left_alt"},
	{Key::leftSuper, "left_super"},
	{Key::rightShift, "right_shift"},
	{Key::rightControl, "right_control"},
	{Key::rightAlt, "right_alt"},
	{Key::rightSuper, "right_super"},
	{Key::kbMenu, "kb_menu"},
	{Key::kp0, "kp_0"},
	{Key::kp1, "kp_1"},
	{Key::kp2, "kp_2"},
	{Key::kp3, "kp_3"},
	{Key::kp4, "kp_4"},
	{Key::kp5, "kp_5"},
	{Key::kp6, "kp_6"},
	{Key::kp7, "kp_7"},
	{Key::kp8, "kp_8"},
	{Key::kp9, "kp_9"},
	{Key::kpDecimal, "kp_decimal"},
	{Key::kpDivide, "kp_divide"},
	{Key::kpMultiply, "kp_multiply"},
	{Key::kpSubtract, "kp_subtract"},
	{Key::kpAdd, "kp_add"},
	{Key::kpEnter, "kp_enter"},
	{Key::kpEqual, "kp_equal"},
	{Key::back, "back"},
	{Key::menu, "menu"},
	{Key::volumeUp, "volume_up"},
	{Key::volumeDown, "volume_down"},
};

constexpr std::pair<CameraMode, std::string_view> modeNames[] = {
	{CameraMode::custom, "custom"},
	{CameraMode::free, "free"},
	{CameraMode::orbital, "orbital"},
	{CameraMode::firstPerson, "first_person"},
	{CameraMode::thirdPerson, "third_person"},
};

template<typename E, std::size_t N>
std::string_view findName(const std::pair<E, std::string_view> (&table)[N],
		E value) {
	for(auto& [v, n] : table) {
		if(v == value) {
			return n;
		}
	}

	return {};
}

template<typename E, std::size_t N>
std::optional<E> findValue(const std::pair<E, std::string_view> (&table)[N],
		std::string_view name) {
	for(auto& [v, n] : table) {
		if(equalCI(n, name)) {
			return v;
		}
	}

	return std::nullopt;
}

} // anon namespace

std::string_view name(Key key) {
	return findName(keyNames, key);
}

std::optional<Key> keyFromName(std::string_view name) {
	return findValue(keyNames, trim(name));
}

std::string_view name(CameraMode mode) {
	return findName(modeNames, mode);
}

std::optional<CameraMode> cameraModeFromName(std::string_view name) {
	return findValue(modeNames, trim(name));
}

std::optional<std::vector<Key>> parseKeyList(std::string_view list, char sep) {
	std::vector<Key> ret;
	auto start = std::size_t(0);
	while(true) {
		auto pos = list.find(sep, start);
		auto count = (pos == list.npos) ? list.npos : pos - start;
		auto part = list.substr(start, count);
		auto key = keyFromName(part);
		if(!key) {
			dlg_debug("parseKeyList: invalid key name '{}'", part);
			return std::nullopt;
		}

		ret.push_back(*key);
		if(pos == list.npos) {
			break;
		}

		start = pos + 1;
	}

	return ret;
}

} // namespace rlcam
