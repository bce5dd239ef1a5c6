#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

// file: string utility for parsing names of keys and modes

namespace rlcam {

// case-insensitive char traits
// see https://stackoverflow.com/questions/11635
struct CharTraitsCI : public std::char_traits<char> {
	static char up(char c) {
		return char(std::toupper(static_cast<unsigned char>(c)));
	}

	static bool eq(char c1, char c2) { return up(c1) == up(c2); }
	static bool ne(char c1, char c2) { return up(c1) != up(c2); }
	static bool lt(char c1, char c2) { return up(c1) <  up(c2); }
	static int compare(const char* s1, const char* s2, std::size_t n) {
		while(n-- != 0) {
			if(up(*s1) < up(*s2)) return -1;
			if(up(*s1) > up(*s2)) return 1;
			++s1; ++s2;
		}
		return 0;
	}
	static const char* find(const char* s, std::size_t n, char a) {
		for(; n > 0; --n, ++s) {
			if(up(*s) == up(a)) {
				return s;
			}
		}
		return nullptr;
	}
};

// case-insensitive
inline bool equalCI(std::string_view a, std::string_view b) {
	using CIView = std::basic_string_view<char, CharTraitsCI>;
	return CIView(a.data(), a.size()) == CIView(b.data(), b.size());
}

// Removes leading and trailing whitespace.
inline std::string_view trim(std::string_view src) {
	auto isSpace = [](char c) {
		return std::isspace(static_cast<unsigned char>(c)) != 0;
	};

	while(!src.empty() && isSpace(src.front())) {
		src.remove_prefix(1);
	}
	while(!src.empty() && isSpace(src.back())) {
		src.remove_suffix(1);
	}
	return src;
}

} // namespace rlcam
