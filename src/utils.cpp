#include "utils.hpp"

#include <algorithm>
#include <cctype>

static bool notSpace(unsigned char ch) {
	return !std::isspace(ch);
}

// UTF-8 encoded White_Space code points outside of ASCII
static constexpr std::string_view unicodeSpaces[] = {
	"\xC2\x85", // next line
	"\xC2\xA0", // no-break space
	"\xE1\x9A\x80", // ogham space mark
	"\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
	"\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", // en quad to hair space
	"\xE2\x80\xA8", // line separator
	"\xE2\x80\xA9", // paragraph separator
	"\xE2\x80\xAF", // narrow no-break space
	"\xE2\x81\x9F", // medium mathematical space
	"\xE3\x80\x80" // ideographic space
};

// byte length of the whitespace character s starts with, 0 if there's none
static sz_t leadingSpaceLen(std::string_view s) {
	if (s.empty()) {
		return 0;
	}

	if (std::isspace(static_cast<unsigned char>(s.front()))) {
		return 1;
	}

	for (auto sp : unicodeSpaces) {
		if (s.substr(0, sp.size()) == sp) {
			return sp.size();
		}
	}

	return 0;
}

static sz_t trailingSpaceLen(std::string_view s) {
	if (s.empty()) {
		return 0;
	}

	if (std::isspace(static_cast<unsigned char>(s.back()))) {
		return 1;
	}

	for (auto sp : unicodeSpaces) {
		if (s.size() >= sp.size() && s.substr(s.size() - sp.size()) == sp) {
			return sp.size();
		}
	}

	return 0;
}

// trim from start (in place)
void ltrim(std::string& s) {
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
}

// trim from end (in place)
void rtrim(std::string& s) {
	s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

// trim from both ends (in place)
void trim(std::string& s) {
	ltrim(s);
	rtrim(s);
}

void ltrim_v(std::string_view& s) {
	while (sz_t len = leadingSpaceLen(s)) {
		s.remove_prefix(len);
	}
}

void rtrim_v(std::string_view& s) {
	while (sz_t len = trailingSpaceLen(s)) {
		s.remove_suffix(len);
	}
}

void trim_v(std::string_view& s) {
	ltrim_v(s);
	rtrim_v(s);
}
