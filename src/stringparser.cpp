#include "stringparser.hpp"

#include <stdexcept>
#include <string>
#include <limits>
#include <charconv>
#include <explints.hpp>

template<typename T>
typename std::enable_if<!std::is_same<T, bool>::value && std::is_integral<T>::value, T>::type
fromString(std::string_view s, int base) {
	using L = std::numeric_limits<T>;

	// from_chars doesn't take the plus sign, but it's a valid number
	if (s.size() > 1 && s[0] == '+' && s[1] != '-') {
		s.remove_prefix(1);
	}

	if (s.size() == 0) {
		throw std::invalid_argument("Improperly formatted argument");
	}

	typename std::conditional<L::is_signed, i64, u64>::type n;
	auto res = std::from_chars(s.data(), s.data() + s.size(), n, base);

	if (res.ec == std::errc::result_out_of_range) {
		throw std::out_of_range("Value too big/small");
	}

	if (res.ptr != s.data() + s.size() || res.ec == std::errc::invalid_argument) { // contains extra data, or not a number
		throw std::invalid_argument("Improperly formatted argument: \"" + std::string(s) + "\"");
	}

	if (n > L::max() || n < L::min()) {
		throw std::out_of_range("Value too big/small");
	}

	return n;
}

template<typename T>
typename std::enable_if<!std::is_same<T, bool>::value && std::is_integral<T>::value, T>::type
fromString(std::string_view s) {
	return fromString<T>(s, 10);
}

// explicit instantiations
template u8 fromString<u8>(std::string_view, int);
template u16 fromString<u16>(std::string_view, int);
template u32 fromString<u32>(std::string_view, int);
template u64 fromString<u64>(std::string_view, int);

template i8 fromString<i8>(std::string_view, int);
template i16 fromString<i16>(std::string_view, int);
template i32 fromString<i32>(std::string_view, int);
template i64 fromString<i64>(std::string_view, int);

template u8 fromString<u8>(std::string_view);
template u16 fromString<u16>(std::string_view);
template u32 fromString<u32>(std::string_view);
template u64 fromString<u64>(std::string_view);

template i8 fromString<i8>(std::string_view);
template i16 fromString<i16>(std::string_view);
template i32 fromString<i32>(std::string_view);
template i64 fromString<i64>(std::string_view);
