#pragma once
#include "Range.hpp"
#include <string>
#include <type_traits>

template<typename T, T MIN, T MAX, typename E>
Range<T, MIN, MAX, E>::Range(T val)
: value(val) {
	if (!contains(val)) {
		if constexpr (std::is_constructible<E, const std::string&>::value) {
			throw E("Value " + std::to_string(val) + " outside range (" + std::to_string(MIN) + "-" + std::to_string(MAX) + ")");
		} else {
			throw E{};
		}
	}
}

template<typename T, T MIN, T MAX, typename E>
T Range<T, MIN, MAX, E>::get() const {
	return value;
}

template<typename T, T MIN, T MAX, typename E>
Range<T, MIN, MAX, E>::operator T() const {
	return value;
}
