#pragma once

#include <string_view>
#include <type_traits>

// throws std::invalid_argument on malformed input,
// std::out_of_range if the number doesn't fit in T
template<typename T>
typename std::enable_if<!std::is_same<T, bool>::value && std::is_integral<T>::value, T>::type
fromString(std::string_view, int base);

template<typename T>
typename std::enable_if<!std::is_same<T, bool>::value && std::is_integral<T>::value, T>::type
fromString(std::string_view);
