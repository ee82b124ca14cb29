#pragma once

#include <compare>
#include <stdexcept>

template<typename T, T MIN, T MAX, typename E = std::range_error>
class Range {
	static_assert(MIN <= MAX, "empty range");

	T value;

public:
	using type = T;
	using error_type = E;
	static constexpr T min = MIN;
	static constexpr T max = MAX;

	// throws E if val is outside [MIN, MAX]
	Range(T val);

	T get() const;
	operator T() const;

	static constexpr bool contains(T val) {
		return val >= MIN && val <= MAX;
	}

	bool operator ==(const Range&) const = default;
	auto operator <=>(const Range&) const = default;
};

#include "Range.tpp" // IWYU pragma: keep
