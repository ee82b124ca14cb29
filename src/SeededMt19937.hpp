#pragma once

#include <random>

class PropertyReader;

class SeededMt19937 {
	std::mt19937 rng;

public:
	using result_type = std::mt19937::result_type;

	SeededMt19937();
	explicit SeededMt19937(result_type seed);

	// uses the "rng.seed" property if set, random_device otherwise
	static SeededMt19937 fromProperties(const PropertyReader&);

	void seed(result_type);
	void seedRandomly();

	result_type operator()();

	static constexpr result_type min() {
		return std::mt19937::min();
	}

	static constexpr result_type max() {
		return std::mt19937::max();
	}
};
