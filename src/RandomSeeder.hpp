#pragma once

#include <random>

// SeedSequence that fills the requested state straight from std::random_device
class RandomSeeder {
	std::random_device rd;

public:
	using result_type = std::random_device::result_type;

	template<typename RandomAccessIterator>
	void generate(RandomAccessIterator, RandomAccessIterator);
};

#include "RandomSeeder.tpp" // IWYU pragma: keep
