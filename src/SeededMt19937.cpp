#include "SeededMt19937.hpp"

#include <iostream>
#include <stdexcept>
#include <optional>

#include <explints.hpp>
#include <RandomSeeder.hpp>
#include <PropertyReader.hpp>

SeededMt19937::SeededMt19937() {
	seedRandomly();
}

SeededMt19937::SeededMt19937(result_type seed)
: rng(seed) { }

SeededMt19937 SeededMt19937::fromProperties(const PropertyReader& pr) {
	std::optional<u32> seed;

	try {
		seed = pr.getProp<u32>("rng.seed");
	} catch (const std::logic_error& e) {
		std::cerr << "Invalid rng.seed property (" << pr.getProp("rng.seed") << "), seeding randomly." << std::endl;
		std::cerr << "what(): " << e.what() << std::endl;
	}

	return seed ? SeededMt19937(*seed) : SeededMt19937();
}

void SeededMt19937::seed(result_type s) {
	rng.seed(s);
}

void SeededMt19937::seedRandomly() {
	// RandomSeeder fills the internal state of the mersenne twister with random
	// numbers from std::random_device
	RandomSeeder rs{};
	rng.seed(rs);
}

SeededMt19937::result_type SeededMt19937::operator()() {
	return rng();
}
