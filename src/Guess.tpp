#pragma once
#include "Guess.hpp"
#include <random>

template<typename URBG>
Guess genRandom(URBG& rng) {
	std::uniform_int_distribution<i32> dist(Guess::MIN, Guess::MAX);
	return Guess(dist(rng));
}
