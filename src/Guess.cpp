#include "Guess.hpp"

#include <ostream>
#include <stdexcept>

#include <SeededMt19937.hpp>
#include <stringparser.hpp>
#include <utils.hpp>

Guess::Guess(i32 v)
: val(v) { }

Guess Guess::parse(std::string_view s) {
	trim_v(s);

	i32 n;
	try {
		n = fromString<i32>(s);
	} catch (const std::logic_error& e) { // invalid_argument or out_of_range
		throw GuessParseError(e.what());
	}

	return Guess(n);
}

i32 Guess::value() const {
	return val;
}

std::string Guess::toString() const {
	return std::to_string(value());
}

bool Guess::operator ==(const Guess& g) const {
	return val == g.val;
}

std::strong_ordering Guess::operator <=>(const Guess& g) const {
	return val <=> g.val;
}

std::ostream& operator <<(std::ostream& os, const Guess& g) {
	return os << g.value();
}

static SeededMt19937& threadRng() {
	static thread_local SeededMt19937 rng;
	return rng;
}

Guess genRandom() noexcept {
	// can't throw, the distribution never leaves the range
	return genRandom(threadRng());
}

void seedRandom(u32 seed) {
	threadRng().seed(seed);
}

void seedRandomFromProperties(const PropertyReader& pr) {
	threadRng() = SeededMt19937::fromProperties(pr);
}
