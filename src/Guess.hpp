#pragma once

#include <compare>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <explints.hpp>
#include <GuessError.hpp>
#include <Range.hpp>

class PropertyReader;

// A number guessed in the 0-100 range. A Guess can't be built holding anything
// else, so code taking one never needs to check the value again.
class Guess {
public:
	using Value = Range<i32, 0, 100, GuessRangeError>;

	static constexpr i32 MIN = Value::min;
	static constexpr i32 MAX = Value::max;

private:
	Value val;

public:
	// throws GuessRangeError
	Guess(i32);

	// Trims whitespace around the text first.
	// throws GuessParseError if it's not an integer, GuessRangeError if it is
	// but doesn't fit the range
	static Guess parse(std::string_view);

	i32 value() const;
	std::string toString() const;

	bool operator ==(const Guess&) const;
	std::strong_ordering operator <=>(const Guess&) const;
};

std::ostream& operator <<(std::ostream&, const Guess&);

// Uniform over the whole range, from the calling thread's generator
Guess genRandom() noexcept;

template<typename URBG>
Guess genRandom(URBG&);

// reseeds the calling thread's generator
void seedRandom(u32);
// "rng.seed" if set and valid, random_device otherwise
void seedRandomFromProperties(const PropertyReader&);

template<>
struct std::hash<Guess> {
	sz_t operator()(const Guess& g) const noexcept {
		return std::hash<i32>{}(g.value());
	}
};

#include "Guess.tpp" // IWYU pragma: keep
