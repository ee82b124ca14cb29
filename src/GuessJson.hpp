#pragma once

#include <nlohmann/json_fwd.hpp>

class Guess;

namespace nlohmann {
	// Guess has no default constructor, so it can't use the to_json/from_json
	// free function pair. A guess is stored as a plain integer; reading also
	// takes a string holding one. Throws GuessParseError or GuessRangeError.
	template<>
	struct adl_serializer<Guess> {
		static Guess from_json(const json&);
		static void to_json(json&, const Guess&);
	};
}
