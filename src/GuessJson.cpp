#include "GuessJson.hpp"

#include <string>

#include <Guess.hpp>

#include <nlohmann/json.hpp>

namespace nlohmann {
	Guess adl_serializer<Guess>::from_json(const json& j) {
		if (j.is_string()) {
			return Guess::parse(j.get_ref<const std::string&>());
		}

		if (!j.is_number_integer()) {
			throw GuessParseError(std::string("Expected an integer, got ") + j.type_name());
		}

		// check before narrowing, big numbers would wrap into the range
		if (j.is_number_unsigned()) {
			if (j.get<u64>() > u64(Guess::MAX)) {
				throw GuessRangeError{};
			}
		} else {
			i64 n = j.get<i64>();
			if (n < Guess::MIN || n > Guess::MAX) {
				throw GuessRangeError{};
			}
		}

		return Guess(j.get<i32>());
	}

	void adl_serializer<Guess>::to_json(json& j, const Guess& g) {
		j = g.value();
	}
}
