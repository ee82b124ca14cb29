#include "GuessError.hpp"

GuessRangeError::GuessRangeError()
: std::range_error("The guess value was out of 0-100 range") { }

GuessError::Kind GuessRangeError::kind() const noexcept {
	return Kind::RANGE;
}

const char* GuessRangeError::what() const noexcept {
	return std::range_error::what();
}

GuessParseError::GuessParseError(const std::string& reason)
: std::invalid_argument(reason) { }

GuessError::Kind GuessParseError::kind() const noexcept {
	return Kind::LEXICAL;
}

const char* GuessParseError::what() const noexcept {
	return std::invalid_argument::what();
}

const char* toString(GuessError::Kind k) {
	switch (k) {
		case GuessError::Kind::LEXICAL:
			return "lexical";

		case GuessError::Kind::RANGE:
			return "range";
	}

	return "unknown";
}
