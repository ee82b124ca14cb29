#pragma once

#include <stdexcept>
#include <string>

// Common base of every error a Guess can be created with, catch this to handle
// both kinds at once, or the derived types to handle one of them
class GuessError {
public:
	enum class Kind {
		LEXICAL,
		RANGE
	};

	virtual ~GuessError() = default;

	virtual Kind kind() const noexcept = 0;
	virtual const char* what() const noexcept = 0;
};

// The integer was well formed, but outside of 0-100
struct GuessRangeError : std::range_error, GuessError {
	GuessRangeError();

	Kind kind() const noexcept override;
	const char* what() const noexcept override;
};

// The text couldn't be read as an integer at all
struct GuessParseError : std::invalid_argument, GuessError {
	explicit GuessParseError(const std::string& reason);

	Kind kind() const noexcept override;
	const char* what() const noexcept override;
};

const char* toString(GuessError::Kind);
