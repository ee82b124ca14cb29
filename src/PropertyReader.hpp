#pragma once

#include <string>
#include <string_view>
#include <map>
#include <optional>
#include <functional>

// Reads "key value" lines, the first space separates the key from the value
class PropertyReader {
	std::string filePath;
	std::map<std::string, std::string, std::less<>> props;

public:
	PropertyReader(std::string_view filePath);

	bool readFromDisk();

	const std::string& getFilePath() const;
	bool isEmpty() const;
	bool hasProp(std::string_view key) const;
	std::string_view getProp(std::string_view key, std::string_view defval = "") const;

	// nullopt if the property isn't set, throws from fromString if it's malformed
	template<typename T>
	std::optional<T> getProp(std::string_view key) const;
};

#include "PropertyReader.tpp" // IWYU pragma: keep
