#pragma once
#include "PropertyReader.hpp"
#include <stringparser.hpp>

template<typename T>
std::optional<T> PropertyReader::getProp(std::string_view key) const {
	auto search = props.find(key);
	if (search == props.end()) {
		return std::nullopt;
	}

	return fromString<T>(search->second);
}
