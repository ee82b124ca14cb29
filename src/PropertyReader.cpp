#include "PropertyReader.hpp"

#include <fstream>

static std::string parseSpecial(std::string str) {
	std::size_t i = 0;
	while ((i = str.find('\\', i)) != std::string::npos) {
		i++;

		if (i == str.size()) {
			str.erase(i - 1);
			break;
		}

		switch (str[i]) {
			case 'n':
				str[i - 1] = '\n';
				break;

			default:
				str[i - 1] = str[i];
				break;
		}

		str.erase(i, 1);
	}

	return str;
}

PropertyReader::PropertyReader(std::string_view path)
: filePath(path) {
	readFromDisk();
}

/* Returns false if it couldn't open the file */
bool PropertyReader::readFromDisk() {
	std::string prop;
	std::ifstream file(filePath);
	bool ok = !!file;
	while (file.good()) {
		std::getline(file, prop);
		if (prop.size() > 0) {
			std::size_t keylen = prop.find_first_of(' ');
			if (keylen != std::string::npos) {
				props.insert_or_assign(parseSpecial(prop.substr(0, keylen)), parseSpecial(prop.substr(keylen + 1)));
			}
		}

		prop.clear();
	}

	return ok;
}

const std::string& PropertyReader::getFilePath() const {
	return filePath;
}

bool PropertyReader::isEmpty() const {
	return props.empty();
}

bool PropertyReader::hasProp(std::string_view key) const {
	return props.find(key) != props.end();
}

std::string_view PropertyReader::getProp(std::string_view key, std::string_view defval) const {
	auto search = props.find(key);
	if (search != props.end()) {
		return search->second;
	}

	return defval;
}
