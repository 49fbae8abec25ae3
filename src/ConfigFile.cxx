// C++
#include <fstream>
#include <sstream>

// cosmos
#include "cosmos/string.hxx"

// ximc
#include "ConfigFile.hxx"

namespace ximc {

ConfigFile::ConfigFile(cosmos::ILogger &logger) :
		m_logger{logger} {
}

const ConfigFile::Entry* ConfigFile::lookup(const std::string &key) const {
	auto it = m_entries.find(key);
	return it == m_entries.end() ? nullptr : &it->second;
}

void ConfigFile::valueError(const std::string &key, const Entry &entry, const std::string_view problem) const {
	m_logger.error() << "ConfigFile: " << entry.origin << ":" << entry.linenr << ": "
		<< problem << " for " << key << ": " << entry.value << "\n";
}

std::optional<std::string> ConfigFile::asString(const std::string &key) const {
	const auto entry = lookup(key);
	if (!entry)
		return std::nullopt;

	auto value = entry->value;

	if (!unquote(value)) {
		valueError(key, *entry, "badly quoted string value");
		return std::nullopt;
	}

	return value;
}

std::optional<bool> ConfigFile::asBool(const std::string &key) const {
	const auto entry = lookup(key);
	if (!entry)
		return std::nullopt;

	const auto &value = entry->value;

	if (value == "true" || value == "yes" || value == "1")
		return true;
	else if (value == "false" || value == "no" || value == "0")
		return false;

	valueError(key, *entry, "bad boolean value");
	return std::nullopt;
}

bool ConfigFile::parse(const std::string_view path) {
	std::ifstream fs{std::string{path}};

	if (!fs) {
		return false;
	}

	parseStream(path, fs);
	return true;
}

void ConfigFile::parseData(const std::string_view origin, const std::string_view data) {
	std::istringstream ss{std::string{data}};
	parseStream(origin, ss);
}

void ConfigFile::parseStream(const std::string_view origin, std::istream &input) {
	size_t linenr = 1;
	std::string line;

	// getline() also delivers a final line lacking a newline
	while (std::getline(input, line)) {
		parseLine(origin, linenr++, std::move(line));
	}
}

void ConfigFile::parseLine(const std::string_view origin, const size_t linenr, std::string line) {
	auto parseError = [=](const std::string_view error) {
		m_logger.error() << "ConfigFile: " << origin << ":" << linenr << ": " << error << "\n";
	};

	cosmos::strip(line);

	if (line.empty() || line[0] == '#')
		return;

	const auto sep = line.find('=');

	if (sep == line.npos) {
		parseError("missing '=' separator");
		return;
	}

	auto key = line.substr(0, sep);
	cosmos::strip(key);

	if (key.empty()) {
		parseError("empty key");
		return;
	} else if (!isASCII(key)) {
		parseError("key contains non-ascii characters");
		return;
	}

	Entry entry;
	entry.value = line.substr(sep + 1);
	entry.origin = origin;
	entry.linenr = linenr;
	cosmos::strip(entry.value);

	m_entries[key] = std::move(entry);
}

bool ConfigFile::isASCII(const std::string_view s) {
	for (const auto ch: s) {
		const auto uch = static_cast<unsigned char>(ch);
		if (uch >= 128 || uch < 0x20)
			return false;
	}

	return true;
}

bool ConfigFile::unquote(std::string &s) {
	if (s.size() < 2 || s.front() != '"' || s.back() != '"')
		return false;

	std::string ret;
	ret.reserve(s.size() - 2);
	bool escaped = false;

	for (const auto ch: std::string_view{s}.substr(1, s.size() - 2)) {
		if (escaped) {
			if (ch != '"' && ch != '\\')
				return false;
			ret.push_back(ch);
			escaped = false;
		} else if (ch == '\\') {
			escaped = true;
		} else if (ch == '"') {
			// unescaped quote within the value
			return false;
		} else {
			ret.push_back(ch);
		}
	}

	if (escaped)
		return false;

	s = std::move(ret);
	return true;
}

} // end ns
