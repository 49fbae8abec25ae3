#pragma once

// C++
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// cosmos
#include "cosmos/io/ILogger.hxx"

namespace ximc {

/// Runtime configuration data read from `key = value` files.
/**
 * Any number of files and in-memory buffers can be parsed, entries from
 * later sources replace those from earlier ones. Lines starting with '#'
 * are comments, no multiline continuation exists.
 *
 * Keys are restricted to printable ASCII. String values need to be quoted
 * like "this", the escapes '\"' and '\\' are recognized. Boolean and
 * integer values are unquoted.
 *
 * Values are only interpreted on access. Diagnostics for bad values name
 * the location the entry was read from.
 **/
class ConfigFile {
public: // functions

	explicit ConfigFile(cosmos::ILogger &logger);

	/// Parse the configuration file found at \c path.
	/**
	 * \return \c false if the file could not be opened.
	 **/
	bool parse(const std::string_view path);

	/// Parse configuration data from an in-memory buffer.
	/**
	 * \c origin is only used for diagnostics.
	 **/
	void parseData(const std::string_view origin, const std::string_view data);

	bool has(const std::string &key) const {
		return lookup(key) != nullptr;
	}

	/// Returns the unquoted string value for \c key.
	/**
	 * std::nullopt is returned if the key is missing or if the value is
	 * badly quoted or contains bad escapes, the latter is logged.
	 **/
	std::optional<std::string> asString(const std::string &key) const;

	/// Access a boolean value, `true`, `false`, `yes`, `no`, `1` and `0` are recognized.
	std::optional<bool> asBool(const std::string &key) const;


protected: // types

	struct Entry {
		std::string value; ///< raw value text, unquoting happens on access
		std::string origin;
		size_t linenr = 0;
	};

protected: // functions

	const Entry* lookup(const std::string &key) const;

	void parseStream(const std::string_view origin, std::istream &input);

	void parseLine(const std::string_view origin, const size_t linenr, std::string line);

	/// Logs a problem with the value of \c key read from \c entry.
	void valueError(const std::string &key, const Entry &entry, const std::string_view problem) const;

	/// Removes quotes and escapes from \c s in-place.
	/**
	 * \return \c false on syntax errors, \c s is undefined then.
	 **/
	static bool unquote(std::string &s);

	/// Returns whether \c s only contains printable ASCII characters.
	static bool isASCII(const std::string_view s);

protected: // data

	cosmos::ILogger &m_logger;
	std::map<std::string, Entry> m_entries;
};

} // end ns
