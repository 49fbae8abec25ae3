#pragma once

// libc
#include <stddef.h>

// C++
#include <cstdint>
#include <string>
#include <string_view>

/**
 * @file
 *
 * This header contains helper functions for dealing with the UTF-8 text
 * delivered by input method servers.
 **/

namespace ximc {

/// A single unicode code point.
using Rune = uint32_t;

namespace utf8 {

	constexpr size_t UTF_SIZE = 4;

	/// Replacement code point for malformed input.
	constexpr Rune UTF_INVALID = 0xFFFD;

	/// Decodes a single UTF8 character from encoded and stores the result in \c u
	/**
	 * If the sequence is malformed then \c u is set to UTF_INVALID.
	 *
	 * \return The number of bytes processed from \c encoded, zero if
	 * \c encoded ends with an incomplete sequence.
	 **/
	size_t decode(const std::string_view encoded, Rune &u);

	/// Returns whether \c s consists only of well-formed UTF-8 sequences.
	bool is_valid(const std::string_view s);

	/// Returns a copy of \c s with each malformed sequence replaced by U+FFFD.
	/**
	 * Well-formed input is returned unchanged.
	 **/
	std::string canonical(const std::string_view s);

} // end utf8

} // end ns
