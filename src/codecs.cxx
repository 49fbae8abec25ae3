// cosmos
#include "cosmos/algs.hxx"

// ximc
#include "codecs.hxx"

namespace ximc {

namespace utf8 {

namespace {

/// Properties of an encoded sequence of a given length.
struct SequenceType {
	uint8_t lead_mask;  ///< bits of the leader byte identifying the sequence length
	uint8_t lead_value; ///< expected value of the masked leader byte
	Rune min;           ///< smallest code point, anything below is an overlong encoding
	Rune max;           ///< largest code point that can be encoded
};

// indexed by the sequence length, index zero describes trailing bytes which
// carry six bits of data each
constexpr SequenceType SEQUENCES[UTF_SIZE + 1] = {
	{0xC0, 0x80,       0,        0},
	{0x80, 0x00,       0,     0x7F},
	{0xE0, 0xC0,    0x80,    0x7FF},
	{0xF0, 0xE0,   0x800,   0xFFFF},
	{0xF8, 0xF0, 0x10000, 0x10FFFF}
};

constexpr size_t TRAILING = 0;
constexpr unsigned TRAILING_BITS = 6;

// reserved for UTF-16 surrogate pairs, never valid in UTF-8
constexpr Rune SURROGATE_FIRST = 0xD800;
constexpr Rune SURROGATE_LAST  = 0xDFFF;

// the replacement character is legitimate input on its own
constexpr std::string_view ENCODED_INVALID{"\xEF\xBF\xBD"};

/// Returns the sequence length announced by \c byte, or TRAILING.
/**
 * Bytes that can never appear in UTF-8 are reported as TRAILING as well.
 **/
size_t classify(const char c) {
	const auto byte = static_cast<uint8_t>(c);

	for (size_t len = 1; len < cosmos::num_elements(SEQUENCES); len++) {
		const auto &seq = SEQUENCES[len];
		if ((byte & seq.lead_mask) == seq.lead_value)
			return len;
	}

	return TRAILING;
}

bool is_trailing(const char c) {
	const auto &seq = SEQUENCES[TRAILING];
	return (static_cast<uint8_t>(c) & seq.lead_mask) == seq.lead_value;
}

bool is_scalar_value(const Rune rune, const size_t len) {
	const auto &seq = SEQUENCES[len];
	return cosmos::in_range(rune, seq.min, seq.max) &&
		!cosmos::in_range(rune, SURROGATE_FIRST, SURROGATE_LAST);
}

/// Splits off the next sequence from \c s.
/**
 * A truncated sequence at the end of the input is consumed completely.
 *
 * \return the number of bytes consumed, never zero for non-empty input.
 * \param[out] malformed set if the consumed bytes are no valid encoding.
 **/
size_t next_sequence(const std::string_view s, bool &malformed) {
	Rune rune;
	const auto len = decode(s, rune);

	if (len == 0) {
		malformed = true;
		return s.size();
	}

	malformed = rune == UTF_INVALID && s.substr(0, len) != ENCODED_INVALID;
	return len;
}

} // end anon ns

size_t decode(const std::string_view encoded, Rune &rune) {
	rune = UTF_INVALID;

	if (encoded.empty())
		return 0;

	const auto len = classify(encoded[0]);

	if (len == TRAILING)
		// not a leader byte, skip it
		return 1;

	Rune decoded = static_cast<uint8_t>(encoded[0]) & ~SEQUENCES[len].lead_mask;

	for (size_t pos = 1; pos < len; pos++) {
		if (pos == encoded.size())
			// the rest of the sequence is missing
			return 0;
		else if (!is_trailing(encoded[pos]))
			// the sequence ends early, resynchronize at this byte
			return pos;

		decoded = (decoded << TRAILING_BITS) |
			(static_cast<uint8_t>(encoded[pos]) & ~SEQUENCES[TRAILING].lead_mask);
	}

	if (is_scalar_value(decoded, len)) {
		rune = decoded;
	}

	return len;
}

bool is_valid(std::string_view s) {
	bool malformed = false;

	while (!s.empty()) {
		s.remove_prefix(next_sequence(s, malformed));
		if (malformed)
			return false;
	}

	return true;
}

std::string canonical(std::string_view s) {
	if (is_valid(s))
		return std::string{s};

	std::string ret;
	ret.reserve(s.size() + ENCODED_INVALID.size());
	bool malformed = false;

	while (!s.empty()) {
		const auto len = next_sequence(s, malformed);

		if (malformed)
			ret.append(ENCODED_INVALID);
		else
			ret.append(s.substr(0, len));

		s.remove_prefix(len);
	}

	return ret;
}

} // end ns utf8

} // end ns
