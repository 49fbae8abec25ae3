#pragma once

// C++
#include <string>
#include <string_view>

// ximc
#include "fwd.hxx"

namespace ximc {

/// Decodes server supplied text into UTF-8.
/**
 * Depending on the encoding negotiated with the server, text is either
 * passed through as UTF-8 or converted from Compound Text. The result is
 * always an independently owned, well-formed UTF-8 string.
 **/
class TextDecoder {
public: // functions

	explicit TextDecoder(const ProtocolEngine &engine) :
			m_engine{engine} {}

	/// Decode \c text from the currently negotiated encoding.
	/**
	 * Conversion failures result in an empty string.
	 **/
	std::string toUTF8(const std::string_view text) const;

protected: // functions

	std::string fromCompoundText(const std::string_view text) const;

protected: // data

	const ProtocolEngine &m_engine;
};

} // end ns
