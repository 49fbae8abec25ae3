// C++
#include <memory>

// ximc
#include "codecs.hxx"
#include "ProtocolEngine.hxx"
#include "TextDecoder.hxx"

namespace ximc {

std::string TextDecoder::toUTF8(const std::string_view text) const {
	switch (m_engine.encoding()) {
		case TextEncoding::UTF8_STRING:
			return utf8::canonical(text);
		case TextEncoding::COMPOUND_TEXT:
			return fromCompoundText(text);
	}

	return std::string{};
}

std::string TextDecoder::fromCompoundText(const std::string_view text) const {
	size_t length = 0;
	auto release = [this](char *buffer) { m_engine.releaseConverted(buffer); };
	std::unique_ptr<char, decltype(release)> converted{
		m_engine.compoundTextToUTF8(text.data(), text.size(), &length),
		release};

	if (!converted)
		return std::string{};

	return utf8::canonical(std::string_view{converted.get(), length});
}

} // end ns
