// C++
#include <ostream>
#include <stdexcept>

// ximc
#include "PreeditInfo.hxx"
#include "TextDecoder.hxx"

namespace ximc {

std::string PreeditInfo::text() const {
	return m_decoder.toUTF8(m_frame.text);
}

InputFeedback PreeditInfo::feedback(const size_t index) const {
	if (index >= m_frame.num_feedback) {
		throw std::out_of_range{"preedit feedback index out of range"};
	}

	return InputFeedback{m_frame.feedback[index]};
}

} // end ns

std::ostream& operator<<(std::ostream &o, const ximc::PreeditInfo &info) {
	o << "PreeditInfo{status: " << info.status().raw()
		<< ", caret: " << info.caret()
		<< ", chg_first: " << info.chgFirst()
		<< ", chg_length: " << info.chgLength()
		<< ", feedback: [";

	for (size_t idx = 0; idx < info.numFeedback(); idx++) {
		if (idx != 0)
			o << ", ";
		o << info.feedback(idx).raw();
	}

	o << "], text: \"" << info.text() << "\"}";
	return o;
}
