#pragma once

// C++
#include <iosfwd>
#include <string>

// cosmos
#include "cosmos/BitMask.hxx"

// ximc
#include "fwd.hxx"
#include "Notification.hxx"
#include "types.hxx"

namespace ximc {

/// Information about the text currently being edited in the input method.
/**
 * This is a borrowed view on a single preedit draw notification. It is
 * only valid during the callback invocation it is passed to and can
 * neither be copied nor moved.
 **/
class PreeditInfo {
public: // types

	enum class Status : uint32_t {
		NO_STRING   = 0x01, ///< text() carries no data
		NO_FEEDBACK = 0x02  ///< no feedback information is available
	};

	using StatusMask = cosmos::BitMask<Status>;

public: // functions

	PreeditInfo(const PreeditFrame &frame, const TextDecoder &decoder) :
			m_frame{frame},
			m_decoder{decoder} {}

	PreeditInfo(const PreeditInfo&) = delete;
	PreeditInfo& operator=(const PreeditInfo&) = delete;

	/// If no status bits are set, text() contains the current preedit text.
	StatusMask status() const { return StatusMask{m_frame.status}; }

	/// Cursor offset within the preedit text in characters.
	int32_t caret() const { return m_frame.caret; }

	/// Starting position of the change in characters.
	int32_t chgFirst() const { return m_frame.chg_first; }

	/// Length of the change in characters.
	int32_t chgLength() const { return m_frame.chg_length; }

	/// Returns the decoded preedit text.
	/**
	 * Decoding is performed on each call.
	 **/
	std::string text() const;

	/// The number of available feedback entries, one per character.
	size_t numFeedback() const { return m_frame.num_feedback; }

	/// Returns the rendering feedback for the character at \c index.
	/**
	 * Throws std::out_of_range if \c index exceeds numFeedback().
	 **/
	InputFeedback feedback(const size_t index) const;

	const PreeditFrame& raw() const { return m_frame; }

protected: // data

	const PreeditFrame &m_frame;
	const TextDecoder &m_decoder;
};

} // end ns

std::ostream& operator<<(std::ostream &o, const ximc::PreeditInfo &info);
