#pragma once

// C++
#include <cstdint>
#include <string_view>
#include <variant>

// XCB
#include <xcb/xproto.h>

// ximc
#include "types.hxx"

namespace ximc {

/**
 * @file
 *
 * Types for the asynchronous notifications a ProtocolEngine delivers to its
 * EngineListener.
 **/

/// Engine neutral representation of a server side preedit draw request.
/**
 * All data is borrowed from the protocol engine and only valid during
 * delivery of the PreeditDraw notification that carries it.
 **/
struct PreeditFrame {
	uint32_t status = 0;
	// INT32 in the XIM protocol
	int32_t caret = 0;
	int32_t chg_first = 0;
	int32_t chg_length = 0;
	std::string_view text; ///< preedit text in the negotiated encoding
	const uint32_t *feedback = nullptr;
	size_t num_feedback = 0;
};

namespace notify {

/// The connection to the input method server has been established.
struct MethodOpened {};

/// The server connection is gone, any input context is invalid now.
struct Disconnected {};

/// Completion of a ProtocolEngine::createContext() request.
/**
 * On failure `ctx` is ContextID::INVALID.
 **/
struct ContextCreated {
	ContextID ctx;
};

/// Completion of a ProtocolEngine::setContextValues() request.
struct ContextValuesSet {
	ContextID ctx;
};

/// Composition finished, `text` is in the negotiated encoding.
struct CommitString {
	ContextID ctx;
	std::string_view text;
};

/// A key event the server did not use for composition.
struct ForwardEvent {
	ContextID ctx;
	const xcb_key_press_event_t *event;
};

struct PreeditStart {
	ContextID ctx;
};

struct PreeditDraw {
	ContextID ctx;
	const PreeditFrame *frame;
};

struct PreeditDone {
	ContextID ctx;
};

} // end ns notify

using Notification = std::variant<
	notify::MethodOpened,
	notify::Disconnected,
	notify::ContextCreated,
	notify::ContextValuesSet,
	notify::CommitString,
	notify::ForwardEvent,
	notify::PreeditStart,
	notify::PreeditDraw,
	notify::PreeditDone>;

} // end ns
