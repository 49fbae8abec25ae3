#pragma once

// C++
#include <functional>
#include <string_view>

/**
 * @file
 *
 * Process wide sink for diagnostic messages of the input method protocol
 * library.
 *
 * Only one handler is active at a time, installing a handler replaces the
 * previous one. Installation and invocation are serialized by a mutex, so
 * the protocol library may log from any thread.
 **/

namespace ximc::log {

/// Receives a single, already formatted diagnostic line.
using Handler = std::function<void (const std::string_view line)>;

/// Installs \c handler as the process wide diagnostic sink.
/**
 * The handler is invoked with the sink's lock held, it must not call back
 * into install() or reset().
 **/
void install(Handler handler);

/// Removes any installed handler, further messages are discarded.
void reset();

/// Returns whether a handler is currently installed.
bool installed();

/// Trims surrounding whitespace from \c line and passes it to the active handler.
void write(const std::string_view line);

} // end ns
