#pragma once

// C++
#include <optional>
#include <string>
#include <string_view>

// cosmos
#include "cosmos/io/ILogger.hxx"

// ximc
#include "fwd.hxx"
#include "types.hxx"

namespace ximc {

/// Runtime settings for creating a Client.
struct Settings {
public: // data

	/// Explicit input method server to connect to, e.g. `@im=fcitx`.
	/**
	 * If unset then the server is determined from the XMODIFIERS
	 * environment variable.
	 **/
	std::optional<std::string> im_name;
	InputStyle input_style;
	/// Offer Compound Text as a text encoding to the server.
	bool use_compound_text = true;
	/// Offer UTF-8 as a text encoding to the server.
	bool use_utf8_string = true;
	/// Forward protocol library diagnostics to the application's logger.
	bool forward_protocol_log = false;

public: // functions

	/// Apply the settings found in the given configuration.
	/**
	 * Recognized keys are `im_name`, `input_style`, `use_compound_text`,
	 * `use_utf8_string` and `forward_protocol_log`. Invalid values are
	 * logged and the previous setting is kept.
	 **/
	void load(const ConfigFile &config, cosmos::ILogger &logger);

	/// Parses an input style name, `default` or `preedit_callbacks`.
	static std::optional<InputStyle> parseInputStyle(const std::string_view name);
};

} // end ns
