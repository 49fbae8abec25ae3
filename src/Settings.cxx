// C++
#include <utility>

// ximc
#include "ConfigFile.hxx"
#include "Settings.hxx"

namespace ximc {

std::optional<InputStyle> Settings::parseInputStyle(const std::string_view name) {
	if (name == "default")
		return InputStyle{};
	else if (name == "preedit_callbacks")
		return InputStyle{InputStyleFlag::PREEDIT_CALLBACKS};

	return std::nullopt;
}

void Settings::load(const ConfigFile &config, cosmos::ILogger &logger) {
	if (auto name = config.asString("im_name"); name) {
		if (name->empty()) {
			im_name.reset();
		} else {
			im_name = *name;
		}
	}

	if (auto style_name = config.asString("input_style"); style_name) {
		if (auto style = parseInputStyle(*style_name); style) {
			input_style = *style;
		} else {
			logger.error() << "invalid input_style setting '" << *style_name
				<< "', expected 'default' or 'preedit_callbacks'\n";
		}
	}

	const std::pair<const char*, bool*> flags[] = {
		{"use_compound_text", &use_compound_text},
		{"use_utf8_string", &use_utf8_string},
		{"forward_protocol_log", &forward_protocol_log}
	};

	for (const auto &[key, setting]: flags) {
		if (auto value = config.asBool(key); value) {
			*setting = *value;
		}
	}

	if (!use_compound_text && !use_utf8_string) {
		logger.error() << "at least one text encoding needs to be enabled, enabling UTF-8\n";
		use_utf8_string = true;
	}
}

} // end ns
