// C++
#include <string>

// cosmos
#include "cosmos/string.hxx"
#include "cosmos/thread/Mutex.hxx"

// ximc
#include "log.hxx"

namespace ximc::log {

namespace {

	struct Sink {
		cosmos::Mutex lock;
		Handler handler;
	};

	Sink& sink() {
		static Sink sink;
		return sink;
	}

} // end anon ns

void install(Handler handler) {
	auto &s = sink();
	cosmos::MutexGuard guard{s.lock};
	s.handler = std::move(handler);
}

void reset() {
	install(Handler{});
}

bool installed() {
	auto &s = sink();
	cosmos::MutexGuard guard{s.lock};
	return static_cast<bool>(s.handler);
}

void write(const std::string_view line) {
	std::string trimmed{line};
	cosmos::strip(trimmed);

	auto &s = sink();
	cosmos::MutexGuard guard{s.lock};

	if (s.handler) {
		s.handler(trimmed);
	}
}

} // end ns
