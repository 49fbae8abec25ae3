// C++
#include <variant>

// cosmos
#include "cosmos/error/RuntimeError.hxx"

// ximc
#include "Client.hxx"
#include "ImdkitEngine.hxx"
#include "Settings.hxx"

namespace ximc {

std::unique_ptr<Client> Client::create(
		xcb_connection_t &conn, const int screen_id,
		const InputStyle style, cosmos::ILogger &logger,
		const std::optional<std::string> &im_name) {
	Settings settings;
	settings.im_name = im_name;
	settings.input_style = style;
	return create(conn, screen_id, settings, logger);
}

std::unique_ptr<Client> Client::create(
		xcb_connection_t &conn, const int screen_id,
		const Settings &settings, cosmos::ILogger &logger) {
	return create(
			std::make_unique<ImdkitEngine>(conn, screen_id, settings),
			settings.input_style, logger);
}

std::unique_ptr<Client> Client::create(
		std::unique_ptr<ProtocolEngine> engine,
		const InputStyle style, cosmos::ILogger &logger) {
	if (!engine) {
		throw cosmos::RuntimeError{"Client::create() called without protocol engine"};
	}

	// not using make_unique, the constructor is not public
	std::unique_ptr<Client> ret{new Client{std::move(engine), style, logger}};
	// only install the back reference now that the address is final
	ret->m_engine->setListener(ret.get());
	return ret;
}

Client::Client(std::unique_ptr<ProtocolEngine> engine, const InputStyle style, cosmos::ILogger &logger) :
		m_engine{std::move(engine)},
		m_logger{logger},
		m_style{style},
		m_decoder{*m_engine},
		m_lifecycle{*m_engine, m_style, m_logger},
		m_placement{*m_engine, m_lifecycle, m_logger},
		m_dispatcher{*m_engine, m_lifecycle, m_logger},
		m_callbacks{m_decoder}
{}

Client::~Client() {
	// order is important here: no more notifications may reach the
	// members being torn down, the context depends on the method and
	// the method on the protocol handle
	m_engine->setListener(nullptr);
	m_lifecycle.destroy();
	m_engine->close();
}

void Client::notify(const Notification &notification) {
	std::visit([this](const auto &n) { this->handle(n); }, notification);
}

void Client::handle(const notify::MethodOpened &) {
	if (m_lifecycle.methodOpened(m_placement.requested())) {
		m_placement.creationSent();
	}
}

void Client::handle(const notify::Disconnected &) {
	m_lifecycle.disconnected();
}

void Client::handle(const notify::ContextCreated &created) {
	if (m_lifecycle.contextCreated(created.ctx)) {
		m_placement.contextOpened();
	}
}

void Client::handle(const notify::ContextValuesSet &done) {
	m_placement.updateDone(done.ctx);
}

void Client::handle(const notify::CommitString &commit) {
	m_callbacks.commitString(targetWindow(), commit.text);
}

void Client::handle(const notify::ForwardEvent &forward) {
	if (!forward.event)
		return;

	m_callbacks.forwardEvent(targetWindow(), *forward.event);
}

void Client::handle(const notify::PreeditStart &) {
	if (usePreeditCallbacks()) {
		m_callbacks.preeditStart(targetWindow());
	}
}

void Client::handle(const notify::PreeditDraw &draw) {
	if (usePreeditCallbacks() && draw.frame) {
		m_callbacks.preeditDraw(targetWindow(), *draw.frame);
	}
}

void Client::handle(const notify::PreeditDone &) {
	if (usePreeditCallbacks()) {
		m_callbacks.preeditDone(targetWindow());
	}
}

} // end ns
