#include "broker_handler.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"
#include "../reactor/stream_socket_wrapper.h"
#include <iterator>

broker_handler::broker_handler(std::shared_ptr<const broker_config> config,
	std::shared_ptr<executor_registry> registry,
	std::shared_ptr<pending_ledger> ledger,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), registry_(registry), ledger_(ledger), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

void broker_handler::on_request(const message_container &message, const response_cb &respond)
{
	if (message.key == broker_connect::KEY_PRODUCERS) {
		process_producer_event(message, respond);
	}

	if (message.key == broker_connect::KEY_EXECUTORS) {
		process_executor_event(message, respond);
	}

	if (message.key == reactor::KEY_UNDELIVERED) {
		process_undelivered(message, respond);
	}
}

void broker_handler::process_producer_event(const message_container &message, const response_cb &respond)
{
	if (message.data.empty()) {
		return;
	}

	const std::string &event = message.data.front();

	if (event == stream_socket_wrapper::FRAME_CONNECTED) {
		auto session = get_producer(message.identity);
		logger_->info("Producer {} connected", session->get_connection().get_description());
		return;
	}

	if (event == stream_socket_wrapper::FRAME_DISCONNECTED) {
		close_producer(message.identity);
		return;
	}

	auto session = get_producer(message.identity);

	if (event == stream_socket_wrapper::FRAME_OVERFLOW) {
		logger_->warn("Producer {} sent a line longer than {} bytes, discarded",
			session->get_connection().get_description(),
			config_->get_max_line_length());
	}

	for (auto it = std::next(message.data.begin()); it != message.data.end(); ++it) {
		session->on_line(*it, respond);
	}
}

void broker_handler::process_executor_event(const message_container &message, const response_cb &respond)
{
	if (message.data.empty()) {
		return;
	}

	const std::string &event = message.data.front();

	if (event == stream_socket_wrapper::FRAME_CONNECTED) {
		auto session = get_executor(message.identity);
		logger_->info("Executor connection {} opened", session->get_connection().get_description());
		return;
	}

	if (event == stream_socket_wrapper::FRAME_DISCONNECTED) {
		close_executor(message.identity, respond);
		return;
	}

	auto session = get_executor(message.identity);

	if (event == stream_socket_wrapper::FRAME_OVERFLOW) {
		logger_->warn("Executor {} sent a line longer than {} bytes, discarded",
			session->get_connection().get_description(),
			config_->get_max_line_length());
	}

	for (auto it = std::next(message.data.begin()); it != message.data.end(); ++it) {
		session->on_line(*it, respond);

		if (session->get_state() == executor_session_state::CLOSED) {
			// the session aborted itself (failed registration), the rest of the input is irrelevant
			executors_.erase(message.identity);
			break;
		}
	}
}

void broker_handler::process_undelivered(const message_container &message, const response_cb &respond)
{
	if (message.data.empty()) {
		return;
	}

	const std::string &channel = message.data.front();
	std::size_t lost_lines = message.data.size() - 1;

	if (channel == broker_connect::KEY_EXECUTORS) {
		if (executors_.find(message.identity) == executors_.end()) {
			return;
		}

		logger_->error("Lost connection to executor {}, {} line(s) not delivered",
			connection_handle(channel, message.identity).get_description(),
			lost_lines);

		close_executor(message.identity, respond);
		respond(connection_handle(channel, message.identity).close_message());
	} else if (channel == broker_connect::KEY_PRODUCERS) {
		for (auto it = std::next(message.data.begin()); it != message.data.end(); ++it) {
			logger_->error("Could not deliver '{}' to producer {}",
				*it,
				connection_handle(channel, message.identity).get_description());
		}

		close_producer(message.identity);
	}
}

std::shared_ptr<producer_session> broker_handler::get_producer(const std::string &peer)
{
	auto it = producers_.find(peer);

	if (it == producers_.end()) {
		auto session = std::make_shared<producer_session>(
			connection_handle(broker_connect::KEY_PRODUCERS, peer), ledger_, logger_);
		it = producers_.emplace(peer, session).first;
	}

	return it->second;
}

std::shared_ptr<executor_session> broker_handler::get_executor(const std::string &peer)
{
	auto it = executors_.find(peer);

	if (it == executors_.end()) {
		auto session = std::make_shared<executor_session>(connection_handle(broker_connect::KEY_EXECUTORS, peer),
			registry_,
			ledger_,
			config_->get_max_task_failures(),
			logger_);
		it = executors_.emplace(peer, session).first;
	}

	return it->second;
}

void broker_handler::close_executor(const std::string &peer, const response_cb &respond)
{
	auto it = executors_.find(peer);

	if (it == executors_.end()) {
		return;
	}

	it->second->on_closed(respond);
	executors_.erase(it);
}

void broker_handler::close_producer(const std::string &peer)
{
	auto it = producers_.find(peer);

	if (it == producers_.end()) {
		return;
	}

	it->second->on_closed();
	producers_.erase(it);
}

std::size_t broker_handler::get_producer_count() const
{
	return producers_.size();
}

std::size_t broker_handler::get_executor_session_count() const
{
	return executors_.size();
}

std::shared_ptr<const executor_session> broker_handler::find_executor_session(const std::string &peer) const
{
	auto it = executors_.find(peer);
	return it != executors_.end() ? it->second : nullptr;
}

std::shared_ptr<const producer_session> broker_handler::find_producer_session(const std::string &peer) const
{
	auto it = producers_.find(peer);
	return it != producers_.end() ? it->second : nullptr;
}
