#pragma once
#include "../common/net.hpp"
#include "LobbyExecutor.hpp"
#include <memory>

using namespace std;

class StrandExecutor : public LobbyExecutor
{
public:
	using Executor = asio::io_context::executor_type;

	explicit StrandExecutor(asio::io_context& io);
	~StrandExecutor() override;

	void post(function<void()> fn) override;
	void start_timer(int seconds, function<void()> fn) override;
	void cancel_timer() override;
	bool timer_pending() const override;

private:
	asio::strand<Executor> strand_;
	asio::steady_timer timer_;
	shared_ptr<bool> armed_; // token of the live wait; false once cancelled
};
