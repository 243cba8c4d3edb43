#include "StrandExecutor.hpp"

using namespace std;

StrandExecutor::StrandExecutor(asio::io_context& io)
	: strand_(io.get_executor())
	, timer_(io)
{
}

StrandExecutor::~StrandExecutor()
{
	cancel_timer();
}

void StrandExecutor::post(function<void()> fn)
{
	asio::post(strand_, move(fn));
}

// must run on the strand, like every other lobby handler
void StrandExecutor::start_timer(int seconds, function<void()> fn)
{
	cancel_timer();

	auto token = make_shared<bool>(true);
	armed_ = token;
	timer_.expires_after(chrono::seconds(seconds));
	timer_.async_wait(asio::bind_executor(strand_, [token, fn = move(fn)](error_code ec)
		{
			if (ec || !*token)
				return;
			*token = false;
			fn();
		}
	)
	);
}

void StrandExecutor::cancel_timer()
{
	if (armed_)
	{
		*armed_ = false;
		armed_.reset();
	}
	timer_.cancel();
}

bool StrandExecutor::timer_pending() const
{
	return armed_ && *armed_;
}
