#pragma once
#include <functional>

using namespace std;

// per-lobby serialization + the lobby's single deadline.
// start_timer() replaces any pending deadline; a cancelled deadline never fires.
class LobbyExecutor
{
public:
	virtual ~LobbyExecutor() = default;

	virtual void post(function<void()> fn) = 0;
	virtual void start_timer(int seconds, function<void()> fn) = 0;
	virtual void cancel_timer() = 0;
	virtual bool timer_pending() const = 0;
};
