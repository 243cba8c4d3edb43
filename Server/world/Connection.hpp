#pragma once
#include <string>

using namespace std;

// transport seen from the game side. implemented by the gateway Session
class Connection
{
public:
	virtual ~Connection() = default;

	// best-effort; dropped if the connection is closed or failing
	virtual void send_text(string text) = 0;
	virtual bool is_open() const = 0;
};
