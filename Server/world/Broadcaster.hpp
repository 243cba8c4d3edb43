#pragma once
#include "../common/protocol.hpp"
#include "Connection.hpp"
#include <memory>
#include <string>

using namespace std;

class ConnectionRegistry;

// JSON event fan-out. fire-and-forget, closed connections are skipped
class Broadcaster
{
public:
	explicit Broadcaster(ConnectionRegistry& registry);

	void to_lobby(const string& lobbyCode, const json& event);
	void to_player(const string& lobbyCode, const string& playerId, const json& event);
	void to_connection(const shared_ptr<Connection>& conn, const json& event);

private:
	ConnectionRegistry& registry_;
};
