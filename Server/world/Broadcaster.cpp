#include "Broadcaster.hpp"
#include "ConnectionRegistry.hpp"

using namespace std;

Broadcaster::Broadcaster(ConnectionRegistry& registry)
	: registry_(registry)
{
}

void Broadcaster::to_lobby(const string& lobbyCode, const json& event)
{
	const string data = event.dump(-1, ' ', false, json::error_handler_t::replace);
	for (auto& conn : registry_.connections_in(lobbyCode))
	{
		if (conn->is_open())
			conn->send_text(data);
	}
}

void Broadcaster::to_player(const string& lobbyCode, const string& playerId, const json& event)
{
	to_connection(registry_.connection_of(lobbyCode, playerId), event);
}

void Broadcaster::to_connection(const shared_ptr<Connection>& conn, const json& event)
{
	if (conn && conn->is_open())
		conn->send_text(event.dump(-1, ' ', false, json::error_handler_t::replace));
}
