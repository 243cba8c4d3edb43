#pragma once
#include "../common/protocol.hpp"
#include "Connection.hpp"
#include <memory>
#include <string>

using namespace std;

class Broadcaster;
class ConnectionRegistry;
class Lobby;
class LobbyDirectory;

// inbound text -> lobby operations. lobby work always runs on that lobby's executor
class Dispatcher
{
public:
	Dispatcher(ConnectionRegistry& registry, LobbyDirectory& directory, Broadcaster& out);

	void on_message(const shared_ptr<Connection>& conn, const string& text);
	void on_disconnect(const shared_ptr<Connection>& conn);

private:
	void handle(const shared_ptr<Connection>& conn, const proto::CreateLobby& m);
	void handle(const shared_ptr<Connection>& conn, const proto::JoinLobby& m);
	void handle(const shared_ptr<Connection>& conn, const proto::StartGame& m);
	void handle(const shared_ptr<Connection>& conn, const proto::SubmitQuestion& m);
	void handle(const shared_ptr<Connection>& conn, const proto::SubmitAnswer& m);
	void handle(const shared_ptr<Connection>& conn, const proto::NextReveal& m);
	void handle(const shared_ptr<Connection>& conn, const proto::SubmitGuesses& m);
	void handle(const shared_ptr<Connection>& conn, const proto::Vote& m);
	void handle(const shared_ptr<Connection>& conn, const proto::NextTurn& m);
	void handle(const shared_ptr<Connection>& conn, const proto::PlayAgain& m);

	// registry entry + joined/lobby_update. runs on the lobby executor
	void bind_player(const shared_ptr<Connection>& conn, const shared_ptr<Lobby>& lobby, const string& playerId, bool isHost);

	// disconnect cleanup for the connection's current lobby, if any
	void leave(const shared_ptr<Connection>& conn);

	// sender's lobby + player id, then fn on the lobby executor. unbound senders are dropped
	template <typename Fn>
	void with_lobby(const shared_ptr<Connection>& conn, Fn fn);

private:
	ConnectionRegistry& registry_;
	LobbyDirectory& directory_;
	Broadcaster& out_;
};
