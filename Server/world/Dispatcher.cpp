#include "Dispatcher.hpp"
#include "Broadcaster.hpp"
#include "ConnectionRegistry.hpp"
#include "Lobby.hpp"
#include "LobbyDirectory.hpp"
#include "../common/common.hpp"
#include <variant>

using namespace std;

Dispatcher::Dispatcher(ConnectionRegistry& registry, LobbyDirectory& directory, Broadcaster& out)
	: registry_(registry), directory_(directory), out_(out)
{
}

void Dispatcher::on_message(const shared_ptr<Connection>& conn, const string& text)
{
	auto msg = proto::decode(text);
	if (!msg)
		return;
	visit([&](const auto& m) { handle(conn, m); }, *msg);
}

void Dispatcher::on_disconnect(const shared_ptr<Connection>& conn)
{
	leave(conn);
}

template <typename Fn>
void Dispatcher::with_lobby(const shared_ptr<Connection>& conn, Fn fn)
{
	auto info = registry_.find(conn.get());
	if (!info)
		return;
	auto lobby = directory_.find(info->lobbyCode);
	if (!lobby)
		return;
	lobby->executor().post([lobby, playerId = info->playerId, fn = move(fn)]
		{
			fn(*lobby, playerId);
		});
}

void Dispatcher::leave(const shared_ptr<Connection>& conn)
{
	auto info = registry_.unbind(conn.get());
	if (!info)
		return;
	common::log("LOBBY", "player " + info->name + " disconnected from " + info->lobbyCode);

	auto lobby = directory_.find(info->lobbyCode);
	if (!lobby)
		return;
	lobby->executor().post([this, lobby, playerId = info->playerId]
		{
			lobby->mark_disconnected(playerId);
			directory_.collect_if_empty(*lobby);
		});
}

void Dispatcher::bind_player(const shared_ptr<Connection>& conn, const shared_ptr<Lobby>& lobby, const string& playerId, bool isHost)
{
	const Player* p = lobby->find_player(playerId);
	if (!p)
		return;
	registry_.bind(conn, ClientInfo{ playerId, lobby->code(), p->name });

	// closed while the join was queued: on_disconnect may have missed the entry
	if (!conn->is_open() && registry_.unbind(conn.get()))
	{
		lobby->mark_disconnected(playerId);
		directory_.collect_if_empty(*lobby);
		return;
	}

	common::log("LOBBY", "+ " + p->name + (isHost ? " created lobby " : " joined lobby ") + lobby->code());
	out_.to_connection(conn, proto::joined(playerId, lobby->code(), isHost));
	lobby->broadcast_roster();
}

// 로비 생성/참가
void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::CreateLobby& m)
{
	leave(conn);

	string playerId = common::random_hex_id();
	auto lobby = directory_.create(playerId, m.name);
	lobby->executor().post([this, conn, lobby, playerId]
		{
			bind_player(conn, lobby, playerId, true);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::JoinLobby& m)
{
	string code = LobbyDirectory::normalize_code(m.code);
	auto lobby = directory_.find(code);
	if (!lobby)
	{
		out_.to_connection(conn, proto::error("Lobby not found"));
		return;
	}
	string playerId = common::random_hex_id();
	lobby->executor().post([this, conn, lobby, playerId, name = m.name]
		{
			// collected between lookup and now
			if (directory_.find(lobby->code()) != lobby)
			{
				out_.to_connection(conn, proto::error("Lobby not found"));
				return;
			}
			// a refused join keeps the sender where it was
			if (auto err = directory_.admit(*lobby, playerId, name))
			{
				out_.to_connection(conn, proto::error(*err));
				return;
			}
			leave(conn);
			bind_player(conn, lobby, playerId, false);
		});
}

// 게임 진행
void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::StartGame&)
{
	with_lobby(conn, [](Lobby& lobby, const string& sender)
		{
			lobby.start_game(sender);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::SubmitQuestion& m)
{
	with_lobby(conn, [question = m.question](Lobby& lobby, const string& sender)
		{
			lobby.submit_question(sender, question);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::SubmitAnswer& m)
{
	with_lobby(conn, [answer = m.answer](Lobby& lobby, const string& sender)
		{
			lobby.submit_answer(sender, answer);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::NextReveal&)
{
	with_lobby(conn, [](Lobby& lobby, const string& sender)
		{
			lobby.next_reveal(sender);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::SubmitGuesses& m)
{
	with_lobby(conn, [guesses = m.guesses](Lobby& lobby, const string& sender)
		{
			lobby.submit_guesses(sender, guesses);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::Vote& m)
{
	with_lobby(conn, [category = m.category, answerId = m.answer_id](Lobby& lobby, const string& sender)
		{
			lobby.vote(sender, category, answerId);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::NextTurn&)
{
	with_lobby(conn, [](Lobby& lobby, const string& sender)
		{
			lobby.next_turn(sender);
		});
}

void Dispatcher::handle(const shared_ptr<Connection>& conn, const proto::PlayAgain&)
{
	with_lobby(conn, [](Lobby& lobby, const string& sender)
		{
			lobby.play_again(sender);
		});
}
