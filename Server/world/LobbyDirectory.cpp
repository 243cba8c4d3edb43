#include "LobbyDirectory.hpp"
#include "Lobby.hpp"
#include "../common/common.hpp"
#include <cctype>
#include <cstring>

using namespace std;

LobbyDirectory::LobbyDirectory(const GameRules& rules, Broadcaster& out, ExecutorFactory makeExecutor, uint32_t seed)
	: rules_(rules)
	, out_(out)
	, make_executor_(move(makeExecutor))
	, rng_(seed ? seed : mt19937::result_type(random_device{}()))
{
}

string LobbyDirectory::generate_code()
{
	const size_t n = strlen(CODE_ALPHABET);
	string code;
	do
	{
		code.assign(CODE_LENGTH, ' ');
		for (auto& c : code)
			c = CODE_ALPHABET[rng_() % n];
	} while (lobbies_.count(code));
	return code;
}

shared_ptr<Lobby> LobbyDirectory::create(const string& hostId, const string& hostName)
{
	lock_guard<mutex> lk(m_);
	string code = generate_code();
	auto lobby = make_shared<Lobby>(code, hostId, hostName, rules_, out_, make_executor_(), static_cast<uint32_t>(rng_()));
	lobbies_.emplace(code, lobby);
	return lobby;
}

shared_ptr<Lobby> LobbyDirectory::find(const string& code) const
{
	lock_guard<mutex> lk(m_);
	auto it = lobbies_.find(code);
	if (it == lobbies_.end()) return nullptr;
	return it->second;
}

bool LobbyDirectory::remove(const string& code)
{
	lock_guard<mutex> lk(m_);
	auto it = lobbies_.find(code);
	if (it == lobbies_.end()) return false;
	lobbies_.erase(it);
	return true;
}

size_t LobbyDirectory::size() const
{
	lock_guard<mutex> lk(m_);
	return lobbies_.size();
}

optional<string> LobbyDirectory::admit(Lobby& lobby, const string& playerId, const string& name) const
{
	if (lobby.phase() != Phase::LOBBY)
		return "Game already in progress";
	if (lobby.players().size() >= rules_.max_players)
		return "Lobby is full (max " + to_string(rules_.max_players) + ")";
	lobby.add_player(playerId, name);
	return nullopt;
}

bool LobbyDirectory::collect_if_empty(Lobby& lobby)
{
	if (!lobby.all_disconnected())
		return false;
	lobby.shutdown();
	if (remove(lobby.code()))
		common::log("LOBBY", "lobby " + lobby.code() + " removed (empty)");
	return true;
}

string LobbyDirectory::normalize_code(const string& raw)
{
	string code = common::trim(raw);
	for (auto& c : code)
		c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
	return code;
}
