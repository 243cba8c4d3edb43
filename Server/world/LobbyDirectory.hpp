#pragma once
#include "../common/config.hpp"
#include "LobbyExecutor.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

using namespace std;

class Broadcaster;
class Lobby;

// active lobbies by join code. created in main, one per process
class LobbyDirectory
{
public:
	using ExecutorFactory = function<unique_ptr<LobbyExecutor>()>;

	static constexpr const char* CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
	static constexpr size_t CODE_LENGTH = 5;

	LobbyDirectory(const GameRules& rules, Broadcaster& out, ExecutorFactory makeExecutor, uint32_t seed = 0);

	shared_ptr<Lobby> create(const string& hostId, const string& hostName);
	shared_ptr<Lobby> find(const string& code) const;
	bool remove(const string& code);
	size_t size() const;

	// join-time policy; run on the lobby's executor. nullopt = admitted
	optional<string> admit(Lobby& lobby, const string& playerId, const string& name) const;

	// drops the lobby (and its pending timer) once every player is disconnected
	bool collect_if_empty(Lobby& lobby);

	// upper-case, surrounding blanks removed
	static string normalize_code(const string& raw);

private:
	string generate_code(); // caller holds m_

	GameRules rules_;
	Broadcaster& out_;
	ExecutorFactory make_executor_;

	mutable mutex m_;
	mt19937 rng_;
	unordered_map<string, shared_ptr<Lobby>> lobbies_; // code, Lobby
};
