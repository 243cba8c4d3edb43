#pragma once
#include "../common/config.hpp"
#include "../common/protocol.hpp"
#include "LobbyExecutor.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace std;

class Broadcaster;

enum class Phase
{
	LOBBY, QUESTION, ANSWERING, REVEAL, GUESSING, VOTING, RESULTS, GAMEOVER
};
const char* to_string(Phase p);

struct Player
{
	string id;
	string name;
	int score = 0;
	bool connected = true;
};

struct Answer
{
	string id;
	string text;
	string playerId; // author
};

struct GuessResult
{
	string answerId;
	string answerText;
	string actualPlayerId;
	string guessedPlayerId; // empty: no guess
	bool correct = false;
};

struct GuessResults
{
	int correct = 0;
	size_t total = 0;
	vector<GuessResult> results;
};

// per-voter ballots of one category. a re-vote overwrites in place (keeps the first-vote position)
class Ballot
{
public:
	void cast(const string& voterId, const string& answerId);
	bool has_voted(const string& voterId) const;
	size_t size() const { return votes_.size(); }
	void clear() { votes_.clear(); }

	// most voted answer id. on a tie, the tied answer that received its first vote
	// earliest wins. nullopt when nobody voted
	optional<string> winner() const;

private:
	vector<pair<string, string>> votes_; // voterId, answerId
};

// one lobby: players, phase machine, turn state, scores.
// every public call must run on the lobby's executor.
class Lobby : public enable_shared_from_this<Lobby>
{
public:
	Lobby(string code, const string& hostId, const string& hostName, const GameRules& rules,
		Broadcaster& out, unique_ptr<LobbyExecutor> executor, uint32_t seed = 0);

	const string& code() const { return code_; }
	const string& host_id() const { return host_id_; }
	Phase phase() const { return phase_; }
	const vector<Player>& players() const { return players_; }
	const Player* find_player(const string& id) const;
	size_t connected_count() const;
	bool all_disconnected() const;
	LobbyExecutor& executor() { return *executor_; }

	// turn state
	const vector<string>& guesser_order() const { return guesser_order_; }
	size_t guesser_index() const { return guesser_idx_; }
	string guesser_id() const;
	vector<string> answerer_ids() const;
	const string& question() const { return question_; }
	const vector<pair<string, string>>& answers() const { return answers_; } // author, text
	const vector<Answer>& shuffled_answers() const { return shuffled_; }
	size_t reveal_index() const { return reveal_idx_; }
	const optional<GuessResults>& guess_results() const { return guess_results_; }

	// 로비
	void add_player(const string& id, const string& name);
	void mark_disconnected(const string& id);
	void broadcast_roster();

	// 게임 진행. false: dropped (wrong phase / sender)
	bool start_game(const string& sender);
	bool submit_question(const string& sender, const string& text);
	bool submit_answer(const string& sender, const string& text);
	bool next_reveal(const string& sender);
	bool submit_guesses(const string& sender, const vector<pair<string, string>>& guesses);
	bool vote(const string& sender, proto::VoteCategory category, const string& answerId);
	bool next_turn(const string& sender);
	bool play_again(const string& sender);

	void shutdown();

	vector<Player> scoreboard() const;
	GuessResults score_guesses();
	pair<optional<string>, optional<string>> tally_votes();

private:
	void start_question_phase();
	void start_answer_phase();
	void start_reveal_phase();
	void start_guessing_phase();
	void start_voting_phase();
	void show_results(const optional<string>& bestId, const optional<string>& funniestId);
	void finish_guessing();
	void finish_voting();
	void send_reveal_answer();

	void reset_turn();
	void start_timer(int seconds, void (Lobby::*on_expire)());
	void on_question_timeout();
	void on_answer_timeout();

	Player* player(const string& id);
	const Answer* find_answer(const string& answerId) const;
	json guesser_json() const;
	json answers_json() const;
	json answer_json(const optional<string>& answerId) const;
	static json scoreboard_json(const vector<Player>& board);
	void broadcast(const json& event);

private:
	string code_;
	string host_id_;
	GameRules rules_;
	Broadcaster& out_;
	unique_ptr<LobbyExecutor> executor_;
	mt19937 rng_;

	vector<Player> players_;
	Phase phase_ = Phase::LOBBY;

	vector<string> guesser_order_;
	size_t guesser_idx_ = 0;
	string question_;
	vector<pair<string, string>> answers_; // author, text (arrival order)
	vector<Answer> shuffled_;
	unordered_map<string, string> guesses_; // answerId, guessed playerId
	Ballot best_;
	Ballot funniest_;
	size_t reveal_idx_ = 0;
	optional<GuessResults> guess_results_;
};
