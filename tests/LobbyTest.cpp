#include "TestSupport.hpp"
#include "world/Broadcaster.hpp"
#include "world/ConnectionRegistry.hpp"
#include "world/Lobby.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <memory>
#include <set>

using namespace std;

namespace
{
	class LobbyTest : public ::testing::Test
	{
	protected:
		LobbyTest() : out(registry) {}

		// host "p0" plus n-1 more players, each with a bound fake connection
		shared_ptr<Lobby> make_lobby(size_t n, GameRules r = GameRules{})
		{
			rules = r;
			lobby = make_shared<Lobby>("ABCDE", "p0", "Host", rules, out, make_unique<ManualExecutor>(), 42);
			bind("p0");
			for (size_t i = 1; i < n; i++)
			{
				string id = "p" + to_string(i);
				lobby->add_player(id, "Player" + to_string(i));
				bind(id);
			}
			return lobby;
		}

		void bind(const string& id)
		{
			auto c = make_shared<FakeConnection>();
			conns[id] = c;
			registry.bind(c, ClientInfo{ id, "ABCDE", id });
		}

		ManualExecutor& timer() { return manual(lobby->executor()); }
		FakeConnection& conn(const string& id) { return *conns.at(id); }

		// question and answering by timeout, full reveal, guessing and voting by timeout
		void play_turn_by_timeouts()
		{
			ASSERT_EQ(lobby->phase(), Phase::QUESTION);
			timer().fire();
			ASSERT_EQ(lobby->phase(), Phase::ANSWERING);
			timer().fire();
			ASSERT_EQ(lobby->phase(), Phase::REVEAL);
			while (lobby->phase() == Phase::REVEAL)
				ASSERT_TRUE(lobby->next_reveal(lobby->guesser_id()));
			ASSERT_EQ(lobby->phase(), Phase::GUESSING);
			timer().fire();
			ASSERT_EQ(lobby->phase(), Phase::VOTING);
			timer().fire();
			ASSERT_EQ(lobby->phase(), Phase::RESULTS);
		}

		void answer_all(const string& prefix = "answer from ")
		{
			for (const auto& id : lobby->answerer_ids())
				lobby->submit_answer(id, prefix + id);
		}

		ConnectionRegistry registry;
		Broadcaster out;
		GameRules rules;
		shared_ptr<Lobby> lobby;
		map<string, shared_ptr<FakeConnection>> conns;
	};
}

TEST(BallotTest, MostVotedAnswerWins)
{
	Ballot best;
	best.cast("v1", "a1");
	best.cast("v2", "a1");
	best.cast("v3", "a2");
	EXPECT_EQ(best.winner(), optional<string>("a1"));
}

TEST(BallotTest, NoVotesMeansNoWinner)
{
	Ballot funniest;
	EXPECT_FALSE(funniest.winner().has_value());
}

TEST(BallotTest, TieGoesToFirstVotedAnswer)
{
	Ballot b;
	b.cast("v1", "a2");
	b.cast("v2", "a1");
	b.cast("v3", "a1");
	b.cast("v4", "a2");
	EXPECT_EQ(b.winner(), optional<string>("a2"));
}

TEST(BallotTest, RevoteOverwritesPreviousChoice)
{
	Ballot b;
	b.cast("v1", "a1");
	b.cast("v2", "a2");
	b.cast("v1", "a2");
	EXPECT_EQ(b.size(), 2u);
	EXPECT_EQ(b.winner(), optional<string>("a2"));
}

TEST_F(LobbyTest, RotationHasEveryPlayerOncePerRound)
{
	GameRules r;
	r.rounds = 3;
	make_lobby(4, r);
	ASSERT_TRUE(lobby->start_game("p0"));

	const auto& order = lobby->guesser_order();
	ASSERT_EQ(order.size(), 12u);
	for (size_t round = 0; round < 3; round++)
	{
		set<string> ids(order.begin() + round * 4, order.begin() + (round + 1) * 4);
		EXPECT_EQ(ids, (set<string>{ "p0", "p1", "p2", "p3" }));
	}
	for (const auto& id : { "p0", "p1", "p2", "p3" })
		EXPECT_EQ(count(order.begin(), order.end(), id), 3);
}

TEST_F(LobbyTest, StartNeedsThreeConnectedPlayers)
{
	make_lobby(2);
	EXPECT_FALSE(lobby->start_game("p0"));
	EXPECT_EQ(lobby->phase(), Phase::LOBBY);
	EXPECT_EQ(conn("p0").last("error")["message"], "Need at least 3 players");

	lobby->add_player("p2", "Late");
	bind("p2");
	lobby->mark_disconnected("p2");
	EXPECT_FALSE(lobby->start_game("p0"));
	EXPECT_EQ(lobby->phase(), Phase::LOBBY);
}

TEST_F(LobbyTest, OnlyHostStartsTheGame)
{
	make_lobby(3);
	EXPECT_FALSE(lobby->start_game("p1"));
	EXPECT_EQ(lobby->phase(), Phase::LOBBY);
	EXPECT_TRUE(conn("p1").of_type("error").empty());
}

TEST_F(LobbyTest, StartResetsScoresAndAnnouncesQuestionPhase)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	EXPECT_EQ(lobby->phase(), Phase::QUESTION);
	EXPECT_TRUE(timer().timer_pending());
	EXPECT_EQ(timer().last_seconds, 60);

	auto phase = conn("p1").last("phase");
	EXPECT_EQ(phase["phase"], "question");
	EXPECT_EQ(phase["guesser"]["id"], lobby->guesser_id());
	EXPECT_EQ(phase["turnNumber"], 1);
	EXPECT_EQ(phase["totalTurns"], 9);
	EXPECT_EQ(phase["roundNumber"], 1);
	EXPECT_EQ(phase["totalRounds"], 3);
	EXPECT_EQ(conn("p2").last("timer")["seconds"], 60);
}

TEST_F(LobbyTest, TurnVisitsEveryPhaseInOrder)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();

	ASSERT_TRUE(lobby->submit_question(guesser, "Favourite food?"));
	EXPECT_EQ(lobby->question(), "Favourite food?");
	answer_all();
	ASSERT_EQ(lobby->phase(), Phase::REVEAL);
	const size_t total = lobby->shuffled_answers().size();
	ASSERT_EQ(total, 2u);

	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_EQ(lobby->phase(), Phase::GUESSING);
	EXPECT_EQ(timer().last_seconds, 60);

	ASSERT_TRUE(lobby->submit_guesses(guesser, {}));
	ASSERT_EQ(lobby->phase(), Phase::VOTING);
	EXPECT_EQ(timer().last_seconds, 20);
	timer().fire();
	EXPECT_EQ(lobby->phase(), Phase::RESULTS);
	EXPECT_FALSE(timer().timer_pending());

	EXPECT_EQ(conn("p1").phases(),
		(vector<string>{ "question", "answering", "reveal", "guessing", "voting", "results" }));

	auto reveals = conn("p2").of_type("reveal_answer");
	ASSERT_EQ(reveals.size(), total);
	set<string> seen;
	for (size_t i = 0; i < reveals.size(); i++)
	{
		EXPECT_EQ(reveals[i]["index"], i);
		EXPECT_EQ(reveals[i]["total"], total);
		seen.insert(reveals[i]["answer"]["id"].get<string>());
	}
	EXPECT_EQ(seen.size(), total);
}

TEST_F(LobbyTest, AllAnswersInSkipTheAnswerTimer)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	ASSERT_TRUE(lobby->submit_question(lobby->guesser_id(), "Why?"));

	auto answerers = lobby->answerer_ids();
	ASSERT_EQ(answerers.size(), 2u);
	ASSERT_TRUE(lobby->submit_answer(answerers[0], "one"));
	EXPECT_EQ(lobby->phase(), Phase::ANSWERING);
	EXPECT_TRUE(timer().timer_pending());
	auto progress = conn(answerers[1]).last("answer_progress");
	EXPECT_EQ(progress["submitted"], 1);
	EXPECT_EQ(progress["total"], 2);

	ASSERT_TRUE(lobby->submit_answer(answerers[1], "two"));
	EXPECT_EQ(lobby->phase(), Phase::REVEAL);
	EXPECT_FALSE(timer().timer_pending());
	EXPECT_EQ(conn(answerers[0]).of_type("answer_submitted").size(), 1u);
	EXPECT_EQ(conn(answerers[1]).of_type("answer_submitted").size(), 1u);
}

TEST_F(LobbyTest, QuestionTimeoutUsesDefaultQuestion)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	timer().fire();
	EXPECT_EQ(lobby->phase(), Phase::ANSWERING);
	EXPECT_EQ(lobby->question(), "What's the best thing about being alive?");
	EXPECT_EQ(conn("p0").last("phase")["question"], "What's the best thing about being alive?");
}

TEST_F(LobbyTest, OnlyGuesserSubmitsQuestion)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	auto answerers = lobby->answerer_ids();
	EXPECT_FALSE(lobby->submit_question(answerers[0], "hijack"));
	EXPECT_EQ(lobby->phase(), Phase::QUESTION);
}

TEST_F(LobbyTest, LongTextIsTruncated)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	ASSERT_TRUE(lobby->submit_question(lobby->guesser_id(), string(500, 'q')));
	EXPECT_EQ(lobby->question().size(), 200u);

	auto answerers = lobby->answerer_ids();
	ASSERT_TRUE(lobby->submit_answer(answerers[0], string(500, 'a')));
	EXPECT_EQ(lobby->answers().front().second.size(), 300u);
}

TEST_F(LobbyTest, AnswerTimeoutFillsMissingAnswers)
{
	make_lobby(4);
	ASSERT_TRUE(lobby->start_game("p0"));
	timer().fire();
	auto answerers = lobby->answerer_ids();
	ASSERT_TRUE(lobby->submit_answer(answerers[0], "real"));

	timer().fire();
	ASSERT_EQ(lobby->phase(), Phase::REVEAL);
	ASSERT_EQ(lobby->shuffled_answers().size(), 3u);
	for (const auto& a : lobby->shuffled_answers())
	{
		if (a.playerId == answerers[0])
			EXPECT_EQ(a.text, "real");
		else
			EXPECT_EQ(a.text, "...");
	}
}

TEST_F(LobbyTest, GuesserAnswerIsIgnored)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	EXPECT_FALSE(lobby->submit_answer(guesser, "mine"));
	EXPECT_TRUE(lobby->answers().empty());
	EXPECT_TRUE(conn(guesser).of_type("answer_submitted").empty());
}

TEST_F(LobbyTest, ResubmittedAnswerOverwrites)
{
	make_lobby(4);
	ASSERT_TRUE(lobby->start_game("p0"));
	timer().fire();
	auto answerers = lobby->answerer_ids();
	lobby->submit_answer(answerers[0], "first");
	lobby->submit_answer(answerers[0], "second");
	ASSERT_EQ(lobby->answers().size(), 1u);
	EXPECT_EQ(lobby->answers().front().second, "second");
}

TEST_F(LobbyTest, OnlyGuesserAdvancesReveal)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	timer().fire();
	answer_all();
	ASSERT_EQ(lobby->phase(), Phase::REVEAL);

	auto answerers = lobby->answerer_ids();
	EXPECT_FALSE(lobby->next_reveal(answerers[0]));
	EXPECT_EQ(lobby->reveal_index(), 0u);
	EXPECT_TRUE(lobby->next_reveal(lobby->guesser_id()));
	EXPECT_EQ(lobby->reveal_index(), 1u);
}

TEST_F(LobbyTest, ScoreGuessesAwardsOnePointPerMatchingAuthor)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_EQ(lobby->phase(), Phase::GUESSING);

	// a1 guessed as a2's author (wrong), a2 guessed correctly
	const auto& answers = lobby->shuffled_answers();
	ASSERT_EQ(answers.size(), 2u);
	const Answer a1 = answers[0];
	const Answer a2 = answers[1];
	ASSERT_TRUE(lobby->submit_guesses(guesser, { { a1.id, a2.playerId }, { a2.id, a2.playerId } }));

	ASSERT_TRUE(lobby->guess_results().has_value());
	EXPECT_EQ(lobby->guess_results()->correct, 1);
	EXPECT_EQ(lobby->guess_results()->total, 2u);
	EXPECT_EQ(lobby->find_player(guesser)->score, 1);
	EXPECT_EQ(lobby->phase(), Phase::VOTING);
}

TEST_F(LobbyTest, GuessingTimeoutScoresMissingGuessesAsWrong)
{
	make_lobby(4);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	EXPECT_EQ(timer().last_seconds, 90);

	timer().fire();
	ASSERT_EQ(lobby->phase(), Phase::VOTING);
	EXPECT_EQ(lobby->guess_results()->correct, 0);
	EXPECT_EQ(lobby->find_player(guesser)->score, 0);
}

TEST_F(LobbyTest, VoteWinnersAuthorsGetBonus)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_TRUE(lobby->submit_guesses(guesser, {}));
	ASSERT_EQ(lobby->phase(), Phase::VOTING);

	const Answer target = lobby->shuffled_answers()[0];
	for (const auto& p : lobby->players())
		ASSERT_TRUE(lobby->vote(p.id, proto::VoteCategory::Best, target.id));
	EXPECT_EQ(lobby->phase(), Phase::VOTING);

	// nobody votes funniest: the timer closes voting and no funniest bonus is given
	timer().fire();
	ASSERT_EQ(lobby->phase(), Phase::RESULTS);
	EXPECT_EQ(lobby->find_player(target.playerId)->score, 1);

	auto results = conn("p0").last("phase");
	EXPECT_EQ(results["phase"], "results");
	EXPECT_EQ(results["bestAnswer"]["text"], target.text);
	EXPECT_TRUE(results["funniestAnswer"].is_null());
	EXPECT_EQ(results["guessResults"]["total"], 2);
	EXPECT_EQ(results["guessResults"]["results"].size(), 2u);
}

TEST_F(LobbyTest, EveryoneVotingBothCategoriesEndsVotingEarly)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_TRUE(lobby->submit_guesses(guesser, {}));

	const auto answers = lobby->shuffled_answers();
	for (const auto& p : lobby->players())
	{
		lobby->vote(p.id, proto::VoteCategory::Best, answers[0].id);
		lobby->vote(p.id, proto::VoteCategory::Funniest, answers[1].id);
	}
	EXPECT_EQ(lobby->phase(), Phase::RESULTS);
	EXPECT_FALSE(timer().timer_pending());
	EXPECT_EQ(lobby->find_player(answers[0].playerId)->score, 1);
	EXPECT_EQ(lobby->find_player(answers[1].playerId)->score, 1);
}

TEST_F(LobbyTest, VoteForUnknownAnswerIsDropped)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_TRUE(lobby->submit_guesses(guesser, {}));
	EXPECT_FALSE(lobby->vote("p1", proto::VoteCategory::Best, "nope"));
}

TEST_F(LobbyTest, OnlyHostAdvancesFromResults)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	play_turn_by_timeouts();
	EXPECT_FALSE(lobby->next_turn("p1"));
	EXPECT_EQ(lobby->phase(), Phase::RESULTS);
	EXPECT_TRUE(lobby->next_turn("p0"));
	EXPECT_EQ(lobby->phase(), Phase::QUESTION);
	EXPECT_EQ(lobby->guesser_index(), 1u);
}

TEST_F(LobbyTest, OutOfPhaseMessagesAreDropped)
{
	make_lobby(3);
	EXPECT_FALSE(lobby->submit_question("p0", "early"));
	EXPECT_FALSE(lobby->next_turn("p0"));
	ASSERT_TRUE(lobby->start_game("p0"));
	EXPECT_FALSE(lobby->start_game("p0"));
	EXPECT_FALSE(lobby->next_reveal(lobby->guesser_id()));
	EXPECT_FALSE(lobby->submit_guesses(lobby->guesser_id(), {}));
	EXPECT_FALSE(lobby->next_turn("p0"));
	EXPECT_EQ(lobby->phase(), Phase::QUESTION);
}

TEST_F(LobbyTest, ThreePlayersThreeRoundsEndInGameOver)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	ASSERT_EQ(lobby->guesser_order().size(), 9u);

	for (int turn = 0; turn < 9; turn++)
	{
		play_turn_by_timeouts();
		ASSERT_TRUE(lobby->next_turn("p0"));
	}
	EXPECT_EQ(lobby->phase(), Phase::GAMEOVER);
	EXPECT_FALSE(timer().timer_pending());

	auto over = conn("p1").last("phase");
	EXPECT_EQ(over["phase"], "gameover");
	auto board = over["scoreboard"];
	ASSERT_EQ(board.size(), 3u);
	for (size_t i = 1; i < board.size(); i++)
		EXPECT_GE(board[i - 1]["score"].get<int>(), board[i]["score"].get<int>());

	EXPECT_FALSE(lobby->next_turn("p0"));
}

TEST_F(LobbyTest, ScoreboardIsStableOnTies)
{
	make_lobby(4);
	auto board = lobby->scoreboard();
	ASSERT_EQ(board.size(), 4u);
	EXPECT_EQ(board[0].id, "p0");
	EXPECT_EQ(board[1].id, "p1");
	EXPECT_EQ(board[2].id, "p2");
	EXPECT_EQ(board[3].id, "p3");
}

TEST_F(LobbyTest, PlayAgainReturnsToLobbyAndCancelsTimer)
{
	make_lobby(3);
	ASSERT_TRUE(lobby->start_game("p0"));
	string guesser = lobby->guesser_id();
	timer().fire();
	answer_all();
	while (lobby->phase() == Phase::REVEAL)
		lobby->next_reveal(guesser);
	ASSERT_TRUE(lobby->submit_guesses(guesser, { { lobby->shuffled_answers()[0].id, lobby->shuffled_answers()[0].playerId } }));
	ASSERT_EQ(lobby->find_player(guesser)->score, 1);
	ASSERT_TRUE(timer().timer_pending());

	EXPECT_FALSE(lobby->play_again("p1"));
	EXPECT_EQ(lobby->phase(), Phase::VOTING);

	EXPECT_TRUE(lobby->play_again("p0"));
	EXPECT_EQ(lobby->phase(), Phase::LOBBY);
	EXPECT_FALSE(timer().timer_pending());
	EXPECT_TRUE(lobby->shuffled_answers().empty());
	for (const auto& p : lobby->players())
		EXPECT_EQ(p.score, 0);
	EXPECT_EQ(conn("p2").last("phase")["phase"], "lobby");
	EXPECT_EQ(conn("p2").last("lobby_update")["players"].size(), 3u);

	EXPECT_TRUE(lobby->start_game("p0"));
}

TEST_F(LobbyTest, DisconnectKeepsPlayerAndBroadcastsRoster)
{
	make_lobby(3);
	lobby->mark_disconnected("p2");
	ASSERT_EQ(lobby->players().size(), 3u);
	EXPECT_FALSE(lobby->find_player("p2")->connected);
	EXPECT_FALSE(lobby->all_disconnected());

	auto roster = conn("p0").last("lobby_update");
	EXPECT_EQ(roster["hostId"], "p0");
	EXPECT_EQ(roster["code"], "ABCDE");
	EXPECT_EQ(roster["players"][2]["connected"], false);

	lobby->mark_disconnected("p0");
	lobby->mark_disconnected("p1");
	EXPECT_TRUE(lobby->all_disconnected());
}

TEST_F(LobbyTest, NamesAreTruncatedAndDefaulted)
{
	make_lobby(1);
	lobby->add_player("x", string(40, 'n'));
	lobby->add_player("y", "");
	EXPECT_EQ(lobby->find_player("x")->name.size(), 20u);
	EXPECT_EQ(lobby->find_player("y")->name, "Player");
}
