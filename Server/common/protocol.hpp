#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace std;
using json = nlohmann::json;

namespace proto
{
    // client -> server
    struct CreateLobby { string name; };
    struct JoinLobby { string name; string code; };
    struct StartGame {};
    struct SubmitQuestion { string question; };
    struct SubmitAnswer { string answer; };
    struct NextReveal {};
    struct SubmitGuesses { vector<pair<string, string>> guesses; }; // answerId, playerId
    enum class VoteCategory { Best, Funniest };
    struct Vote { VoteCategory category; string answer_id; };
    struct NextTurn {};
    struct PlayAgain {};

    using ClientMessage = variant<
        CreateLobby, JoinLobby, StartGame,
        SubmitQuestion, SubmitAnswer, NextReveal,
        SubmitGuesses, Vote, NextTurn, PlayAgain>;

    // nullopt: not JSON, not an object, unknown type or wrong field types
    optional<ClientMessage> decode(const string& text);

    const char* to_string(VoteCategory c);

    // keeps at most max_chars code points, never splits a UTF-8 sequence
    string truncate_utf8(const string& s, size_t max_chars);

    // server -> client
    json joined(const string& playerId, const string& lobbyCode, bool isHost);
    json error(const string& message);
    json timer(int seconds, long long endsAt);
    json answer_submitted();
    json answer_progress(size_t submitted, size_t total);
}
