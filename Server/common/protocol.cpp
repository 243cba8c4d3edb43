#include "protocol.hpp"
#include <algorithm>

using namespace std;

namespace
{
    // missing or non-string -> ""
    string str_field(const json& j, const char* key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string())
            return "";
        return it->get<string>();
    }
}

namespace proto
{
    optional<ClientMessage> decode(const string& text)
    {
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return nullopt;

        string type = str_field(j, "type");

        if (type == "create_lobby")
            return CreateLobby{ str_field(j, "name") };
        if (type == "join_lobby")
            return JoinLobby{ str_field(j, "name"), str_field(j, "code") };
        if (type == "start_game")
            return StartGame{};
        if (type == "submit_question")
            return SubmitQuestion{ str_field(j, "question") };
        if (type == "submit_answer")
            return SubmitAnswer{ str_field(j, "answer") };
        if (type == "next_reveal")
            return NextReveal{};
        if (type == "submit_guesses")
        {
            SubmitGuesses msg;
            auto it = j.find("guesses");
            if (it != j.end() && it->is_object())
            {
                for (auto& [answerId, playerId] : it->items())
                {
                    if (playerId.is_string())
                        msg.guesses.emplace_back(answerId, playerId.get<string>());
                }
            }
            return msg;
        }
        if (type == "vote")
        {
            string category = str_field(j, "category");
            string answerId = str_field(j, "answerId");
            if (answerId.empty())
                return nullopt;
            if (category == "best")
                return Vote{ VoteCategory::Best, answerId };
            if (category == "funniest")
                return Vote{ VoteCategory::Funniest, answerId };
            return nullopt;
        }
        if (type == "next_turn")
            return NextTurn{};
        if (type == "play_again")
            return PlayAgain{};
        return nullopt;
    }

    const char* to_string(VoteCategory c)
    {
        switch (c)
        {
        case VoteCategory::Best: return "best";
        case VoteCategory::Funniest: return "funniest";
        }
        return "";
    }

    string truncate_utf8(const string& s, size_t max_chars)
    {
        size_t chars = 0;
        size_t i = 0;
        while (i < s.size())
        {
            if (chars == max_chars)
                return s.substr(0, i);
            unsigned char c = static_cast<unsigned char>(s[i]);
            size_t len = 1;
            if (c >= 0xF0) len = 4;
            else if (c >= 0xE0) len = 3;
            else if (c >= 0xC0) len = 2;
            i = min(s.size(), i + len);
            ++chars;
        }
        return s;
    }

    json joined(const string& playerId, const string& lobbyCode, bool isHost)
    {
        return { {"type", "joined"}, {"playerId", playerId}, {"lobbyCode", lobbyCode}, {"isHost", isHost} };
    }

    json error(const string& message)
    {
        return { {"type", "error"}, {"message", message} };
    }

    json timer(int seconds, long long endsAt)
    {
        return { {"type", "timer"}, {"seconds", seconds}, {"endsAt", endsAt} };
    }

    json answer_submitted()
    {
        return { {"type", "answer_submitted"} };
    }

    json answer_progress(size_t submitted, size_t total)
    {
        return { {"type", "answer_progress"}, {"submitted", submitted}, {"total", total} };
    }
}
