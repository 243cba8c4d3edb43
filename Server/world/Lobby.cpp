#include "Lobby.hpp"
#include "Broadcaster.hpp"
#include "../common/common.hpp"
#include <algorithm>
#include <random>

using namespace std;

const char* to_string(Phase p)
{
    switch (p)
    {
    case Phase::LOBBY: return "lobby";
    case Phase::QUESTION: return "question";
    case Phase::ANSWERING: return "answering";
    case Phase::REVEAL: return "reveal";
    case Phase::GUESSING: return "guessing";
    case Phase::VOTING: return "voting";
    case Phase::RESULTS: return "results";
    case Phase::GAMEOVER: return "gameover";
    }
    return "";
}

void Ballot::cast(const string& voterId, const string& answerId)
{
    for (auto& [voter, answer] : votes_)
    {
        if (voter == voterId)
        {
            answer = answerId;
            return;
        }
    }
    votes_.emplace_back(voterId, answerId);
}

bool Ballot::has_voted(const string& voterId) const
{
    return any_of(votes_.begin(), votes_.end(), [&](const auto& v) { return v.first == voterId; });
}

optional<string> Ballot::winner() const
{
    vector<pair<string, int>> counts; // answerId, votes (first-seen order)
    for (const auto& [voter, answerId] : votes_)
    {
        auto it = find_if(counts.begin(), counts.end(), [&](const auto& c) { return c.first == answerId; });
        if (it == counts.end())
            counts.emplace_back(answerId, 1);
        else
            it->second++;
    }

    optional<string> best;
    int top = 0;
    for (const auto& [answerId, n] : counts)
    {
        if (n > top)
        {
            top = n;
            best = answerId;
        }
    }
    return best;
}

Lobby::Lobby(string code, const string& hostId, const string& hostName, const GameRules& rules,
    Broadcaster& out, unique_ptr<LobbyExecutor> executor, uint32_t seed)
    : code_(move(code))
    , host_id_(hostId)
    , rules_(rules)
    , out_(out)
    , executor_(move(executor))
    , rng_(seed ? seed : mt19937::result_type(random_device{}()))
{
    add_player(hostId, hostName);
}

const Player* Lobby::find_player(const string& id) const
{
    auto it = find_if(players_.begin(), players_.end(), [&](const Player& p) { return p.id == id; });
    return it == players_.end() ? nullptr : &*it;
}

Player* Lobby::player(const string& id)
{
    auto it = find_if(players_.begin(), players_.end(), [&](const Player& p) { return p.id == id; });
    return it == players_.end() ? nullptr : &*it;
}

size_t Lobby::connected_count() const
{
    return count_if(players_.begin(), players_.end(), [](const Player& p) { return p.connected; });
}

bool Lobby::all_disconnected() const
{
    return connected_count() == 0;
}

string Lobby::guesser_id() const
{
    if (guesser_idx_ >= guesser_order_.size())
        return "";
    return guesser_order_[guesser_idx_];
}

vector<string> Lobby::answerer_ids() const
{
    const string guesser = guesser_id();
    vector<string> out;
    for (const auto& p : players_)
    {
        if (p.id != guesser)
            out.push_back(p.id);
    }
    return out;
}

// 로비
void Lobby::add_player(const string& id, const string& name)
{
    string shown = proto::truncate_utf8(name.empty() ? "Player" : name, rules_.max_name);
    players_.push_back(Player{ id, move(shown), 0, true });
}

void Lobby::mark_disconnected(const string& id)
{
    if (auto p = player(id))
        p->connected = false;
    broadcast_roster();
}

void Lobby::broadcast_roster()
{
    json players = json::array();
    for (const auto& p : players_)
        players.push_back({ {"id", p.id}, {"name", p.name}, {"score", p.score}, {"connected", p.connected} });
    broadcast({ {"type", "lobby_update"}, {"players", players}, {"hostId", host_id_}, {"code", code_} });
}

void Lobby::shutdown()
{
    executor_->cancel_timer();
}

// 게임 진행
bool Lobby::start_game(const string& sender)
{
    if (sender != host_id_ || phase_ != Phase::LOBBY)
        return false;
    if (connected_count() < rules_.min_players)
    {
        out_.to_player(code_, sender, proto::error("Need at least " + to_string(rules_.min_players) + " players"));
        return false;
    }

    vector<string> ids;
    for (const auto& p : players_)
        ids.push_back(p.id);

    guesser_order_.clear();
    for (int r = 0; r < rules_.rounds; r++)
    {
        shuffle(ids.begin(), ids.end(), rng_);
        guesser_order_.insert(guesser_order_.end(), ids.begin(), ids.end());
    }
    guesser_idx_ = 0;
    for (auto& p : players_)
        p.score = 0;

    common::log("LOBBY", "game started in " + code_ + " with " + to_string(players_.size()) + " players");
    start_question_phase();
    return true;
}

bool Lobby::submit_question(const string& sender, const string& text)
{
    if (phase_ != Phase::QUESTION || sender != guesser_id())
        return false;
    question_ = proto::truncate_utf8(text, rules_.max_question);
    if (question_.empty())
        question_ = rules_.default_question;
    executor_->cancel_timer();
    start_answer_phase();
    return true;
}

bool Lobby::submit_answer(const string& sender, const string& text)
{
    if (phase_ != Phase::ANSWERING || sender == guesser_id() || !find_player(sender))
        return false;

    string trimmed = proto::truncate_utf8(text, rules_.max_answer);
    auto it = find_if(answers_.begin(), answers_.end(), [&](const auto& a) { return a.first == sender; });
    if (it == answers_.end())
        answers_.emplace_back(sender, move(trimmed));
    else
        it->second = move(trimmed);
    out_.to_player(code_, sender, proto::answer_submitted());

    auto answerers = answerer_ids();
    bool all = all_of(answerers.begin(), answerers.end(), [&](const string& id)
        {
            return any_of(answers_.begin(), answers_.end(), [&](const auto& a) { return a.first == id; });
        });
    if (all)
    {
        executor_->cancel_timer();
        start_reveal_phase();
    }
    else
    {
        broadcast(proto::answer_progress(answers_.size(), answerers.size()));
    }
    return true;
}

bool Lobby::next_reveal(const string& sender)
{
    if (phase_ != Phase::REVEAL || sender != guesser_id())
        return false;
    reveal_idx_++;
    if (reveal_idx_ >= shuffled_.size())
        start_guessing_phase();
    else
        send_reveal_answer();
    return true;
}

bool Lobby::submit_guesses(const string& sender, const vector<pair<string, string>>& guesses)
{
    if (phase_ != Phase::GUESSING || sender != guesser_id())
        return false;
    guesses_.clear();
    for (const auto& [answerId, playerId] : guesses)
        guesses_[answerId] = playerId;
    executor_->cancel_timer();
    finish_guessing();
    return true;
}

bool Lobby::vote(const string& sender, proto::VoteCategory category, const string& answerId)
{
    if (phase_ != Phase::VOTING || !find_player(sender) || !find_answer(answerId))
        return false;

    (category == proto::VoteCategory::Best ? best_ : funniest_).cast(sender, answerId);

    bool allVoted = all_of(players_.begin(), players_.end(), [&](const Player& p)
        {
            return best_.has_voted(p.id) && funniest_.has_voted(p.id);
        });
    if (allVoted)
    {
        executor_->cancel_timer();
        finish_voting();
    }
    return true;
}

bool Lobby::next_turn(const string& sender)
{
    if (phase_ != Phase::RESULTS || sender != host_id_)
        return false;

    guesser_idx_++;
    if (guesser_idx_ >= guesser_order_.size())
    {
        phase_ = Phase::GAMEOVER;
        broadcast({ {"type", "phase"}, {"phase", to_string(phase_)}, {"scoreboard", scoreboard_json(scoreboard())} });
        common::log("LOBBY", "game over in " + code_);
    }
    else
    {
        start_question_phase();
    }
    return true;
}

bool Lobby::play_again(const string& sender)
{
    if (sender != host_id_)
        return false;

    executor_->cancel_timer();
    phase_ = Phase::LOBBY;
    for (auto& p : players_)
        p.score = 0;
    reset_turn();
    guesser_order_.clear();
    guesser_idx_ = 0;

    broadcast({ {"type", "phase"}, {"phase", to_string(phase_)} });
    broadcast_roster();
    return true;
}

// 페이즈 전환
void Lobby::reset_turn()
{
    question_.clear();
    answers_.clear();
    guesses_.clear();
    best_.clear();
    funniest_.clear();
    shuffled_.clear();
    reveal_idx_ = 0;
    guess_results_.reset();
}

void Lobby::start_question_phase()
{
    phase_ = Phase::QUESTION;
    reset_turn();

    const size_t n = max<size_t>(1, players_.size());
    broadcast({
        {"type", "phase"},
        {"phase", to_string(phase_)},
        {"guesser", guesser_json()},
        {"turnNumber", guesser_idx_ + 1},
        {"totalTurns", guesser_order_.size()},
        {"roundNumber", guesser_idx_ / n + 1},
        {"totalRounds", rules_.rounds},
    });
    start_timer(rules_.question_seconds, &Lobby::on_question_timeout);
}

void Lobby::on_question_timeout()
{
    if (question_.empty())
        question_ = rules_.default_question;
    start_answer_phase();
}

void Lobby::start_answer_phase()
{
    phase_ = Phase::ANSWERING;
    broadcast({ {"type", "phase"}, {"phase", to_string(phase_)}, {"question", question_}, {"guesser", guesser_json()} });
    start_timer(rules_.answer_seconds, &Lobby::on_answer_timeout);
}

void Lobby::on_answer_timeout()
{
    for (const auto& id : answerer_ids())
    {
        bool has = any_of(answers_.begin(), answers_.end(), [&](const auto& a) { return a.first == id; });
        if (!has)
            answers_.emplace_back(id, rules_.missing_answer);
    }
    start_reveal_phase();
}

void Lobby::start_reveal_phase()
{
    executor_->cancel_timer();

    shuffled_.clear();
    for (const auto& [playerId, text] : answers_)
        shuffled_.push_back(Answer{ common::random_hex_id(rng_), text, playerId });
    shuffle(shuffled_.begin(), shuffled_.end(), rng_);
    reveal_idx_ = 0;
    phase_ = Phase::REVEAL;

    broadcast({
        {"type", "phase"},
        {"phase", to_string(phase_)},
        {"question", question_},
        {"totalAnswers", shuffled_.size()},
        {"guesser", guesser_json()},
    });

    if (shuffled_.empty())
        start_guessing_phase();
    else
        send_reveal_answer();
}

void Lobby::send_reveal_answer()
{
    if (reveal_idx_ >= shuffled_.size())
        return;
    const Answer& a = shuffled_[reveal_idx_];
    broadcast({
        {"type", "reveal_answer"},
        {"index", reveal_idx_},
        {"total", shuffled_.size()},
        {"answer", { {"id", a.id}, {"text", a.text} }},
    });
}

void Lobby::start_guessing_phase()
{
    phase_ = Phase::GUESSING;
    auto answerers = answerer_ids();

    json players = json::array();
    for (const auto& id : answerers)
    {
        if (auto p = find_player(id))
            players.push_back({ {"id", p->id}, {"name", p->name} });
    }

    broadcast({
        {"type", "phase"},
        {"phase", to_string(phase_)},
        {"question", question_},
        {"answers", answers_json()},
        {"players", players},
        {"guesser", guesser_json()},
    });
    start_timer(rules_.guess_seconds_per_answerer * static_cast<int>(answerers.size()), &Lobby::finish_guessing);
}

void Lobby::finish_guessing()
{
    guess_results_ = score_guesses();
    start_voting_phase();
}

GuessResults Lobby::score_guesses()
{
    GuessResults out;
    out.total = shuffled_.size();
    for (const auto& a : shuffled_)
    {
        GuessResult r;
        r.answerId = a.id;
        r.answerText = a.text;
        r.actualPlayerId = a.playerId;
        auto it = guesses_.find(a.id);
        if (it != guesses_.end())
            r.guessedPlayerId = it->second;
        r.correct = !r.guessedPlayerId.empty() && r.guessedPlayerId == a.playerId;
        if (r.correct)
            out.correct++;
        out.results.push_back(move(r));
    }

    if (auto g = player(guesser_id()))
        g->score += out.correct;
    return out;
}

void Lobby::start_voting_phase()
{
    phase_ = Phase::VOTING;
    broadcast({
        {"type", "phase"},
        {"phase", to_string(phase_)},
        {"question", question_},
        {"answers", answers_json()},
        {"guesser", guesser_json()},
    });
    start_timer(rules_.vote_seconds, &Lobby::finish_voting);
}

void Lobby::finish_voting()
{
    auto [bestId, funniestId] = tally_votes();
    show_results(bestId, funniestId);
}

pair<optional<string>, optional<string>> Lobby::tally_votes()
{
    auto bestId = best_.winner();
    auto funniestId = funniest_.winner();

    for (const auto& id : { bestId, funniestId })
    {
        if (!id)
            continue;
        if (auto a = find_answer(*id))
        {
            if (auto p = player(a->playerId))
                p->score += 1;
        }
    }
    return { bestId, funniestId };
}

void Lobby::show_results(const optional<string>& bestId, const optional<string>& funniestId)
{
    executor_->cancel_timer();
    phase_ = Phase::RESULTS;

    json guessResults = nullptr;
    if (guess_results_)
    {
        json results = json::array();
        for (const auto& r : guess_results_->results)
        {
            json actual = nullptr;
            if (auto p = find_player(r.actualPlayerId))
                actual = { {"id", p->id}, {"name", p->name} };
            json guessed = nullptr;
            if (auto p = find_player(r.guessedPlayerId))
                guessed = { {"id", p->id}, {"name", p->name} };
            results.push_back({
                {"answerId", r.answerId},
                {"answerText", r.answerText},
                {"actualPlayer", actual},
                {"guessedPlayer", guessed},
                {"correct", r.correct},
            });
        }
        guessResults = { {"correct", guess_results_->correct}, {"total", guess_results_->total}, {"results", results} };
    }

    broadcast({
        {"type", "phase"},
        {"phase", to_string(phase_)},
        {"guessResults", guessResults},
        {"bestAnswer", answer_json(bestId)},
        {"funniestAnswer", answer_json(funniestId)},
        {"scoreboard", scoreboard_json(scoreboard())},
    });
}

vector<Player> Lobby::scoreboard() const
{
    vector<Player> board = players_;
    stable_sort(board.begin(), board.end(), [](const Player& a, const Player& b) { return a.score > b.score; });
    return board;
}

// 타이머
void Lobby::start_timer(int seconds, void (Lobby::*on_expire)())
{
    weak_ptr<Lobby> weak = weak_from_this();
    executor_->start_timer(seconds, [weak, on_expire]
        {
            if (auto self = weak.lock())
                ((*self).*on_expire)();
        });
    broadcast(proto::timer(seconds, common::epoch_ms() + seconds * 1000LL));
}

// helpers
const Answer* Lobby::find_answer(const string& answerId) const
{
    auto it = find_if(shuffled_.begin(), shuffled_.end(), [&](const Answer& a) { return a.id == answerId; });
    return it == shuffled_.end() ? nullptr : &*it;
}

json Lobby::guesser_json() const
{
    auto p = find_player(guesser_id());
    if (!p)
        return nullptr;
    return { {"id", p->id}, {"name", p->name} };
}

json Lobby::answers_json() const
{
    json arr = json::array();
    for (const auto& a : shuffled_)
        arr.push_back({ {"id", a.id}, {"text", a.text} });
    return arr;
}

json Lobby::answer_json(const optional<string>& answerId) const
{
    if (!answerId)
        return nullptr;
    auto a = find_answer(*answerId);
    if (!a)
        return nullptr;
    auto p = find_player(a->playerId);
    return { {"text", a->text}, {"player", p ? json(p->name) : json(nullptr)} };
}

json Lobby::scoreboard_json(const vector<Player>& board)
{
    json arr = json::array();
    for (const auto& p : board)
        arr.push_back({ {"id", p.id}, {"name", p.name}, {"score", p.score} });
    return arr;
}

void Lobby::broadcast(const json& event)
{
    out_.to_lobby(code_, event);
}
