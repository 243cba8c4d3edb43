#pragma once
#include "common.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std;

struct GameRules
{
    int rounds = 3;
    int question_seconds = 60;
    int answer_seconds = 60;
    int guess_seconds_per_answerer = 30;
    int vote_seconds = 20;

    size_t min_players = 3;
    size_t max_players = 10;

    size_t max_name = 20;
    size_t max_question = 200;
    size_t max_answer = 300;

    string default_question = "What's the best thing about being alive?";
    string missing_answer = "...";
};

struct ServerConfig
{
    unsigned short port = 3000;
    string client_path;
    int io_threads = 1;
    GameRules rules;
};

namespace config
{
    inline const char* env(const char* name)
    {
        return getenv(name);
    }

    inline string find_client_document(const char* explicit_path)
    {
        if (explicit_path && *explicit_path)
            return explicit_path;
        if (auto p = env("WHODAT_CLIENT"))
            return p;
        for (const char* candidate : { "client/index.html", "index.html" })
        {
            error_code ec;
            if (filesystem::exists(candidate, ec))
                return candidate;
        }
        return "";
    }

    // argv[1] port, argv[2] client document. env: PORT, WHODAT_CLIENT, WHODAT_THREADS
    inline ServerConfig load(int argc, char* argv[])
    {
        ServerConfig cfg;

        int port = common::to_int(argc > 1 ? argv[1] : env("PORT"), 3000);
        if (port <= 0 || port > 65535)
            throw invalid_argument("invalid port " + to_string(port));
        cfg.port = static_cast<unsigned short>(port);

        cfg.client_path = find_client_document(argc > 2 ? argv[2] : nullptr);

        int hw = static_cast<int>(thread::hardware_concurrency());
        cfg.io_threads = max(1, common::to_int(env("WHODAT_THREADS"), hw));
        return cfg;
    }
}
