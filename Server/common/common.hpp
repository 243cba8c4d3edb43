#pragma once
#include <cctype>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

using namespace std;

namespace common
{
    inline string now()
    {
        using namespace chrono;
        auto tp = floor<seconds>(system_clock::now());

        ostringstream os;
        os << format("{:%H:%M:%S}", zoned_time{ current_zone(), tp });
        return os.str();
    }
    inline void log(const char* tag, const string& msg)
    {
        static mutex m; lock_guard<mutex> lk(m);
        cout << "[" << now() << "][" << tag << "] " << msg << endl;
    }
    inline int to_int(const char* s, int d)
    {
        if (!s || !*s)
            return d;
        try
        {
            size_t used = 0;
            int v = stoi(s, &used);
            return used == char_traits<char>::length(s) ? v : d;
        }
        catch (const logic_error&)
        {
            return d;
        }
    }
    inline string trim(const string& s)
    {
        auto b = s.find_first_not_of(" \t\r\n");
        if (b == string::npos) return "";
        auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }
    inline string lower(string s)
    {
        for (auto& c : s)
            c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        return s;
    }
    inline long long epoch_ms()
    {
        using namespace chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    // 16 hex chars, player / answer id
    template <typename Rng>
    string random_hex_id(Rng& rng)
    {
        static const char* hex = "0123456789abcdef";
        string t(16, '0');
        for (auto& c : t)
            c = hex[rng() % 16];
        return t;
    }

    inline string random_hex_id()
    {
        static mutex m; lock_guard<mutex> lk(m);
        static mt19937_64 rng{ random_device{}() };
        return random_hex_id(rng);
    }
}
