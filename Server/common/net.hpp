#pragma once
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif
#include "common.hpp"
#include <asio.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace std;

namespace net
{

	inline void run_io_threads(asio::io_context& io, int n)
	{
		vector<thread> ths;
		ths.reserve(n);
		for (int i = 0; i < n; i++)
		{
			ths.emplace_back([&] { io.run(); });
		}
		for (auto& t : ths)
			t.join();
	}

	struct HttpRequest
	{
		string method;
		string target;
		unordered_map<string, string> headers; // lower-case name, value
	};

	// request line + headers, up to the blank line
	inline optional<HttpRequest> parse_http_request(const string& head)
	{
		istringstream is(head);
		string line;
		if (!getline(is, line))
			return nullopt;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();

		HttpRequest req;
		string version;
		istringstream rl(line);
		if (!(rl >> req.method >> req.target >> version))
			return nullopt;
		if (version.rfind("HTTP/", 0) != 0)
			return nullopt;

		while (getline(is, line))
		{
			if (!line.empty() && line.back() == '\r')
				line.pop_back();
			if (line.empty())
				break;
			auto p = line.find(':');
			if (p == string::npos)
				continue;
			req.headers[common::lower(common::trim(line.substr(0, p)))] = common::trim(line.substr(p + 1));
		}
		return req;
	}

	inline string header(const HttpRequest& req, const string& name)
	{
		auto it = req.headers.find(name);
		return it == req.headers.end() ? "" : it->second;
	}

	// "Upgrade: websocket" + "Connection: ..., Upgrade"
	inline bool wants_websocket(const HttpRequest& req)
	{
		return common::lower(header(req, "upgrade")) == "websocket"
			&& common::lower(header(req, "connection")).find("upgrade") != string::npos
			&& !header(req, "sec-websocket-key").empty();
	}

	inline string http_response(int status, const string& reason, const string& content_type, const string& body)
	{
		ostringstream os;
		os << "HTTP/1.1 " << status << " " << reason << "\r\n";
		if (!content_type.empty())
			os << "Content-Type: " << content_type << "\r\n";
		os << "Content-Length: " << body.size() << "\r\n"
			<< "Connection: close\r\n\r\n"
			<< body;
		return os.str();
	}

}
