#pragma once
#include "Connection.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

struct ClientInfo
{
	string playerId;
	string lobbyCode;
	string name;
};

// live connection -> player/lobby. entries exist only after a successful create/join
class ConnectionRegistry
{
public:
	void bind(const shared_ptr<Connection>& conn, ClientInfo info);
	optional<ClientInfo> find(const Connection* conn) const;
	optional<ClientInfo> unbind(const Connection* conn);

	vector<shared_ptr<Connection>> connections_in(const string& lobbyCode) const;
	shared_ptr<Connection> connection_of(const string& lobbyCode, const string& playerId) const;
	size_t size() const;

private:
	struct Entry
	{
		weak_ptr<Connection> conn;
		ClientInfo info;
	};

	mutable mutex m_;
	unordered_map<const Connection*, Entry> entries_; // connection, Entry
};
