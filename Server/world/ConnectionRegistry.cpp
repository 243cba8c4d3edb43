#include "ConnectionRegistry.hpp"

using namespace std;

void ConnectionRegistry::bind(const shared_ptr<Connection>& conn, ClientInfo info)
{
	lock_guard<mutex> lk(m_);
	entries_[conn.get()] = Entry{ conn, move(info) };
}

optional<ClientInfo> ConnectionRegistry::find(const Connection* conn) const
{
	lock_guard<mutex> lk(m_);
	auto it = entries_.find(conn);
	if (it == entries_.end()) return nullopt;
	return it->second.info;
}

optional<ClientInfo> ConnectionRegistry::unbind(const Connection* conn)
{
	lock_guard<mutex> lk(m_);
	auto it = entries_.find(conn);
	if (it == entries_.end()) return nullopt;
	ClientInfo info = move(it->second.info);
	entries_.erase(it);
	return info;
}

vector<shared_ptr<Connection>> ConnectionRegistry::connections_in(const string& lobbyCode) const
{
	vector<shared_ptr<Connection>> out;
	lock_guard<mutex> lk(m_);
	for (const auto& [key, e] : entries_)
	{
		if (e.info.lobbyCode != lobbyCode)
			continue;
		if (auto c = e.conn.lock())
			out.push_back(move(c));
	}
	return out;
}

shared_ptr<Connection> ConnectionRegistry::connection_of(const string& lobbyCode, const string& playerId) const
{
	lock_guard<mutex> lk(m_);
	for (const auto& [key, e] : entries_)
	{
		if (e.info.lobbyCode == lobbyCode && e.info.playerId == playerId)
			return e.conn.lock();
	}
	return nullptr;
}

size_t ConnectionRegistry::size() const
{
	lock_guard<mutex> lk(m_);
	return entries_.size();
}
