#pragma once
#include "../common/common.hpp"
#include "../common/net.hpp"
#include <memory>
#include <string>

using  asio::ip::tcp;
using namespace std;

class Session;
class Dispatcher;
class LobbyDirectory;

// HTTP / WebSocket listener. one Session per accepted socket
class Server
{
public:
	Server(asio::io_context& io_, unsigned short port, Dispatcher& dispatcher, LobbyDirectory& directory, string clientHtml);

	Dispatcher& dispatcher() { return dispatcher_; }
	LobbyDirectory& directory() { return directory_; }
	const string& client_html() const { return client_html_; }
	unsigned short port() const { return acc.local_endpoint().port(); }

private:
	void accept();

	tcp::acceptor acc;
	Dispatcher& dispatcher_;
	LobbyDirectory& directory_;
	string client_html_;
};
