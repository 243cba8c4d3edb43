#include "Server.hpp"
#include "Session.hpp"
#include <asio.hpp>
#include <memory>

Server::Server(asio::io_context& io_, unsigned short port, Dispatcher& dispatcher, LobbyDirectory& directory, string clientHtml)
	: acc(io_, tcp::endpoint(tcp::v4(), port))
	, dispatcher_(dispatcher)
	, directory_(directory)
	, client_html_(move(clientHtml))
{
	accept();
	common::log("GATEWAY", "listen HTTP/WebSocket " + to_string(this->port()));
}

void Server::accept()
{
	acc.async_accept([this](error_code ec, tcp::socket s)
		{
			if (!ec)
			{
				auto sp = make_shared<Session>(move(s), *this);
				sp->start();
			}
			else if (ec == asio::error::operation_aborted)
			{
				return;
			}
			accept();
		});
}
