#include "../common/common.hpp"
#include "../common/net.hpp"
#include "../common/protocol.hpp"
#include "../world/Dispatcher.hpp"
#include "../world/LobbyDirectory.hpp"
#include "Session.hpp"
#include "Server.hpp"
#include <asio.hpp>
#include <memory>

namespace
{
	constexpr size_t MAX_REQUEST_HEAD = 8192;
}

Session::Session(tcp::socket s, Server& svr)
	: socket(move(s)),
	buf(MAX_REQUEST_HEAD),
	strand_state(asio::make_strand(socket.get_executor())),
	server(svr)
{
}

void Session::start()
{
	read_request();
}

void Session::read_request()
{
	auto self = shared_from_this();
	asio::async_read_until(socket, buf, "\r\n\r\n",
		asio::bind_executor(strand_state, [this, self](error_code ec, size_t n)
			{
				if (ec)
				{
					on_close(ec);
					return;
				}
				auto data = buf.data();
				string head(asio::buffers_begin(data), asio::buffers_begin(data) + n);
				buf.consume(n);
				handle_request(head);
			}));
}

void Session::handle_request(const string& head)
{
	auto req = net::parse_http_request(head);
	if (!req)
	{
		serve_http(400, "Bad Request", "text/plain", "Bad request");
		return;
	}

	if (net::wants_websocket(*req))
	{
		enqueue(make_shared<string>(ws::handshake_response(net::header(*req, "sec-websocket-key"))));
		upgraded = true;
		common::log("GATEWAY", "new WebSocket connection");

		// frames that arrived together with the handshake
		auto data = buf.data();
		string rest(asio::buffers_begin(data), asio::buffers_end(data));
		buf.consume(rest.size());
		decoder.feed(rest.data(), rest.size());
		read_frames();
		return;
	}

	string path = req->target.substr(0, req->target.find('?'));
	if (req->method != "GET")
	{
		serve_http(404, "Not Found", "text/plain", "Not found");
	}
	else if (path == "/" || path == "/index.html")
	{
		const string& html = server.client_html();
		if (html.empty())
			serve_http(404, "Not Found", "text/plain", "Not found");
		else
			serve_http(200, "OK", "text/html; charset=utf-8", html);
	}
	else if (path == "/health")
	{
		json body = { {"status", "ok"}, {"lobbies", server.directory().size()} };
		serve_http(200, "OK", "application/json", body.dump());
	}
	else
	{
		serve_http(404, "Not Found", "text/plain", "Not found");
	}
}

void Session::serve_http(int status, const string& reason, const string& content_type, const string& body)
{
	enqueue(make_shared<string>(net::http_response(status, reason, content_type, body)), true);
}

void Session::read_frames()
{
	// drain what is already buffered first
	ws::Frame frame;
	while (open)
	{
		auto st = decoder.next(frame);
		if (st == ws::FrameDecoder::Status::NeedMore)
			break;
		if (st == ws::FrameDecoder::Status::TooLarge)
		{
			common::log("GATEWAY", "frame too large, closing");
			enqueue(make_shared<string>(ws::encode_frame(ws::Opcode::Close, "")), true);
			on_close({});
			return;
		}
		handle_frame(frame);
	}
	if (!open)
		return;

	auto self = shared_from_this();
	socket.async_read_some(asio::buffer(chunk),
		asio::bind_executor(strand_state, [this, self](error_code ec, size_t n)
			{
				if (ec)
				{
					on_close(ec);
					return;
				}
				decoder.feed(chunk.data(), n);
				read_frames();
			}));
}

void Session::handle_frame(ws::Frame& frame)
{
	switch (frame.opcode)
	{
	case ws::Opcode::Text:
		if (!frame.fin)
		{
			common::log("GATEWAY", "fragmented message dropped");
			return;
		}
		server.dispatcher().on_message(shared_from_this(), frame.payload);
		return;
	case ws::Opcode::Continuation:
		common::log("GATEWAY", "continuation frame dropped");
		return;
	case ws::Opcode::Ping:
		enqueue(make_shared<string>(ws::encode_frame(ws::Opcode::Pong, "")));
		return;
	case ws::Opcode::Close:
		enqueue(make_shared<string>(ws::encode_frame(ws::Opcode::Close, "")), true);
		on_close({});
		return;
	case ws::Opcode::Binary:
	case ws::Opcode::Pong:
		return;
	}
}

void Session::send_text(string text)
{
	if (!open)
		return;
	send_raw(ws::encode_text(text));
}

bool Session::is_open() const
{
	return open;
}

void Session::send_raw(string bytes)
{
	auto msg = make_shared<string>(move(bytes));
	auto self = shared_from_this();

	asio::post(strand_state, [this, self, msg]
		{
			enqueue(msg);
		}
	);
}

// on the strand. after on_close only the final (close_after) write is accepted
void Session::enqueue(shared_ptr<string> msg, bool close_after)
{
	if (closed_once && !close_after)
		return;
	outq_.push_back(move(msg));
	if (close_after)
		close_after_write = true;
	if (!sending)
	{
		sending = true;
		do_write();
	}
}

void Session::do_write()
{
	auto self = shared_from_this();
	asio::async_write(socket, asio::buffer(*outq_.front()),
		asio::bind_executor(strand_state, [this, self](error_code ec, size_t)
			{
				if (ec)
				{
					outq_.clear();
					sending = false;
					on_close(ec);
					return;
				}
				outq_.pop_front();
				if (!outq_.empty())
				{
					do_write();
				}
				else
				{
					sending = false;
					if (close_after_write)
						shutdown_socket();
				}
			}
		)
	);
}

// runs once: leaves the lobby, then closes the socket unless a final write is pending
void Session::on_close(error_code ec)
{
	if (!closed_once)
	{
		closed_once = true;
		open = false;
		if (upgraded)
		{
			if (ec && ec != asio::error::eof)
				common::log("GATEWAY", string("client closed: ") + ec.message());
			server.dispatcher().on_disconnect(shared_from_this());
		}
	}
	if (!sending && outq_.empty())
		shutdown_socket();
}

void Session::shutdown_socket()
{
	error_code ignore;
	socket.shutdown(tcp::socket::shutdown_both, ignore);
	socket.close(ignore);
}
