#pragma once
#include "../common/common.hpp"
#include "../common/net.hpp"
#include "../world/Connection.hpp"
#include "FrameCodec.hpp"
#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

using  asio::ip::tcp;
using namespace std;
using Exec = asio::any_io_executor;

class Server;

// one TCP client: plain HTTP request, or WebSocket after the upgrade
class Session : public Connection, public enable_shared_from_this<Session>
{
public:
	Session(tcp::socket s, Server& svr);

	void start();

	void send_text(string text) override;
	bool is_open() const override;

private:
	void read_request();
	void handle_request(const string& head);
	void serve_http(int status, const string& reason, const string& content_type, const string& body);

	void read_frames();
	void handle_frame(ws::Frame& frame);

	void send_raw(string bytes);
	void enqueue(shared_ptr<string> msg, bool close_after = false);
	void do_write();
	void on_close(error_code ec);
	void shutdown_socket();

private:
	tcp::socket socket;
	asio::streambuf buf;
	array<char, 4096> chunk{};
	asio::strand<Exec> strand_state;
	deque<shared_ptr<string>> outq_;
	bool sending = false;
	bool close_after_write = false;
	atomic<bool> open{ true };
	bool upgraded = false;
	bool closed_once = false;
	ws::FrameDecoder decoder;
	Server& server;
};
