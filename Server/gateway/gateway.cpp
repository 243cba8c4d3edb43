#include "../common/common.hpp"
#include "../common/config.hpp"
#include "../common/net.hpp"
#include "../world/Broadcaster.hpp"
#include "../world/ConnectionRegistry.hpp"
#include "../world/Dispatcher.hpp"
#include "../world/LobbyDirectory.hpp"
#include "../world/StrandExecutor.hpp"
#include "Server.hpp"
#include <exception>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

using  asio::ip::tcp;
using namespace std;

namespace
{
	string load_client_document(const string& path)
	{
		if (path.empty())
		{
			common::log("CONFIG", "client document not found, GET / will answer 404");
			return "";
		}
		ifstream in(path, ios::binary);
		if (!in)
		{
			common::log("CONFIG", "cannot open client document " + path);
			return "";
		}
		ostringstream os;
		os << in.rdbuf();
		common::log("CONFIG", "client document " + path);
		return os.str();
	}
}

int main(int argc, char* argv[])
{
	try
	{
		ServerConfig cfg = config::load(argc, argv);

		asio::io_context io;
		ConnectionRegistry registry;
		Broadcaster broadcaster(registry);
		LobbyDirectory directory(cfg.rules, broadcaster, [&io] { return make_unique<StrandExecutor>(io); });
		Dispatcher dispatcher(registry, directory, broadcaster);

		Server s(io, cfg.port, dispatcher, directory, load_client_document(cfg.client_path));
		common::log("GATEWAY", "WhoDat? game server on http://localhost:" + to_string(s.port())
			+ " threads=" + to_string(cfg.io_threads));

		net::run_io_threads(io, cfg.io_threads);
	}
	catch (const exception& e)
	{
		common::log("GATEWAY", string("fatal: ") + e.what());
		return 1;
	}
	return 0;
}
