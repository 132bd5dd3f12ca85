// rp_server.hpp — Connection registry, dispatch pipeline, server context
//
// Threads:
//   accept        poll-accepts TCP connections, spawns one session each
//   session       handshake, then read → decode → inbound queue
//   writer        one per client, pops its byte queue → WebSocket send
//   outbound      Dispatcher::run(): encode once, fan out to Active clients
//   tick          Kernel task "server/inbound": Router::process() per message
//
// Clients start Pending and see no broadcasts. The introduction handler
// snapshots the World on the tick and emits one targeted, promoting envelope
// (snapshot + [35, true]); the dispatcher promotes the client as it delivers
// it, so every later broadcast follows the snapshot.
//
// Usage:
//   Kernel kernel;
//   ServerConfig cfg;
//   cfg.port = 50000;
//   Server server(cfg);
//   server.start(kernel);
//   Component e = server.world.entities.register_content(...);
//   kernel.loop_run();
//   server.stop();
//
// Depends: rp_core.hpp, rp_ws.hpp, rp_store.hpp, rp_asset.hpp

#pragma once

#include "rp_core.hpp"
#include "rp_ws.hpp"
#include "rp_store.hpp"
#include "rp_asset.hpp"
#include <unordered_set>

namespace rp {

// =============================================================================
// ConnectionRegistry
// =============================================================================
struct Client {
	ClientId id = 0;
	std::shared_ptr<WsSocket> ws;  // null in pipeline tests
	BlockingQueue<SharedBytes> outgoing;
	std::string name;              // written on the tick by the introduction handler
};

enum class ClientState : uint8_t { Absent, Pending, Active };

class ConnectionRegistry {
	mutable std::mutex mtx;
	std::unordered_map<ClientId, std::shared_ptr<Client>> pending;
	std::unordered_map<ClientId, std::shared_ptr<Client>> active;
	std::atomic<ClientId> next_id{1};

public:
	std::shared_ptr<Client> add_pending(std::shared_ptr<WsSocket> ws) {
		auto c = std::make_shared<Client>();
		c->id = next_id.fetch_add(1);
		c->ws = std::move(ws);
		std::lock_guard<std::mutex> lk(mtx);
		pending[c->id] = c;
		return c;
	}

	// Pending → Active. False if the client is not pending.
	bool promote(ClientId id) {
		std::lock_guard<std::mutex> lk(mtx);
		auto it = pending.find(id);
		if (it == pending.end()) return false;
		active[id] = std::move(it->second);
		pending.erase(it);
		return true;
	}

	// Closes the client's queue so its writer exits.
	std::shared_ptr<Client> remove(ClientId id) {
		std::shared_ptr<Client> c;
		{
			std::lock_guard<std::mutex> lk(mtx);
			auto it = pending.find(id);
			if (it != pending.end()) {
				c = std::move(it->second);
				pending.erase(it);
			} else if ((it = active.find(id)) != active.end()) {
				c = std::move(it->second);
				active.erase(it);
			}
		}
		if (c) c->outgoing.close();
		return c;
	}

	ClientState state(ClientId id) const {
		std::lock_guard<std::mutex> lk(mtx);
		if (active.count(id)) return ClientState::Active;
		if (pending.count(id)) return ClientState::Pending;
		return ClientState::Absent;
	}

	std::shared_ptr<Client> find(ClientId id) const {
		std::lock_guard<std::mutex> lk(mtx);
		auto it = active.find(id);
		if (it != active.end()) return it->second;
		it = pending.find(id);
		return it == pending.end() ? nullptr : it->second;
	}

	std::shared_ptr<Client> find_active(ClientId id) const {
		std::lock_guard<std::mutex> lk(mtx);
		auto it = active.find(id);
		return it == active.end() ? nullptr : it->second;
	}

	std::vector<std::shared_ptr<Client>> active_clients() const {
		std::lock_guard<std::mutex> lk(mtx);
		std::vector<std::shared_ptr<Client>> out;
		out.reserve(active.size());
		for (auto& kv : active) out.push_back(kv.second);
		return out;
	}

	size_t pending_count() const {
		std::lock_guard<std::mutex> lk(mtx);
		return pending.size();
	}

	size_t active_count() const {
		std::lock_guard<std::mutex> lk(mtx);
		return active.size();
	}

	// Shutdown: closes every queue and socket; entries stay until their
	// sessions remove them.
	void close_all() {
		std::vector<std::shared_ptr<Client>> all;
		{
			std::lock_guard<std::mutex> lk(mtx);
			for (auto& kv : pending) all.push_back(kv.second);
			for (auto& kv : active) all.push_back(kv.second);
		}
		for (auto& c : all) {
			c->outgoing.close();
			if (c->ws) c->ws->close();
		}
	}
};

// =============================================================================
// Dispatcher — outbound queue consumer
// =============================================================================
class Dispatcher {
	BlockingQueue<Outbound>& queue;
	ConnectionRegistry& registry;

public:
	using EncodeFn = std::function<Bytes(const Content&)>;

	EncodeFn encode_fn = [](const Content& c) { return encode(c); };
	std::atomic<uint64_t> delivered{0};
	std::atomic<uint64_t> dropped{0};

	Dispatcher(BlockingQueue<Outbound>& q, ConnectionRegistry& r) : queue(q), registry(r) {}

	// False if the envelope was dropped (encode failure or absent target).
	bool dispatch(Outbound env) {
		SharedBytes bytes;
		try {
			bytes = std::make_shared<const Bytes>(encode_fn(env.content));
		} catch (const std::exception& e) {
			fprintf(stderr, "[server] unable to encode message, dropping it: %s\n", e.what());
			dropped++;
			return false;
		}

		if (env.target) {
			ClientId id = *env.target;
			if (env.promote && !registry.promote(id))
				fprintf(stderr, "[server] client %llu could not be promoted\n", (unsigned long long)id);
			auto c = registry.find_active(id);
			if (!c) {
				fprintf(stderr, "[server] client %llu is not active, dropping message\n", (unsigned long long)id);
				dropped++;
				return false;
			}
			c->outgoing.push(bytes);
		} else {
			for (auto& c : registry.active_clients())
				c->outgoing.push(bytes);
		}
		delivered++;
		return true;
	}

	// Runs until the queue is closed.
	void run() {
		Outbound env;
		while (queue.pop(env))
			dispatch(std::move(env));
	}
};

// =============================================================================
// Router — inbound (type, payload) pairs → handlers
// =============================================================================
class Router {
public:
	using Handler = std::function<void(ClientId, const Content&)>;

	void on_message(uint32_t type, Handler fn) { handlers[type] = std::move(fn); }

	// Returns the number of pairs handed to a handler.
	size_t process(const Inbound& msg) {
		const Content& arr = msg.content;
		if (!arr.is_array()) {
			fprintf(stderr, "[server] message from client %llu is not an array\n", (unsigned long long)msg.client);
			return 0;
		}

		size_t handled = 0;
		for (size_t i = 0; i < arr.size(); i += 2) {
			if (i + 1 >= arr.size()) {
				fprintf(stderr, "[server] trailing message type without payload from client %llu\n",
					(unsigned long long)msg.client);
				break;
			}
			const Content& type = arr[i];
			if (!type.is_number_integer() || type.get<int64_t>() < 0
				|| (type.is_number_unsigned() && type.get<uint64_t>() > UINT32_MAX)) {
				fprintf(stderr, "[server] malformed message type from client %llu\n", (unsigned long long)msg.client);
				break;
			}
			auto it = handlers.find(type.get<uint32_t>());
			if (it == handlers.end()) {
				fprintf(stderr, "[server] unknown message type %lld\n", (long long)type.get<int64_t>());
				continue;
			}
			it->second(msg.client, arr[i + 1]);
			handled++;
		}
		return handled;
	}

private:
	std::unordered_map<uint32_t, Handler> handlers;
};

// =============================================================================
// ServerConfig / Server
// =============================================================================
struct ServerConfig {
	int port = 50000;
	uint64_t max_payload = WS_DEFAULT_MAX_PAYLOAD;
	size_t handshake_limit = 4096;
	int accept_poll_ms = 200;
	size_t send_chunk = 0;         // 0 = measured SO_SNDBUF
	size_t inline_threshold = 1024;
	int asset_port = 0;            // 0 = port + 1
	bool serve_assets = true;
};

class Server {
public:
	ServerConfig config;

	// Declaration order matters: the World and Dispatcher hold references
	// to the queues and registry.
	BlockingQueue<Outbound> outbound;
	BlockingQueue<Inbound> inbound;
	World world;
	ConnectionRegistry registry;
	Dispatcher dispatcher;
	Router router;
	AssetServer assets;

	std::function<void(ClientId, const InvokeMsg&)> on_invoke;

	explicit Server(ServerConfig cfg = {})
		: config(cfg), world(outbound), dispatcher(outbound, registry) {
		router.on_message(MSG_INTRODUCTION, [this](ClientId from, const Content& payload) {
			handle_client_message(from, MSG_INTRODUCTION, payload);
		});
		router.on_message(MSG_INVOKE, [this](ClientId from, const Content& payload) {
			handle_client_message(from, MSG_INVOKE, payload);
		});
	}

	~Server() { stop(); }

	Server(const Server&) = delete;
	Server& operator=(const Server&) = delete;

	bool start(Kernel& k, float inbound_priority = 0.f) {
		if (started) return true;
		if (!listener.open(config.port)) return false;

		if (config.serve_assets) {
			int aport = config.asset_port ? config.asset_port : listener.port() + 1;
			if (!assets.start(aport, config.accept_poll_ms)) {
				listener.close();
				return false;
			}
		}

		stopping = false;
		started = true;
		outbound_thread = std::thread([this] { dispatcher.run(); });
		accept_thread = std::thread([this] { accept_loop(); });
		kernel = &k;
		kernel->task_add("server/inbound", inbound_priority, [this](Kernel&) { process_inbound(); });

		printf("[server] listening on port %d\n", listener.port());
		return true;
	}

	// Idempotent.
	void stop() {
		if (!started) return;
		started = false;
		stopping = true;
		if (kernel) kernel->task_stop("server/inbound");
		kernel = nullptr;

		if (accept_thread.joinable()) accept_thread.join();
		listener.close();

		outbound.close();
		inbound.close();
		registry.close_all();
		{
			std::lock_guard<std::mutex> lk(live_mtx);
			for (auto& ws : live) ws->close();
		}
		if (outbound_thread.joinable()) outbound_thread.join();
		sessions.join_all();
		assets.stop();
		printf("[server] stopped\n");
	}

	int port() const { return listener.port(); }
	bool is_running() const { return started; }

	// Tick task body.
	void process_inbound() {
		Inbound msg;
		while (inbound.try_pop(msg))
			router.process(msg);
	}

	void handle_client_message(ClientId from, uint32_t type, const Content& payload) {
		ClientMessage msg;
		if (!decode_client_message(type, payload, msg)) {
			fprintf(stderr, "[server] malformed message %u from client %llu\n", type, (unsigned long long)from);
			return;
		}
		if (auto* intro = std::get_if<IntroductionMsg>(&msg)) {
			handle_introduction(from, *intro);
		} else if (auto* inv = std::get_if<InvokeMsg>(&msg)) {
			if (!on_invoke) {
				printf("[server] invoke from client %llu ignored, no handler\n", (unsigned long long)from);
				return;
			}
			on_invoke(from, *inv);
		}
	}

	void handle_introduction(ClientId from, const IntroductionMsg& m) {
		auto c = registry.find(from);
		if (!c) return;
		c->name = m.client_name;
		printf("[server] client %llu introduced as '%s'\n", (unsigned long long)from, m.client_name.c_str());

		Content dump = world.snapshot();
		append_message(dump, ServerMessage{ReadyMsg{}});
		outbound.push(Outbound::to(from, std::move(dump), true));
	}

private:
	TcpListener listener;
	Kernel* kernel = nullptr;
	std::thread accept_thread;
	std::thread outbound_thread;
	ThreadGroup sessions;
	std::atomic<bool> stopping{false};
	std::atomic<bool> started{false};

	// Every socket between accept and session end, so stop() can unblock
	// sessions still in the handshake.
	std::mutex live_mtx;
	std::unordered_set<std::shared_ptr<WsSocket>> live;

	void accept_loop() {
		while (!stopping) {
			sessions.reap();
			socket_t fd = listener.accept(config.accept_poll_ms);
			if (fd == INVALID_SOCKET) continue;

			auto ws = std::make_shared<WsSocket>(fd);
			ws->set_max_payload(config.max_payload);
			if (config.send_chunk) ws->set_max_chunk(config.send_chunk);
			{
				std::lock_guard<std::mutex> lk(live_mtx);
				live.insert(ws);
			}
			sessions.spawn([this, ws] { run_session(ws); });
		}
	}

	void run_session(std::shared_ptr<WsSocket> ws) {
		if (!stopping && ws->handshake(config.handshake_limit)) {
			auto client = registry.add_pending(ws);
			printf("[server] client %llu connected\n", (unsigned long long)client->id);
			sessions.spawn([client] { writer_loop(*client); });
			read_loop(*client);
			registry.remove(client->id);
			printf("[server] client %llu disconnected\n", (unsigned long long)client->id);
		}
		ws->close();
		std::lock_guard<std::mutex> lk(live_mtx);
		live.erase(ws);
	}

	void read_loop(Client& client) {
		Bytes data;
		try {
			while (!stopping) {
				if (!ws_read_message(*client.ws, data)) break;

				Content content;
				try {
					content = decode(data);
				} catch (const nlohmann::json::exception& e) {
					fprintf(stderr, "[server] undecodable message from client %llu: %s\n",
						(unsigned long long)client.id, e.what());
					break;
				}
				if (!content.is_array()) {
					fprintf(stderr, "[server] message from client %llu is not an array\n", (unsigned long long)client.id);
					break;
				}
				inbound.push(Inbound{client.id, std::move(content)});
			}
		} catch (const WsFault& e) {
			if (!stopping)
				fprintf(stderr, "[server] client %llu: %s\n", (unsigned long long)client.id, e.what());
		}
		client.ws->close();
	}

	static void writer_loop(Client& client) {
		SharedBytes bytes;
		while (client.outgoing.pop(bytes)) {
			try {
				client.ws->send(*bytes, true);
			} catch (const WsFault& e) {
				fprintf(stderr, "[server] write to client %llu failed: %s\n", (unsigned long long)client.id, e.what());
				client.ws->close();
				return;
			}
		}
	}
};

} // namespace rp
