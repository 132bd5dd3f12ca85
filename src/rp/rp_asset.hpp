// rp_asset.hpp — Out-of-band blob hosting over HTTP
//
// Large buffers are not inlined into create messages. They are installed
// here under a random identity and served as
//   GET /<identity>  → 200 application/octet-stream | 404
//   OPTIONS *        → 200 (CORS preflight, max-age 3600)
// Every response carries Access-Control-Allow-Origin: *.
//
// Asset is the RAII handle for one installed blob. RegisteredBuffer pairs a
// buffer component with its Asset when the payload is over the inline
// threshold.
//
// Usage:
//   AssetServer assets;
//   assets.start(50001);
//   RegisteredBuffer buf(world, assets, bytes);
//
// Depends: rp_ws.hpp (sockets), rp_store.hpp, OpenSSL libcrypto (RAND_bytes)

#pragma once

#include <openssl/rand.h>

#include "rp_ws.hpp"
#include "rp_store.hpp"
#include <unordered_map>
#include <thread>

namespace rp {

struct AssetRef {
	std::string path;
	int port = 0;
};

// 128 random bits as 32 lowercase hex digits.
inline std::string random_identity() {
	unsigned char raw[16];
	if (RAND_bytes(raw, sizeof(raw)) != 1)
		throw std::runtime_error("[asset] RAND_bytes failed");
	static const char* hex = "0123456789abcdef";
	std::string out;
	out.reserve(32);
	for (unsigned char b : raw) {
		out += hex[b >> 4];
		out += hex[b & 0x0F];
	}
	return out;
}

// =============================================================================
// AssetServer
// =============================================================================
class AssetServer {
	mutable std::mutex mtx;
	std::unordered_map<std::string, std::shared_ptr<const Bytes>> blobs;

	TcpListener listener;
	std::thread accept_thread;
	ThreadGroup requests;
	std::atomic<bool> stopping{false};
	int request_timeout_ms = 2000;

public:
	AssetServer() = default;
	AssetServer(const AssetServer&) = delete;
	AssetServer& operator=(const AssetServer&) = delete;
	~AssetServer() { stop(); }

	bool start(int port, int poll_ms = 200) {
		if (accept_thread.joinable()) return true;
		if (!listener.open(port)) return false;
		stopping = false;
		accept_thread = std::thread([this, poll_ms] { accept_loop(poll_ms); });
		printf("[asset] serving on port %d\n", listener.port());
		return true;
	}

	void stop() {
		if (!accept_thread.joinable()) return;
		stopping = true;
		accept_thread.join();
		listener.close();
		requests.join_all();
		printf("[asset] stopped\n");
	}

	bool is_running() const { return listener.is_open(); }
	int port() const { return listener.port(); }

	AssetRef install(const std::string& identity, Bytes bytes) {
		{
			std::lock_guard<std::mutex> lk(mtx);
			blobs[identity] = std::make_shared<const Bytes>(std::move(bytes));
		}
		return AssetRef{identity, listener.port()};
	}

	bool remove(const std::string& identity) {
		std::lock_guard<std::mutex> lk(mtx);
		return blobs.erase(identity) > 0;
	}

	std::shared_ptr<const Bytes> find(const std::string& identity) const {
		std::lock_guard<std::mutex> lk(mtx);
		auto it = blobs.find(identity);
		return it == blobs.end() ? nullptr : it->second;
	}

	size_t size() const {
		std::lock_guard<std::mutex> lk(mtx);
		return blobs.size();
	}

private:
	void accept_loop(int poll_ms) {
		while (!stopping) {
			requests.reap();
			socket_t fd = listener.accept(poll_ms);
			if (fd == INVALID_SOCKET) continue;
			sock_set_timeouts(fd, request_timeout_ms);
			requests.spawn([this, fd] {
				handle_request(fd);
				::close(fd);
			});
		}
	}

	void handle_request(socket_t fd) {
		std::string head;
		if (!sock_read_http_head(fd, head, 8192)) return;

		size_t sp1 = head.find(' ');
		size_t sp2 = sp1 == std::string::npos ? std::string::npos : head.find(' ', sp1 + 1);
		if (sp2 == std::string::npos) {
			respond(fd, "400 Bad Request", nullptr, {});
			return;
		}
		std::string method = head.substr(0, sp1);
		std::string path = head.substr(sp1 + 1, sp2 - sp1 - 1);

		if (method == "OPTIONS") {
			respond(fd, "200 OK", nullptr, "Access-Control-Max-Age: 3600\r\n"
			                               "Access-Control-Allow-Methods: GET, OPTIONS\r\n");
			return;
		}
		if (method != "GET") {
			respond(fd, "405 Method Not Allowed", nullptr, {});
			return;
		}

		std::string identity = path.empty() ? path : path.substr(1);
		size_t q = identity.find('?');
		if (q != std::string::npos) identity.resize(q);

		auto blob = find(identity);
		if (!blob) {
			printf("[asset] 404 %s\n", path.c_str());
			respond(fd, "404 Not Found", nullptr, {});
			return;
		}
		respond(fd, "200 OK", blob.get(), "Content-Type: application/octet-stream\r\n");
	}

	static void respond(socket_t fd, const char* status, const Bytes* body, const std::string& extra) {
		size_t len = body ? body->size() : 0;
		std::string head = std::string("HTTP/1.1 ") + status + "\r\n"
			"Access-Control-Allow-Origin: *\r\n" + extra +
			"Content-Length: " + std::to_string(len) + "\r\n"
			"Connection: close\r\n\r\n";
		if (!sock_write_all(fd, head.data(), head.size()) ||
		    (len && !sock_write_all(fd, body->data(), len)))
			fprintf(stderr, "[asset] response aborted: %s\n", std::strerror(errno));
	}
};

// =============================================================================
// Asset — one installed blob, removed on destruction
// =============================================================================
class Asset {
	AssetServer* server = nullptr;
	AssetRef ref;

public:
	Asset(AssetServer& s, Bytes bytes) : server(&s) {
		ref = server->install(random_identity(), std::move(bytes));
	}

	~Asset() {
		if (server) server->remove(ref.path);
	}

	Asset(const Asset&) = delete;
	Asset& operator=(const Asset&) = delete;

	const std::string& identity() const { return ref.path; }
	const AssetRef& reference() const { return ref; }
};

// =============================================================================
// RegisteredBuffer — buffer component, inline or asset-backed
// =============================================================================
class RegisteredBuffer {
	std::unique_ptr<Asset> asset;  // declared first: outlives the component
	Component component;

	static Content make_content(AssetServer& assets, const Bytes& bytes, size_t threshold,
	                            std::unique_ptr<Asset>& asset_out) {
		BufferContent bc;
		bc.size = bytes.size();
		if (bytes.size() <= threshold) {
			bc.inline_bytes = bytes;
		} else {
			asset_out.reset(new Asset(assets, bytes));
			UriBytes uri;
			uri.path = asset_out->identity();
			uri.port = asset_out->reference().port;
			bc.uri_bytes = uri;
		}
		return bc.to_content();
	}

public:
	RegisteredBuffer(World& world, AssetServer& assets, const Bytes& bytes,
	                 size_t inline_threshold = 1024)
		: component(world.buffers.register_content(make_content(assets, bytes, inline_threshold, asset))) {}

	RegisteredBuffer(const RegisteredBuffer&) = delete;
	RegisteredBuffer& operator=(const RegisteredBuffer&) = delete;

	Id id() const { return component.id(); }
	bool is_inline() const { return asset == nullptr; }
	const Asset* hosted() const { return asset.get(); }
	const Content* content() const { return component.content(); }
};

} // namespace rp
