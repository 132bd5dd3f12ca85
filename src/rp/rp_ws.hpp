// rp_ws.hpp — WebSocket transport over blocking TCP
//
// WsSocket: one accepted TCP connection speaking RFC 6455 framing.
//   - handshake(): HTTP upgrade, Sec-WebSocket-Accept via SHA-1 + base64
//   - receive(): one frame → Message / Closing / Ping (pongs are swallowed)
//   - send(): chunked binary frames, serialized by a per-socket mutex
//   - pong(), close(): control frames; close is idempotent
//
// TcpListener: bind/listen plus poll-based accept(timeout) so accept loops
// can observe shutdown.
//
// Frame header helpers are pure functions, usable without a socket.
//
// Usage:
//   TcpListener lis;
//   lis.open(50000);
//   socket_t fd = lis.accept(200);
//   auto ws = std::make_shared<WsSocket>(fd);
//   if (!ws->handshake()) return;
//   Bytes msg;
//   while (ws_read_message(*ws, msg)) { ... }
//
// Depends: rp_msg.hpp (Bytes), OpenSSL libcrypto, POSIX sockets

#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <sys/time.h>
#include <errno.h>
using socket_t = int;
#ifndef INVALID_SOCKET
	#define INVALID_SOCKET (-1)
#endif
#ifndef SOCKET_ERROR
	#define SOCKET_ERROR (-1)
#endif
#ifndef MSG_NOSIGNAL
	#define MSG_NOSIGNAL 0
#endif

#include <openssl/evp.h>

#include "rp_msg.hpp"
#include <cctype>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <atomic>
#include <string>

namespace rp {

static constexpr uint8_t WS_OP_CONTINUATION = 0x0;
static constexpr uint8_t WS_OP_TEXT         = 0x1;
static constexpr uint8_t WS_OP_BINARY       = 0x2;
static constexpr uint8_t WS_OP_CLOSE        = 0x8;
static constexpr uint8_t WS_OP_PING         = 0x9;
static constexpr uint8_t WS_OP_PONG         = 0xA;

static constexpr uint64_t WS_DEFAULT_MAX_PAYLOAD = 100000000;
static constexpr size_t WS_MAX_HEADER = 14;
static constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

struct WsFault : std::exception {
	enum class Kind : uint8_t { FrameTooLarge, UnknownOpcode, TransportLost };
	Kind kind;
	std::string msg;
	WsFault(Kind k, std::string m) : kind(k), msg(std::move(m)) {}
	const char* what() const noexcept override { return msg.c_str(); }
};

// =============================================================================
// Raw socket helpers (shared with rp_asset.hpp)
// =============================================================================
inline bool sock_write_all(socket_t s, const void* data, size_t len) {
	const uint8_t* p = static_cast<const uint8_t*>(data);
	while (len > 0) {
		ssize_t n = ::send(s, p, len, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		p += n;
		len -= (size_t)n;
	}
	return true;
}

// Reads until "\r\n\r\n" or limit bytes. Returns false on EOF, error or overflow.
inline bool sock_read_http_head(socket_t s, std::string& out, size_t limit) {
	out.clear();
	char buf[512];
	while (out.find("\r\n\r\n") == std::string::npos) {
		if (out.size() >= limit) return false;
		size_t want = std::min(sizeof(buf), limit - out.size());
		ssize_t n = ::recv(s, buf, want, 0);
		if (n < 0 && errno == EINTR) continue;
		if (n <= 0) return false;
		out.append(buf, (size_t)n);
	}
	return true;
}

inline void sock_set_timeouts(socket_t s, int ms) {
	struct timeval tv;
	tv.tv_sec = ms / 1000;
	tv.tv_usec = (ms % 1000) * 1000;
	setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
	setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline socket_t tcp_connect(const char* ip, int port) {
	socket_t s = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
	if (s == INVALID_SOCKET) return INVALID_SOCKET;
	struct sockaddr_in addr{};
	addr.sin_family = AF_INET;
	addr.sin_port = htons((uint16_t)port);
	if (inet_pton(AF_INET, ip, &addr.sin_addr) != 1 ||
	    ::connect(s, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR) {
		::close(s);
		return INVALID_SOCKET;
	}
	return s;
}

// =============================================================================
// HTTP header lookup — case-insensitive name, trimmed value
// =============================================================================
inline bool iequals(const std::string& a, const char* b) {
	size_t n = std::strlen(b);
	if (a.size() != n) return false;
	for (size_t i = 0; i < n; i++)
		if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
	return true;
}

inline bool icontains(const std::string& hay, const char* needle) {
	std::string h, n(needle);
	for (char c : hay) h += (char)std::tolower((unsigned char)c);
	for (char& c : n) c = (char)std::tolower((unsigned char)c);
	return h.find(n) != std::string::npos;
}

inline bool http_header(const std::string& head, const char* name, std::string& value) {
	size_t pos = head.find("\r\n");
	while (pos != std::string::npos) {
		size_t start = pos + 2;
		size_t end = head.find("\r\n", start);
		if (end == std::string::npos || end == start) break;
		std::string line = head.substr(start, end - start);
		size_t colon = line.find(':');
		if (colon != std::string::npos && iequals(line.substr(0, colon), name)) {
			size_t b = line.find_first_not_of(" \t", colon + 1);
			size_t e = line.find_last_not_of(" \t");
			value = (b == std::string::npos) ? std::string() : line.substr(b, e - b + 1);
			return true;
		}
		pos = end;
	}
	return false;
}

// =============================================================================
// Frame helpers
// =============================================================================
inline std::string base64_encode(const uint8_t* data, size_t len) {
	std::string out(4 * ((len + 2) / 3) + 1, '\0');
	int n = EVP_EncodeBlock((unsigned char*)&out[0], data, (int)len);
	out.resize((size_t)n);
	return out;
}

inline std::string ws_accept_key(const std::string& key) {
	std::string src = key + WS_GUID;
	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned int md_len = 0;
	if (EVP_Digest(src.data(), src.size(), md, &md_len, EVP_sha1(), nullptr) != 1)
		throw std::runtime_error("[ws] SHA-1 digest failed");
	return base64_encode(md, md_len);
}

struct WsHeader {
	bool fin = false;
	uint8_t opcode = 0;
	bool masked = false;
	uint64_t length = 0;
	uint8_t mask[4] = {0, 0, 0, 0};
};

// Smallest length form that fits. Writes into out[WS_MAX_HEADER], returns size.
inline size_t ws_write_header(uint8_t* out, uint8_t opcode, bool fin, uint64_t len,
                              const uint8_t* mask = nullptr) {
	size_t n = 0;
	out[n++] = (uint8_t)((fin ? 0x80 : 0x00) | (opcode & 0x0F));
	uint8_t mbit = mask ? 0x80 : 0x00;
	if (len <= 125) {
		out[n++] = (uint8_t)(mbit | len);
	} else if (len <= 0xFFFF) {
		out[n++] = (uint8_t)(mbit | 126);
		out[n++] = (uint8_t)(len >> 8);
		out[n++] = (uint8_t)(len);
	} else {
		out[n++] = (uint8_t)(mbit | 127);
		for (int i = 7; i >= 0; i--)
			out[n++] = (uint8_t)(len >> (i * 8));
	}
	if (mask) {
		std::memcpy(out + n, mask, 4);
		n += 4;
	}
	return n;
}

// Total header size implied by the second header byte.
inline size_t ws_header_size(uint8_t b1) {
	size_t n = 2;
	uint8_t len7 = b1 & 0x7F;
	if (len7 == 126) n += 2;
	else if (len7 == 127) n += 8;
	if (b1 & 0x80) n += 4;
	return n;
}

// Returns bytes consumed, or 0 if data holds less than a full header.
inline size_t ws_parse_header(const uint8_t* data, size_t size, WsHeader& h) {
	if (size < 2) return 0;
	size_t need = ws_header_size(data[1]);
	if (size < need) return 0;

	h.fin = (data[0] & 0x80) != 0;
	h.opcode = data[0] & 0x0F;
	h.masked = (data[1] & 0x80) != 0;

	size_t p = 2;
	uint8_t len7 = data[1] & 0x7F;
	if (len7 == 126) {
		h.length = ((uint64_t)data[2] << 8) | data[3];
		p += 2;
	} else if (len7 == 127) {
		h.length = 0;
		for (int i = 0; i < 8; i++)
			h.length = (h.length << 8) | data[2 + i];
		p += 8;
	} else {
		h.length = len7;
	}
	if (h.masked) {
		std::memcpy(h.mask, data + p, 4);
		p += 4;
	}
	return p;
}

// XOR is its own inverse: masking and unmasking are the same call.
inline void ws_apply_mask(uint8_t* data, size_t len, const uint8_t key[4]) {
	for (size_t i = 0; i < len; i++)
		data[i] ^= key[i & 3];
}

inline size_t ws_frame_count(size_t len, size_t chunk) {
	if (len == 0 || chunk == 0) return 1;
	return (len + chunk - 1) / chunk;
}

// =============================================================================
// WsSocket
// =============================================================================
enum class WsKind : uint8_t { Message, Closing, Ping };

struct WsFrame {
	Bytes payload;
	bool last = false;
	WsKind kind = WsKind::Message;
};

class WsSocket {
	socket_t sock = INVALID_SOCKET;
	std::mutex send_mtx;
	std::atomic<bool> closed{false};
	size_t chunk = 0;
	uint64_t payload_limit = WS_DEFAULT_MAX_PAYLOAD;

public:
	// Takes ownership of fd.
	explicit WsSocket(socket_t fd) : sock(fd) {
		int one = 1;
		// Fails harmlessly on non-TCP sockets (socketpair in tests).
		setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
		int sndbuf = 0;
		socklen_t slen = sizeof(sndbuf);
		if (getsockopt(sock, SOL_SOCKET, SO_SNDBUF, &sndbuf, &slen) == 0 && sndbuf > 0)
			chunk = (size_t)sndbuf;
	}

	~WsSocket() {
		if (sock != INVALID_SOCKET) ::close(sock);
	}

	WsSocket(const WsSocket&) = delete;
	WsSocket& operator=(const WsSocket&) = delete;

	socket_t fd() const { return sock; }
	bool is_closed() const { return closed.load(); }

	size_t max_chunk() const { return chunk; }
	void set_max_chunk(size_t c) { chunk = c; }
	uint64_t max_payload() const { return payload_limit; }
	void set_max_payload(uint64_t p) { payload_limit = p; }

	// Returns false if the request is malformed, lacks the upgrade headers,
	// or the connection drops before the response is written.
	bool handshake(size_t limit = 4096) {
		std::string head;
		if (!sock_read_http_head(sock, head, limit)) {
			fprintf(stderr, "[ws] handshake: incomplete request\n");
			return false;
		}
		std::string upgrade, key;
		if (!http_header(head, "Upgrade", upgrade) || !icontains(upgrade, "websocket")) {
			fprintf(stderr, "[ws] handshake: missing Upgrade: websocket\n");
			return false;
		}
		if (!http_header(head, "Sec-WebSocket-Key", key) || key.empty()) {
			fprintf(stderr, "[ws] handshake: missing Sec-WebSocket-Key\n");
			return false;
		}

		std::string resp =
			"HTTP/1.1 101 Switching Protocols\r\n"
			"Connection: Upgrade\r\n"
			"Upgrade: websocket\r\n"
			"Sec-WebSocket-Accept: " + ws_accept_key(key) + "\r\n\r\n";

		std::lock_guard<std::mutex> lk(send_mtx);
		return sock_write_all(sock, resp.data(), resp.size());
	}

	// One frame. Pong frames are consumed and the next frame is read.
	// Throws WsFault.
	WsFrame receive() {
		for (;;) {
			uint8_t raw[WS_MAX_HEADER];
			read_exact(raw, 2);
			size_t hsize = ws_header_size(raw[1]);
			if (hsize > 2) read_exact(raw + 2, hsize - 2);

			WsHeader h;
			ws_parse_header(raw, hsize, h);

			if (h.length > payload_limit)
				throw WsFault(WsFault::Kind::FrameTooLarge,
					"frame of " + std::to_string(h.length) + " bytes exceeds limit");

			WsKind kind;
			switch (h.opcode) {
				case WS_OP_TEXT:
				case WS_OP_BINARY: kind = WsKind::Message; break;
				case WS_OP_CLOSE:  kind = WsKind::Closing; break;
				case WS_OP_PING:   kind = WsKind::Ping; break;
				case WS_OP_PONG:   kind = WsKind::Message; break;
				default:
					throw WsFault(WsFault::Kind::UnknownOpcode,
						"unknown opcode " + std::to_string(h.opcode));
			}

			WsFrame f;
			f.payload.resize((size_t)h.length);
			if (h.length) read_exact(f.payload.data(), f.payload.size());
			if (h.masked) ws_apply_mask(f.payload.data(), f.payload.size(), h.mask);

			if (h.opcode == WS_OP_PONG) continue;

			f.last = h.fin;
			f.kind = kind;
			return f;
		}
	}

	// Throws WsFault{TransportLost} if the socket is closed or the write fails.
	void send(const uint8_t* data, size_t len, bool last = true) {
		std::lock_guard<std::mutex> lk(send_mtx);
		if (closed) throw WsFault(WsFault::Kind::TransportLost, "send on closed socket");

		size_t limit = chunk == 0 ? len : chunk;
		if (len <= limit) {
			write_frame(WS_OP_BINARY, last, data, len);
			return;
		}
		size_t off = 0;
		while (off < len) {
			size_t n = std::min(limit, len - off);
			write_frame(WS_OP_BINARY, last && off + n == len, data + off, n);
			off += n;
		}
	}

	void send(const Bytes& b, bool last = true) { send(b.data(), b.size(), last); }

	void pong() {
		static const uint8_t frame[2] = {0x8A, 0x00};
		std::lock_guard<std::mutex> lk(send_mtx);
		if (closed) return;
		if (!sock_write_all(sock, frame, sizeof(frame)))
			throw WsFault(WsFault::Kind::TransportLost, "pong failed");
	}

	// Sends close(1000) once and shuts the socket down. A writer stalled
	// mid-send keeps the mutex; then only the shutdown happens, which
	// unblocks it.
	void close() {
		bool expected = false;
		if (!closed.compare_exchange_strong(expected, true)) return;
		static const uint8_t frame[4] = {0x88, 0x02, 0x03, 0xE8};
		{
			std::unique_lock<std::mutex> lk(send_mtx, std::try_to_lock);
			if (lk.owns_lock() && !sock_write_all(sock, frame, sizeof(frame)))
				printf("[ws] close frame not delivered, peer already gone\n");
		}
		::shutdown(sock, SHUT_RDWR);
	}

private:
	void read_exact(uint8_t* out, size_t n) {
		size_t got = 0;
		while (got < n) {
			ssize_t r = ::recv(sock, out + got, n - got, 0);
			if (r == 0)
				throw WsFault(WsFault::Kind::TransportLost, "connection closed by peer");
			if (r < 0) {
				if (errno == EINTR) continue;
				throw WsFault(WsFault::Kind::TransportLost, std::string("recv: ") + std::strerror(errno));
			}
			got += (size_t)r;
		}
	}

	// Caller holds send_mtx.
	void write_frame(uint8_t opcode, bool fin, const uint8_t* data, size_t len) {
		uint8_t head[WS_MAX_HEADER];
		size_t hn = ws_write_header(head, opcode, fin, len);
		if (!sock_write_all(sock, head, hn) || (len && !sock_write_all(sock, data, len)))
			throw WsFault(WsFault::Kind::TransportLost, std::string("send: ") + std::strerror(errno));
	}
};

// Accumulates Message frames until FIN. Pings are answered in place.
// Returns false when the peer starts the closing handshake.
inline bool ws_read_message(WsSocket& ws, Bytes& out) {
	out.clear();
	for (;;) {
		WsFrame f = ws.receive();
		switch (f.kind) {
			case WsKind::Closing:
				return false;
			case WsKind::Ping:
				ws.pong();
				break;
			case WsKind::Message:
				out.insert(out.end(), f.payload.begin(), f.payload.end());
				if (f.last) return true;
				break;
		}
	}
}

// =============================================================================
// TcpListener
// =============================================================================
class TcpListener {
	socket_t sock = INVALID_SOCKET;
	int bound_port = 0;

public:
	TcpListener() = default;
	TcpListener(const TcpListener&) = delete;
	TcpListener& operator=(const TcpListener&) = delete;
	~TcpListener() { close(); }

	// port 0 binds an ephemeral port; port() reports the real one.
	bool open(int port) {
		close();
		sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
		if (sock == INVALID_SOCKET) return false;

		int opt = 1;
		setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

		struct sockaddr_in addr{};
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = INADDR_ANY;
		addr.sin_port = htons((uint16_t)port);

		if (::bind(sock, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR ||
		    ::listen(sock, 64) == SOCKET_ERROR) {
			fprintf(stderr, "[ws] unable to listen on port %d: %s\n", port, std::strerror(errno));
			close();
			return false;
		}

		socklen_t alen = sizeof(addr);
		if (getsockname(sock, (struct sockaddr*)&addr, &alen) == 0)
			bound_port = ntohs(addr.sin_port);
		else
			bound_port = port;
		return true;
	}

	// INVALID_SOCKET on timeout or error.
	socket_t accept(int timeout_ms) {
		if (sock == INVALID_SOCKET) return INVALID_SOCKET;
		struct pollfd pfd{};
		pfd.fd = sock;
		pfd.events = POLLIN;
		int r = ::poll(&pfd, 1, timeout_ms);
		if (r <= 0 || !(pfd.revents & POLLIN)) return INVALID_SOCKET;

		socket_t c = ::accept(sock, nullptr, nullptr);
		if (c == INVALID_SOCKET) return INVALID_SOCKET;
		int one = 1;
		setsockopt(c, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
		return c;
	}

	bool is_open() const { return sock != INVALID_SOCKET; }
	int port() const { return bound_port; }

	void close() {
		if (sock != INVALID_SOCKET) {
			::close(sock);
			sock = INVALID_SOCKET;
		}
	}
};

} // namespace rp
