// rp_msg.hpp — Wire envelopes, typed payloads, CBOR codec
//
// Every application message is a flat CBOR array of (message_type, payload)
// pairs: [type, payload, type, payload, ...]. A single transport message may
// carry any number of pairs; the receiver consumes them two at a time.
//
// Content is an ordered string-keyed map (nlohmann::json object). The store
// never looks inside it except for the "id" key it injects.
//
// Payload shapes are a closed set:
//   client → server   IntroductionMsg (0), InvokeMsg (1)
//   server → client   CreateMsg, UpdateMsg, DeleteMsg, ReadyMsg (35)
// plus typed builders for the component contents the core creates itself.
//
// Depends: rp_core.hpp, nlohmann/json

#pragma once

#include "rp_core.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rp {

using Content = nlohmann::json;
using Bytes = std::vector<uint8_t>;
using SharedBytes = std::shared_ptr<const Bytes>;
using ClientId = uint64_t;

// =============================================================================
// Message types
// =============================================================================
static constexpr uint32_t MSG_INTRODUCTION = 0;
static constexpr uint32_t MSG_INVOKE       = 1;
static constexpr uint32_t MSG_READY        = 35;
static constexpr uint32_t NO_UPDATE        = 0xFFFFFFFF;

struct MessageIds {
	uint32_t create_mid;
	uint32_t update_mid;
	uint32_t delete_mid;
};

static constexpr MessageIds ENTITY_MIDS      = {4, 5, 6};
static constexpr MessageIds BUFFER_MIDS      = {10, NO_UPDATE, 11};
static constexpr MessageIds BUFFER_VIEW_MIDS = {12, NO_UPDATE, 13};
static constexpr MessageIds MATERIAL_MIDS    = {14, 15, 16};
static constexpr MessageIds IMAGE_MIDS       = {17, NO_UPDATE, 18};
static constexpr MessageIds TEXTURE_MIDS     = {19, NO_UPDATE, 20};
static constexpr MessageIds GEOMETRY_MIDS    = {26, NO_UPDATE, 27};

// =============================================================================
// Codec
// =============================================================================
inline Bytes encode(const Content& c) {
	return Content::to_cbor(c);
}

// Throws nlohmann::json::parse_error on malformed or truncated input.
inline Content decode(const uint8_t* data, size_t size) {
	return Content::from_cbor(data, data + size);
}

inline Content decode(const Bytes& b) { return decode(b.data(), b.size()); }

// Ids travel as [slot, gen].
inline Content id_to_content(Id id) {
	return Content::array({id.slot, id.gen});
}

inline Id id_from_content(const Content& c) {
	if (!c.is_array() || c.size() != 2) return NULL_ID;
	if (!c[0].is_number_unsigned() || !c[1].is_number_unsigned()) return NULL_ID;
	return Id::make(c[0].get<uint32_t>(), c[1].get<uint32_t>());
}

// =============================================================================
// Outbound / inbound envelopes
// =============================================================================
struct Outbound {
	Content content;                 // flat [type, payload, ...]
	std::optional<ClientId> target;  // empty = every Active client
	bool promote = false;            // Pending → Active on delivery

	static Outbound broadcast(Content c) {
		Outbound o;
		o.content = std::move(c);
		return o;
	}

	static Outbound to(ClientId id, Content c, bool promote_client = false) {
		Outbound o;
		o.content = std::move(c);
		o.target = id;
		o.promote = promote_client;
		return o;
	}
};

struct Inbound {
	ClientId client = 0;
	Content content;
};

// =============================================================================
// Client → server payloads
// =============================================================================
struct IntroductionMsg {
	std::string client_name;
};

struct InvokeMsg {
	Content body;  // opaque, interpreted by the scene authority
};

using ClientMessage = std::variant<IntroductionMsg, InvokeMsg>;

inline bool decode_introduction(const Content& payload, IntroductionMsg& out) {
	if (!payload.is_object()) return false;
	auto it = payload.find("client_name");
	if (it == payload.end() || !it->is_string()) return false;
	out.client_name = it->get<std::string>();
	return true;
}

// Returns false for unknown types or payloads of the wrong shape.
inline bool decode_client_message(int64_t type, const Content& payload, ClientMessage& out) {
	switch (type) {
		case MSG_INTRODUCTION: {
			IntroductionMsg m;
			if (!decode_introduction(payload, m)) return false;
			out = std::move(m);
			return true;
		}
		case MSG_INVOKE:
			out = InvokeMsg{payload};
			return true;
		default:
			return false;
	}
}

inline void append_message(Content& arr, const ClientMessage& m) {
	if (auto* intro = std::get_if<IntroductionMsg>(&m)) {
		arr.push_back(MSG_INTRODUCTION);
		arr.push_back(Content{{"client_name", intro->client_name}});
	} else if (auto* inv = std::get_if<InvokeMsg>(&m)) {
		arr.push_back(MSG_INVOKE);
		arr.push_back(inv->body);
	}
}

// =============================================================================
// Server → client payloads
// =============================================================================
struct CreateMsg {
	uint32_t type;
	Content content;  // full component content, "id" included
};

struct UpdateMsg {
	uint32_t type;
	Content delta;    // changed keys plus "id"
};

struct DeleteMsg {
	uint32_t type;
	Id id;
};

struct ReadyMsg {};

using ServerMessage = std::variant<CreateMsg, UpdateMsg, DeleteMsg, ReadyMsg>;

inline void append_message(Content& arr, const ServerMessage& m) {
	std::visit([&arr](const auto& v) {
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, CreateMsg>) {
			arr.push_back(v.type);
			arr.push_back(v.content);
		} else if constexpr (std::is_same_v<T, UpdateMsg>) {
			arr.push_back(v.type);
			arr.push_back(v.delta);
		} else if constexpr (std::is_same_v<T, DeleteMsg>) {
			arr.push_back(v.type);
			arr.push_back(Content{{"id", id_to_content(v.id)}});
		} else {
			arr.push_back(MSG_READY);
			arr.push_back(true);
		}
	}, m);
}

inline Content make_envelope(const ServerMessage& m) {
	Content arr = Content::array();
	append_message(arr, m);
	return arr;
}

inline Content make_client_envelope(const ClientMessage& m) {
	Content arr = Content::array();
	append_message(arr, m);
	return arr;
}

// =============================================================================
// Component content builders
// =============================================================================
struct UriBytes {
	std::string scheme = "http";
	std::string path;
	int port = 0;

	Content to_content() const {
		return Content{{"scheme", scheme}, {"path", path}, {"port", port}};
	}
};

// Exactly one of inline_bytes / uri_bytes is set.
struct BufferContent {
	uint64_t size = 0;
	std::optional<Bytes> inline_bytes;
	std::optional<UriBytes> uri_bytes;

	Content to_content() const {
		Content c{{"size", size}};
		if (inline_bytes)
			c["inline_bytes"] = Content::binary(*inline_bytes);
		else if (uri_bytes)
			c["uri_bytes"] = uri_bytes->to_content();
		return c;
	}
};

struct BufferViewContent {
	Id source_buffer;
	std::string type = "UNK";  // GEOMETRY, IMAGE or UNK
	uint64_t offset = 0;
	uint64_t length = 0;

	Content to_content() const {
		return Content{
			{"source_buffer", id_to_content(source_buffer)},
			{"type", type},
			{"offset", offset},
			{"length", length},
		};
	}
};

struct ImageContent {
	Id buffer_source;

	Content to_content() const {
		return Content{{"buffer_source", id_to_content(buffer_source)}};
	}
};

struct TextureContent {
	std::string name;
	Id image;

	Content to_content() const {
		return Content{{"name", name}, {"image", id_to_content(image)}};
	}
};

// Column-major 4x4, right-handed.
using Transform = std::array<float, 16>;

inline Transform identity_transform() {
	return {1, 0, 0, 0,  0, 1, 0, 0,  0, 0, 1, 0,  0, 0, 0, 1};
}

struct EntityContent {
	std::string name;
	Id parent = NULL_ID;
	std::optional<Transform> transform;

	Content to_content() const {
		Content c{{"name", name}, {"parent", id_to_content(parent)}};
		if (transform) c["transform"] = *transform;
		return c;
	}
};

} // namespace rp
