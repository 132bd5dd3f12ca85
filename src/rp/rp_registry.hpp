// rp_registry.hpp — Deduplicating resource cache + texture bundles
//
// ResourceCache<Key, Value> maps a key to a shared resource. The cache holds
// a strong reference; eviction is explicit. When the cache and every caller
// have dropped their references the resource's components are deleted.
//
// Usage:
//   ResourceCache<std::string, RegisteredTexture> textures;
//   auto tex = textures.get_or_create("brick.png", [&] {
//       return std::make_shared<RegisteredTexture>(world, assets, "brick", bytes);
//   });
//   textures.evict("brick.png");
//
// Depends: rp_asset.hpp

#pragma once

#include "rp_asset.hpp"

namespace rp
{

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ResourceCache
{
	std::unordered_map<Key, std::shared_ptr<Value>, Hash> entries;

public:
	// make: () -> std::shared_ptr<Value>. A null result is returned, not cached.
	template <typename F>
	std::shared_ptr<Value> get_or_create(const Key &key, F &&make)
	{
		auto it = entries.find(key);
		if (it != entries.end())
			return it->second;

		std::shared_ptr<Value> v = make();
		if (v)
			entries.emplace(key, v);
		return v;
	}

	std::shared_ptr<Value> find(const Key &key) const
	{
		auto it = entries.find(key);
		return it == entries.end() ? nullptr : it->second;
	}

	bool evict(const Key &key) { return entries.erase(key) > 0; }
	void clear() { entries.clear(); }
	bool contains(const Key &key) const { return entries.count(key) > 0; }
	size_t size() const { return entries.size(); }
};

// =============================================================================
// RegisteredTexture — buffer → buffer view → image → texture
//
// Members are declared in creation order so destruction deletes the texture
// first and the buffer last.
// =============================================================================
class RegisteredTexture
{
	RegisteredBuffer buffer;
	Component view;
	Component image;
	Component texture;

	static Content view_content(Id buf, uint64_t length)
	{
		BufferViewContent v;
		v.source_buffer = buf;
		v.type = "IMAGE";
		v.offset = 0;
		v.length = length;
		return v.to_content();
	}

public:
	RegisteredTexture(World &world, AssetServer &assets, const std::string &name,
	                  const Bytes &encoded, size_t inline_threshold = 1024)
		: buffer(world, assets, encoded, inline_threshold),
		  view(world.buffer_views.register_content(view_content(buffer.id(), encoded.size()))),
		  image(world.images.register_content(ImageContent{view.id()}.to_content())),
		  texture(world.textures.register_content(TextureContent{name, image.id()}.to_content()))
	{
	}

	RegisteredTexture(const RegisteredTexture &) = delete;
	RegisteredTexture &operator=(const RegisteredTexture &) = delete;

	Id id() const { return texture.id(); }
	Id image_id() const { return image.id(); }
	Id view_id() const { return view.id(); }
	Id buffer_id() const { return buffer.id(); }
};

} // namespace rp
