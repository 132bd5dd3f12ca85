// rp_store.hpp — Authoritative component storage
//
// One ComponentList per category. Each list owns an IdAllocator and a
// SlotMap<Content>, and turns every mutation into an outbound envelope:
//
//   register_content(c) → [create_mid, c + id]
//   patch(id, delta)    → [update_mid, delta + id]
//   handle destroyed    → [delete_mid, {id}]
//
// Component is the move-only handle the scene authority keeps. Dropping it
// deletes the component exactly once.
//
// World groups the seven lists and builds the join snapshot in dependency
// order: buffers, buffer views, images, textures, materials, geometry,
// entities.
//
// Tick thread only. Lists must outlive their handles.
//
// Depends: rp_core.hpp, rp_msg.hpp

#pragma once

#include "rp_core.hpp"
#include "rp_msg.hpp"

namespace rp
{

class Component;

// =============================================================================
// ComponentList
// =============================================================================
class ComponentList
{
	BlockingQueue<Outbound> *sink;
	MessageIds mids;
	const char *label;
	IdAllocator ids;
	SlotMap<Content> active;

	friend class Component;

	void publish(const ServerMessage &m)
	{
		// Refused only once the server has shut down.
		sink->push(Outbound::broadcast(make_envelope(m)));
	}

	void destroy(Id id)
	{
		if (!active.remove(id))
			return;
		ids.release(id);
		publish(DeleteMsg{mids.delete_mid, id});
	}

public:
	ComponentList(BlockingQueue<Outbound> &out, MessageIds m, const char *name)
		: sink(&out), mids(m), label(name) {}

	ComponentList(const ComponentList &) = delete;
	ComponentList &operator=(const ComponentList &) = delete;

	Component register_content(Content content);

	// Merges delta into the stored content and broadcasts delta + id.
	// Throws std::logic_error for immutable categories or dead ids.
	void patch(Id id, Content delta)
	{
		if (mids.update_mid == NO_UPDATE)
			throw std::logic_error(std::string("[store] ") + label + " components are immutable");
		if (!delta.is_object())
			throw std::invalid_argument(std::string("[store] ") + label + " patch must be a map");

		Content *stored = active.get(id);
		if (!stored)
			throw std::logic_error(std::string("[store] patch on dead ") + label + " component");

		delta["id"] = id_to_content(id);
		for (auto it = delta.begin(); it != delta.end(); ++it)
			(*stored)[it.key()] = it.value();
		publish(UpdateMsg{mids.update_mid, std::move(delta)});
	}

	const Content *get(Id id) const { return active.get(id); }
	bool has(Id id) const { return active.has(id); }
	size_t size() const { return active.size(); }
	const MessageIds &message_ids() const { return mids; }
	const char *name() const { return label; }

	void snapshot_into(Content &arr) const
	{
		active.each([&](Id, const Content &c) {
			arr.push_back(mids.create_mid);
			arr.push_back(c);
		});
	}
};

// =============================================================================
// Component — RAII handle
// =============================================================================
class Component
{
	ComponentList *list = nullptr;
	Id ident = NULL_ID;

public:
	Component() = default;
	Component(ComponentList *l, Id id) : list(l), ident(id) {}

	Component(const Component &) = delete;
	Component &operator=(const Component &) = delete;

	Component(Component &&o) noexcept : list(o.list), ident(o.ident)
	{
		o.list = nullptr;
		o.ident = NULL_ID;
	}

	Component &operator=(Component &&o) noexcept
	{
		if (this != &o)
		{
			reset();
			list = o.list;
			ident = o.ident;
			o.list = nullptr;
			o.ident = NULL_ID;
		}
		return *this;
	}

	~Component() { reset(); }

	Id id() const { return ident; }
	explicit operator bool() const { return list != nullptr; }

	void patch(Content delta)
	{
		if (!list)
			throw std::logic_error("[store] patch through an empty handle");
		list->patch(ident, std::move(delta));
	}

	const Content *content() const { return list ? list->get(ident) : nullptr; }

	void reset()
	{
		if (!list)
			return;
		ComponentList *l = list;
		list = nullptr;
		l->destroy(ident);
		ident = NULL_ID;
	}
};

inline Component ComponentList::register_content(Content content)
{
	if (content.is_null())
		content = Content::object();
	if (!content.is_object())
		throw std::invalid_argument(std::string("[store] ") + label + " content must be a map");

	Id id = ids.allocate();
	content["id"] = id_to_content(id);
	Content *stored = active.add(id, std::move(content));
	publish(CreateMsg{mids.create_mid, *stored});
	return Component(this, id);
}

// =============================================================================
// World
// =============================================================================
struct World
{
	ComponentList buffers;
	ComponentList buffer_views;
	ComponentList images;
	ComponentList textures;
	ComponentList materials;
	ComponentList geometries;
	ComponentList entities;

	explicit World(BlockingQueue<Outbound> &out)
		: buffers(out, BUFFER_MIDS, "buffer"),
		  buffer_views(out, BUFFER_VIEW_MIDS, "buffer_view"),
		  images(out, IMAGE_MIDS, "image"),
		  textures(out, TEXTURE_MIDS, "texture"),
		  materials(out, MATERIAL_MIDS, "material"),
		  geometries(out, GEOMETRY_MIDS, "geometry"),
		  entities(out, ENTITY_MIDS, "entity") {}

	World(const World &) = delete;
	World &operator=(const World &) = delete;

	// Creates for everything live, dependencies first.
	Content snapshot() const
	{
		Content arr = Content::array();
		for (const ComponentList *l : {&buffers, &buffer_views, &images, &textures,
		                               &materials, &geometries, &entities})
			l->snapshot_into(arr);
		return arr;
	}

	size_t total() const
	{
		return buffers.size() + buffer_views.size() + images.size() + textures.size() +
		       materials.size() + geometries.size() + entities.size();
	}
};

} // namespace rp
