#include "doctest/doctest.h"
#include "test_util.hpp"
#include "rp_core.hpp"
#include "rp_msg.hpp"
#include "rp_store.hpp"
#include "rp_server.hpp"
#include "rp_registry.hpp"
#include <cstdio>
#include <cstring>

using namespace rp;

static std::vector<Content> drain_envelopes(BlockingQueue<Outbound>& q)
{
    std::vector<Content> out;
    Outbound env;
    while (q.try_pop(env))
        out.push_back(std::move(env.content));
    return out;
}

static void pump(Server& s)
{
    Outbound env;
    while (s.outbound.try_pop(env))
        s.dispatcher.dispatch(std::move(env));
}

static ServerConfig offline_config()
{
    ServerConfig cfg;
    cfg.serve_assets = false;
    return cfg;
}

// =========================================================================
// CORE
// =========================================================================

TEST_SUITE("core") {

TEST_CASE("id equality and null") {
    CHECK(NULL_ID.is_null());
    CHECK(Id::make(0, 0) != NULL_ID);
    CHECK(Id::make(3, 1) == Id::make(3, 1));
    CHECK(Id::make(3, 1) != Id::make(3, 2));
    CHECK(Id::make(NULL_INDEX, 0).is_null());
}

TEST_CASE("allocator reuses released slot with next generation") {
    IdAllocator ids;
    Id a = ids.allocate();
    CHECK(a == Id::make(0, 0));
    ids.release(a);
    Id b = ids.allocate();
    CHECK(b == Id::make(0, 1));
    Id c = ids.allocate();
    CHECK(c == Id::make(1, 0));
    CHECK(ids.high_water() == 2);
}

TEST_CASE("allocator retires exhausted slot") {
    IdAllocator ids;
    Id a = ids.allocate();
    ids.release(Id::make(a.slot, NULL_INDEX - 1));
    Id b = ids.allocate();
    CHECK(b == Id::make(1, 0));
    CHECK(ids.free_count() == 0);
}

TEST_CASE("allocator free list is LIFO") {
    IdAllocator ids;
    Id a = ids.allocate();
    ids.allocate();
    Id c = ids.allocate();
    ids.release(a);
    ids.release(c);
    CHECK(ids.allocate() == Id::make(2, 1));
    CHECK(ids.allocate() == Id::make(0, 1));
    CHECK(ids.allocate() == Id::make(3, 0));
}

TEST_CASE("slot map swap-remove and stale ids") {
    SlotMap<int> m;
    Id a = Id::make(0, 0), b = Id::make(1, 0), c = Id::make(2, 0);
    m.add(a, 10);
    m.add(b, 20);
    m.add(c, 30);
    CHECK(m.remove(b));
    CHECK(!m.remove(b));
    CHECK(m.get(b) == nullptr);
    REQUIRE(m.get(c) != nullptr);
    CHECK(*m.get(c) == 30);
    CHECK(m.size() == 2);

    Id b2 = Id::make(1, 1);
    m.add(b2, 21);
    CHECK(m.get(b) == nullptr);
    CHECK(*m.get(b2) == 21);

    int sum = 0;
    m.each([&](Id, const int& v) { sum += v; });
    CHECK(sum == 61);
}

TEST_CASE("blocking queue hands items across threads in order") {
    BlockingQueue<int> q;
    std::thread producer([&] {
        for (int i = 0; i < 100; i++) q.push(i);
    });
    int expected = 0;
    int v = -1;
    while (expected < 100 && q.pop(v))
    {
        CHECK(v == expected);
        expected++;
    }
    producer.join();
    CHECK(expected == 100);
}

TEST_CASE("blocking queue close releases waiters") {
    BlockingQueue<int> q;
    std::atomic<bool> returned{false};
    bool result = true;
    std::thread waiter([&] {
        int v;
        result = q.pop(v);
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(!returned);
    q.close();
    waiter.join();
    CHECK(!result);
    CHECK(!q.push(1));
    CHECK(q.is_closed());
}

TEST_CASE("thread group join and reap") {
    ThreadGroup g;
    std::atomic<int> n{0};
    for (int i = 0; i < 4; i++)
        g.spawn([&] { n++; });
    CHECK(wait_until([&] { return n.load() == 4; }));
    CHECK(wait_until([&] { g.reap(); return g.size() == 0; }));

    g.spawn([&] { g.spawn([&] { n++; }); });
    g.join_all();
    CHECK(n.load() == 5);
}

TEST_CASE("kernel runs tasks by priority") {
    Kernel k;
    std::string order;
    k.task_add("late", 20.f, [&](Kernel&) { order += "c"; });
    k.task_add("early", 0.f, [&](Kernel&) { order += "a"; });
    k.task_add("mid", 10.f, [&](Kernel&) { order += "b"; });
    k.loop_once();
    CHECK(order == "abc");
    CHECK(k.loop_tick() == 1);

    k.task_stop("mid");
    k.loop_once();
    CHECK(order == "abcac");
    REQUIRE(k.task_get("late") != nullptr);
    CHECK(k.task_get("late")->runs == 2);
}

TEST_CASE("kernel deactivates faulting task") {
    Kernel k;
    int ok_runs = 0;
    k.task_add("bad", 0.f, [](Kernel&) { throw TaskFault("broken"); });
    k.task_add("good", 1.f, [&](Kernel&) { ok_runs++; });
    k.loop_once();
    k.loop_once();
    CHECK(ok_runs == 2);
    REQUIRE(k.faults().size() == 1);
    CHECK(k.faults()[0] == "bad: broken");
    CHECK(!k.task_get("bad")->active);
}

TEST_CASE("kernel quit stops loop_run") {
    Kernel k;
    k.task_add("stopper", 0.f, [](Kernel& k) {
        if (k.loop_tick() == 3) k.quit();
    });
    k.loop_run();
    CHECK(k.loop_tick() == 3);
    CHECK(!k.is_running());
}

} // TEST_SUITE core

// =========================================================================
// MESSAGES
// =========================================================================

TEST_SUITE("msg") {

TEST_CASE("id content form") {
    Content c = id_to_content(Id::make(4, 2));
    CHECK(c.dump() == "[4,2]");
    CHECK(id_from_content(c) == Id::make(4, 2));
    CHECK(id_from_content(Content("x")) == NULL_ID);
    CHECK(id_from_content(Content::array({1})) == NULL_ID);
}

TEST_CASE("client messages decode by type") {
    ClientMessage m;
    REQUIRE(decode_client_message(MSG_INTRODUCTION, Content{{"client_name", "viewer"}}, m));
    CHECK(std::get<IntroductionMsg>(m).client_name == "viewer");
    CHECK(!decode_client_message(MSG_INTRODUCTION, Content{{"name", "viewer"}}, m));
    REQUIRE(decode_client_message(MSG_INVOKE, Content{{"method", 3}}, m));
    CHECK(std::get<InvokeMsg>(m).body["method"] == 3);
    CHECK(!decode_client_message(99, Content::object(), m));
}

TEST_CASE("server envelopes") {
    CHECK(make_envelope(ReadyMsg{}).dump() == "[35,true]");
    CHECK(make_envelope(DeleteMsg{ENTITY_MIDS.delete_mid, Id::make(1, 0)}).dump() == "[6,{\"id\":[1,0]}]");
    Content created = make_envelope(CreateMsg{ENTITY_MIDS.create_mid, Content{{"name", "a"}}});
    CHECK(created[0] == 4);
    CHECK(created[1]["name"] == "a");
}

TEST_CASE("cbor codec rejects garbage") {
    Content env = make_envelope(ReadyMsg{});
    Bytes b = encode(env);
    CHECK(decode(b) == env);
    Bytes bad = {0xFF};
    CHECK_THROWS_AS(decode(bad), nlohmann::json::parse_error);
    Bytes truncated(b.begin(), b.end() - 1);
    CHECK_THROWS_AS(decode(truncated), nlohmann::json::parse_error);
    Bytes huge = {0x9B, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    CHECK_THROWS_AS(decode(huge), nlohmann::json::exception);
}

TEST_CASE("buffer content carries exactly one source") {
    BufferContent inl;
    inl.size = 3;
    inl.inline_bytes = Bytes{1, 2, 3};
    Content c = inl.to_content();
    CHECK(c["size"] == 3);
    CHECK(c["inline_bytes"].is_binary());
    CHECK(!c.contains("uri_bytes"));

    BufferContent uri;
    uri.size = 5000;
    uri.uri_bytes = UriBytes{"http", "abc", 50001};
    c = uri.to_content();
    CHECK(c["uri_bytes"]["path"] == "abc");
    CHECK(c["uri_bytes"]["port"] == 50001);
    CHECK(!c.contains("inline_bytes"));
}

} // TEST_SUITE msg

// =========================================================================
// STORE
// =========================================================================

TEST_SUITE("store") {

TEST_CASE("register emits create with injected id") {
    BlockingQueue<Outbound> q;
    World w(q);
    Component e = w.entities.register_content(Content{{"name", "a"}});
    CHECK(e.id() == Id::make(0, 0));

    auto envs = drain_envelopes(q);
    REQUIRE(envs.size() == 1);
    CHECK(envs[0].size() == 2);
    CHECK(envs[0][0] == ENTITY_MIDS.create_mid);
    CHECK(envs[0][1]["name"] == "a");
    CHECK(envs[0][1]["id"] == id_to_content(e.id()));
    REQUIRE(e.content() != nullptr);
    CHECK((*e.content())["id"] == id_to_content(e.id()));
}

TEST_CASE("registration stores an independent copy") {
    BlockingQueue<Outbound> q;
    World w(q);
    Content src{{"x", 1}};
    Component e = w.entities.register_content(src);
    src["x"] = 2;
    CHECK((*e.content())["x"] == 1);
    CHECK(!src.contains("id"));
}

TEST_CASE("patch merges into stored content and broadcasts the delta") {
    BlockingQueue<Outbound> q;
    World w(q);
    Component m = w.materials.register_content(Content{{"a", 1}, {"b", 2}});
    drain_envelopes(q);

    m.patch(Content{{"b", 3}, {"c", 4}});

    const Content& stored = *m.content();
    CHECK(stored.size() == 4);
    CHECK(stored["a"] == 1);
    CHECK(stored["b"] == 3);
    CHECK(stored["c"] == 4);
    CHECK(stored["id"] == id_to_content(m.id()));

    auto envs = drain_envelopes(q);
    REQUIRE(envs.size() == 1);
    CHECK(envs[0][0] == MATERIAL_MIDS.update_mid);
    const Content& delta = envs[0][1];
    CHECK(delta.size() == 3);
    CHECK(delta["b"] == 3);
    CHECK(delta["c"] == 4);
    CHECK(delta["id"] == id_to_content(m.id()));
    CHECK(!delta.contains("a"));
}

TEST_CASE("patch on immutable category is rejected") {
    BlockingQueue<Outbound> q;
    World w(q);
    Component b = w.buffers.register_content(Content{{"size", 0}});
    drain_envelopes(q);
    CHECK_THROWS_AS(b.patch(Content{{"size", 1}}), std::logic_error);
    CHECK(drain_envelopes(q).empty());
    CHECK((*b.content())["size"] == 0);
}

TEST_CASE("dropping a handle deletes exactly once") {
    BlockingQueue<Outbound> q;
    World w(q);
    {
        Component e = w.entities.register_content(Content{{"name", "a"}});
        Component moved = std::move(e);
        CHECK(!e);
        CHECK(moved.id() == Id::make(0, 0));
        e.reset();
    }
    auto envs = drain_envelopes(q);
    REQUIRE(envs.size() == 2);
    CHECK(envs[0] == make_envelope(CreateMsg{ENTITY_MIDS.create_mid, Content{{"name", "a"}, {"id", {0, 0}}}}));
    CHECK(envs[1] == make_envelope(DeleteMsg{ENTITY_MIDS.delete_mid, Id::make(0, 0)}));
    CHECK(envs[1][1].dump() == "{\"id\":[0,0]}");
    CHECK(w.entities.size() == 0);

    Component again = w.entities.register_content(Content::object());
    CHECK(again.id() == Id::make(0, 1));
}

TEST_CASE("move assignment deletes the overwritten component") {
    BlockingQueue<Outbound> q;
    World w(q);
    Component a = w.entities.register_content(Content{{"name", "a"}});
    Component b = w.entities.register_content(Content{{"name", "b"}});
    Id old_a = a.id();
    drain_envelopes(q);
    a = std::move(b);
    auto envs = drain_envelopes(q);
    REQUIRE(envs.size() == 1);
    CHECK(envs[0][1]["id"] == id_to_content(old_a));
    CHECK(w.entities.size() == 1);
}

TEST_CASE("snapshot lists dependencies first") {
    BlockingQueue<Outbound> q;
    World w(q);
    Component e = w.entities.register_content(Content{{"name", "e"}});
    Component m = w.materials.register_content(Content{{"name", "m"}});
    Component t = w.textures.register_content(Content{{"name", "t"}});
    Component b = w.buffers.register_content(Content{{"size", 1}});

    Content snap = w.snapshot();
    REQUIRE(snap.size() == 8);
    CHECK(snap[0] == BUFFER_MIDS.create_mid);
    CHECK(snap[2] == TEXTURE_MIDS.create_mid);
    CHECK(snap[4] == MATERIAL_MIDS.create_mid);
    CHECK(snap[6] == ENTITY_MIDS.create_mid);
    CHECK(snap[7]["id"] == id_to_content(e.id()));
    CHECK(w.total() == 4);
}

} // TEST_SUITE store

// =========================================================================
// PIPELINE
// =========================================================================

TEST_SUITE("pipeline") {

TEST_CASE("broadcast fans the same bytes out to every active client") {
    BlockingQueue<Outbound> q;
    ConnectionRegistry reg;
    Dispatcher d(q, reg);
    std::vector<std::shared_ptr<Client>> clients;
    for (int i = 0; i < 3; i++)
    {
        clients.push_back(reg.add_pending(nullptr));
        REQUIRE(reg.promote(clients.back()->id));
    }

    Content env = make_envelope(CreateMsg{ENTITY_MIDS.create_mid, Content{{"name", "x"}}});
    CHECK(d.dispatch(Outbound::broadcast(env)));

    SharedBytes first;
    for (auto& c : clients)
    {
        REQUIRE(c->outgoing.size() == 1);
        SharedBytes b;
        REQUIRE(c->outgoing.try_pop(b));
        if (!first) first = b;
        CHECK(b.get() == first.get());
        CHECK(decode(*b) == env);
    }
}

TEST_CASE("pending client sees nothing until introduction completes") {
    Server s(offline_config());
    auto c = s.registry.add_pending(nullptr);
    Component e = s.world.entities.register_content(Content{{"name", "e"}});
    pump(s);
    CHECK(c->outgoing.size() == 0);
    CHECK(s.registry.state(c->id) == ClientState::Pending);

    s.inbound.push(Inbound{c->id, make_client_envelope(IntroductionMsg{"viewer"})});
    s.process_inbound();
    pump(s);

    CHECK(s.registry.state(c->id) == ClientState::Active);
    CHECK(c->name == "viewer");
    REQUIRE(c->outgoing.size() == 1);
    SharedBytes b;
    REQUIRE(c->outgoing.try_pop(b));
    Content dump = decode(*b);
    REQUIRE(dump.size() == 4);
    CHECK(dump[0] == ENTITY_MIDS.create_mid);
    CHECK(dump[1]["name"] == "e");
    CHECK(dump[2] == MSG_READY);
    CHECK(dump[3] == true);

    e.patch(Content{{"name", "e2"}});
    pump(s);
    REQUIRE(c->outgoing.try_pop(b));
    Content upd = decode(*b);
    CHECK(upd[0] == ENTITY_MIDS.update_mid);
    CHECK(upd[1]["name"] == "e2");
}

TEST_CASE("second client joins with current state") {
    Server s(offline_config());
    auto first = s.registry.add_pending(nullptr);
    s.inbound.push(Inbound{first->id, make_client_envelope(IntroductionMsg{"one"})});
    s.process_inbound();
    pump(s);
    SharedBytes b;
    REQUIRE(first->outgoing.try_pop(b));
    CHECK(decode(*b).dump() == "[35,true]");

    Component e = s.world.entities.register_content(Content{{"name", "late"}});
    auto second = s.registry.add_pending(nullptr);
    s.inbound.push(Inbound{second->id, make_client_envelope(IntroductionMsg{"two"})});
    s.process_inbound();
    pump(s);

    REQUIRE(first->outgoing.try_pop(b));
    CHECK(decode(*b)[0] == ENTITY_MIDS.create_mid);
    CHECK(first->outgoing.size() == 0);

    REQUIRE(second->outgoing.try_pop(b));
    Content dump = decode(*b);
    REQUIRE(dump.size() == 4);
    CHECK(dump[1]["name"] == "late");
    CHECK(second->outgoing.size() == 0);
}

TEST_CASE("malformed introduction leaves client pending") {
    Server s(offline_config());
    auto c = s.registry.add_pending(nullptr);
    s.inbound.push(Inbound{c->id, Content::array({MSG_INTRODUCTION, Content{{"nom", 1}}})});
    s.process_inbound();
    pump(s);
    CHECK(s.registry.state(c->id) == ClientState::Pending);
    CHECK(c->outgoing.size() == 0);
}

TEST_CASE("invoke reaches the scene callback") {
    Server s(offline_config());
    ClientId seen = 0;
    Content body;
    s.on_invoke = [&](ClientId from, const InvokeMsg& m) {
        seen = from;
        body = m.body;
    };
    s.inbound.push(Inbound{7, make_client_envelope(InvokeMsg{Content{{"method", "spin"}}})});
    s.process_inbound();
    CHECK(seen == 7);
    CHECK(body["method"] == "spin");
}

TEST_CASE("router stops at trailing type without payload") {
    Router r;
    int calls = 0;
    r.on_message(7, [&](ClientId, const Content&) { calls++; });

    CHECK(r.process(Inbound{1, Content::array({7, Content::object(), 7})}) == 1);
    CHECK(calls == 1);

    CHECK(r.process(Inbound{1, Content::array({"x", Content::object(), 7, Content::object()})}) == 0);
    CHECK(r.process(Inbound{1, Content::array({99, Content::object(), 7, Content::object()})}) == 1);
    CHECK(r.process(Inbound{1, Content{{"not", "array"}}}) == 0);
    CHECK(calls == 2);
}

TEST_CASE("router rejects types beyond 32 bits") {
    Router r;
    int intros = 0;
    r.on_message(MSG_INTRODUCTION, [&](ClientId, const Content&) { intros++; });

    Content wide = Content::array({4294967296ULL, Content{{"client_name", "x"}}});
    CHECK(r.process(Inbound{1, wide}) == 0);
    Content wider = Content::array({4294967296ULL + 3, Content::object(), MSG_INTRODUCTION, Content::object()});
    CHECK(r.process(Inbound{1, wider}) == 0);
    CHECK(intros == 0);

    CHECK(r.process(Inbound{1, Content::array({MSG_INTRODUCTION, Content{{"client_name", "x"}}})}) == 1);
    CHECK(intros == 1);
}

TEST_CASE("targeted envelope to absent client is dropped") {
    BlockingQueue<Outbound> q;
    ConnectionRegistry reg;
    Dispatcher d(q, reg);
    auto c = reg.add_pending(nullptr);
    CHECK(!d.dispatch(Outbound::to(c->id + 100, make_envelope(ReadyMsg{}))));
    CHECK(!d.dispatch(Outbound::to(c->id, make_envelope(ReadyMsg{}))));
    CHECK(d.dropped.load() == 2);
    CHECK(c->outgoing.size() == 0);
}

TEST_CASE("encode failure drops only that envelope") {
    BlockingQueue<Outbound> q;
    ConnectionRegistry reg;
    Dispatcher d(q, reg);
    auto c = reg.add_pending(nullptr);
    reg.promote(c->id);
    d.encode_fn = [](const Content& content) -> Bytes {
        if (content.size() > 1 && content[1].contains("poison"))
            throw std::runtime_error("unencodable");
        return encode(content);
    };

    std::thread consumer([&] { d.run(); });
    q.push(Outbound::broadcast(make_envelope(CreateMsg{4, Content{{"poison", true}}})));
    q.push(Outbound::broadcast(make_envelope(CreateMsg{4, Content{{"name", "fine"}}})));

    SharedBytes b;
    REQUIRE(c->outgoing.pop(b));
    CHECK(decode(*b)[1]["name"] == "fine");
    q.close();
    consumer.join();
    CHECK(d.dropped.load() == 1);
    CHECK(d.delivered.load() == 1);
}

TEST_CASE("removing a client closes its queue") {
    ConnectionRegistry reg;
    auto c = reg.add_pending(nullptr);
    auto other = reg.add_pending(nullptr);
    CHECK(c->id != other->id);
    CHECK(reg.pending_count() == 2);
    REQUIRE(reg.remove(c->id) == c);
    CHECK(c->outgoing.is_closed());
    CHECK(reg.state(c->id) == ClientState::Absent);
    CHECK(reg.remove(c->id) == nullptr);
    CHECK(!reg.promote(c->id));
}

} // TEST_SUITE pipeline

// =========================================================================
// REGISTRY
// =========================================================================

TEST_SUITE("registry") {

TEST_CASE("buffer inline up to threshold, asset-hosted above") {
    BlockingQueue<Outbound> q;
    World w(q);
    AssetServer assets;
    {
        RegisteredBuffer small(w, assets, Bytes(1024, 7));
        CHECK(small.is_inline());
        const Content& c = *small.content();
        CHECK(c["size"] == 1024);
        REQUIRE(c["inline_bytes"].is_binary());
        CHECK(c["inline_bytes"].get_binary().size() == 1024);

        RegisteredBuffer big(w, assets, Bytes(1025, 7));
        CHECK(!big.is_inline());
        REQUIRE(big.hosted() != nullptr);
        const Content& bc = *big.content();
        CHECK(bc["size"] == 1025);
        CHECK(!bc.contains("inline_bytes"));
        CHECK(bc["uri_bytes"]["scheme"] == "http");
        CHECK(bc["uri_bytes"]["path"] == big.hosted()->identity());
        CHECK(big.hosted()->identity().size() == 32);
        CHECK(assets.size() == 1);
        REQUIRE(assets.find(big.hosted()->identity()) != nullptr);
        CHECK(assets.find(big.hosted()->identity())->size() == 1025);
    }
    CHECK(assets.size() == 0);
    CHECK(w.buffers.size() == 0);
}

TEST_CASE("cache creates once and eviction deletes the bundle") {
    BlockingQueue<Outbound> q;
    World w(q);
    AssetServer assets;
    ResourceCache<std::string, RegisteredTexture> cache;
    int made = 0;
    auto make = [&] {
        made++;
        return std::make_shared<RegisteredTexture>(w, assets, "brick", Bytes(64, 1));
    };

    auto t1 = cache.get_or_create("brick.png", make);
    auto t2 = cache.get_or_create("brick.png", make);
    CHECK(made == 1);
    CHECK(t1 == t2);
    CHECK(cache.contains("brick.png"));
    CHECK(w.total() == 4);

    auto creates = drain_envelopes(q);
    REQUIRE(creates.size() == 4);
    CHECK(creates[0][0] == BUFFER_MIDS.create_mid);
    CHECK(creates[1][0] == BUFFER_VIEW_MIDS.create_mid);
    CHECK(creates[1][1]["source_buffer"] == id_to_content(t1->buffer_id()));
    CHECK(creates[2][0] == IMAGE_MIDS.create_mid);
    CHECK(creates[2][1]["buffer_source"] == id_to_content(t1->view_id()));
    CHECK(creates[3][0] == TEXTURE_MIDS.create_mid);
    CHECK(creates[3][1]["image"] == id_to_content(t1->image_id()));

    CHECK(cache.evict("brick.png"));
    CHECK(!cache.evict("brick.png"));
    CHECK(w.total() == 4);
    t1.reset();
    t2.reset();
    CHECK(w.total() == 0);

    auto deletes = drain_envelopes(q);
    REQUIRE(deletes.size() == 4);
    CHECK(deletes[0][0] == TEXTURE_MIDS.delete_mid);
    CHECK(deletes[1][0] == IMAGE_MIDS.delete_mid);
    CHECK(deletes[2][0] == BUFFER_VIEW_MIDS.delete_mid);
    CHECK(deletes[3][0] == BUFFER_MIDS.delete_mid);
}

TEST_CASE("null factory result is not cached") {
    ResourceCache<int, int> cache;
    auto v = cache.get_or_create(1, [] { return std::shared_ptr<int>(); });
    CHECK(v == nullptr);
    CHECK(cache.size() == 0);
    cache.get_or_create(2, [] { return std::make_shared<int>(5); });
    CHECK(*cache.find(2) == 5);
    cache.clear();
    CHECK(cache.size() == 0);
}

} // TEST_SUITE registry
