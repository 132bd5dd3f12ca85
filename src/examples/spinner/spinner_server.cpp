// spinner_server.cpp — Demo scene server for replica
// Run:   ./spinner_server [port]
//
// Publishes a small scene (a root entity, a spinning child, a material,
// an inline and an asset-hosted buffer, a texture chain) and rotates the
// spinner every tick. Connect any client speaking the replica protocol.

#include "rp_core.hpp"
#include "rp_server.hpp"
#include "rp_registry.hpp"
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>

using namespace rp;

static std::atomic<bool> g_quit{false};

static void on_signal(int) { g_quit = true; }

// =============================================================================
// Scene state — owned by main, mutated only on the tick
// =============================================================================
struct SpinnerScene {
    ResourceCache<std::string, RegisteredTexture> textures;
    std::unique_ptr<RegisteredBuffer> small_buffer;
    std::unique_ptr<RegisteredBuffer> big_buffer;
    Component material;
    Component root;
    Component spinner;
    float angle = 0.f;
    float status_accum = 0.f;
};

static Bytes make_pattern(size_t n, uint8_t seed) {
    Bytes b(n);
    for (size_t i = 0; i < n; i++) b[i] = (uint8_t)((i * 31 + seed) & 0xFF);
    return b;
}

static Transform rotation_y(float a) {
    Transform t = identity_transform();
    t[0] = std::cos(a);
    t[2] = -std::sin(a);
    t[8] = std::sin(a);
    t[10] = std::cos(a);
    return t;
}

static void scene_init(Kernel& k, Server& server, SpinnerScene& scene) {
    World& w = server.world;
    size_t threshold = server.config.inline_threshold;

    scene.small_buffer.reset(new RegisteredBuffer(w, server.assets, make_pattern(256, 1), threshold));
    scene.big_buffer.reset(new RegisteredBuffer(w, server.assets, make_pattern(64 * 1024, 2), threshold));

    auto tex = scene.textures.get_or_create("checker", [&] {
        return std::make_shared<RegisteredTexture>(w, server.assets, "checker", make_pattern(4096, 3), threshold);
    });

    scene.material = w.materials.register_content(Content{
        {"name", "spinner_mat"},
        {"pbr_info", {{"base_color", {1.0, 0.5, 0.2, 1.0}}, {"base_color_texture", {{"texture", id_to_content(tex->id())}}}}},
    });

    EntityContent root;
    root.name = "root";
    root.transform = identity_transform();
    scene.root = w.entities.register_content(root.to_content());

    EntityContent spin;
    spin.name = "spinner";
    spin.parent = scene.root.id();
    spin.transform = rotation_y(0.f);
    scene.spinner = w.entities.register_content(spin.to_content());

    server.on_invoke = [](ClientId from, const InvokeMsg& m) {
        printf("[scene] invoke from client %llu: %s\n", (unsigned long long)from, m.body.dump().c_str());
    };

    k.task_add("scene/spin", 10.f, [&scene](Kernel& k) {
        scene.angle += k.loop_dt();
        scene.spinner.patch(Content{{"transform", rotation_y(scene.angle)}});
    });

    k.task_add("scene/status", 20.f, [&scene, &server](Kernel& k) {
        scene.status_accum += k.loop_dt();
        if (scene.status_accum < 5.f) return;
        scene.status_accum = 0;
        printf("[server] tick=%llu  components=%zu  clients=%zu active, %zu pending\n",
               (unsigned long long)k.loop_tick(), server.world.total(),
               server.registry.active_count(), server.registry.pending_count());
    });

    k.task_add("scene/quit", 100.f, [](Kernel& k) {
        if (g_quit) k.quit();
    });
}

// =============================================================================
// Main
// =============================================================================
int main(int argc, char** argv) {
    ServerConfig cfg;
    if (argc > 1) cfg.port = atoi(argv[1]);

    printf("[server] starting on port %d\n", cfg.port);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Kernel kernel;
    kernel.loop_set_rate(60);

    Server server(cfg);
    if (!server.start(kernel)) {
        fprintf(stderr, "[server] failed to start\n");
        return 1;
    }

    {
        SpinnerScene scene;
        scene_init(kernel, server, scene);
        kernel.loop_run();
        for (auto& f : kernel.faults())
            fprintf(stderr, "[server] task fault: %s\n", f.c_str());
    }

    server.stop();
    return 0;
}
