// grafiek_engine TexturePool and texture context tests

#include <catch2/catch_test_macros.hpp>
#include <grafiek/engine/context.hpp>
#include <grafiek/engine/system_textures.hpp>
#include <grafiek/engine/texture_pool.hpp>
#include "gpu/backends/null/null_backend.hpp"

#include <array>
#include <memory>

using namespace grafiek_engine;
using grafiek_gpu::backends::NullBackend;

namespace {

std::unique_ptr<NullBackend> make_backend() {
    auto backend = std::make_unique<NullBackend>();
    (void)backend->init(grafiek_gpu::BackendConfig{});
    return backend;
}

TextureHandle sized(std::uint32_t width, std::uint32_t height) {
    return TextureHandle{std::nullopt, width, height, TextureFormat::RGBAu8};
}

} // anonymous namespace

// =============================================================================
// System Textures
// =============================================================================

TEST_CASE("TexturePool system textures", "[gpu][pool]") {
    auto backend = make_backend();
    TexturePool pool(*backend);

    SECTION("insert at reserved id") {
        REQUIRE(pool.insert_texture(CHECK, CHECK_DATA).is_ok());
        REQUIRE(pool.contains(CHECK.id.value()));
        REQUIRE(pool.owner_of(*CHECK.id) == TextureOwner::engine());

        auto texture = pool.get_texture(*CHECK.id);
        REQUIRE(texture.has_value());
        REQUIRE(backend->texture_data(*texture)[4] == 255);
    }

    SECTION("reserved id used twice") {
        REQUIRE(pool.insert_texture(SPECK, SPECK_DATA).is_ok());
        auto again = pool.insert_texture(SPECK, SPECK_DATA);
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == grafiek_core::ErrorCode::AlreadyExists);
    }

    SECTION("insert without an id") {
        REQUIRE(pool.insert_texture(sized(1, 1), SPECK_DATA).is_err());
    }

    SECTION("data size mismatch leaves nothing behind") {
        REQUIRE(pool.insert_texture(CHECK, SPECK_DATA).is_err());
        REQUIRE_FALSE(pool.contains(*CHECK.id));
        REQUIRE(backend->texture_count() == 0);
    }
}

// =============================================================================
// Allocation and Release
// =============================================================================

TEST_CASE("TexturePool allocation", "[gpu][pool]") {
    auto backend = make_backend();
    TexturePool pool(*backend);

    SECTION("ids start after the reserved range and never repeat") {
        auto a = pool.alloc_texture(sized(4, 4));
        auto b = pool.alloc_texture(sized(4, 4));
        REQUIRE(a.has_value());
        REQUIRE(a->value == SYSTEM_TEXTURE_COUNT);
        REQUIRE(b->value == SYSTEM_TEXTURE_COUNT + 1);

        REQUIRE(pool.release_texture(*b));
        auto c = pool.alloc_texture(sized(4, 4));
        REQUIRE(c->value == SYSTEM_TEXTURE_COUNT + 2);
    }

    SECTION("failed allocation yields no id") {
        REQUIRE_FALSE(pool.alloc_texture(sized(0, 4)).has_value());
        REQUIRE(pool.size() == 0);
    }

    SECTION("allocation with data uploads pixels") {
        std::array<std::uint8_t, 4> pixel{9, 8, 7, 6};
        auto id = pool.alloc_texture_with_data(TextureOwner::engine(), sized(1, 1), pixel);
        REQUIRE(id.has_value());
        REQUIRE(backend->texture_data(*pool.get_texture(*id))[0] == 9);
    }

    SECTION("allocation with bad data is rolled back") {
        std::array<std::uint8_t, 3> short_pixel{};
        REQUIRE_FALSE(pool.alloc_texture_with_data(TextureOwner::engine(), sized(1, 1), short_pixel));
        REQUIRE(pool.size() == 0);
        REQUIRE(backend->texture_count() == 0);
    }

    SECTION("release node textures only touches that node") {
        NodeIndex first(0, 0);
        NodeIndex second(1, 0);
        (void)pool.alloc_texture(sized(2, 2), TextureOwner::of_node(first));
        (void)pool.alloc_texture(sized(2, 2), TextureOwner::of_node(first));
        auto kept = pool.alloc_texture(sized(2, 2), TextureOwner::of_node(second));
        auto engine_owned = pool.alloc_texture(sized(2, 2));

        REQUIRE(pool.release_node_textures(first) == 2);
        REQUIRE(pool.size() == 2);
        REQUIRE(pool.contains(*kept));
        REQUIRE(pool.contains(*engine_owned));
        REQUIRE(backend->texture_count() == 2);
    }

    SECTION("replace keeps the id and destroys the old backing") {
        auto id = pool.alloc_texture(sized(2, 2));
        auto old_texture = *pool.get_texture(*id);

        grafiek_gpu::TextureDesc desc;
        desc.width = 8;
        desc.height = 8;
        auto replacement = backend->create_texture(desc);
        REQUIRE(pool.replace_texture(*id, replacement));

        REQUIRE(pool.get_texture(*id) == replacement);
        REQUIRE_FALSE(backend->texture_desc(old_texture).has_value());
        REQUIRE(pool.texture_desc(*id)->width == 8);
    }

    SECTION("unknown ids") {
        REQUIRE_FALSE(pool.release_texture(TextureId{99}));
        REQUIRE_FALSE(pool.replace_texture(TextureId{99}, grafiek_gpu::TextureHandle{}));
        REQUIRE_FALSE(pool.owner_of(TextureId{99}).has_value());
    }

    SECTION("destroying the pool destroys its textures") {
        {
            TexturePool scoped(*backend);
            (void)scoped.alloc_texture(sized(2, 2));
            REQUIRE(backend->texture_count() == 1);
        }
        REQUIRE(backend->texture_count() == 0);
    }
}

// =============================================================================
// ExecutionContext::ensure_texture
// =============================================================================

TEST_CASE("ExecutionContext ensure_texture", "[gpu][context]") {
    ExecutionContext ctx(make_backend());
    auto& pool = ctx.textures();
    REQUIRE(pool.insert_texture(CHECK, CHECK_DATA).is_ok());

    NodeIndex owner(3, 1);

    SECTION("allocates an unallocated handle for its owner") {
        TextureHandle handle = sized(16, 8);
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        REQUIRE(handle.id.has_value());
        REQUIRE(pool.owner_of(*handle.id) == TextureOwner::of_node(owner));
        REQUIRE(ctx.texture(handle).has_value());
    }

    SECTION("is a no-op when nothing changed") {
        TextureHandle handle = sized(16, 8);
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        auto id = handle.id;
        auto texture = ctx.texture(handle);

        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        REQUIRE(handle.id == id);
        REQUIRE(ctx.texture(handle) == texture);
        REQUIRE(pool.size() == 2);
    }

    SECTION("resizes in place keeping the id") {
        TextureHandle handle = sized(16, 8);
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        auto id = handle.id;

        handle.width = 32;
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        REQUIRE(handle.id == id);
        REQUIRE(pool.texture_desc(*id)->width == 32);
        REQUIRE(pool.size() == 2);
    }

    SECTION("never resizes a system texture") {
        TextureHandle handle = CHECK;
        handle.width = 64;
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        REQUIRE(handle.id != CHECK.id);
        REQUIRE(pool.texture_desc(*CHECK.id)->width == 2);
    }

    SECTION("matching system texture is shared") {
        TextureHandle handle = CHECK;
        REQUIRE(ctx.ensure_texture(handle, TextureOwner::of_node(owner)));
        REQUIRE(handle.id == CHECK.id);
        REQUIRE(pool.size() == 1);
    }
}
