#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fake_backend.hpp"
#include "../src/audio/audio_config.hpp"
#include "../src/audio/audio_manager.hpp"
#include "../src/audio/sound_effects.hpp"
#include "../src/layout.hpp"
#include <memory>
#include <set>
#include <string>

// The audio library has no raylib dependency: every test drives AudioManager
// through FakeBackend and a hand-advanced clock.

using namespace xiangqi::audio;
using Catch::Matchers::WithinAbs;

static SoundConfig make_config(int max_instances, float min_delay, float volume = 1.0f,
                               SoundCategory cat = SoundCategory::Other) {
    SoundConfig c;
    c.category      = cat;
    c.volume        = volume;
    c.max_instances = max_instances;
    c.min_delay     = min_delay;
    return c;
}

// Settings with sounds a, b, c (5 instances, no delay) on the given pool.
static AudioSettings test_settings(int channels) {
    AudioSettings s;
    s.sound_dir     = "sfx";
    s.channels      = channels;
    s.master_volume = 1.0f;
    s.sfx_volume    = 1.0f;
    s.sounds["a"] = make_config(5, 0.0f);
    s.sounds["b"] = make_config(5, 0.0f);
    s.sounds["c"] = make_config(5, 0.0f);
    return s;
}

struct Rig {
    double       t = 100.0;
    FakeBackend* fake = nullptr;
    std::unique_ptr<AudioManager> manager;

    explicit Rig(AudioSettings settings, const std::set<std::string>& files = {"sfx/a.wav", "sfx/b.wav", "sfx/c.wav"}) {
        auto backend = std::make_unique<FakeBackend>();
        fake = backend.get();
        for (const auto& f : files) fake->add_file(f);
        manager = std::make_unique<AudioManager>(std::move(backend), std::move(settings),
                                                 [this]() { return t; });
    }
};

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

TEST_CASE("load_sound — resolves path from name and extension order", "[audio][load]") {
    AudioSettings s = test_settings(4);
    Rig rig(s, {"sfx/a.ogg", "sfx/a.mp3"});

    REQUIRE(rig.manager->load_sound("a") == LoadResult::Ok);
    auto info = rig.manager->info("a");
    REQUIRE(info);
    CHECK(info->path == "sfx/a.ogg");
}

TEST_CASE("load_sound — is idempotent", "[audio][load]") {
    Rig rig(test_settings(4));

    REQUIRE(rig.manager->load_sound("a") == LoadResult::Ok);
    REQUIRE(rig.manager->load_sound("a") == LoadResult::Ok);
    CHECK(rig.manager->loaded_count() == 1);
    CHECK(rig.fake->sounds.size() == 1);
}

TEST_CASE("load_sound — missing file is NotFound", "[audio][load]") {
    Rig rig(test_settings(4), {});

    CHECK(rig.manager->load_sound("a") == LoadResult::NotFound);
    CHECK_FALSE(rig.manager->is_loaded("a"));
}

TEST_CASE("load_sound — undecodable file is DecodeError", "[audio][load]") {
    Rig rig(test_settings(4), {});
    rig.fake->add_file("sfx/a.wav", true);

    CHECK(rig.manager->load_sound("a") == LoadResult::DecodeError);
    CHECK_FALSE(rig.manager->is_loaded("a"));
}

TEST_CASE("load_sound — explicit path and config round-trip through info", "[audio][load]") {
    Rig rig(test_settings(4), {"elsewhere/boom.wav"});
    SoundConfig cfg = make_config(2, 0.25f, 0.6f, SoundCategory::Game);

    REQUIRE(rig.manager->load_sound("boom", "elsewhere/boom.wav", cfg) == LoadResult::Ok);
    auto info = rig.manager->info("boom");
    REQUIRE(info);
    CHECK(info->config.category == SoundCategory::Game);
    CHECK(info->config.max_instances == 2);
    CHECK_THAT(info->config.min_delay, WithinAbs(0.25f, 1e-6f));
    CHECK_THAT(info->config.volume,    WithinAbs(0.6f,  1e-6f));
    CHECK(info->play_count == 0);

    rig.t += 1.0;
    REQUIRE(rig.manager->play("boom") == PlayResult::Ok);
    CHECK(rig.manager->info("boom")->play_count == 1);
}

TEST_CASE("load_sound — unknown sound gets the default config", "[audio][load]") {
    AudioSettings s = test_settings(4);
    s.max_sound_instances = 7;
    s.min_play_delay      = 0.3f;
    Rig rig(s, {"sfx/zap.wav"});

    REQUIRE(rig.manager->load_sound("zap") == LoadResult::Ok);
    auto info = rig.manager->info("zap");
    REQUIRE(info);
    CHECK(info->config.category == SoundCategory::Other);
    CHECK_THAT(info->config.volume, WithinAbs(1.0f, 1e-6f));
    CHECK(info->config.max_instances == 7);
    CHECK_THAT(info->config.min_delay, WithinAbs(0.3f, 1e-6f));
}

TEST_CASE("load_sound — out-of-range config is validated", "[audio][load]") {
    Rig rig(test_settings(4));

    REQUIRE(rig.manager->load_sound("a", "", make_config(0, -2.0f, 3.0f)) == LoadResult::Ok);
    auto info = rig.manager->info("a");
    REQUIRE(info);
    CHECK(info->config.max_instances == 1);
    CHECK(info->config.min_delay == 0.0f);
    CHECK(info->config.volume == 1.0f);
}

TEST_CASE("load_configured — reports failures and keeps going", "[audio][load]") {
    Rig rig(test_settings(4), {"sfx/a.wav", "sfx/c.wav"});
    rig.fake->add_file("sfx/c.wav", true);

    auto results = rig.manager->load_configured();

    REQUIRE(results.size() == 3);
    CHECK(results["a"] == LoadResult::Ok);
    CHECK(results["b"] == LoadResult::NotFound);
    CHECK(results["c"] == LoadResult::DecodeError);
    CHECK(rig.manager->loaded_count() == 1);
}

TEST_CASE("load_all — loads every sound file in the directory once", "[audio][load]") {
    Rig rig(test_settings(4), {"sfx/a.wav", "sfx/gong.ogg", "sfx/readme.txt", "other/x.wav"});
    REQUIRE(rig.manager->load_sound("a") == LoadResult::Ok);

    auto results = rig.manager->load_all();

    CHECK(results.size() == 1);
    CHECK(results["gong"] == LoadResult::Ok);
    CHECK(rig.manager->is_loaded("gong"));
    CHECK_FALSE(rig.manager->is_loaded("readme"));
    CHECK_FALSE(rig.manager->is_loaded("x"));
}

// ---------------------------------------------------------------------------
// Play limits
// ---------------------------------------------------------------------------

TEST_CASE("play — loads on demand", "[audio][play]") {
    Rig rig(test_settings(4));

    CHECK(rig.manager->play("a") == PlayResult::Ok);
    CHECK(rig.manager->is_loaded("a"));
    CHECK(rig.manager->active_count() == 1);
    CHECK(rig.fake->busy_count() == 1);
}

TEST_CASE("play — unloadable sound is NotLoaded", "[audio][play]") {
    Rig rig(test_settings(4));

    CHECK(rig.manager->play("nope") == PlayResult::NotLoaded);
    CHECK(rig.manager->active_count() == 0);
}

TEST_CASE("play — immediate replay is RateLimited until min_delay passes", "[audio][play]") {
    AudioSettings s = test_settings(4);
    s.sounds["a"] = make_config(5, 0.5f);
    Rig rig(s);

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    CHECK(rig.manager->play("a") == PlayResult::RateLimited);

    rig.t += 0.4;
    CHECK(rig.manager->play("a") == PlayResult::RateLimited);

    rig.t += 0.2;
    CHECK(rig.manager->play("a") == PlayResult::Ok);
    CHECK(rig.manager->info("a")->play_count == 2);
}

TEST_CASE("play — rate limit is per sound", "[audio][play]") {
    AudioSettings s = test_settings(4);
    s.sounds["a"] = make_config(5, 1.0f);
    Rig rig(s);

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    CHECK(rig.manager->play("b") == PlayResult::Ok);
}

TEST_CASE("play — N+1th concurrent instance is ConcurrencyLimited", "[audio][play]") {
    AudioSettings s = test_settings(8);
    s.sounds["a"] = make_config(3, 0.0f);
    Rig rig(s);

    for (int i = 0; i < 3; ++i) REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    CHECK(rig.manager->play("a") == PlayResult::ConcurrencyLimited);
    CHECK(rig.manager->info("a")->play_count == 3);
}

TEST_CASE("play — finished instance frees its concurrency slot", "[audio][play]") {
    AudioSettings s = test_settings(8);
    s.sounds["a"] = make_config(1, 0.0f);
    Rig rig(s);

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("a") == PlayResult::ConcurrencyLimited);

    rig.fake->finish(0);
    CHECK(rig.manager->play("a") == PlayResult::Ok);
}

TEST_CASE("play — empty pool is NoChannelAvailable", "[audio][play]") {
    Rig rig(test_settings(0));

    CHECK(rig.manager->play("a") == PlayResult::NoChannelAvailable);
    CHECK(rig.manager->info("a")->play_count == 0);
}

TEST_CASE("play — final volume mixes base, request, master and effects", "[audio][play]") {
    AudioSettings s = test_settings(4);
    s.sounds["a"]   = make_config(5, 0.0f, 0.5f);
    s.master_volume = 0.8f;
    s.sfx_volume    = 0.5f;
    Rig rig(s);

    REQUIRE(rig.manager->play("a", 0.5f) == PlayResult::Ok);
    CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(0.5f * 0.5f * 0.8f * 0.5f, 1e-6f));
}

TEST_CASE("play — final volume is clamped to 1", "[audio][play]") {
    Rig rig(test_settings(4));

    REQUIRE(rig.manager->play("a", 4.0f) == PlayResult::Ok);
    CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(1.0f, 1e-6f));
}

// ---------------------------------------------------------------------------
// Channel pool
// ---------------------------------------------------------------------------

TEST_CASE("channel pool — full pool evicts the oldest instance", "[audio][pool]") {
    Rig rig(test_settings(2));

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    rig.t += 1.0;
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);
    REQUIRE(rig.fake->busy_count() == 2);

    rig.t += 1.0;
    REQUIRE(rig.manager->play("c") == PlayResult::Ok);

    CHECK(rig.manager->active_count() == 2);
    CHECK(rig.fake->busy_count() == 2);
    CHECK(rig.fake->stop_calls == 1);
    CHECK(rig.fake->sound_on(0) == "sfx/c.wav");
    CHECK(rig.manager->playing_names() == std::set<std::string>{"b", "c"});
}

TEST_CASE("channel pool — equal start times evict in play order", "[audio][pool]") {
    Rig rig(test_settings(2));

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);
    REQUIRE(rig.manager->play("c") == PlayResult::Ok);

    CHECK(rig.manager->playing_names() == std::set<std::string>{"b", "c"});
}

TEST_CASE("channel pool — active instances never exceed channel count", "[audio][pool]") {
    Rig rig(test_settings(3));

    const char* names[] = {"a", "b", "c"};
    for (int i = 0; i < 12; ++i) {
        rig.t += 0.01;
        REQUIRE(rig.manager->play(names[i % 3]) == PlayResult::Ok);
        CHECK(rig.manager->active_count() <= 3);
        CHECK(rig.fake->busy_count() <= 3);
    }
    CHECK(rig.manager->free_channel_count() == 0);
}

TEST_CASE("channel pool — free channel is preferred over eviction", "[audio][pool]") {
    Rig rig(test_settings(2));

    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);
    rig.fake->finish(1);

    REQUIRE(rig.manager->play("c") == PlayResult::Ok);
    CHECK(rig.fake->stop_calls == 0);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"a", "c"});
}

// ---------------------------------------------------------------------------
// Stop / pause
// ---------------------------------------------------------------------------

TEST_CASE("stop_all — empties playing set", "[audio][stop]") {
    Rig rig(test_settings(4));
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);

    rig.manager->stop_all();

    CHECK(rig.manager->playing_names().empty());
    CHECK(rig.manager->active_count() == 0);
    CHECK(rig.fake->stop_all_calls == 1);
}

TEST_CASE("stop_sound — stops only the named sound and counts instances", "[audio][stop]") {
    Rig rig(test_settings(4));
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);

    CHECK(rig.manager->stop_sound("a") == 2);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"b"});
    CHECK(rig.manager->stop_sound("a") == 0);
    CHECK(rig.manager->stop_sound("never") == 0);
}

TEST_CASE("pause_all / resume_all — keep bookkeeping intact", "[audio][stop]") {
    Rig rig(test_settings(4));
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);

    rig.manager->pause_all();
    CHECK(rig.fake->paused);
    CHECK(rig.manager->active_count() == 1);

    rig.manager->resume_all();
    CHECK_FALSE(rig.fake->paused);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"a"});
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

TEST_CASE("volume — setters clamp and are idempotent", "[audio][volume]") {
    Rig rig(test_settings(4));

    rig.manager->set_master_volume(-1.0f);
    CHECK(rig.manager->master_volume() == 0.0f);
    rig.manager->set_master_volume(5.0f);
    CHECK(rig.manager->master_volume() == 1.0f);
    rig.manager->set_master_volume(5.0f);
    CHECK(rig.manager->master_volume() == 1.0f);

    rig.manager->set_effects_volume(-3.0f);
    CHECK(rig.manager->effects_volume() == 0.0f);
    rig.manager->set_effects_volume(2.0f);
    CHECK(rig.manager->effects_volume() == 1.0f);
}

TEST_CASE("volume — change re-applies sound baselines and live channels", "[audio][volume]") {
    AudioSettings s = test_settings(4);
    s.sounds["a"] = make_config(5, 0.0f, 0.8f);
    Rig rig(s);
    REQUIRE(rig.manager->play("a", 0.5f) == PlayResult::Ok);
    const SoundHandle h = rig.fake->channels[0].sound;

    rig.manager->set_master_volume(0.5f);

    CHECK_THAT(rig.fake->sound_volume[h],       WithinAbs(0.8f * 0.5f,        1e-6f));
    CHECK_THAT(rig.fake->channels[0].volume,    WithinAbs(0.8f * 0.5f * 0.5f, 1e-6f));

    rig.manager->set_effects_volume(0.0f);
    CHECK(rig.fake->channels[0].volume == 0.0f);
}

// ---------------------------------------------------------------------------
// Maintenance & lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("update — reaps finished channels", "[audio][update]") {
    Rig rig(test_settings(4));
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->play("b") == PlayResult::Ok);

    rig.fake->finish(0);
    rig.manager->update();

    CHECK(rig.manager->active_count() == 1);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"b"});
}

TEST_CASE("update — drops stale records even while the channel is busy", "[audio][update]") {
    AudioSettings s = test_settings(4);
    s.stale_after = 10.0f;
    Rig rig(s);
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);

    rig.t += 9.5;
    rig.manager->update();
    CHECK(rig.manager->active_count() == 1);

    rig.t += 0.5;
    rig.manager->update();
    CHECK(rig.manager->active_count() == 0);
    CHECK(rig.fake->busy_count() == 1);
}

TEST_CASE("play — pool held by untracked playback still yields a channel", "[audio][update]") {
    AudioSettings s = test_settings(1);
    s.stale_after = 1.0f;
    Rig rig(s);
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    rig.t += 2.0;
    rig.manager->update();
    REQUIRE(rig.manager->active_count() == 0);

    CHECK(rig.manager->play("b") == PlayResult::Ok);
    CHECK(rig.fake->sound_on(0) == "sfx/b.wav");
}

TEST_CASE("cleanup — releases everything and closes the pool", "[audio][lifecycle]") {
    Rig rig(test_settings(4));
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);
    REQUIRE(rig.manager->load_sound("b") == LoadResult::Ok);

    rig.manager->cleanup();

    CHECK(rig.manager->loaded_count() == 0);
    CHECK(rig.manager->active_count() == 0);
    CHECK(rig.manager->channel_count() == 0);
    CHECK(rig.fake->sounds.empty());
    CHECK_FALSE(rig.fake->open);
    CHECK(rig.manager->play("a") == PlayResult::NoChannelAvailable);

    rig.manager->init();
    CHECK(rig.manager->channel_count() == 4);
    rig.t += 1.0;
    CHECK(rig.manager->play("a") == PlayResult::Ok);
}

TEST_CASE("to_string — names every result", "[audio]") {
    CHECK(std::string(to_string(LoadResult::NotFound)) == "not found");
    CHECK(std::string(to_string(PlayResult::RateLimited)) == "rate limited");
    CHECK(std::string(to_string(PlayResult::NoChannelAvailable)) == "no channel available");
}

// ---------------------------------------------------------------------------
// AudioSettings
// ---------------------------------------------------------------------------

TEST_CASE("AudioSettings — built-in table covers the game cues", "[config]") {
    AudioSettings s = AudioSettings::defaults();
    for (const char* name : {"click", "select", "hover", "confirm", "cancel", "move", "game_start"})
        CHECK(s.sounds.count(name) == 1);
    for (const auto& [group, members] : s.groups)
        for (const auto& m : members) CHECK(s.sounds.count(m) == 1);
}

TEST_CASE("parse_category — round-trips every category", "[config]") {
    for (auto c : {SoundCategory::Ui, SoundCategory::Piece, SoundCategory::Game,
                   SoundCategory::Ambient, SoundCategory::Other}) {
        auto parsed = parse_category(to_string(c));
        REQUIRE(parsed);
        CHECK(*parsed == c);
    }
    CHECK_FALSE(parse_category("music"));
}

// ---------------------------------------------------------------------------
// SoundEffects
// ---------------------------------------------------------------------------

TEST_CASE("SoundEffects — named cues route to the manager", "[effects]") {
    AudioSettings s = test_settings(4);
    s.sounds["hover"] = make_config(5, 0.0f);
    Rig rig(s, {"sfx/hover.wav"});
    SoundEffects fx(*rig.manager, 1);

    CHECK(fx.play_hover());
    CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(0.7f, 1e-6f));
    CHECK_FALSE(fx.play_click());
}

TEST_CASE("SoundEffects — random group play picks only loaded members", "[effects]") {
    AudioSettings s = test_settings(4);
    s.groups["g"]     = {"a", "b", "ghost"};
    s.groups["empty"] = {"ghost"};
    Rig rig(s);
    REQUIRE(rig.manager->load_sound("a") == LoadResult::Ok);
    REQUIRE(rig.manager->load_sound("b") == LoadResult::Ok);
    SoundEffects fx(*rig.manager, 42);

    for (int i = 0; i < 20; ++i) {
        rig.t += 1.0;
        auto played = fx.play_random_from_group("g");
        REQUIRE(played);
        CHECK((*played == "a" || *played == "b"));
        rig.manager->stop_all();
    }
    CHECK_FALSE(fx.play_random_from_group("empty"));
    CHECK_FALSE(fx.play_random_from_group("unknown"));
}

TEST_CASE("SoundEffects — sequence fires at cumulative offsets", "[effects]") {
    Rig rig(test_settings(4));
    SoundEffects fx(*rig.manager, 1);

    CHECK(fx.play_sequence({"a", "b", "c"}) == 1);
    CHECK(fx.pending_count() == 2);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"a"});

    rig.t += 0.05;
    CHECK(fx.update() == 0);

    rig.t += 0.06; // 0.11 s
    CHECK(fx.update() == 1);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"a", "b"});

    rig.t += 0.10; // 0.21 s
    CHECK(fx.update() == 1);
    CHECK(fx.pending_count() == 0);
    CHECK(rig.manager->playing_names() == std::set<std::string>{"a", "b", "c"});
}

TEST_CASE("SoundEffects — explicit delays and stop_all cancels the queue", "[effects]") {
    Rig rig(test_settings(4));
    SoundEffects fx(*rig.manager, 1);

    fx.play_sequence({"a", "b"}, {1.0f});
    rig.t += 0.5;
    CHECK(fx.update() == 0);

    fx.stop_all();
    CHECK(fx.pending_count() == 0);
    rig.t += 1.0;
    CHECK(fx.update() == 0);
    CHECK(rig.manager->playing_names().empty());
}

TEST_CASE("SoundEffects — spatial play attenuates and pans", "[effects]") {
    Rig rig(test_settings(8));
    SoundEffects fx(*rig.manager, 1);
    const Point2 listener{400.0f, 300.0f};

    SECTION("At the listener: full volume, centred") {
        REQUIRE(fx.play_spatial("a", {400.0f, 300.0f}, listener));
        CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(1.0f, 1e-6f));
        CHECK_THAT(rig.fake->channels[0].pan,    WithinAbs(0.0f, 1e-6f));
    }

    SECTION("Half way to the right") {
        REQUIRE(fx.play_spatial("a", {650.0f, 300.0f}, listener));
        CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(0.5f,   1e-5f));
        CHECK_THAT(rig.fake->channels[0].pan,    WithinAbs(0.625f, 1e-5f));
    }

    SECTION("Far left clamps pan, volume floors at 0.1") {
        REQUIRE(fx.play_spatial("a", {-80.0f, 300.0f}, listener));
        CHECK_THAT(rig.fake->channels[0].volume, WithinAbs(0.1f,  1e-5f));
        CHECK_THAT(rig.fake->channels[0].pan,    WithinAbs(-1.0f, 1e-6f));
    }

    SECTION("Out of range is silent") {
        CHECK_FALSE(fx.play_spatial("a", {900.0f, 300.0f}, listener));
        CHECK(rig.manager->active_count() == 0);
    }
}

TEST_CASE("SoundEffects — preload, volume and status", "[effects]") {
    Rig rig(test_settings(4));
    SoundEffects fx(*rig.manager, 1);

    CHECK(fx.preload({"a", "b", "missing"}) == 2);
    REQUIRE(rig.manager->play("a") == PlayResult::Ok);

    fx.set_volume(0.5f, std::nullopt);
    CHECK(fx.volume().master == 0.5f);
    CHECK(fx.volume().sfx == 1.0f);
    fx.set_volume(std::nullopt, 9.0f);
    CHECK(fx.volume().sfx == 1.0f);

    AudioStatus st = fx.status();
    CHECK(st.loaded_sounds == 2);
    CHECK(st.playing_now == 1);
    CHECK(st.available_channels == 3);
    CHECK(st.volume.master == 0.5f);
}

// ---------------------------------------------------------------------------
// Board layout
// ---------------------------------------------------------------------------

using namespace xiangqi::layout;

TEST_CASE("board_rect — tall window uses 80% of width", "[layout]") {
    BoardRect b = board_rect(900, 1000);
    CHECK(b.area.w == 720);
    CHECK(b.area.h == 800);
    CHECK(b.area.x == 90);
    CHECK(b.area.y == 100);
    CHECK(b.square == 80);
}

TEST_CASE("board_rect — wide window falls back to 80% of height", "[layout]") {
    BoardRect b = board_rect(1280, 720);
    CHECK(b.area.h == 576);
    CHECK(b.area.w == 518);
    CHECK(b.area.x == 381);
    CHECK(b.area.y == 72);
    CHECK(b.square == 57);
}

TEST_CASE("cover_fit — scales to cover and centres the overflow", "[layout]") {
    Rect r = cover_fit(800, 600, 400, 400);
    CHECK(r.w == 800);
    CHECK(r.h == 800);
    CHECK(r.x == 0);
    CHECK(r.y == -100);
}

TEST_CASE("cell_at — maps pixels to grid cells", "[layout]") {
    BoardRect b = board_rect(900, 1000);

    auto first = cell_at(b, 95.0f, 105.0f);
    REQUIRE(first);
    CHECK(first->row == 0);
    CHECK(first->col == 0);

    auto last = cell_at(b, 735.0f, 825.0f);
    REQUIRE(last);
    CHECK(last->row == 9);
    CHECK(last->col == 8);

    CHECK_FALSE(cell_at(b, 89.0f, 150.0f));
    CHECK_FALSE(cell_at(b, 810.0f, 150.0f));

    float cx = 0, cy = 0;
    cell_center(b, {9, 8}, cx, cy);
    CHECK_THAT(cx, WithinAbs(770.0f, 1e-4f));
    CHECK_THAT(cy, WithinAbs(860.0f, 1e-4f));
}
