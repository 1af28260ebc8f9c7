#include <doctest/doctest.h>
#include <ambience/sound_player_manager.hh>
#include <ambience/null_sound_player.hh>
#include <ambience/audio_focus_arbiter.hh>
#include "../test_fixtures.hh"
#include <atomic>
#include <chrono>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace ambience;
using namespace ambience::test;
using namespace std::chrono_literals;

using player_state = sound_player::state;
using manager_state = sound_player_manager::state;

namespace {
    std::string sound_name(int i) {
        return "sound_" + std::to_string(i);
    }

    std::size_t live_players(const mock_sound_player_factory& factory, const std::string& sound_id) {
        std::size_t live = 0;
        for (const auto& p : factory.players(sound_id)) {
            if (p->get_state() != player_state::stopped) {
                ++live;
            }
        }
        return live;
    }
}

TEST_SUITE("ThreadSafety") {

    TEST_CASE_FIXTURE(manager_fixture, "concurrent play and stop on distinct sounds") {
        constexpr int threads_count = 8;
        constexpr int iterations = 300;

        std::vector <std::thread> threads;
        for (int t = 0; t < threads_count; ++t) {
            threads.emplace_back([this, t] {
                const auto id = sound_name(t);
                std::mt19937 gen(static_cast <unsigned>(t));
                std::uniform_int_distribution <int> op(0, 4);
                for (int i = 0; i < iterations; ++i) {
                    switch (op(gen)) {
                        case 0:
                        case 1:
                            manager->play_sound(id);
                            break;
                        case 2:
                            manager->stop_sound(id);
                            break;
                        case 3:
                            if (auto p = player(id)) {
                                p->complete_fade();
                            }
                            break;
                        default:
                            manager->set_sound_volume(id, static_cast <float>(i % 10) / 10.f);
                            break;
                    }
                }
                // Leave every sound audible at the end
                manager->set_sound_volume(id, 0.5f);
                manager->play_sound(id);
                if (auto p = player(id)) {
                    p->complete_fade();
                }
                manager->play_sound(id);
            });
        }
        for (auto& th : threads) {
            th.join();
        }

        const auto preset = manager->get_current_preset();
        for (int t = 0; t < threads_count; ++t) {
            const auto id = sound_name(t);
            INFO("sound " << id);
            CHECK(live_players(*factory, id) <= 1);
            CHECK(manager->get_sound_volume(id) == doctest::Approx(0.5f));
            REQUIRE(preset.count(id) == 1);
            CHECK(preset.at(id) == doctest::Approx(0.5f));
        }
        CHECK(manager->get_state() == manager_state::playing);
    }

    TEST_CASE_FIXTURE(manager_fixture, "notifications race with control calls") {
        constexpr int sounds = 6;
        for (int i = 0; i < sounds; ++i) {
            manager->play_sound(sound_name(i));
        }

        std::atomic <bool> done{false};
        std::vector <std::thread> threads;

        // Players reporting on their own threads
        for (int i = 0; i < sounds; ++i) {
            threads.emplace_back([this, i, &done] {
                const auto id = sound_name(i);
                const player_state cycle[] = {
                    player_state::pausing, player_state::paused, player_state::buffering, player_state::playing
                };
                int n = 0;
                while (!done) {
                    if (auto p = player(id)) {
                        if (p->get_state() != player_state::stopped) {
                            p->report(cycle[n++ % 4]);
                        }
                    }
                    std::this_thread::yield();
                }
            });
        }

        // Settings and queries from the caller side
        threads.emplace_back([this, &done] {
            std::mt19937 gen(99);
            std::uniform_real_distribution <float> vol(0.f, 1.f);
            const char* bitrates[] = {"128k", "192k", "256k", "320k"};
            int n = 0;
            while (!done) {
                manager->set_volume(vol(gen));
                manager->set_audio_bitrate(bitrates[n++ % 4]);
                manager->set_fade_out_duration(std::chrono::milliseconds(n % 3));
                (void) manager->get_current_preset();
                (void) manager->get_state();
            }
        });

        threads.emplace_back([this, &done] {
            while (!done) {
                manager->pause(false);
                manager->resume();
            }
        });

        std::this_thread::sleep_for(300ms);
        done = true;
        for (auto& th : threads) {
            th.join();
        }

        // Settle every player and check the aggregate matches
        for (int i = 0; i < sounds; ++i) {
            player(sound_name(i))->report(player_state::playing);
        }
        CHECK(manager->get_state() == manager_state::playing);

        const float volume = manager->get_volume();
        manager->set_volume(volume);
        for (int i = 0; i < sounds; ++i) {
            const auto id = sound_name(i);
            CHECK(factory->built(id) == 1);
            CHECK(player(id)->last_volume() == doctest::Approx(volume));
        }
    }

    TEST_CASE_FIXTURE(manager_fixture, "focus changes race with playback") {
        manager->play_preset({{"rain", 0.5f}, {"wind", 0.5f}});

        std::atomic <bool> done{false};
        std::thread focus_thread([this, &done] {
            const focus_change changes[] = {focus_change::loss_transient, focus_change::gain,
                                            focus_change::loss_transient_can_duck, focus_change::gain};
            int n = 0;
            while (!done) {
                arbiter->send(changes[n++ % 4]);
                std::this_thread::yield();
            }
        });
        std::thread control_thread([this, &done] {
            int n = 0;
            while (!done) {
                manager->play_preset({{"rain", 0.5f}, {"wind", static_cast <float>(n++ % 10) / 10.f}});
                manager->set_fade_in_duration(std::chrono::milliseconds(n % 2));
            }
        });

        std::this_thread::sleep_for(200ms);
        done = true;
        focus_thread.join();
        control_thread.join();

        manager->stop(true);
        CHECK(manager->get_state() == manager_state::stopped);
        CHECK(manager->get_current_preset().empty());
        CHECK(live_players(*factory, "rain") == 0);
        CHECK(live_players(*factory, "wind") == 0);
    }

    TEST_CASE("managers destroyed while another client takes focus") {
        auto stack = std::make_shared <audio_focus_stack>();
        auto rival = std::make_shared <recording_focus_client>();

        std::atomic <bool> done{false};
        std::thread rival_thread([&stack, &rival, &done] {
            int n = 0;
            while (!done) {
                stack->request_focus(rival, default_audio_attributes, n++ % 2 == 0);
                stack->abandon_focus(rival);
            }
        });

        for (int i = 0; i < 300; ++i) {
            auto factory = std::make_shared <mock_sound_player_factory>();
            auto manager = std::make_unique <sound_player_manager>(factory, stack);
            manager->play_preset({{"rain", 0.5f}, {"wind", 0.5f}});
            manager.reset();
        }

        done = true;
        rival_thread.join();

        CHECK(stack->size() == 0);
        CHECK(stack->holder() == nullptr);
    }

    TEST_CASE("null players under concurrent control") {
        auto stack = std::make_shared <audio_focus_stack>();
        null_sound_player::timing timing;
        timing.buffering_delay = 2ms;
        manager_config config;
        config.fade_out_duration = 3ms;
        sound_player_manager manager(std::make_shared <null_sound_player_factory>(timing), stack, config);

        std::atomic <bool> done{false};
        std::vector <std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&manager, &done, t] {
                const auto id = sound_name(t);
                int n = 0;
                while (!done) {
                    switch (n++ % 4) {
                        case 0:
                            manager.play_sound(id);
                            break;
                        case 1:
                            manager.pause(n % 8 == 1);
                            break;
                        case 2:
                            manager.resume();
                            break;
                        default:
                            manager.stop_sound(id);
                            break;
                    }
                    std::this_thread::sleep_for(1ms);
                }
            });
        }

        std::this_thread::sleep_for(300ms);
        done = true;
        for (auto& th : threads) {
            th.join();
        }

        manager.stop(true);
        CHECK(wait_for([&manager] { return manager.get_state() == manager_state::stopped; }));
        CHECK(manager.get_current_preset().empty());
        CHECK(wait_for([&stack] { return stack->size() == 0; }));
    }
}
