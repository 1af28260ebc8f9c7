#include <doctest/doctest.h>
#include <ambience/sound_player_manager.hh>
#include <ambience/error.hh>
#include "../test_fixtures.hh"

using namespace ambience;
using namespace ambience::test;

using player_state = sound_player::state;
using manager_state = sound_player_manager::state;

TEST_SUITE("PlaybackControl::Construction") {

    TEST_CASE("null factory is rejected") {
        CHECK_THROWS_AS(sound_player_manager(nullptr, std::make_shared <mock_focus_arbiter>()), ambience_error);
    }

    TEST_CASE("null arbiter needs focus management disabled") {
        auto factory = std::make_shared <mock_sound_player_factory>();
        CHECK_THROWS_AS(sound_player_manager(factory, nullptr), ambience_error);

        manager_config config;
        config.audio_focus_management = false;
        CHECK_NOTHROW(sound_player_manager(factory, nullptr, config));
    }

    TEST_CASE_FIXTURE(manager_fixture, "initial state") {
        CHECK(manager->get_state() == manager_state::stopped);
        CHECK_FALSE(manager->has_audio_focus());
        CHECK(manager->get_volume() == doctest::Approx(1.f));
        CHECK(manager->get_current_preset().empty());
        CHECK(arbiter->requests() == 0);
    }

    TEST_CASE("factory returning no player fails the play request") {
        sound_player_manager manager(std::make_shared <broken_sound_player_factory>(),
                                     std::make_shared <mock_focus_arbiter>());
        CHECK_THROWS_AS(manager.play_sound("rain"), ambience_error);
        CHECK(manager.get_current_preset().empty());
    }

    TEST_CASE("destruction stops players and gives focus back") {
        auto factory = std::make_shared <mock_sound_player_factory>();
        auto arbiter = std::make_shared <mock_focus_arbiter>();
        {
            sound_player_manager manager(factory, arbiter);
            manager.play_sound("rain");
            REQUIRE(manager.has_audio_focus());
        }
        auto p = factory->latest("rain");
        CHECK(p->get_state() == player_state::stopped);
        CHECK_FALSE(p->has_listener());
        CHECK(arbiter->abandons() >= 1);
    }
}

TEST_SUITE("PlaybackControl::PlaySound") {

    TEST_CASE_FIXTURE(manager_fixture, "first play requests focus and starts the sound") {
        manager->play_sound("rain");

        CHECK(arbiter->requests() == 1);
        CHECK_FALSE(arbiter->last_transient());
        CHECK(manager->has_audio_focus());
        CHECK(player("rain")->play_calls() == 1);
        CHECK(manager->get_state() == manager_state::playing);

        const auto states = events->states();
        REQUIRE(states.size() == 1);
        CHECK(states[0] == manager_state::playing);
    }

    TEST_CASE_FIXTURE(manager_fixture, "second sound only starts itself") {
        manager->play_sound("rain");
        manager->play_sound("wind");

        CHECK(arbiter->requests() == 1);
        CHECK(player("rain")->play_calls() == 1);
        CHECK(player("wind")->play_calls() == 1);
    }

    TEST_CASE_FIXTURE(manager_fixture, "playing a live sound reuses its player") {
        manager->play_sound("rain");
        manager->play_sound("rain");

        CHECK(factory->built("rain") == 1);
        CHECK(player("rain")->play_calls() == 2);
    }

    TEST_CASE_FIXTURE(manager_fixture, "new sound while paused resumes the whole mix") {
        manager->play_sound("rain");
        manager->pause(true);
        REQUIRE(manager->get_state() == manager_state::paused);

        manager->play_sound("wind");

        CHECK(player("rain")->play_calls() == 2);
        CHECK(player("wind")->play_calls() == 1);
        CHECK(player("rain")->get_state() == player_state::playing);
        CHECK(manager->get_state() == manager_state::playing);
    }

    TEST_CASE_FIXTURE(manager_fixture, "refused focus defers playback") {
        arbiter->set_grant(false);
        manager->play_sound("rain");

        CHECK(player("rain")->play_calls() == 0);
        CHECK_FALSE(manager->has_audio_focus());
        CHECK(manager->get_state() == manager_state::stopped);

        // Focus arrives later
        arbiter->send(focus_change::gain);
        CHECK(player("rain")->play_calls() == 1);
        CHECK(manager->get_state() == manager_state::playing);
    }
}

TEST_SUITE("PlaybackControl::StopAndPause") {

    TEST_CASE_FIXTURE(manager_fixture, "stop sound fades out a single sound") {
        manager->play_sound("rain");
        manager->play_sound("wind");

        manager->stop_sound("rain");

        const auto calls = player("rain")->stop_calls();
        REQUIRE(calls.size() == 1);
        CHECK_FALSE(calls[0]);
        CHECK(player("wind")->stop_calls().empty());
        CHECK(manager->get_state() == manager_state::playing);

        player("rain")->complete_fade();
        CHECK(manager->get_current_preset() == sound_player_manager::preset_t{{"wind", 1.f}});
    }

    TEST_CASE_FIXTURE(manager_fixture, "stop sound for an unknown id is a no-op") {
        CHECK_NOTHROW(manager->stop_sound("nothing"));
        CHECK(factory->built_total() == 0);
        CHECK(events->sound_states().empty());
    }

    TEST_CASE_FIXTURE(manager_fixture, "immediate stop empties the registry and abandons focus") {
        manager->play_sound("rain");
        manager->play_sound("wind");

        manager->stop(true);

        CHECK(player("rain")->stop_calls() == std::vector <bool>{true});
        CHECK(player("wind")->stop_calls() == std::vector <bool>{true});
        CHECK(manager->get_state() == manager_state::stopped);
        CHECK(manager->get_current_preset().empty());
        CHECK_FALSE(manager->has_audio_focus());
        CHECK(arbiter->abandons() == 1);
    }

    TEST_CASE_FIXTURE(manager_fixture, "faded stop passes through stopping") {
        manager->play_sound("rain");
        manager->play_sound("wind");

        manager->stop(false);
        CHECK(manager->get_state() == manager_state::stopping);

        player("rain")->complete_fade();
        player("wind")->complete_fade();
        CHECK(manager->get_state() == manager_state::stopped);

        const auto states = events->states();
        REQUIRE(states.size() == 3);
        CHECK(states[1] == manager_state::stopping);
        CHECK(states[2] == manager_state::stopped);
    }

    TEST_CASE_FIXTURE(manager_fixture, "faded pause of two sounds ends paused and abandons focus once") {
        manager->play_sound("rain");
        manager->play_sound("wind");
        events->clear();

        manager->pause(false);
        CHECK(player("rain")->pause_calls() == std::vector <bool>{false});
        CHECK(player("wind")->pause_calls() == std::vector <bool>{false});
        CHECK(manager->get_state() == manager_state::pausing);
        CHECK(arbiter->abandons() == 0);

        player("rain")->complete_fade();
        player("wind")->complete_fade();

        const auto states = events->states();
        REQUIRE_FALSE(states.empty());
        CHECK(states.front() == manager_state::pausing);
        CHECK(states.back() == manager_state::paused);
        CHECK(manager->get_state() == manager_state::paused);
        CHECK(arbiter->abandons() == 1);
        CHECK_FALSE(manager->has_audio_focus());

        // Paused sounds are still part of the mix
        CHECK(manager->get_current_preset().size() == 2);
    }

    TEST_CASE_FIXTURE(manager_fixture, "operations on an empty manager are safe") {
        CHECK_NOTHROW(manager->pause(true));
        CHECK_NOTHROW(manager->stop(false));
        CHECK(manager->get_state() == manager_state::stopped);
        CHECK(events->states().empty());
    }
}

TEST_SUITE("PlaybackControl::Resume") {

    TEST_CASE_FIXTURE(manager_fixture, "resume with focus plays every sound") {
        manager->play_sound("rain");
        manager->play_sound("wind");
        manager->pause(true);
        // pausing gave focus back
        REQUIRE_FALSE(manager->has_audio_focus());

        manager->resume();

        CHECK(arbiter->requests() == 2);
        CHECK(player("rain")->play_calls() == 2);
        CHECK(player("wind")->play_calls() == 2);
        CHECK(manager->get_state() == manager_state::playing);
    }

    TEST_CASE_FIXTURE(manager_fixture, "resume while holding focus does not ask again") {
        manager->play_sound("rain");
        manager->resume();

        CHECK(arbiter->requests() == 1);
        CHECK(player("rain")->play_calls() == 2);
    }

    TEST_CASE_FIXTURE(manager_fixture, "resume without focus waits for it") {
        manager->play_sound("rain");
        manager->pause(true);
        arbiter->set_grant(false);

        manager->resume();
        CHECK(player("rain")->play_calls() == 1);
        CHECK(manager->get_state() == manager_state::paused);

        arbiter->send(focus_change::gain);
        CHECK(player("rain")->play_calls() == 2);
        CHECK(manager->get_state() == manager_state::playing);
    }
}
