#ifndef AMBIENCE_TEST_FIXTURES_HH
#define AMBIENCE_TEST_FIXTURES_HH

#include <ambience/sound_player_manager.hh>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include "mock_components.hh"

namespace ambience::test {
    // Manager wired to mock players, a mock arbiter and a recording listener
    class manager_fixture {
        protected:
            std::shared_ptr <mock_sound_player_factory> factory;
            std::shared_ptr <mock_focus_arbiter> arbiter;
            std::shared_ptr <recording_listener> events;
            std::unique_ptr <sound_player_manager> manager;

        public:
            explicit manager_fixture(const manager_config& config = manager_config{},
                                     bool auto_transition = true)
                : factory(std::make_shared <mock_sound_player_factory>(auto_transition)),
                  arbiter(std::make_shared <mock_focus_arbiter>()),
                  events(std::make_shared <recording_listener>()),
                  manager(std::make_unique <sound_player_manager>(factory, arbiter, config)) {
                manager->set_listener(events);
            }

            std::shared_ptr <mock_sound_player> player(const std::string& sound_id) const {
                return factory->latest(sound_id);
            }
    };

    // Same as manager_fixture, but players only change state when the test
    // reports it
    class manual_manager_fixture : public manager_fixture {
        public:
            manual_manager_fixture()
                : manager_fixture(manager_config{}, false) {
            }
    };

    // Poll until pred holds or the timeout expires
    inline bool wait_for(const std::function <bool()>& pred,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }
}

#endif // AMBIENCE_TEST_FIXTURES_HH
