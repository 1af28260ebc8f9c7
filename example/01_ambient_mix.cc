/**
 * @example 01_ambient_mix.cc
 * @brief Playing a mix of ambient sounds
 *
 * This example plays a preset on headless null players, pauses and
 * resumes it, and shows how a short announcement from another audio
 * client interrupts the mix and gives it back.
 */

#include <ambience/sound_player_manager.hh>
#include <ambience/null_sound_player.hh>
#include <ambience/audio_focus_arbiter.hh>
#include <ambience/error.hh>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

namespace {
    // Player notifications arrive on a background thread
    std::mutex print_mutex;

    class printing_listener : public ambience::sound_player_manager::listener {
        public:
            void on_state_change(ambience::sound_player_manager::state s) override {
                std::lock_guard <std::mutex> lock(print_mutex);
                std::cout << "[mix] " << s << "\n";
            }

            void on_volume_change(float volume) override {
                std::lock_guard <std::mutex> lock(print_mutex);
                std::cout << "[mix] volume " << volume << "\n";
            }

            void on_sound_state_change(const std::string& sound_id, ambience::sound_player::state s) override {
                std::lock_guard <std::mutex> lock(print_mutex);
                std::cout << "  " << sound_id << ": " << s << "\n";
            }

            void on_sound_volume_change(const std::string& sound_id, float volume) override {
                std::lock_guard <std::mutex> lock(print_mutex);
                std::cout << "  " << sound_id << ": volume " << volume << "\n";
            }
    };

    class announcer : public ambience::audio_focus_client {
        public:
            void on_focus_change(ambience::focus_change change) override {
                std::lock_guard <std::mutex> lock(print_mutex);
                std::cout << "[announcer] " << ambience::to_string(change) << "\n";
            }
    };

    void step(const char* what) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        std::lock_guard <std::mutex> lock(print_mutex);
        std::cout << "\n== " << what << "\n";
    }
}

int main() {
    using namespace std::chrono_literals;

    try {
        auto focus = std::make_shared <ambience::audio_focus_stack>();

        ambience::manager_config config;
        config.fade_in_duration = 200ms;
        config.fade_out_duration = 300ms;
        config.audio_bitrate = "192k";

        ambience::sound_player_manager manager(std::make_shared <ambience::null_sound_player_factory>(),
                                               focus, config);
        manager.set_listener(std::make_shared <printing_listener>());

        step("play preset");
        manager.play_preset({{"rain", 0.6f}, {"thunder", 0.3f}, {"birds", 0.8f}});

        step("lower the global volume");
        manager.set_volume(0.5f);

        step("swap birds for wind");
        manager.play_preset({{"rain", 0.6f}, {"thunder", 0.3f}, {"wind", 0.4f}});

        step("pause");
        manager.pause(false);

        step("resume");
        manager.resume();

        step("announcement takes focus");
        auto voice = std::make_shared <announcer>();
        focus->request_focus(voice, ambience::default_audio_attributes, true);

        step("announcement done");
        focus->abandon_focus(voice);

        step("current preset");
        {
            const auto preset = manager.get_current_preset();
            std::lock_guard <std::mutex> lock(print_mutex);
            for (const auto& [id, volume] : preset) {
                std::cout << "  " << id << " @ " << volume << "\n";
            }
        }

        step("stop");
        manager.stop(false);

        step("done");
    } catch (const ambience::ambience_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
