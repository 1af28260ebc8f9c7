// This is copyrighted software. More information is at the end of this file.
/**
 * @file sound_player_manager.hh
 * @brief Coordinates the players of all sounds of a mix
 */
#ifndef AMBIENCE_SOUND_PLAYER_MANAGER_HH
#define AMBIENCE_SOUND_PLAYER_MANAGER_HH

#include <chrono>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <ambience/audio_attributes.hh>
#include <ambience/audio_focus_arbiter.hh>
#include <ambience/audio_focus_manager.hh>
#include <ambience/sound_player.hh>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @struct manager_config
     * @brief Initial settings of a sound_player_manager
     */
    struct manager_config {
        std::chrono::milliseconds fade_in_duration{0};
        std::chrono::milliseconds fade_out_duration{0};
        bool premium_segments_enabled = false;
        std::string audio_bitrate = "128k";
        audio_attributes attributes = default_audio_attributes;
        float volume = 1.f;
        bool audio_focus_management = true;
    };

    /**
     * @class sound_player_manager
     * @brief Owns the players of all sounds and derives one playback state
     *
     * The manager creates a sound_player per sound id on demand, applies the
     * manager-wide settings to it, and drops it once it reports
     * sound_player::state::stopped. From the states of all live players it
     * derives an aggregate state (see reconcile_state()), and it pauses and
     * resumes playback as audio focus is lost and regained.
     *
     * ## Basic Usage
     *
     * @code
     * auto arbiter = std::make_shared<ambience::audio_focus_stack>();
     * auto factory = std::make_shared<ambience::null_sound_player_factory>();
     * ambience::sound_player_manager manager(factory, arbiter);
     * manager.set_listener(my_listener);
     *
     * manager.set_fade_in_duration(std::chrono::seconds(1));
     * manager.play_preset({{"rain", 0.5f}, {"thunder", 1.f}});
     * // ...
     * manager.pause(false);
     * manager.resume();
     * manager.stop(false);
     * @endcode
     *
     * ## Thread Safety
     *
     * All methods are thread-safe. Player and focus notifications may arrive
     * on any thread; they are serialized with caller operations by a single
     * recursive mutex. Listener callbacks run synchronously, with that mutex
     * held, on the thread that triggered them.
     */
    class AMBIENCE_EXPORT sound_player_manager {
        public:
            /**
             * @brief Aggregate playback state
             *
             * stopped is the initial state. pausing and stopping are held
             * while all sounds fade out.
             */
            enum class state {
                playing,
                pausing,
                paused,
                stopping,
                stopped
            };

            using preset_t = std::map <std::string, float>;

            /**
             * @brief Observer of aggregate and per-sound changes
             */
            class listener {
                public:
                    virtual ~listener() = default;

                    /// Aggregate state changed
                    virtual void on_state_change(state s) = 0;

                    /// Global volume was set
                    virtual void on_volume_change(float volume) = 0;

                    virtual void on_sound_state_change(const std::string& sound_id, sound_player::state s) = 0;
                    virtual void on_sound_volume_change(const std::string& sound_id, float volume) = 0;
            };

            /**
             * @param factory builds the players
             * @param arbiter focus arbiter used while focus management is enabled;
             *        may be null only if config.audio_focus_management is false
             * @param config initial settings
             *
             * @throws ambience_error if factory is null, or arbiter is null while
             *         focus management is enabled
             */
            sound_player_manager(std::shared_ptr <sound_player_factory> factory,
                                 std::shared_ptr <audio_focus_arbiter> arbiter,
                                 const manager_config& config = manager_config{});
            ~sound_player_manager();

            sound_player_manager(const sound_player_manager&) = delete;
            sound_player_manager& operator=(const sound_player_manager&) = delete;

            void set_listener(std::shared_ptr <listener> lst);

            void set_fade_in_duration(std::chrono::milliseconds duration);
            void set_fade_out_duration(std::chrono::milliseconds duration);
            void set_premium_segments_enabled(bool enabled);

            /**
             * @brief Set the streaming bitrate of all current and future players
             * @param bitrate "128k", "192k", "256k" or "320k"
             */
            void set_audio_bitrate(const std::string& bitrate);

            /**
             * @brief Set the attributes of all current and future players
             *
             * With focus management enabled the focus manager is recreated for
             * the new attributes; focus that was held is requested again.
             */
            void set_audio_attributes(const audio_attributes& attrs);

            /**
             * @brief Switch between arbiter-backed and no-op focus management
             *
             * Playback is paused while switching and resumed afterwards if the
             * manager was playing.
             */
            void set_audio_focus_management_enabled(bool enabled);

            /**
             * @brief Replace the player factory and recreate all players
             *
             * Paused sounds come back paused, all others are played again.
             * Does nothing if factory is the installed one.
             *
             * @throws ambience_error if factory is null
             */
            void set_sound_player_factory(std::shared_ptr <sound_player_factory> factory);

            /**
             * @brief Set the multiplier applied to the volume of every sound
             * @throws invalid_volume_error if volume is not in [0, 1]
             */
            void set_volume(float volume);

            /**
             * @brief Set the volume of one sound
             *
             * The volume is remembered even if the sound is not playing.
             *
             * @throws invalid_volume_error if volume is not in [0, 1]
             */
            void set_sound_volume(const std::string& sound_id, float volume);

            [[nodiscard]] float get_volume() const;

            /**
             * @return remembered volume of the sound, 1 if never set
             */
            [[nodiscard]] float get_sound_volume(const std::string& sound_id) const;

            /**
             * @brief Play a sound
             *
             * If focus is not held, or the manager is pausing or paused, all
             * sounds are resumed together with this one.
             */
            void play_sound(const std::string& sound_id);

            /**
             * @brief Stop a sound with a fade-out; unknown ids are ignored
             */
            void stop_sound(const std::string& sound_id);

            void stop(bool immediate);
            void pause(bool immediate);

            /**
             * @brief Play all sounds, requesting focus first if needed
             */
            void resume();

            /**
             * @brief Make the given mix the current one
             *
             * Sounds not in the preset are stopped, sounds in it get their
             * volume and are played if not already playing.
             *
             * @throws invalid_volume_error if any volume is not in [0, 1];
             *         nothing is changed in that case
             */
            void play_preset(const preset_t& preset);

            /**
             * @return ids and volumes of all sounds that are neither stopping nor stopped
             */
            [[nodiscard]] preset_t get_current_preset() const;

            [[nodiscard]] state get_state() const;
            [[nodiscard]] bool has_audio_focus() const;

            /**
             * @brief Focus came back; resumes playback a transient loss interrupted
             *
             * The focus manager calls this. It is public for hosts that learn
             * about focus by other means.
             */
            void on_audio_focus_gained();

            /**
             * @brief Focus was lost; pauses playback immediately
             * @param transient true if playback should resume on the next gain
             */
            void on_audio_focus_lost(bool transient);

        private:
            struct impl;
            std::shared_ptr <impl> m_pimpl;
    };

    /**
     * @brief Derive the aggregate state from the states of all live players
     *
     * Rules, first match wins:
     * 1. no players: stopped
     * 2. all stopping: stopping
     * 3. all paused: paused
     * 4. all pausing or stopping: pausing
     * 5. anything else: playing
     */
    AMBIENCE_EXPORT sound_player_manager::state reconcile_state(const std::vector <sound_player::state>& states);

    AMBIENCE_EXPORT const char* to_string(sound_player_manager::state s);
    AMBIENCE_EXPORT std::ostream& operator<<(std::ostream& os, sound_player_manager::state s);
}

#endif

/*
 * Copyright (C) 2025
 *
 * This file is part of ambience.
 *
 * ambience is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * ambience is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with ambience.  If not, see <http://www.gnu.org/licenses/>.
 */
