// This is copyrighted software. More information is at the end of this file.
/**
 * @file sound_player.hh
 * @brief Per-sound playback capability
 */
#ifndef AMBIENCE_SOUND_PLAYER_HH
#define AMBIENCE_SOUND_PLAYER_HH

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <ambience/audio_attributes.hh>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @class sound_player
     * @brief Plays a single sound and reports its playback state
     *
     * A sound_player is the black box behind one sound id. It owns the
     * decoding and rendering of the sound and exposes a small state machine:
     *
     * @code
     * paused -> buffering -> playing -> pausing -> paused -> buffering ...
     *                               \-> stopping -> stopped
     * @endcode
     *
     * A new player starts in state::paused without loading anything.
     * pausing and stopping are the fade-out phases of pause() and stop().
     * stopped is terminal: a stopped player is never reused.
     *
     * ## Thread Safety
     *
     * - All methods may be called from any thread
     * - get_state() must be safe to call while transitions are in flight
     * - The state change listener may run on the player's own thread, or
     *   synchronously from within play(), pause() or stop()
     * - The owner may release its reference to the player from within the
     *   listener; implementations must keep themselves alive until the
     *   notification returns
     */
    class AMBIENCE_EXPORT sound_player {
        public:
            enum class state {
                stopped,
                buffering,
                playing,
                pausing,
                paused,
                stopping
            };

            using state_change_listener_t = std::function <void(state)>;

            virtual ~sound_player() = default;

            /**
             * @brief Start or resume playback, fading in if configured
             */
            virtual void play() = 0;

            /**
             * @brief Pause playback
             * @param immediate skip the fade-out
             */
            virtual void pause(bool immediate) = 0;

            /**
             * @brief Stop playback; the player ends in state::stopped
             * @param immediate skip the fade-out
             */
            virtual void stop(bool immediate) = 0;

            virtual void set_volume(float volume) = 0;
            virtual void set_fade_in_duration(std::chrono::milliseconds duration) = 0;
            virtual void set_fade_out_duration(std::chrono::milliseconds duration) = 0;
            virtual void set_premium_segments_enabled(bool enabled) = 0;

            /**
             * @brief Select the streaming quality
             * @param bitrate one of "128k", "192k", "256k" or "320k"
             */
            virtual void set_audio_bitrate(const std::string& bitrate) = 0;
            virtual void set_audio_attributes(const audio_attributes& attrs) = 0;

            /**
             * @brief Register the single state change callback
             *
             * Replaces any previously registered callback. Passing an empty
             * function removes it.
             */
            virtual void set_state_change_listener(state_change_listener_t listener) = 0;

            [[nodiscard]] virtual state get_state() const = 0;
    };

    /**
     * @class sound_player_factory
     * @brief Builds players for sound ids
     *
     * Factories are compared by identity: installing the same factory
     * instance twice on a manager is a no-op.
     */
    class AMBIENCE_EXPORT sound_player_factory {
        public:
            virtual ~sound_player_factory() = default;

            /**
             * @brief Create a new player in state::paused
             * @param sound_id sound to play
             */
            virtual std::shared_ptr <sound_player> build_player(const std::string& sound_id) = 0;
    };

    AMBIENCE_EXPORT const char* to_string(sound_player::state s);
    AMBIENCE_EXPORT std::ostream& operator<<(std::ostream& os, sound_player::state s);
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
