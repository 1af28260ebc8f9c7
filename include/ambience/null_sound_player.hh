// This is copyrighted software. More information is at the end of this file.
/**
 * @file null_sound_player.hh
 * @brief Headless sound player
 */
#ifndef AMBIENCE_NULL_SOUND_PLAYER_HH
#define AMBIENCE_NULL_SOUND_PLAYER_HH

#include <chrono>
#include <memory>
#include <string>
#include <ambience/sound_player.hh>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @class null_sound_player
     * @brief Sound player that renders nothing but keeps real timing
     *
     * The null player runs the complete sound_player state machine for
     * headless environments, examples and tests. Buffering takes
     * timing::buffering_delay, fade-outs take the configured fade-out
     * duration, and the output level follows a cubic fade envelope.
     *
     * State changes are reported on a shared background thread, in the
     * order they happen. Destroying the player cancels its pending
     * transitions and notifications.
     */
    class AMBIENCE_EXPORT null_sound_player : public sound_player {
        public:
            struct timing {
                std::chrono::milliseconds buffering_delay{100};
            };

            null_sound_player(std::string sound_id, timing t);
            ~null_sound_player() override;

            null_sound_player(const null_sound_player&) = delete;
            null_sound_player& operator=(const null_sound_player&) = delete;

            void play() override;
            void pause(bool immediate) override;
            void stop(bool immediate) override;

            void set_volume(float volume) override;
            void set_fade_in_duration(std::chrono::milliseconds duration) override;
            void set_fade_out_duration(std::chrono::milliseconds duration) override;
            void set_premium_segments_enabled(bool enabled) override;
            void set_audio_bitrate(const std::string& bitrate) override;
            void set_audio_attributes(const audio_attributes& attrs) override;
            void set_state_change_listener(state_change_listener_t listener) override;

            [[nodiscard]] state get_state() const override;

            [[nodiscard]] const std::string& sound_id() const;
            [[nodiscard]] float volume() const;

            /**
             * @brief Level the sound would be rendered at right now
             * @return volume times the fade gain; 0 unless playing, pausing or stopping
             */
            [[nodiscard]] float output_level() const;

            [[nodiscard]] std::string audio_bitrate() const;
            [[nodiscard]] bool premium_segments_enabled() const;
            [[nodiscard]] audio_attributes attributes() const;

        private:
            struct impl;
            std::shared_ptr <impl> m_pimpl;
    };

    /**
     * @class null_sound_player_factory
     * @brief Builds null_sound_player instances sharing one timing
     */
    class AMBIENCE_EXPORT null_sound_player_factory : public sound_player_factory {
        public:
            explicit null_sound_player_factory(null_sound_player::timing t = null_sound_player::timing{});

            std::shared_ptr <sound_player> build_player(const std::string& sound_id) override;

        private:
            null_sound_player::timing m_timing;
    };
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
