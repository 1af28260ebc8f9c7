// This is copyrighted software. More information is at the end of this file.
#include <cstdint>
#include <mutex>
#include <utility>

#include <ambience/null_sound_player.hh>
#include <failsafe/failsafe.hh>
#include "ambience/callback_dispatcher.hh"
#include "ambience/fade_envelope.hh"

namespace ambience {

    struct null_sound_player::impl final : std::enable_shared_from_this <impl> {
        impl(std::string sound_id, timing t)
            : m_token(callback_dispatcher::next_token()),
              m_sound_id(std::move(sound_id)),
              m_timing(t) {
            m_fade.reset(0.f);
        }

        const int m_token;
        const std::string m_sound_id;
        const timing m_timing;

        mutable std::mutex m_mutex;
        state m_state = state::paused;
        // Bumped on every transition; scheduled completions of older
        // generations are stale.
        std::uint64_t m_generation = 0;
        fade_envelope m_fade;

        float m_volume = 1.f;
        std::chrono::milliseconds m_fade_in_duration{0};
        std::chrono::milliseconds m_fade_out_duration{0};
        bool m_premium_segments_enabled = false;
        std::string m_audio_bitrate = "128k";
        audio_attributes m_audio_attrs = default_audio_attributes;
        state_change_listener_t m_listener;

        // Callers hold m_mutex.
        void transition(state new_state);
        void schedule_completion(std::chrono::milliseconds delay);
        void complete(std::uint64_t generation);

        void play();
        void pause(bool immediate);
        void stop(bool immediate);
    };

    void null_sound_player::impl::transition(state new_state) {
        m_state = new_state;
        ++m_generation;

        switch (new_state) {
            case state::playing:
                m_fade.start_fade_in(m_fade_in_duration);
                break;
            case state::pausing:
            case state::stopping:
                m_fade.start_fade_out(m_fade_out_duration);
                break;
            case state::buffering:
            case state::paused:
            case state::stopped:
                m_fade.reset(0.f);
                break;
        }

        // Notifications go through the dispatcher so that they leave in
        // transition order, whichever thread caused the transition.
        std::weak_ptr <impl> self = weak_from_this();
        callback_dispatcher::instance().post(m_token, std::chrono::milliseconds{0}, [self, new_state] {
            auto p = self.lock();
            if (!p) {
                return;
            }
            state_change_listener_t listener;
            {
                std::lock_guard <std::mutex> locker(p->m_mutex);
                listener = p->m_listener;
            }
            if (listener) {
                listener(new_state);
            }
        });
    }

    void null_sound_player::impl::schedule_completion(std::chrono::milliseconds delay) {
        std::weak_ptr <impl> self = weak_from_this();
        const auto generation = m_generation;
        callback_dispatcher::instance().post(m_token, delay, [self, generation] {
            if (auto p = self.lock()) {
                p->complete(generation);
            }
        });
    }

    void null_sound_player::impl::complete(std::uint64_t generation) {
        std::lock_guard <std::mutex> locker(m_mutex);
        if (generation != m_generation) {
            return;
        }

        switch (m_state) {
            case state::buffering:
                transition(state::playing);
                break;
            case state::pausing:
                transition(state::paused);
                break;
            case state::stopping:
                transition(state::stopped);
                break;
            default:
                break;
        }
    }

    void null_sound_player::impl::play() {
        switch (m_state) {
            case state::paused:
                transition(state::buffering);
                schedule_completion(m_timing.buffering_delay);
                break;
            case state::pausing:
                // Still loaded; fade back in from the current level.
                transition(state::playing);
                break;
            case state::buffering:
            case state::playing:
            case state::stopping:
            case state::stopped:
                break;
        }
    }

    void null_sound_player::impl::pause(bool immediate) {
        switch (m_state) {
            case state::buffering:
                transition(state::paused);
                break;
            case state::playing:
                if (immediate || m_fade_out_duration.count() <= 0) {
                    transition(state::paused);
                } else {
                    transition(state::pausing);
                    schedule_completion(m_fade_out_duration);
                }
                break;
            case state::pausing:
                if (immediate) {
                    transition(state::paused);
                }
                break;
            case state::paused:
            case state::stopping:
            case state::stopped:
                break;
        }
    }

    void null_sound_player::impl::stop(bool immediate) {
        switch (m_state) {
            case state::buffering:
            case state::paused:
                transition(state::stopped);
                break;
            case state::playing:
            case state::pausing:
                if (immediate || m_fade_out_duration.count() <= 0) {
                    transition(state::stopped);
                } else {
                    transition(state::stopping);
                    schedule_completion(m_fade_out_duration);
                }
                break;
            case state::stopping:
                if (immediate) {
                    transition(state::stopped);
                }
                break;
            case state::stopped:
                break;
        }
    }

    // ==============================================================================================================

    null_sound_player::null_sound_player(std::string sound_id, timing t)
        : m_pimpl(std::make_shared <impl>(std::move(sound_id), t)) {
    }

    null_sound_player::~null_sound_player() {
        {
            std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
            m_pimpl->m_listener = nullptr;
        }
        callback_dispatcher::instance().cleanup(m_pimpl->m_token);
    }

    void null_sound_player::play() {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->play();
    }

    void null_sound_player::pause(bool immediate) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->pause(immediate);
    }

    void null_sound_player::stop(bool immediate) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->stop(immediate);
    }

    void null_sound_player::set_volume(float volume) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_volume = volume < 0.f ? 0.f : volume;
    }

    void null_sound_player::set_fade_in_duration(std::chrono::milliseconds duration) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_fade_in_duration = duration;
    }

    void null_sound_player::set_fade_out_duration(std::chrono::milliseconds duration) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_fade_out_duration = duration;
    }

    void null_sound_player::set_premium_segments_enabled(bool enabled) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_premium_segments_enabled = enabled;
    }

    void null_sound_player::set_audio_bitrate(const std::string& bitrate) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        if (bitrate != "128k" && bitrate != "192k" && bitrate != "256k" && bitrate != "320k") {
            LOG_WARN("null_sound_player", m_pimpl->m_sound_id, "got unknown bitrate", bitrate);
        }
        m_pimpl->m_audio_bitrate = bitrate;
    }

    void null_sound_player::set_audio_attributes(const audio_attributes& attrs) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_audio_attrs = attrs;
    }

    void null_sound_player::set_state_change_listener(state_change_listener_t listener) {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        m_pimpl->m_listener = std::move(listener);
    }

    auto null_sound_player::get_state() const -> state {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        return m_pimpl->m_state;
    }

    const std::string& null_sound_player::sound_id() const {
        return m_pimpl->m_sound_id;
    }

    float null_sound_player::volume() const {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        return m_pimpl->m_volume;
    }

    float null_sound_player::output_level() const {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        switch (m_pimpl->m_state) {
            case state::playing:
            case state::pausing:
            case state::stopping:
                return m_pimpl->m_volume * m_pimpl->m_fade.gain();
            default:
                return 0.f;
        }
    }

    std::string null_sound_player::audio_bitrate() const {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        return m_pimpl->m_audio_bitrate;
    }

    bool null_sound_player::premium_segments_enabled() const {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        return m_pimpl->m_premium_segments_enabled;
    }

    audio_attributes null_sound_player::attributes() const {
        std::lock_guard <std::mutex> locker(m_pimpl->m_mutex);
        return m_pimpl->m_audio_attrs;
    }

    // ==============================================================================================================

    null_sound_player_factory::null_sound_player_factory(null_sound_player::timing t)
        : m_timing(t) {
    }

    std::shared_ptr <sound_player> null_sound_player_factory::build_player(const std::string& sound_id) {
        return std::make_shared <null_sound_player>(sound_id, m_timing);
    }
}

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
