// This is copyrighted software. More information is at the end of this file.
#include "ambience/fade_envelope.hh"

namespace ambience {

    void fade_envelope::start_fade_in(std::chrono::milliseconds duration, clock::time_point now) noexcept {
        m_from = gain(now);
        m_duration = duration;
        m_start_time = now;
        m_state = state::fade_in;
        m_idle_gain = 1.f;
    }

    void fade_envelope::start_fade_out(std::chrono::milliseconds duration, clock::time_point now) noexcept {
        m_from = gain(now);
        m_duration = duration;
        m_start_time = now;
        m_state = state::fade_out;
        m_idle_gain = 0.f;
    }

    float fade_envelope::gain(clock::time_point now) const noexcept {
        if (m_state == state::none || is_complete(now)) {
            return m_idle_gain;
        }

        const auto elapsed = std::chrono::duration_cast <std::chrono::milliseconds>(now - m_start_time);
        const float frac = static_cast <float>(elapsed.count()) / static_cast <float>(m_duration.count());
        if (m_state == state::fade_in) {
            return m_from + (1.f - m_from) * frac * frac * frac;
        }
        const float inv = 1.f - frac;
        return m_from * inv * inv * inv;
    }

    bool fade_envelope::is_complete(clock::time_point now) const noexcept {
        if (m_state == state::none) {
            return true;
        }
        return now - m_start_time >= m_duration;
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
