// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>

namespace ambience {

    /**
     * fade_envelope computes the cubic gain ramp of a fade-in or fade-out.
     * A fade starts from the gain the envelope had when it was started, so
     * reversing a fade half way does not jump.
     */
    class fade_envelope {
        public:
            enum class state { none, fade_in, fade_out };

            using clock = std::chrono::steady_clock;

            void start_fade_in(std::chrono::milliseconds duration, clock::time_point now = clock::now()) noexcept;
            void start_fade_out(std::chrono::milliseconds duration, clock::time_point now = clock::now()) noexcept;

            /**
             * Gain in [0,1] at the given time. 1 when idle after a fade-in,
             * 0 when idle after a fade-out.
             */
            [[nodiscard]] float gain(clock::time_point now = clock::now()) const noexcept;

            [[nodiscard]] bool is_complete(clock::time_point now = clock::now()) const noexcept;

            [[nodiscard]] state get_state() const noexcept { return m_state; }

            void reset(float gain = 1.f) noexcept {
                m_state = state::none;
                m_idle_gain = gain;
            }

        private:
            state m_state = state::none;
            float m_from = 0.f;
            float m_idle_gain = 1.f;
            std::chrono::milliseconds m_duration{0};
            clock::time_point m_start_time;
    };

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
