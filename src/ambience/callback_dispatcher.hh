// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ambience {

    /**
     * callback_dispatcher runs delayed tasks on one background thread, in
     * deadline order. Tasks posted with the same deadline run in posting
     * order. Each task carries the token of its owner so that all pending
     * tasks of an owner can be dropped at once.
     */
    class callback_dispatcher {
        public:
            using task_t = std::function <void()>;

            callback_dispatcher(const callback_dispatcher&) = delete;
            callback_dispatcher& operator=(const callback_dispatcher&) = delete;

            static callback_dispatcher& instance();

            static int next_token();

            void post(int token, std::chrono::milliseconds delay, task_t task);

            /**
             * Drop the pending tasks of token. A task that is already running
             * is not interrupted.
             */
            void cleanup(int token);

            [[nodiscard]] std::size_t pending() const;

        private:
            callback_dispatcher();
            ~callback_dispatcher();

            void run();

            struct entry {
                std::chrono::steady_clock::time_point deadline;
                std::uint64_t seq;
                int token;
                task_t task;
            };

            std::vector <entry> m_queue;
            std::uint64_t m_seq = 0;
            bool m_shutdown = false;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            std::thread m_worker;
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
