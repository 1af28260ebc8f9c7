// This is copyrighted software. More information is at the end of this file.
#include <algorithm>
#include <atomic>
#include <exception>

#include "ambience/callback_dispatcher.hh"
#include <failsafe/failsafe.hh>

namespace ambience {
    callback_dispatcher& callback_dispatcher::instance() {
        static callback_dispatcher inst;
        return inst;
    }

    int callback_dispatcher::next_token() {
        static std::atomic <int> token_generator{0};
        return token_generator++;
    }

    void callback_dispatcher::post(int token, std::chrono::milliseconds delay, task_t task) {
        {
            std::lock_guard <std::mutex> lk(m_mutex);
            entry e{std::chrono::steady_clock::now() + delay, m_seq++, token, std::move(task)};
            // Keep the queue sorted by (deadline, seq).
            auto pos = std::upper_bound(m_queue.begin(), m_queue.end(), e,
                                        [](const entry& a, const entry& b) {
                                            return a.deadline < b.deadline
                                                   || (a.deadline == b.deadline && a.seq < b.seq);
                                        });
            m_queue.insert(pos, std::move(e));
        }
        m_cv.notify_one();
    }

    void callback_dispatcher::cleanup(int token) {
        std::lock_guard <std::mutex> lk(m_mutex);
        m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                     [token](const entry& e) { return e.token == token; }),
                      m_queue.end());
    }

    std::size_t callback_dispatcher::pending() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_queue.size();
    }

    void callback_dispatcher::run() {
        std::unique_lock <std::mutex> lk(m_mutex);
        while (true) {
            if (m_shutdown) {
                return;
            }
            if (m_queue.empty()) {
                m_cv.wait(lk);
                continue;
            }

            const auto deadline = m_queue.front().deadline;
            if (std::chrono::steady_clock::now() < deadline) {
                m_cv.wait_until(lk, deadline);
                continue;
            }

            task_t task = std::move(m_queue.front().task);
            m_queue.erase(m_queue.begin());

            // Run without the lock: tasks post and cancel other tasks.
            lk.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("callback_dispatcher", "Task failed:", e.what());
            }
            lk.lock();
        }
    }

    callback_dispatcher::callback_dispatcher()
        : m_worker([this] { run(); }) {
    }

    callback_dispatcher::~callback_dispatcher() {
        {
            std::lock_guard <std::mutex> lk(m_mutex);
            m_shutdown = true;
            m_queue.clear();
        }
        m_cv.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }
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
