// This is copyrighted software. More information is at the end of this file.
#include <algorithm>
#include <iterator>

#include <ambience/audio_focus_arbiter.hh>
#include <failsafe/failsafe.hh>

namespace ambience {

    const char* to_string(focus_change change) {
        switch (change) {
            case focus_change::gain:
                return "gain";
            case focus_change::loss:
                return "loss";
            case focus_change::loss_transient:
                return "loss_transient";
            case focus_change::loss_transient_can_duck:
                return "loss_transient_can_duck";
        }
        return "unknown";
    }

    focus_request_result audio_focus_stack::request_focus(const std::shared_ptr <audio_focus_client>& client,
                                                          const audio_attributes& attrs,
                                                          bool transient) {
        std::vector <notification_t> notifications;
        {
            std::lock_guard <std::mutex> locker(m_mutex);

            if (!client) {
                return focus_request_result::failed;
            }
            if (m_locked) {
                LOG_INFO("audio_focus", "Focus request refused, stack is locked");
                return focus_request_result::failed;
            }

            drop_expired();
            if (!m_stack.empty() && m_stack.back().id == client.get()) {
                m_stack.back().attrs = attrs;
                return focus_request_result::granted;
            }

            m_stack.erase(std::remove_if(m_stack.begin(), m_stack.end(),
                                         [&client](const entry& e) { return e.id == client.get(); }),
                          m_stack.end());

            if (!m_stack.empty()) {
                if (!transient) {
                    notify_top(notifications, focus_change::loss);
                    m_stack.pop_back();
                } else if (attrs.content_type == audio_content_type::sonification) {
                    notify_top(notifications, focus_change::loss_transient_can_duck);
                } else {
                    notify_top(notifications, focus_change::loss_transient);
                }
            }

            m_stack.push_back(entry{client, client.get(), attrs});
        }

        deliver(notifications);
        return focus_request_result::granted;
    }

    void audio_focus_stack::abandon_focus(const std::shared_ptr <audio_focus_client>& client) {
        std::vector <notification_t> notifications;
        {
            std::lock_guard <std::mutex> locker(m_mutex);

            auto it = std::find_if(m_stack.begin(), m_stack.end(),
                                   [&client](const entry& e) { return e.id == client.get(); });
            if (it == m_stack.end()) {
                return;
            }

            const bool was_holder = std::next(it) == m_stack.end();
            m_stack.erase(it);
            drop_expired();

            if (was_holder && !m_stack.empty() && !m_locked) {
                notify_top(notifications, focus_change::gain);
            }
        }

        deliver(notifications);
    }

    void audio_focus_stack::lock() {
        std::vector <notification_t> notifications;
        {
            std::lock_guard <std::mutex> locker(m_mutex);
            if (m_locked) {
                return;
            }

            m_locked = true;
            drop_expired();
            if (!m_stack.empty()) {
                notify_top(notifications, focus_change::loss_transient);
            }
        }

        LOG_INFO("audio_focus", "Focus stack locked");
        deliver(notifications);
    }

    void audio_focus_stack::unlock() {
        std::vector <notification_t> notifications;
        {
            std::lock_guard <std::mutex> locker(m_mutex);
            if (!m_locked) {
                return;
            }

            m_locked = false;
            drop_expired();
            if (!m_stack.empty()) {
                notify_top(notifications, focus_change::gain);
            }
        }

        LOG_INFO("audio_focus", "Focus stack unlocked");
        deliver(notifications);
    }

    std::shared_ptr <audio_focus_client> audio_focus_stack::holder() const {
        std::lock_guard <std::mutex> locker(m_mutex);
        if (m_locked || m_stack.empty()) {
            return nullptr;
        }
        return m_stack.back().client.lock();
    }

    std::size_t audio_focus_stack::size() const {
        std::lock_guard <std::mutex> locker(m_mutex);
        return m_stack.size();
    }

    void audio_focus_stack::drop_expired() {
        const auto before = m_stack.size();
        m_stack.erase(std::remove_if(m_stack.begin(), m_stack.end(),
                                     [](const entry& e) { return e.client.expired(); }),
                      m_stack.end());
        if (m_stack.size() != before) {
            LOG_WARN("audio_focus", "Dropped", before - m_stack.size(), "clients destroyed without abandoning focus");
        }
    }

    void audio_focus_stack::notify_top(std::vector <notification_t>& notifications, focus_change change) {
        // Pinned here; the owner may drop the client before delivery.
        if (auto client = m_stack.back().client.lock()) {
            notifications.emplace_back(std::move(client), change);
        }
    }

    void audio_focus_stack::deliver(const std::vector <notification_t>& notifications) {
        for (const auto& [client, change] : notifications) {
            LOG_DEBUG("audio_focus", "Delivering", to_string(change));
            client->on_focus_change(change);
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
