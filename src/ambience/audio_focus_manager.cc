// This is copyrighted software. More information is at the end of this file.
#include <mutex>
#include <utility>

#include <ambience/audio_focus_manager.hh>
#include <ambience/error.hh>
#include <failsafe/failsafe.hh>

namespace ambience {

    class default_audio_focus_manager::client final : public audio_focus_client {
        public:
            explicit client(std::shared_ptr <listener> lst)
                : m_listener(std::move(lst)) {
            }

            void on_focus_change(focus_change change) override {
                std::shared_ptr <listener> lst;
                {
                    std::lock_guard <std::mutex> locker(m_mutex);
                    if (!m_listener) {
                        return;
                    }
                    m_has_focus = change == focus_change::gain;
                    lst = m_listener;
                }

                LOG_INFO("audio_focus", "Audio focus change:", to_string(change));
                switch (change) {
                    case focus_change::gain:
                        lst->on_audio_focus_gained();
                        break;
                    case focus_change::loss:
                        lst->on_audio_focus_lost(false);
                        break;
                    case focus_change::loss_transient:
                    case focus_change::loss_transient_can_duck:
                        lst->on_audio_focus_lost(true);
                        break;
                }
            }

            [[nodiscard]] bool has_focus() const {
                std::lock_guard <std::mutex> locker(m_mutex);
                return m_has_focus;
            }

            // Returns the previous value.
            bool set_has_focus(bool held) {
                std::lock_guard <std::mutex> locker(m_mutex);
                return std::exchange(m_has_focus, held);
            }

            void detach() {
                std::lock_guard <std::mutex> locker(m_mutex);
                m_listener.reset();
                m_has_focus = false;
            }

        private:
            mutable std::mutex m_mutex;
            bool m_has_focus = false;
            std::shared_ptr <listener> m_listener;
    };

    default_audio_focus_manager::default_audio_focus_manager(std::shared_ptr <audio_focus_arbiter> arbiter,
                                                             const audio_attributes& attrs,
                                                             std::shared_ptr <listener> lst)
        : m_arbiter(std::move(arbiter)),
          m_attrs(attrs),
          m_listener(std::move(lst)) {
        if (!m_arbiter) {
            LOG_ERROR("audio_focus", "Focus manager created without an arbiter");
            throw ambience_error("audio focus arbiter is null");
        }
        if (!m_listener) {
            LOG_ERROR("audio_focus", "Focus manager created without a listener");
            throw ambience_error("audio focus listener is null");
        }
        m_client = std::make_shared <client>(m_listener);
    }

    default_audio_focus_manager::~default_audio_focus_manager() {
        m_client->detach();
        // Also drops a transiently lost request still waiting on the arbiter.
        m_arbiter->abandon_focus(m_client);
    }

    bool default_audio_focus_manager::has_focus() const {
        return m_client->has_focus();
    }

    void default_audio_focus_manager::request_focus() {
        if (m_client->has_focus()) {
            return;
        }

        if (m_arbiter->request_focus(m_client, m_attrs, false) != focus_request_result::granted) {
            LOG_WARN("audio_focus", "Audio focus request failed");
            return;
        }

        m_client->set_has_focus(true);
        LOG_INFO("audio_focus", "Audio focus granted");
        m_listener->on_audio_focus_gained();
    }

    void default_audio_focus_manager::abandon_focus() {
        if (!m_client->set_has_focus(false)) {
            return;
        }

        LOG_INFO("audio_focus", "Abandoning audio focus");
        m_arbiter->abandon_focus(m_client);
    }

    // ==============================================================================================================

    noop_audio_focus_manager::noop_audio_focus_manager(std::shared_ptr <listener> lst)
        : m_listener(std::move(lst)) {
        if (!m_listener) {
            LOG_ERROR("audio_focus", "Focus manager created without a listener");
            throw ambience_error("audio focus listener is null");
        }
    }

    bool noop_audio_focus_manager::has_focus() const {
        return true;
    }

    void noop_audio_focus_manager::request_focus() {
        m_listener->on_audio_focus_gained();
    }

    void noop_audio_focus_manager::abandon_focus() {
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
