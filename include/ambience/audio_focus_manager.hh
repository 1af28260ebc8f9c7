// This is copyrighted software. More information is at the end of this file.
/**
 * @file audio_focus_manager.hh
 * @brief Audio focus capability used by sound_player_manager
 */
#ifndef AMBIENCE_AUDIO_FOCUS_MANAGER_HH
#define AMBIENCE_AUDIO_FOCUS_MANAGER_HH

#include <memory>
#include <ambience/audio_attributes.hh>
#include <ambience/audio_focus_arbiter.hh>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @class audio_focus_manager
     * @brief Requests, abandons and tracks audio focus for one client
     *
     * Two implementations exist:
     * - default_audio_focus_manager negotiates with an audio_focus_arbiter
     * - noop_audio_focus_manager always reports focus as held, used when
     *   focus management is disabled
     */
    class AMBIENCE_EXPORT audio_focus_manager {
        public:
            /**
             * @brief Receiver of focus gain and loss
             */
            class listener {
                public:
                    virtual ~listener() = default;

                    virtual void on_audio_focus_gained() = 0;

                    /**
                     * @param transient true if focus is expected to come back
                     */
                    virtual void on_audio_focus_lost(bool transient) = 0;
            };

            virtual ~audio_focus_manager() = default;

            [[nodiscard]] virtual bool has_focus() const = 0;

            /**
             * @brief Request focus; on_audio_focus_gained() fires once it is held
             */
            virtual void request_focus() = 0;

            virtual void abandon_focus() = 0;
    };

    /**
     * @class default_audio_focus_manager
     * @brief Focus manager backed by an audio_focus_arbiter
     *
     * request_focus() does nothing while focus is held. A granted request
     * notifies the listener synchronously; transitions coming from the
     * arbiter are forwarded as they arrive. Any transient loss, ducking
     * included, is reported as transient.
     *
     * The arbiter sees a separate client object shared with it. The
     * destructor detaches that client, so a transition still being
     * delivered afterwards reaches no listener, and abandons focus.
     */
    class AMBIENCE_EXPORT default_audio_focus_manager : public audio_focus_manager {
        public:
            /**
             * @throws ambience_error if arbiter or lst is null
             */
            default_audio_focus_manager(std::shared_ptr <audio_focus_arbiter> arbiter,
                                        const audio_attributes& attrs,
                                        std::shared_ptr <listener> lst);
            ~default_audio_focus_manager() override;

            default_audio_focus_manager(const default_audio_focus_manager&) = delete;
            default_audio_focus_manager& operator=(const default_audio_focus_manager&) = delete;

            [[nodiscard]] bool has_focus() const override;
            void request_focus() override;
            void abandon_focus() override;

        private:
            class client;

            std::shared_ptr <audio_focus_arbiter> m_arbiter;
            audio_attributes m_attrs;
            std::shared_ptr <listener> m_listener;
            std::shared_ptr <client> m_client;
    };

    /**
     * @class noop_audio_focus_manager
     * @brief Focus manager that never competes for focus
     */
    class AMBIENCE_EXPORT noop_audio_focus_manager : public audio_focus_manager {
        public:
            explicit noop_audio_focus_manager(std::shared_ptr <listener> lst);

            [[nodiscard]] bool has_focus() const override;
            void request_focus() override;
            void abandon_focus() override;

        private:
            std::shared_ptr <listener> m_listener;
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
