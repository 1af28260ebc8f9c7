// This is copyrighted software. More information is at the end of this file.
/**
 * @file audio_focus_arbiter.hh
 * @brief Arbitration of the exclusive audio output resource
 */
#ifndef AMBIENCE_AUDIO_FOCUS_ARBITER_HH
#define AMBIENCE_AUDIO_FOCUS_ARBITER_HH

#include <memory>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>
#include <ambience/audio_attributes.hh>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @brief Focus transition delivered to a focus client
     */
    enum class focus_change {
        gain,
        loss,
        loss_transient,
        loss_transient_can_duck
    };

    enum class focus_request_result {
        granted,
        failed
    };

    AMBIENCE_EXPORT const char* to_string(focus_change change);

    /**
     * @class audio_focus_client
     * @brief Receives focus transitions from an arbiter
     */
    class AMBIENCE_EXPORT audio_focus_client {
        public:
            virtual ~audio_focus_client() = default;
            virtual void on_focus_change(focus_change change) = 0;
    };

    /**
     * @class audio_focus_arbiter
     * @brief Platform capability deciding which client may produce sound
     *
     * A granted request is not confirmed with a focus_change::gain
     * callback; the return value is the confirmation. Later transitions
     * (losing focus to another client, getting it back) are delivered
     * through audio_focus_client::on_focus_change(), possibly on another
     * thread.
     *
     * Arbiters keep clients only weakly. A client pinned for an ongoing
     * delivery stays alive until the callback returns, even if its owner
     * abandons focus and drops it meanwhile.
     */
    class AMBIENCE_EXPORT audio_focus_arbiter {
        public:
            virtual ~audio_focus_arbiter() = default;

            /**
             * @brief Ask for focus
             * @param client requester, also the receiver of later transitions
             * @param attrs attributes of the requester's playback
             * @param transient true if the requester only needs focus briefly
             */
            virtual focus_request_result request_focus(const std::shared_ptr <audio_focus_client>& client,
                                                       const audio_attributes& attrs,
                                                       bool transient) = 0;

            /**
             * @brief Give focus back
             *
             * Removes the client from arbitration. Does nothing for unknown
             * clients.
             */
            virtual void abandon_focus(const std::shared_ptr <audio_focus_client>& client) = 0;
    };

    /**
     * @class audio_focus_stack
     * @brief In-process arbiter with stack semantics
     *
     * The most recent requester holds focus. When a new client takes focus
     * the previous holder receives:
     * - loss_transient_can_duck if the new request is transient and for
     *   sonification content, which can be played over a lowered mix
     * - loss_transient if the new request is otherwise transient
     * - loss otherwise; the previous holder is then dropped from the stack
     *
     * When the holder abandons focus, the next client on the stack receives
     * focus_change::gain.
     *
     * While the stack is locked (e.g. a call is in progress) every request
     * fails.
     *
     * Callbacks are delivered on the calling thread, after the internal
     * mutex has been released. Clients destroyed without abandoning are
     * skipped and dropped.
     */
    class AMBIENCE_EXPORT audio_focus_stack : public audio_focus_arbiter {
        public:
            audio_focus_stack() = default;
            ~audio_focus_stack() override = default;

            audio_focus_stack(const audio_focus_stack&) = delete;
            audio_focus_stack& operator=(const audio_focus_stack&) = delete;

            focus_request_result request_focus(const std::shared_ptr <audio_focus_client>& client,
                                               const audio_attributes& attrs,
                                               bool transient) override;
            void abandon_focus(const std::shared_ptr <audio_focus_client>& client) override;

            /**
             * @brief Make all requests fail until unlock() is called
             *
             * The current holder loses focus transiently.
             */
            void lock();

            /**
             * @brief Accept requests again and give focus back to the top client
             */
            void unlock();

            [[nodiscard]] std::shared_ptr <audio_focus_client> holder() const;
            [[nodiscard]] std::size_t size() const;

        private:
            struct entry {
                std::weak_ptr <audio_focus_client> client;
                const audio_focus_client* id;
                audio_attributes attrs;
            };

            using notification_t = std::pair <std::shared_ptr <audio_focus_client>, focus_change>;

            // Callers hold m_mutex.
            void drop_expired();
            void notify_top(std::vector <notification_t>& notifications, focus_change change);

            static void deliver(const std::vector <notification_t>& notifications);

            mutable std::mutex m_mutex;
            std::vector <entry> m_stack;
            bool m_locked = false;
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
