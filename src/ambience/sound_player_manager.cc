// This is copyrighted software. More information is at the end of this file.
#include <algorithm>
#include <mutex>
#include <set>
#include <utility>

#include <ambience/sound_player_manager.hh>
#include <ambience/error.hh>
#include <failsafe/failsafe.hh>

namespace ambience {

    namespace {
        void validate_volume(float volume) {
            if (!(volume >= 0.f && volume <= 1.f)) {
                LOG_WARN("sound_player_manager", "Rejected volume", volume);
                throw invalid_volume_error("volume must be in range [0, 1]");
            }
        }

        bool is_stopping_or_stopped(sound_player::state s) {
            return s == sound_player::state::stopping || s == sound_player::state::stopped;
        }
    }

    struct sound_player_manager::impl final {
        impl(std::shared_ptr <sound_player_factory> factory,
             std::shared_ptr <audio_focus_arbiter> arbiter,
             const manager_config& config);

        using player_list_t = std::vector <std::pair <std::string, std::shared_ptr <sound_player>>>;

        std::shared_ptr <sound_player_factory> m_factory;
        std::shared_ptr <audio_focus_arbiter> m_arbiter;

        std::chrono::milliseconds m_fade_in_duration;
        std::chrono::milliseconds m_fade_out_duration;
        bool m_premium_segments_enabled;
        std::string m_audio_bitrate;
        audio_attributes m_audio_attrs;
        float m_volume;
        bool m_focus_management;

        std::shared_ptr <listener> m_listener;
        std::unique_ptr <audio_focus_manager> m_focus_manager;
        bool m_resume_on_focus_gain = false;

        std::map <std::string, std::shared_ptr <sound_player>> m_players;
        std::map <std::string, float> m_sound_volumes;
        state m_state = state::stopped;
        bool m_closed = false;

        // Recursive: players and focus managers may call back synchronously.
        mutable std::recursive_mutex m_mutex;

        std::weak_ptr <impl> m_self;

        class manager_lock final {
            std::lock_guard <std::recursive_mutex> m_lock;

            public:
                explicit manager_lock(const impl* p)
                    : m_lock(p->m_mutex) {
                }
        };

        // Focus events may still be in flight on another thread while the
        // manager goes away; they only reach a live impl.
        class focus_listener final : public audio_focus_manager::listener {
            std::weak_ptr <impl> m_impl;

            public:
                explicit focus_listener(std::weak_ptr <impl> p)
                    : m_impl(std::move(p)) {
                }

                void on_audio_focus_gained() override {
                    if (auto p = m_impl.lock()) {
                        p->on_focus_gained();
                    }
                }

                void on_audio_focus_lost(bool transient) override {
                    if (auto p = m_impl.lock()) {
                        p->on_focus_lost(transient);
                    }
                }
        };

        std::unique_ptr <audio_focus_manager> make_focus_manager();
        void replace_focus_manager(bool request_focus);

        // Broadcasts run on a copy: players may report stopped, and get
        // erased, from within the call.
        [[nodiscard]] player_list_t snapshot() const {
            return player_list_t(m_players.begin(), m_players.end());
        }

        [[nodiscard]] float sound_volume(const std::string& sound_id) const {
            auto it = m_sound_volumes.find(sound_id);
            return it == m_sound_volumes.end() ? 1.f : it->second;
        }

        void init_player(const std::string& sound_id);
        void on_player_state_change(const std::string& sound_id, const sound_player* reporter,
                                    sound_player::state player_state);
        void reconcile();
        void set_state(state new_state);

        void pause(bool immediate);
        void resume();
        void on_focus_gained();
        void on_focus_lost(bool transient);
    };

    // ==============================================================================================================

    sound_player_manager::impl::impl(std::shared_ptr <sound_player_factory> factory,
                                     std::shared_ptr <audio_focus_arbiter> arbiter,
                                     const manager_config& config)
        : m_factory(std::move(factory)),
          m_arbiter(std::move(arbiter)),
          m_fade_in_duration(config.fade_in_duration),
          m_fade_out_duration(config.fade_out_duration),
          m_premium_segments_enabled(config.premium_segments_enabled),
          m_audio_bitrate(config.audio_bitrate),
          m_audio_attrs(config.attributes),
          m_volume(config.volume),
          m_focus_management(config.audio_focus_management) {
    }

    std::unique_ptr <audio_focus_manager> sound_player_manager::impl::make_focus_manager() {
        auto lst = std::make_shared <focus_listener>(m_self);
        if (m_focus_management) {
            return std::make_unique <default_audio_focus_manager>(m_arbiter, m_audio_attrs, std::move(lst));
        }
        return std::make_unique <noop_audio_focus_manager>(std::move(lst));
    }

    void sound_player_manager::impl::replace_focus_manager(bool request_focus) {
        // The old manager gives up its focus before the new one may ask for it.
        if (m_focus_manager) {
            m_focus_manager->abandon_focus();
            m_focus_manager.reset();
        }
        m_focus_manager = make_focus_manager();
        if (request_focus) {
            m_focus_manager->request_focus();
        }
    }

    void sound_player_manager::impl::init_player(const std::string& sound_id) {
        auto it = m_players.find(sound_id);
        if (it != m_players.end() && it->second->get_state() != sound_player::state::stopped) {
            return;
        }

        auto player = m_factory->build_player(sound_id);
        if (!player) {
            LOG_ERROR("sound_player_manager", "Factory returned no player for", sound_id);
            throw ambience_error("sound player factory returned no player for " + sound_id);
        }

        player->set_fade_in_duration(m_fade_in_duration);
        player->set_fade_out_duration(m_fade_out_duration);
        player->set_premium_segments_enabled(m_premium_segments_enabled);
        player->set_audio_bitrate(m_audio_bitrate);
        player->set_audio_attributes(m_audio_attrs);
        player->set_volume(m_volume * sound_volume(sound_id));

        std::weak_ptr <impl> self = m_self;
        const sound_player* reporter = player.get();
        player->set_state_change_listener([self, sound_id, reporter](sound_player::state s) {
            if (auto p = self.lock()) {
                p->on_player_state_change(sound_id, reporter, s);
            }
        });

        m_players[sound_id] = std::move(player);
    }

    void sound_player_manager::impl::on_player_state_change(const std::string& sound_id,
                                                            const sound_player* reporter,
                                                            sound_player::state player_state) {
        manager_lock lock(this);

        auto it = m_players.find(sound_id);
        if (it == m_players.end() || it->second.get() != reporter) {
            // A discarded player still finishing its stop.
            return;
        }

        LOG_DEBUG("sound_player_manager", sound_id, "->", to_string(player_state));

        if (player_state == sound_player::state::stopped) {
            m_players.erase(it);
        }

        reconcile();
        if (m_state == state::paused || m_state == state::stopped) {
            m_focus_manager->abandon_focus();
        }

        if (m_listener) {
            m_listener->on_sound_state_change(sound_id, player_state);
        }
    }

    void sound_player_manager::impl::reconcile() {
        std::vector <sound_player::state> states;
        states.reserve(m_players.size());
        for (const auto& [id, player] : m_players) {
            const auto s = player->get_state();
            // Already stopped, only its notification is still on the way.
            if (s != sound_player::state::stopped) {
                states.push_back(s);
            }
        }
        set_state(reconcile_state(states));
    }

    void sound_player_manager::impl::set_state(state new_state) {
        if (new_state == m_state) {
            return;
        }

        m_state = new_state;
        if (m_listener) {
            m_listener->on_state_change(new_state);
        }
    }

    void sound_player_manager::impl::pause(bool immediate) {
        for (auto& [id, player] : snapshot()) {
            player->pause(immediate);
        }
    }

    void sound_player_manager::impl::resume() {
        if (m_focus_manager->has_focus()) {
            for (auto& [id, player] : snapshot()) {
                player->play();
            }
        } else {
            m_resume_on_focus_gain = true;
            m_focus_manager->request_focus();
        }
    }

    void sound_player_manager::impl::on_focus_gained() {
        manager_lock lock(this);
        if (m_closed) {
            return;
        }

        if (m_resume_on_focus_gain) {
            LOG_INFO("sound_player_manager", "Audio focus gained, resuming playback");
            m_resume_on_focus_gain = false;
            resume();
        }
    }

    void sound_player_manager::impl::on_focus_lost(bool transient) {
        manager_lock lock(this);
        if (m_closed) {
            return;
        }

        if (m_state == state::paused || m_state == state::stopped) {
            return;
        }

        LOG_INFO("sound_player_manager", "Audio focus lost", transient ? "(transient)" : "(permanent)",
                 ", pausing playback");
        pause(true);
        m_resume_on_focus_gain = transient;
    }

    // ==============================================================================================================

    sound_player_manager::sound_player_manager(std::shared_ptr <sound_player_factory> factory,
                                               std::shared_ptr <audio_focus_arbiter> arbiter,
                                               const manager_config& config) {
        if (!factory) {
            LOG_ERROR("sound_player_manager", "Cannot create manager without a player factory");
            throw ambience_error("sound player factory is null");
        }
        if (!arbiter && config.audio_focus_management) {
            LOG_ERROR("sound_player_manager", "Cannot manage audio focus without an arbiter");
            throw ambience_error("audio focus arbiter is null but focus management is enabled");
        }
        validate_volume(config.volume);

        m_pimpl = std::make_shared <impl>(std::move(factory), std::move(arbiter), config);
        m_pimpl->m_self = m_pimpl;
        m_pimpl->m_focus_manager = m_pimpl->make_focus_manager();
    }

    sound_player_manager::~sound_player_manager() {
        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->m_closed = true;

        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_state_change_listener(nullptr);
            player->stop(true);
        }
        m_pimpl->m_players.clear();
        m_pimpl->m_listener.reset();

        if (m_pimpl->m_focus_manager) {
            m_pimpl->m_focus_manager->abandon_focus();
            m_pimpl->m_focus_manager.reset();
        }
    }

    void sound_player_manager::set_listener(std::shared_ptr <listener> lst) {
        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->m_listener = std::move(lst);
    }

    void sound_player_manager::set_fade_in_duration(std::chrono::milliseconds duration) {
        impl::manager_lock lock(m_pimpl.get());
        if (duration == m_pimpl->m_fade_in_duration) {
            return;
        }

        m_pimpl->m_fade_in_duration = duration;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_fade_in_duration(duration);
        }
    }

    void sound_player_manager::set_fade_out_duration(std::chrono::milliseconds duration) {
        impl::manager_lock lock(m_pimpl.get());
        if (duration == m_pimpl->m_fade_out_duration) {
            return;
        }

        m_pimpl->m_fade_out_duration = duration;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_fade_out_duration(duration);
        }
    }

    void sound_player_manager::set_premium_segments_enabled(bool enabled) {
        impl::manager_lock lock(m_pimpl.get());
        if (enabled == m_pimpl->m_premium_segments_enabled) {
            return;
        }

        m_pimpl->m_premium_segments_enabled = enabled;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_premium_segments_enabled(enabled);
        }
    }

    void sound_player_manager::set_audio_bitrate(const std::string& bitrate) {
        impl::manager_lock lock(m_pimpl.get());
        if (bitrate == m_pimpl->m_audio_bitrate) {
            return;
        }

        m_pimpl->m_audio_bitrate = bitrate;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_audio_bitrate(bitrate);
        }
    }

    void sound_player_manager::set_audio_attributes(const audio_attributes& attrs) {
        impl::manager_lock lock(m_pimpl.get());
        if (attrs == m_pimpl->m_audio_attrs) {
            return;
        }

        m_pimpl->m_audio_attrs = attrs;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_audio_attributes(attrs);
        }

        if (m_pimpl->m_focus_management) {
            LOG_INFO("sound_player_manager", "Audio attributes changed, recreating focus manager");
            m_pimpl->replace_focus_manager(m_pimpl->m_focus_manager->has_focus());
        }
    }

    void sound_player_manager::set_audio_focus_management_enabled(bool enabled) {
        impl::manager_lock lock(m_pimpl.get());
        if (enabled == m_pimpl->m_focus_management) {
            return;
        }

        if (enabled && !m_pimpl->m_arbiter) {
            LOG_ERROR("sound_player_manager", "Cannot manage audio focus without an arbiter");
            throw ambience_error("cannot enable audio focus management without an arbiter");
        }

        LOG_INFO("sound_player_manager", "Audio focus management", enabled ? "enabled" : "disabled");

        const bool was_playing = m_pimpl->m_state == state::playing;
        pause(true);

        m_pimpl->m_focus_management = enabled;
        m_pimpl->replace_focus_manager(false);

        if (was_playing) {
            resume();
        }
    }

    void sound_player_manager::set_sound_player_factory(std::shared_ptr <sound_player_factory> factory) {
        if (!factory) {
            LOG_ERROR("sound_player_manager", "Rejected null player factory");
            throw ambience_error("sound player factory is null");
        }

        impl::manager_lock lock(m_pimpl.get());
        if (factory == m_pimpl->m_factory) {
            return;
        }

        m_pimpl->m_factory = std::move(factory);

        std::vector <std::string> sound_ids;
        std::set <std::string> paused_sound_ids;
        for (const auto& [id, player] : m_pimpl->m_players) {
            const auto player_state = player->get_state();
            if (is_stopping_or_stopped(player_state)) {
                continue;
            }
            sound_ids.push_back(id);
            if (player_state == sound_player::state::pausing || player_state == sound_player::state::paused) {
                paused_sound_ids.insert(id);
            }
        }

        LOG_INFO("sound_player_manager", "Switching player factory,", sound_ids.size(), "sounds to recreate,",
                 paused_sound_ids.size(), "of them paused");

        // Old players are detached first so their stop does not touch the
        // aggregate state or audio focus.
        auto old_players = m_pimpl->snapshot();
        m_pimpl->m_players.clear();
        for (auto& [id, player] : old_players) {
            player->set_state_change_listener(nullptr);
            player->stop(true);
        }

        for (const auto& sound_id : sound_ids) {
            if (paused_sound_ids.count(sound_id) != 0) {
                m_pimpl->init_player(sound_id);
                if (m_pimpl->m_listener) {
                    m_pimpl->m_listener->on_sound_state_change(sound_id,
                                                               m_pimpl->m_players.at(sound_id)->get_state());
                }
            } else {
                play_sound(sound_id);
            }
        }

        m_pimpl->reconcile();
    }

    void sound_player_manager::set_volume(float volume) {
        validate_volume(volume);

        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->m_volume = volume;
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->set_volume(volume * m_pimpl->sound_volume(id));
        }

        if (m_pimpl->m_listener) {
            m_pimpl->m_listener->on_volume_change(volume);
        }
    }

    void sound_player_manager::set_sound_volume(const std::string& sound_id, float volume) {
        validate_volume(volume);

        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->m_sound_volumes[sound_id] = volume;

        auto it = m_pimpl->m_players.find(sound_id);
        if (it != m_pimpl->m_players.end()) {
            it->second->set_volume(m_pimpl->m_volume * volume);
        }

        if (m_pimpl->m_listener) {
            m_pimpl->m_listener->on_sound_volume_change(sound_id, volume);
        }
    }

    float sound_player_manager::get_volume() const {
        impl::manager_lock lock(m_pimpl.get());
        return m_pimpl->m_volume;
    }

    float sound_player_manager::get_sound_volume(const std::string& sound_id) const {
        impl::manager_lock lock(m_pimpl.get());
        return m_pimpl->sound_volume(sound_id);
    }

    void sound_player_manager::play_sound(const std::string& sound_id) {
        impl::manager_lock lock(m_pimpl.get());

        m_pimpl->init_player(sound_id);
        auto player = m_pimpl->m_players.at(sound_id);
        if (!m_pimpl->m_focus_manager->has_focus()
            || m_pimpl->m_state == state::pausing
            || m_pimpl->m_state == state::paused) {
            resume();
        } else {
            player->play();
        }
    }

    void sound_player_manager::stop_sound(const std::string& sound_id) {
        impl::manager_lock lock(m_pimpl.get());

        auto it = m_pimpl->m_players.find(sound_id);
        if (it == m_pimpl->m_players.end()) {
            return;
        }
        auto player = it->second;
        player->stop(false);
    }

    void sound_player_manager::stop(bool immediate) {
        impl::manager_lock lock(m_pimpl.get());
        for (auto& [id, player] : m_pimpl->snapshot()) {
            player->stop(immediate);
        }
    }

    void sound_player_manager::pause(bool immediate) {
        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->pause(immediate);
    }

    void sound_player_manager::resume() {
        impl::manager_lock lock(m_pimpl.get());
        m_pimpl->resume();
    }

    void sound_player_manager::play_preset(const preset_t& preset) {
        for (const auto& [id, volume] : preset) {
            validate_volume(volume);
        }

        impl::manager_lock lock(m_pimpl.get());

        for (auto& [id, player] : m_pimpl->snapshot()) {
            if (preset.count(id) == 0) {
                stop_sound(id);
            }
        }

        for (const auto& [id, volume] : preset) {
            // Every sound, not only playing ones: a new sound starts at its preset volume.
            set_sound_volume(id, volume);

            auto it = m_pimpl->m_players.find(id);
            if (it == m_pimpl->m_players.end() || it->second->get_state() != sound_player::state::playing) {
                play_sound(id);
            }
        }
    }

    sound_player_manager::preset_t sound_player_manager::get_current_preset() const {
        impl::manager_lock lock(m_pimpl.get());

        preset_t preset;
        for (const auto& [id, player] : m_pimpl->m_players) {
            if (!is_stopping_or_stopped(player->get_state())) {
                preset[id] = m_pimpl->sound_volume(id);
            }
        }
        return preset;
    }

    auto sound_player_manager::get_state() const -> state {
        impl::manager_lock lock(m_pimpl.get());
        return m_pimpl->m_state;
    }

    bool sound_player_manager::has_audio_focus() const {
        impl::manager_lock lock(m_pimpl.get());
        return m_pimpl->m_focus_manager->has_focus();
    }

    void sound_player_manager::on_audio_focus_gained() {
        m_pimpl->on_focus_gained();
    }

    void sound_player_manager::on_audio_focus_lost(bool transient) {
        m_pimpl->on_focus_lost(transient);
    }

    // ==============================================================================================================

    sound_player_manager::state reconcile_state(const std::vector <sound_player::state>& states) {
        using player_state = sound_player::state;

        auto all_of = [&states](auto pred) {
            return std::all_of(states.begin(), states.end(), pred);
        };

        if (states.empty()) {
            return sound_player_manager::state::stopped;
        }
        if (all_of([](player_state s) { return s == player_state::stopping; })) {
            return sound_player_manager::state::stopping;
        }
        if (all_of([](player_state s) { return s == player_state::paused; })) {
            return sound_player_manager::state::paused;
        }
        // Sounds removed from a mix may still be stopping while the rest pauses.
        if (all_of([](player_state s) { return s == player_state::pausing || s == player_state::stopping; })) {
            return sound_player_manager::state::pausing;
        }
        return sound_player_manager::state::playing;
    }

    const char* to_string(sound_player_manager::state s) {
        switch (s) {
            case sound_player_manager::state::playing:
                return "playing";
            case sound_player_manager::state::pausing:
                return "pausing";
            case sound_player_manager::state::paused:
                return "paused";
            case sound_player_manager::state::stopping:
                return "stopping";
            case sound_player_manager::state::stopped:
                return "stopped";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, sound_player_manager::state s) {
        return os << to_string(s);
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
