#ifndef AMBIENCE_MOCK_COMPONENTS_HH
#define AMBIENCE_MOCK_COMPONENTS_HH

#include <ambience/audio_focus_arbiter.hh>
#include <ambience/sound_player.hh>
#include <ambience/sound_player_manager.hh>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ambience::test {

// Player that records every call and reports states synchronously.
//
// With auto_transition enabled (the default) play() reports buffering and
// playing, immediate pause()/stop() report paused/stopped, and faded ones
// report pausing/stopping and wait for complete_fade().
class mock_sound_player : public sound_player {
public:
    explicit mock_sound_player(std::string sound_id, bool auto_transition = true)
        : m_sound_id(std::move(sound_id)), m_auto_transition(auto_transition) {}

    void play() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_play_calls;
            if (!m_auto_transition || m_state == state::stopped || m_state == state::stopping
                || m_state == state::playing) {
                return;
            }
        }
        report(state::buffering);
        report(state::playing);
    }

    void pause(bool immediate) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pause_calls.push_back(immediate);
            if (!m_auto_transition || m_state == state::paused || m_state == state::stopped
                || m_state == state::stopping) {
                return;
            }
        }
        report(immediate ? state::paused : state::pausing);
    }

    void stop(bool immediate) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop_calls.push_back(immediate);
            if (!m_auto_transition || m_state == state::stopped) {
                return;
            }
        }
        report(immediate ? state::stopped : state::stopping);
    }

    void set_volume(float volume) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volumes.push_back(volume);
    }

    void set_fade_in_duration(std::chrono::milliseconds duration) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fade_in_durations.push_back(duration);
    }

    void set_fade_out_duration(std::chrono::milliseconds duration) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fade_out_durations.push_back(duration);
    }

    void set_premium_segments_enabled(bool enabled) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_premium_calls.push_back(enabled);
    }

    void set_audio_bitrate(const std::string& bitrate) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_bitrates.push_back(bitrate);
    }

    void set_audio_attributes(const audio_attributes& attrs) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attributes.push_back(attrs);
    }

    void set_state_change_listener(state_change_listener_t listener) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_listener = std::move(listener);
    }

    state get_state() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    // Move to a state and notify the listener, as a real player would.
    void report(state s) {
        state_change_listener_t listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = s;
            listener = m_listener;
        }
        if (listener) {
            listener(s);
        }
    }

    // Move to a state without notifying, as if the notification were still
    // queued on another thread.
    void move_silently(state s) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = s;
    }

    // Finish a pending fade-out.
    void complete_fade() {
        const auto s = get_state();
        if (s == state::pausing) {
            report(state::paused);
        } else if (s == state::stopping) {
            report(state::stopped);
        }
    }

    const std::string& sound_id() const { return m_sound_id; }

    int play_calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_play_calls;
    }

    std::vector<bool> pause_calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pause_calls;
    }

    std::vector<bool> stop_calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stop_calls;
    }

    std::vector<float> volumes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_volumes;
    }

    float last_volume() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_volumes.empty() ? -1.f : m_volumes.back();
    }

    std::vector<std::chrono::milliseconds> fade_in_durations() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fade_in_durations;
    }

    std::vector<std::chrono::milliseconds> fade_out_durations() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fade_out_durations;
    }

    std::vector<bool> premium_calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_premium_calls;
    }

    std::vector<std::string> bitrates() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bitrates;
    }

    std::vector<audio_attributes> attributes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_attributes;
    }

    bool has_listener() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<bool>(m_listener);
    }

private:
    const std::string m_sound_id;
    const bool m_auto_transition;

    mutable std::mutex m_mutex;
    state m_state = state::paused;
    state_change_listener_t m_listener;

    int m_play_calls = 0;
    std::vector<bool> m_pause_calls;
    std::vector<bool> m_stop_calls;
    std::vector<float> m_volumes;
    std::vector<std::chrono::milliseconds> m_fade_in_durations;
    std::vector<std::chrono::milliseconds> m_fade_out_durations;
    std::vector<bool> m_premium_calls;
    std::vector<std::string> m_bitrates;
    std::vector<audio_attributes> m_attributes;
};

// Factory that keeps every player it built, so tests can inspect players
// the manager has already dropped.
class mock_sound_player_factory : public sound_player_factory {
public:
    explicit mock_sound_player_factory(bool auto_transition = true)
        : m_auto_transition(auto_transition) {}

    std::shared_ptr<sound_player> build_player(const std::string& sound_id) override {
        auto player = std::make_shared<mock_sound_player>(sound_id, m_auto_transition);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_players[sound_id].push_back(player);
        return player;
    }

    std::shared_ptr<mock_sound_player> latest(const std::string& sound_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(sound_id);
        if (it == m_players.end() || it->second.empty()) {
            return nullptr;
        }
        return it->second.back();
    }

    std::vector<std::shared_ptr<mock_sound_player>> players(const std::string& sound_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(sound_id);
        return it == m_players.end() ? std::vector<std::shared_ptr<mock_sound_player>>{} : it->second;
    }

    std::size_t built(const std::string& sound_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(sound_id);
        return it == m_players.end() ? 0 : it->second.size();
    }

    std::size_t built_total() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t total = 0;
        for (const auto& [id, players] : m_players) {
            total += players.size();
        }
        return total;
    }

private:
    const bool m_auto_transition;
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<std::shared_ptr<mock_sound_player>>> m_players;
};

// Factory that returns no player at all.
class broken_sound_player_factory : public sound_player_factory {
public:
    std::shared_ptr<sound_player> build_player(const std::string&) override {
        return nullptr;
    }
};

// Arbiter that grants (or refuses) every request and lets tests push focus
// changes to the last requester, until that requester abandons.
class mock_focus_arbiter : public audio_focus_arbiter {
public:
    focus_request_result request_focus(const std::shared_ptr<audio_focus_client>& client,
                                       const audio_attributes& attrs,
                                       bool transient) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_requests;
        m_client = client;
        m_last_attrs = attrs;
        m_last_transient = transient;
        return m_grant ? focus_request_result::granted : focus_request_result::failed;
    }

    void abandon_focus(const std::shared_ptr<audio_focus_client>& client) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_abandons;
        if (m_client.lock() == client) {
            m_client.reset();
        }
    }

    void send(focus_change change) {
        std::shared_ptr<audio_focus_client> client;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            client = m_client.lock();
        }
        if (client) {
            client->on_focus_change(change);
        }
    }

    void set_grant(bool grant) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_grant = grant;
    }

    int requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    // Abandon calls, including those made by destructors.
    std::size_t abandons() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_abandons;
    }

    audio_attributes last_attributes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_attrs;
    }

    bool last_transient() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_transient;
    }

private:
    mutable std::mutex m_mutex;
    bool m_grant = true;
    int m_requests = 0;
    std::weak_ptr<audio_focus_client> m_client;
    audio_attributes m_last_attrs;
    bool m_last_transient = false;
    std::size_t m_abandons = 0;
};

// Focus client recording everything the arbiter delivers.
class recording_focus_client : public audio_focus_client {
public:
    void on_focus_change(focus_change change) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_changes.push_back(change);
    }

    std::vector<focus_change> changes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_changes;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<focus_change> m_changes;
};

// Focus manager listener recording gain/loss.
class recording_focus_listener : public audio_focus_manager::listener {
public:
    void on_audio_focus_gained() override { ++gained; }
    void on_audio_focus_lost(bool transient) override { lost.push_back(transient); }

    int gained = 0;
    std::vector<bool> lost;
};

// Manager listener recording all notifications.
class recording_listener : public sound_player_manager::listener {
public:
    void on_state_change(sound_player_manager::state s) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states.push_back(s);
    }

    void on_volume_change(float volume) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volumes.push_back(volume);
    }

    void on_sound_state_change(const std::string& sound_id, sound_player::state s) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sound_states.emplace_back(sound_id, s);
    }

    void on_sound_volume_change(const std::string& sound_id, float volume) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sound_volumes.emplace_back(sound_id, volume);
    }

    std::vector<sound_player_manager::state> states() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_states;
    }

    std::vector<float> volumes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_volumes;
    }

    std::vector<std::pair<std::string, sound_player::state>> sound_states() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sound_states;
    }

    std::vector<std::pair<std::string, float>> sound_volumes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sound_volumes;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states.clear();
        m_volumes.clear();
        m_sound_states.clear();
        m_sound_volumes.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<sound_player_manager::state> m_states;
    std::vector<float> m_volumes;
    std::vector<std::pair<std::string, sound_player::state>> m_sound_states;
    std::vector<std::pair<std::string, float>> m_sound_volumes;
};

} // namespace ambience::test

#endif // AMBIENCE_MOCK_COMPONENTS_HH
