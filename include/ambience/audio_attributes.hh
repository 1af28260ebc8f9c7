// This is copyrighted software. More information is at the end of this file.
/**
 * @file audio_attributes.hh
 * @brief Playback attributes shared by players and the focus arbiter
 */
#ifndef AMBIENCE_AUDIO_ATTRIBUTES_HH
#define AMBIENCE_AUDIO_ATTRIBUTES_HH

#include <ostream>
#include <ambience/export_ambience.h>

namespace ambience {

    /**
     * @brief What the audio is played for
     */
    enum class audio_usage {
        media,
        alarm
    };

    /**
     * @brief What kind of content is played
     */
    enum class audio_content_type {
        music,
        movie,
        speech,
        sonification
    };

    /**
     * @brief Output stream the platform routes the audio to
     */
    enum class audio_stream_type {
        music,
        alarm
    };

    /**
     * @struct audio_attributes
     * @brief Describes how a sound is rendered and arbitrated
     *
     * Attributes are handed to every sound_player and to the focus arbiter,
     * which may use the usage to decide between competing clients.
     */
    struct audio_attributes {
        audio_usage usage = audio_usage::media;
        audio_content_type content_type = audio_content_type::movie;
        audio_stream_type legacy_stream = audio_stream_type::music;
    };

    inline bool operator==(const audio_attributes& a, const audio_attributes& b) {
        return a.usage == b.usage
               && a.content_type == b.content_type
               && a.legacy_stream == b.legacy_stream;
    }

    inline bool operator!=(const audio_attributes& a, const audio_attributes& b) {
        return !(a == b);
    }

    /// Playback on the music stream
    AMBIENCE_EXPORT extern const audio_attributes default_audio_attributes;

    /// Playback on the alarm stream
    AMBIENCE_EXPORT extern const audio_attributes alarm_audio_attributes;

    AMBIENCE_EXPORT std::ostream& operator<<(std::ostream& os, const audio_attributes& attrs);
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
