// This is copyrighted software. More information is at the end of this file.
#include <ambience/audio_attributes.hh>

namespace ambience {

    const audio_attributes default_audio_attributes{
        audio_usage::media,
        audio_content_type::movie,
        audio_stream_type::music
    };

    const audio_attributes alarm_audio_attributes{
        audio_usage::alarm,
        audio_content_type::movie,
        audio_stream_type::alarm
    };

    static const char* usage_name(audio_usage usage) {
        switch (usage) {
            case audio_usage::media:
                return "media";
            case audio_usage::alarm:
                return "alarm";
        }
        return "unknown";
    }

    static const char* content_type_name(audio_content_type type) {
        switch (type) {
            case audio_content_type::music:
                return "music";
            case audio_content_type::movie:
                return "movie";
            case audio_content_type::speech:
                return "speech";
            case audio_content_type::sonification:
                return "sonification";
        }
        return "unknown";
    }

    static const char* stream_type_name(audio_stream_type type) {
        switch (type) {
            case audio_stream_type::music:
                return "music";
            case audio_stream_type::alarm:
                return "alarm";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, const audio_attributes& attrs) {
        os << "audio_attributes{"
           << "usage=" << usage_name(attrs.usage) << ", "
           << "content_type=" << content_type_name(attrs.content_type) << ", "
           << "legacy_stream=" << stream_type_name(attrs.legacy_stream)
           << "}";
        return os;
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
