/*
 * Copyright (C) 2026 The hlsforge authors
 *
 * This file is part of hlsforge.
 *
 * hlsforge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * hlsforge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with hlsforge.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "hls/VariantPlaylist.hpp"

#include <string_view>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "hls/Exception.hpp"

namespace hlsforge::hls
{
    namespace
    {
        struct Tag
        {
            std::string_view name;
            std::string_view value;
        };

        std::optional<Tag> parseTag(std::string_view line)
        {
            if (!line.starts_with("#EXT"))
                return std::nullopt;

            Tag tag;
            const std::string_view::size_type valueSeparator{ line.find(':') };
            if (valueSeparator == std::string_view::npos)
            {
                tag.name = line;
            }
            else
            {
                tag.name = line.substr(0, valueSeparator);
                tag.value = line.substr(valueSeparator + 1);
            }

            return tag;
        }

        // EXTINF:<duration>,[<title>]
        std::chrono::milliseconds parseSegmentDuration(std::string_view value)
        {
            const std::string_view durationStr{ value.substr(0, value.find(',')) };
            const std::optional<double> duration{ core::stringUtils::readAs<double>(durationStr) };
            if (!duration || *duration < 0)
                throw PlaylistParseException{ "Invalid segment duration '" + std::string{ durationStr } + "'" };

            return std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(*duration * 1000) };
        }
    } // namespace

    VariantPlaylist parseVariantPlaylist(std::istream& is)
    {
        VariantPlaylist playlist;

        bool firstLine{ true };
        std::optional<std::chrono::milliseconds> pendingSegmentDuration;

        std::string line;
        while (std::getline(is, line))
        {
            const std::string_view trimmedLine{ core::stringUtils::stringTrim(line) };
            if (firstLine)
            {
                if (trimmedLine != "#EXTM3U")
                    throw PlaylistParseException{ "Missing #EXTM3U header" };

                firstLine = false;
                continue;
            }

            if (trimmedLine.empty())
                continue;

            if (const std::optional<Tag> tag{ parseTag(trimmedLine) })
            {
                if (tag->name == "#EXTINF")
                {
                    pendingSegmentDuration = parseSegmentDuration(tag->value);
                }
                else if (tag->name == "#EXT-X-TARGETDURATION")
                {
                    const std::optional<unsigned> targetDuration{ core::stringUtils::readAs<unsigned>(tag->value) };
                    if (!targetDuration)
                        throw PlaylistParseException{ "Invalid target duration '" + std::string{ tag->value } + "'" };
                    playlist.targetDuration = std::chrono::seconds{ *targetDuration };
                }
                else if (tag->name == "#EXT-X-PLAYLIST-TYPE")
                {
                    playlist.playlistType = std::string{ tag->value };
                }
                else if (tag->name == "#EXT-X-ENDLIST")
                {
                    playlist.endList = true;
                }

                continue;
            }

            // other comments
            if (trimmedLine.front() == '#')
                continue;

            if (!pendingSegmentDuration)
            {
                HLSFORGE_LOG(HLS, DEBUG, "Skipping uri '" << trimmedLine << "' that has no #EXTINF");
                continue;
            }

            playlist.segments.push_back(Segment{ std::string{ trimmedLine }, *pendingSegmentDuration });
            pendingSegmentDuration.reset();
        }

        if (firstLine)
            throw PlaylistParseException{ "Empty playlist" };

        return playlist;
    }
} // namespace hlsforge::hls
