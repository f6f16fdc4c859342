#pragma once
#include <array>
#include <string>
#include "../model/Entities.hpp"

namespace Anime1Relay {

    enum class PlaylistType {
        M3U8,
        DPL,
        DPL_EXT,
        XSPF,
        XSPF_EXT
    };

    struct PlaylistInfo {
        PlaylistType type = PlaylistType::M3U8;
        std::string content;
        std::string media_type;
        std::string file_name;
    };

    namespace PlaylistBuilder {

        constexpr std::array<PlaylistType, 5> kAllTypes = {
            PlaylistType::M3U8, PlaylistType::DPL, PlaylistType::DPL_EXT,
            PlaylistType::XSPF, PlaylistType::XSPF_EXT
        };

        // Lower-case name used in query strings ("m3u8", "dpl_ext", ...).
        std::string TypeName(PlaylistType type);

        // Case-insensitive, surrounding whitespace ignored. Throws UnsupportedPlaylistFormat.
        PlaylistType ParseType(const std::string& name);

        // Deterministic rendering of a category; base_uri may end with '/'.
        PlaylistInfo Build(PlaylistType type, const std::string& base_uri, const Category& category);

        std::string BuildM3U8(const std::string& base_uri, const Category& category);
        std::string BuildDPL(const std::string& base_uri, const Category& category);
        std::string BuildDPLExt(const std::string& base_uri, const Category& category);
        std::string BuildXSPF(const std::string& base_uri, const Category& category);
        std::string BuildXSPFExt(const std::string& base_uri, const Category& category);

    }

}
