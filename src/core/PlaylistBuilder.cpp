#include "PlaylistBuilder.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <pugixml.hpp>
#include "Errors.hpp"
#include "../utils/UrlUtil.hpp"

namespace Anime1Relay {
namespace PlaylistBuilder {

namespace {

// Line-based formats cannot carry line breaks inside a title.
std::string SingleLine(const std::string& s) {
    std::string out = s;
    std::replace(out.begin(), out.end(), '\r', ' ');
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

std::string PostUri(const std::string& base, const Post& post) {
    return base + "/v/" + post.id;
}

std::string CategoryUri(const std::string& base, const Category& category) {
    return base + "/c/" + category.id;
}

std::string DplHeader() {
    return "DAUMPLAYLIST\n"
           "topindex=0\n"
           "saveplaypos=0\n";
}

void AppendTrack(pugi::xml_node track_list, const std::string& location, const std::string& title) {
    pugi::xml_node track = track_list.append_child("track");
    track.append_child("location").text().set(location.c_str());
    track.append_child("title").text().set(title.c_str());
}

// Adds the XML declaration and <playlist>; returns the empty <trackList>.
pugi::xml_node NewPlaylist(pugi::xml_document& doc, const std::string& title) {
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node playlist = doc.append_child("playlist");
    playlist.append_attribute("version") = "1";
    playlist.append_attribute("xmlns") = "http://xspf.org/ns/0/";
    playlist.append_child("title").text().set(title.c_str());
    return playlist.append_child("trackList");
}

std::string Serialize(const pugi::xml_document& doc) {
    std::ostringstream out;
    // XML 1.0 has no representation for control characters, not even as references.
    doc.save(out, "  ", pugi::format_indent | pugi::format_skip_control_chars, pugi::encoding_utf8);
    return out.str();
}

} // anonymous namespace

std::string TypeName(PlaylistType type) {
    switch (type) {
        case PlaylistType::M3U8:     return "m3u8";
        case PlaylistType::DPL:      return "dpl";
        case PlaylistType::DPL_EXT:  return "dpl_ext";
        case PlaylistType::XSPF:     return "xspf";
        case PlaylistType::XSPF_EXT: return "xspf_ext";
    }
    return "";
}

PlaylistType ParseType(const std::string& name) {
    size_t b = 0, e = name.size();
    while (b < e && std::isspace(static_cast<unsigned char>(name[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(name[e - 1]))) --e;
    std::string key = name.substr(b, e - b);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    for (PlaylistType type : kAllTypes) {
        if (TypeName(type) == key) return type;
    }
    throw UnsupportedPlaylistFormat(name);
}

std::string BuildM3U8(const std::string& base_uri, const Category& category) {
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);
    std::string content = "#EXTM3U\n";
    for (const auto& post : category.posts) {
        content += "#EXTINF:-1," + SingleLine(post.title) + "\n";
        content += PostUri(base, post) + "\n";
    }
    return content;
}

std::string BuildDPL(const std::string& base_uri, const Category& category) {
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);
    std::string content = DplHeader();
    size_t index = 1;
    for (const auto& post : category.posts) {
        content += std::to_string(index) + "*title*" + SingleLine(post.title) + "\n";
        content += std::to_string(index) + "*file*" + PostUri(base, post) + "\n";
        ++index;
    }
    return content;
}

std::string BuildDPLExt(const std::string& base_uri, const Category& category) {
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);
    return DplHeader() + "extplaylist=" + CategoryUri(base, category) + "/m3u8\n";
}

std::string BuildXSPF(const std::string& base_uri, const Category& category) {
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);
    pugi::xml_document doc;
    pugi::xml_node track_list = NewPlaylist(doc, category.title);
    for (const auto& post : category.posts) {
        AppendTrack(track_list, PostUri(base, post), post.title);
    }
    return Serialize(doc);
}

std::string BuildXSPFExt(const std::string& base_uri, const Category& category) {
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);
    pugi::xml_document doc;
    AppendTrack(NewPlaylist(doc, category.title), CategoryUri(base, category), category.title);
    return Serialize(doc);
}

PlaylistInfo Build(PlaylistType type, const std::string& base_uri, const Category& category) {
    PlaylistInfo info;
    info.type = type;
    switch (type) {
        case PlaylistType::M3U8:
            info.content = BuildM3U8(base_uri, category);
            info.media_type = "application/x-mpegURL";
            info.file_name = category.title + ".m3u8";
            break;
        case PlaylistType::DPL:
            info.content = BuildDPL(base_uri, category);
            info.media_type = "text/plain";
            info.file_name = category.title + ".dpl";
            break;
        case PlaylistType::DPL_EXT:
            info.content = BuildDPLExt(base_uri, category);
            info.media_type = "text/plain";
            info.file_name = category.title + ".dpl";
            break;
        case PlaylistType::XSPF:
            info.content = BuildXSPF(base_uri, category);
            info.media_type = "application/xspf+xml";
            info.file_name = category.title + ".xspf";
            break;
        case PlaylistType::XSPF_EXT:
            info.content = BuildXSPFExt(base_uri, category);
            info.media_type = "application/xspf+xml";
            info.file_name = category.title + ".xspf";
            break;
    }
    return info;
}

}
}
