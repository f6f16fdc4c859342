#include <catch2/catch_all.hpp>
#include <pugixml.hpp>
#include "Fakes.hpp"
#include "core/Errors.hpp"
#include "core/PlaylistBuilder.hpp"

using namespace Anime1Relay;
using Anime1Relay::Testing::MakePost;

namespace {

Category SampleCategory() {
    Category category;
    category.id = "55";
    category.title = "Tom & Jerry <2024>";
    category.posts = { MakePost("101", "Ep [1]"), MakePost("102", "Ep [2]"), MakePost("103", "Ep [3]") };
    return category;
}

size_t CountOf(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) ++count;
    return count;
}

}

TEST_CASE("m3u8 lists one entry per post in order") {
    auto info = PlaylistBuilder::Build(PlaylistType::M3U8, "http://127.0.0.1:8520/", SampleCategory());
    CHECK(info.media_type == "application/x-mpegURL");
    CHECK(info.file_name == "Tom & Jerry <2024>.m3u8");
    CHECK(info.content ==
          "#EXTM3U\n"
          "#EXTINF:-1,Ep [1]\nhttp://127.0.0.1:8520/v/101\n"
          "#EXTINF:-1,Ep [2]\nhttp://127.0.0.1:8520/v/102\n"
          "#EXTINF:-1,Ep [3]\nhttp://127.0.0.1:8520/v/103\n");
}

TEST_CASE("An empty category still yields a valid m3u8") {
    Category category;
    category.id = "1";
    category.title = "Empty";
    CHECK(PlaylistBuilder::BuildM3U8("http://h", category) == "#EXTM3U\n");
}

TEST_CASE("Line-based formats flatten multi-line titles") {
    Category category = SampleCategory();
    category.posts = { MakePost("1", "line one\nline two") };
    auto m3u = PlaylistBuilder::BuildM3U8("http://h", category);
    CHECK(m3u.find("#EXTINF:-1,line one line two\n") != std::string::npos);
}

TEST_CASE("dpl numbers entries from one") {
    auto info = PlaylistBuilder::Build(PlaylistType::DPL, "http://h", SampleCategory());
    CHECK(info.media_type == "text/plain");
    CHECK(info.file_name == "Tom & Jerry <2024>.dpl");
    CHECK(info.content.rfind("DAUMPLAYLIST\n", 0) == 0);
    CHECK(info.content.find("1*title*Ep [1]\n1*file*http://h/v/101\n") != std::string::npos);
    CHECK(info.content.find("3*title*Ep [3]\n3*file*http://h/v/103\n") != std::string::npos);
    CHECK(CountOf(info.content, "*file*") == 3);
}

TEST_CASE("dpl_ext points at the category m3u8") {
    auto content = PlaylistBuilder::BuildDPLExt("http://h/", SampleCategory());
    CHECK(content == "DAUMPLAYLIST\ntopindex=0\nsaveplaypos=0\nextplaylist=http://h/c/55/m3u8\n");
}

TEST_CASE("xspf escapes markup in titles") {
    auto info = PlaylistBuilder::Build(PlaylistType::XSPF, "http://h", SampleCategory());
    CHECK(info.media_type == "application/xspf+xml");
    CHECK(info.file_name == "Tom & Jerry <2024>.xspf");
    CHECK(info.content.find("<title>Tom &amp; Jerry &lt;2024&gt;</title>") != std::string::npos);
    CHECK(info.content.find("Tom & Jerry") == std::string::npos);
    CHECK(CountOf(info.content, "<track>") == 3);
    CHECK(info.content.find("<location>http://h/v/102</location>") != std::string::npos);

    auto ext = PlaylistBuilder::BuildXSPFExt("http://h", SampleCategory());
    CHECK(CountOf(ext, "<track>") == 1);
    CHECK(ext.find("<location>http://h/c/55</location>") != std::string::npos);
}

TEST_CASE("xspf drops characters XML cannot carry") {
    Category category;
    category.id = "9";
    category.title = "Show\x01 \x1b[OVA]";
    category.posts = { MakePost("1", "Ep\x0b 1") };

    const std::string content = PlaylistBuilder::BuildXSPF("http://h", category);
    for (char c : content) {
        CHECK((static_cast<unsigned char>(c) >= 0x20 || c == '\n'));
    }
    CHECK(content.find("&#") == std::string::npos);

    pugi::xml_document doc;
    REQUIRE(doc.load_string(content.c_str()));
    pugi::xml_node playlist = doc.child("playlist");
    CHECK(std::string(playlist.child_value("title")) == "Show [OVA]");
    pugi::xml_node track = playlist.child("trackList").child("track");
    CHECK(std::string(track.child_value("title")) == "Ep 1");
    CHECK(std::string(track.child_value("location")) == "http://h/v/1");
}

TEST_CASE("xspf output is a well-formed document") {
    pugi::xml_document doc;
    const std::string content = PlaylistBuilder::BuildXSPF("http://h", SampleCategory());
    CHECK(content.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>", 0) == 0);
    REQUIRE(doc.load_string(content.c_str()));
    pugi::xml_node playlist = doc.child("playlist");
    CHECK(std::string(playlist.attribute("xmlns").value()) == "http://xspf.org/ns/0/");
    CHECK(std::string(playlist.child_value("title")) == "Tom & Jerry <2024>");

    size_t tracks = 0;
    for (pugi::xml_node track : playlist.child("trackList").children("track")) {
        ++tracks;
        CHECK(std::string(track.child_value("location")).rfind("http://h/v/10", 0) == 0);
    }
    CHECK(tracks == 3);
}

TEST_CASE("Building is deterministic") {
    for (PlaylistType type : PlaylistBuilder::kAllTypes) {
        CHECK(PlaylistBuilder::Build(type, "http://h", SampleCategory()).content ==
              PlaylistBuilder::Build(type, "http://h", SampleCategory()).content);
    }
}

TEST_CASE("ParseType accepts known names in any case") {
    CHECK(PlaylistBuilder::ParseType("m3u8") == PlaylistType::M3U8);
    CHECK(PlaylistBuilder::ParseType(" DPL ") == PlaylistType::DPL);
    CHECK(PlaylistBuilder::ParseType("Dpl_Ext") == PlaylistType::DPL_EXT);
    CHECK(PlaylistBuilder::ParseType("xspf") == PlaylistType::XSPF);
    CHECK(PlaylistBuilder::ParseType("XSPF_EXT") == PlaylistType::XSPF_EXT);
    CHECK_THROWS_AS(PlaylistBuilder::ParseType("pls"), UnsupportedPlaylistFormat);
    CHECK_THROWS_WITH(PlaylistBuilder::ParseType("asx"), "Unknown playlist type asx");

    for (PlaylistType type : PlaylistBuilder::kAllTypes) {
        CHECK(PlaylistBuilder::ParseType(PlaylistBuilder::TypeName(type)) == type);
    }
}
