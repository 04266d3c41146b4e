#include "common.hpp"

#include "video/video.hpp"

using namespace Video;

int main(const int argc, char *argv[]) {
    Setup();
    const int ret = Catch::Session().run(argc, argv);
    return ret;
}

TEST_CASE("ParseProbe") {
    const fs::path path = "clip.mp4";

    SECTION("Video and audio") {
        const auto info = ParseProbe(path, R"({
            "programs": [],
            "streams": [
                {"codec_name": "h264", "codec_type": "video", "duration": "12.480000"},
                {"codec_name": "aac", "codec_type": "audio", "duration": "12.523000"}
            ]
        })");
        REQUIRE(info.HasVideo);
        REQUIRE(info.HasAudio);
        REQUIRE(info.VideoCodec == "h264");
        REQUIRE(info.AudioCodec == "aac");
        REQUIRE(info.Duration == Catch::Approx(12.523));
    }

    SECTION("Video only") {
        const auto info = ParseProbe(path, R"({"streams": [{"codec_name": "h264", "codec_type": "video"}]})");
        REQUIRE(info.HasVideo);
        REQUIRE_FALSE(info.HasAudio);
        REQUIRE(info.Duration == 0.0);
    }

    SECTION("Data streams and odd durations are ignored") {
        const auto info = ParseProbe(path, R"({"streams": [
            {"codec_type": "data", "duration": "99.0"},
            {"codec_name": "opus", "codec_type": "audio", "duration": "N/A"}
        ]})");
        REQUIRE_FALSE(info.HasVideo);
        REQUIRE(info.HasAudio);
        REQUIRE(info.Duration == 0.0);
    }

    SECTION("No streams") {
        const auto info = ParseProbe(path, "{}");
        REQUIRE_FALSE(info.HasVideo);
        REQUIRE_FALSE(info.HasAudio);
    }

    SECTION("Garbage") {
        REQUIRE_THROWS_AS(ParseProbe(path, "Invalid data found when processing input"), narratune::ValidationError);
    }
}

TEST_CASE("Validate") {
    const auto dir = CleanOutputDir("video_validate");

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Validate(dir / "missing.mp4"), narratune::ValidationError);
    }

    SECTION("Wrong extension is rejected before probing") {
        const auto path = dir / "clip.mov";
        WriteBytes(path, "not probed");
        REQUIRE_THROWS_AS(Validate(path), narratune::ValidationError);
    }

    SECTION("Directory") {
        const auto sub = dir / "folder.mp4";
        fs::create_directories(sub);
        REQUIRE_THROWS_AS(Validate(sub), narratune::ValidationError);
    }
}

TEST_CASE("Stage names") {
    REQUIRE(std::string(ToString(Stage::Probing)) == "probing");
    REQUIRE(std::string(ToString(Stage::ExtractingAudio)) == "extracting audio");
    REQUIRE(std::string(ToString(Stage::Remuxing)) == "remuxing");
}
