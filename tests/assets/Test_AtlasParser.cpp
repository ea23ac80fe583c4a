#include <doctest/doctest.h>
#include "rigview/assets/AtlasParser.hpp"
#include "../TestRig.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace rigview::assets;

TEST_CASE("Atlas page names") {
    SUBCASE("Declared pages come back in declaration order") {
        const std::vector<std::vector<std::string>> cases = {
            {"hero"},
            {"page1", "page2"},
            {"c.png", "a.png", "b.png"},
            {"dup", "other", "dup"},
        };
        for (const auto& pages : cases) {
            auto names = extractAtlasPageNames(rigview::test::makeAtlas(pages));
            REQUIRE(names.has_value());
            CHECK(*names == pages);
        }
    }

    SUBCASE("Blank lines between a page name and its size line are skipped") {
        auto names = extractAtlasPageNames("page1\n\n\n   size: 64,64\nformat: RGBA8888\n");
        REQUIRE(names.has_value());
        CHECK(*names == std::vector<std::string>{"page1"});
    }

    SUBCASE("CRLF line endings and surrounding whitespace are trimmed") {
        auto names = extractAtlasPageNames("\r\n  page1.png  \r\nsize: 64,64\r\nfilter: Linear,Linear\r\n");
        REQUIRE(names.has_value());
        CHECK(*names == std::vector<std::string>{"page1.png"});
    }

    SUBCASE("Region names are not pages") {
        // "head" is followed by "rotate:", not "size:".
        auto names = extractAtlasPageNames(rigview::test::makeAtlas({"only"}));
        REQUIRE(names.has_value());
        CHECK(names->size() == 1);
    }

    SUBCASE("Lines containing a colon never name a page") {
        auto names = extractAtlasPageNames("weird:name\nsize: 64,64\n");
        CHECK_FALSE(names.has_value());
    }

    SUBCASE("No pages is MalformedAtlas") {
        for (const char* text : {"", "\n\n", "size: 64,64\n", "page1\nformat: RGBA8888\n", "page1"}) {
            auto names = extractAtlasPageNames(text);
            REQUIRE_FALSE(names.has_value());
            CHECK(names.error().code == BindErrorCode::MalformedAtlas);
            CHECK(names.error().message == "Atlas pages not found. Check the .atlas file.");
        }
    }
}

namespace {
    // Emits atlas text in the shapes exporters produce: optional blank or
    // whitespace-only lines, mixed LF / CRLF endings, padded page names and
    // region blocks whose own size: lines follow an xy: line.
    class AtlasTextGenerator {
    public:
        explicit AtlasTextGenerator(uint32_t seed) : m_rng(seed) {}

        std::vector<std::string> pageNames() {
            static const std::vector<std::string> pool = {
                "hero", "hero.png", "hero 2.png", "skin.alt.v3.png", "a", "page one", "x-y_z.webp", "p.1"};
            std::vector<std::string> names(pick(1, 6));
            for (auto& name : names) {
                name = pool[pick(0, static_cast<int>(pool.size()) - 1)];
            }
            return names;
        }

        std::string atlas(const std::vector<std::string>& pages, bool withSizeLines) {
            std::string text;
            blankLines(text);
            for (const auto& page : pages) {
                line(text, padding() + page + padding());
                blankLines(text);
                line(text, withSizeLines ? "size: 512, 256" : "format: RGBA8888");
                line(text, "filter: Linear, Linear");
                for (int region = pick(0, 3); region > 0; --region) {
                    blankLines(text);
                    line(text, padding() + "region" + std::to_string(region));
                    line(text, pick(0, 1) == 0 ? "  rotate: false" : "  bounds: 2, 2, 64, 64");
                    line(text, "  xy: 2, 2");
                    line(text, "  size: 64, 64");
                }
                blankLines(text);
            }
            return text;
        }

    private:
        int pick(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(m_rng); }

        std::string padding() {
            static const char* const kPads[] = {"", "", " ", "\t", "  \t "};
            return kPads[pick(0, 4)];
        }

        void line(std::string& text, const std::string& content) {
            text += content;
            text += pick(0, 2) == 0 ? "\r\n" : "\n";
        }

        void blankLines(std::string& text) {
            for (int n = pick(0, 2); n > 0; --n) {
                line(text, padding());
            }
        }

        std::mt19937 m_rng;
    };
}

TEST_CASE("Generated atlases yield their pages in declaration order") {
    AtlasTextGenerator generator(0x5eedu);
    for (int iteration = 0; iteration < 500; ++iteration) {
        CAPTURE(iteration);
        const auto pages = generator.pageNames();
        const auto text = generator.atlas(pages, true);
        CAPTURE(text);

        auto names = extractAtlasPageNames(text);
        REQUIRE(names.has_value());
        CHECK(*names == pages);
    }
}

TEST_CASE("Generated atlases without size lines are malformed") {
    AtlasTextGenerator generator(0xa71a5u);
    for (int iteration = 0; iteration < 200; ++iteration) {
        CAPTURE(iteration);
        const auto text = generator.atlas(generator.pageNames(), false);
        CAPTURE(text);

        auto names = extractAtlasPageNames(text);
        REQUIRE_FALSE(names.has_value());
        CHECK(names.error().code == BindErrorCode::MalformedAtlas);
    }
}
