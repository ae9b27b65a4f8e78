#include <gtest/gtest.h>

#include "filters/path_filter.hpp"

using smartmig::filters::PathFilter;

TEST(PathFilterTest, ExcludesDependencyAndBuildDirectories)
{
    PathFilter filter;
    EXPECT_TRUE(filter.should_exclude("node_modules/x.js"));
    EXPECT_TRUE(filter.should_exclude("web/node_modules/react/index.js"));
    EXPECT_TRUE(filter.should_exclude("pkg/__pycache__/mod.cpython-311.pyc"));
    EXPECT_TRUE(filter.should_exclude("build/output.o"));
    EXPECT_TRUE(filter.should_exclude("target/debug/app"));
    EXPECT_TRUE(filter.should_exclude(".venv/lib/site.py"));
}

TEST(PathFilterTest, ExtensionTokensMatchSuffix)
{
    PathFilter filter;
    EXPECT_TRUE(filter.should_exclude("src/module.pyc"));
    EXPECT_TRUE(filter.should_exclude("server.log"));
    EXPECT_TRUE(filter.should_exclude("scratch/data.tmp"));
    EXPECT_FALSE(filter.should_exclude("src/module.py"));
    EXPECT_FALSE(filter.should_exclude("logbook.txt"));
}

TEST(PathFilterTest, LiteralTokensMatchWholeSegmentsOnly)
{
    PathFilter filter;
    EXPECT_FALSE(filter.should_exclude("src/builder.cpp"));
    EXPECT_FALSE(filter.should_exclude("distribution/notes.txt"));
    EXPECT_TRUE(filter.should_exclude("src/dist"));
    EXPECT_TRUE(filter.should_exclude(".DS_Store"));
    EXPECT_TRUE(filter.should_exclude("photos/Thumbs.db"));
}

TEST(PathFilterTest, IncludeTokensWinOverExcludeTokens)
{
    PathFilter filter;
    EXPECT_FALSE(filter.should_exclude(".env"));
    EXPECT_FALSE(filter.should_exclude("build/.env.production"));
    EXPECT_FALSE(filter.should_exclude("node_modules/left-pad/package.json"));
    EXPECT_FALSE(filter.should_exclude("dist/README.md"));

    // Every default include token survives even inside an excluded directory.
    for (const auto& token : PathFilter::default_include_tokens()) {
        EXPECT_FALSE(filter.should_exclude(std::filesystem::path("node_modules") / token)) << token;
    }
}

TEST(PathFilterTest, GitMetadataKeptWithoutObjectStorage)
{
    PathFilter filter;
    EXPECT_FALSE(filter.should_exclude(".git/HEAD"));
    EXPECT_FALSE(filter.should_exclude(".git/config"));
    EXPECT_FALSE(filter.should_exclude(".git/hooks/pre-commit.sample"));
    EXPECT_TRUE(filter.should_exclude(".git/objects/ab/cdef0123"));
    EXPECT_TRUE(filter.should_exclude(".git/refs/heads/main"));
    EXPECT_TRUE(filter.should_exclude(".git/logs/HEAD"));
    EXPECT_TRUE(filter.should_exclude("vendor/lib/.git/objects/pack/pack-1.pack"));

    // Outside a .git directory these names are ordinary.
    EXPECT_FALSE(filter.should_exclude("docs/objects/diagram.svg"));
    EXPECT_FALSE(filter.should_exclude("src/refs/table.cpp"));
}

TEST(PathFilterTest, MultiSegmentTokensMatchConsecutiveSegments)
{
    PathFilter filter;
    EXPECT_TRUE(filter.should_exclude(".vscode/settings.json"));
    EXPECT_TRUE(filter.should_exclude("app/.idea/workspace.xml"));
    EXPECT_FALSE(filter.should_exclude(".vscode/launch.json"));
    EXPECT_FALSE(filter.should_exclude(".idea/misc.xml"));
}

TEST(PathFilterTest, PrefixTokensMatchFinalComponent)
{
    PathFilter filter({"tmp_*"}, {});
    EXPECT_TRUE(filter.should_exclude("data/tmp_upload.bin"));
    EXPECT_FALSE(filter.should_exclude("tmp_dir/data.bin"));
    EXPECT_FALSE(filter.should_exclude("data/my_tmp_upload.bin"));
}

TEST(PathFilterTest, AdditionalTokensLayerOnDefaults)
{
    PathFilter filter({"secrets", "*.bak"}, {"keep.bak"});
    EXPECT_TRUE(filter.should_exclude("config/secrets/key.pem"));
    EXPECT_TRUE(filter.should_exclude("notes.bak"));
    EXPECT_FALSE(filter.should_exclude("keep.bak"));
    EXPECT_TRUE(filter.should_exclude("node_modules/x.js"));

    EXPECT_FALSE(PathFilter::default_exclude_tokens().contains("secrets"));
    EXPECT_FALSE(PathFilter::default_include_tokens().contains("keep.bak"));
    EXPECT_FALSE(PathFilter{}.should_exclude("config/secrets/key.pem"));
}

TEST(PathFilterTest, OrdinarySourceFilesAreKept)
{
    PathFilter filter;
    EXPECT_FALSE(filter.should_exclude("a.txt"));
    EXPECT_FALSE(filter.should_exclude("src/main.cpp"));
    EXPECT_FALSE(filter.should_exclude("docs/guide/index.html"));
}
