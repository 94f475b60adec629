#include <gtest/gtest.h>
#include <workloads/source_spec.hpp>

namespace {

Result<SiteSpec> decode(const std::string& json) {
    return decode_site_spec(Json::parse(json));
}

std::string env_of(const EnvVars& env, const std::string& key) {
    for (const auto& kv : env) {
        if (kv.first == key) return kv.second;
    }
    return "<unset>";
}

} // namespace

TEST(SourceSpec, DecodesGitSource) {
    auto r = decode(R"({
        "source": {
            "type": "git",
            "git": {"repository": "https://example.test/r.git", "branch": "main", "path": "site"}
        }
    })");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.source_type, "git");
    auto* git = std::get_if<GitSource>(&r.value.source);
    ASSERT_NE(git, nullptr);
    EXPECT_EQ(git->repository.value_or(""), "https://example.test/r.git");
    EXPECT_EQ(git->branch.value_or(""), "main");
    EXPECT_EQ(git->path.value_or(""), "site");
}

TEST(SourceSpec, DecodesDockerSource) {
    auto r = decode(R"({"source": {"type": "docker", "docker": {"image": "nginx:1.25", "path": "/usr/share/nginx"}}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto* docker = std::get_if<DockerSource>(&r.value.source);
    ASSERT_NE(docker, nullptr);
    EXPECT_EQ(docker->image.value_or(""), "nginx:1.25");
    EXPECT_EQ(docker->path.value_or(""), "/usr/share/nginx");
}

TEST(SourceSpec, DecodesArchiveSource) {
    auto r = decode(R"({"source": {"type": "archive", "archive": {"url": "https://x.test/a.zip", "path": "out"}}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto* archive = std::get_if<ArchiveSource>(&r.value.source);
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->url.value_or(""), "https://x.test/a.zip");
    EXPECT_EQ(archive->path.value_or(""), "out");
}

TEST(SourceSpec, AcceptsLegacyUrlType) {
    auto r = decode(R"({"source": {"type": "url", "url": {"archive": "https://x.test/a.tgz"}}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.source_type, "url");
    auto* archive = std::get_if<ArchiveSource>(&r.value.source);
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->url.value_or(""), "https://x.test/a.tgz");
    EXPECT_FALSE(archive->path.has_value());
}

TEST(SourceSpec, UnknownTypeIsNotAnError) {
    auto r = decode(R"({"source": {"type": "svn"}})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.source_type, "svn");
    EXPECT_TRUE(std::holds_alternative<UnknownSource>(r.value.source));
    EXPECT_STREQ(source_kind_name(r.value.source), "unknown");
}

TEST(SourceSpec, MissingSpecDecodesToDefaults) {
    auto r = decode_site_spec(Json());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.source_type, "");
    EXPECT_FALSE(r.value.build.enabled);
    EXPECT_EQ(r.value.build.command, "npm run build");
    EXPECT_EQ(r.value.build.output_dir, "dist");
    EXPECT_FALSE(r.value.spa.has_value());
}

TEST(SourceSpec, BuildOverridesAndEmptyValues) {
    auto r = decode(R"({"build": {"enabled": true, "command": "yarn build", "outputDir": ""}, "spa": true})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.build.enabled);
    EXPECT_EQ(r.value.build.command, "yarn build");
    EXPECT_EQ(r.value.build.output_dir, "dist");
    ASSERT_TRUE(r.value.spa.has_value());
    EXPECT_TRUE(*r.value.spa);
}

TEST(SourceSpec, RejectsStructuralErrors) {
    for (const char* bad : {
             R"({"source": "git"})",
             R"({"build": [1, 2]})",
             R"({"source": {"type": "git", "git": "main"}})",
             R"({"source": {"type": {"nested": true}}})",
             R"({"source": {"type": "git", "git": {"branch": ["main"]}}})",
             R"({"source": {"type": "git", "git": {"branch": 7}}})",
             R"({"build": {"enabled": "true"}})",
             R"({"build": {"enabled": 1}})",
             R"([1, 2, 3])",
         }) {
        auto r = decode(bad);
        EXPECT_TRUE(r.is_err()) << bad;
        EXPECT_EQ(r.kind, ErrorKind::Invalid) << bad;
        EXPECT_FALSE(r.error.empty()) << bad;
    }
}

TEST(SourceSpec, SourceEnvExportsOnlyPresentFields) {
    EnvVars env;
    GitSource git;
    git.repository = "https://example.test/r.git";
    append_source_env(git, env);

    EXPECT_EQ(env_of(env, "GIT_REPOSITORY"), "https://example.test/r.git");
    EXPECT_EQ(env_of(env, "GIT_BRANCH"), "<unset>");
    EXPECT_EQ(env_of(env, "GIT_PATH"), "<unset>");
}

TEST(SourceSpec, ArchiveEnvUsesUrlNames) {
    EnvVars env;
    ArchiveSource archive;
    archive.url = "https://x.test/a.zip";
    archive.path = "public";
    append_source_env(archive, env);

    EXPECT_EQ(env_of(env, "URL_ARCHIVE"), "https://x.test/a.zip");
    EXPECT_EQ(env_of(env, "URL_PATH"), "public");
}
