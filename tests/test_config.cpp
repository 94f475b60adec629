#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace {

const char* CONFIG_ENV[] = {
    "FORGEOP_CONFIG", "CONTROLLER_KIND", "NAMESPACE", "EXECUTION_IMAGE", "BUILDER_IMAGE",
    "RUNNER_IMAGE", "BASE_DOMAIN", "BACKEND_API_URL", "MINIO_ENDPOINT", "MINIO_ACCESS_KEY",
    "MINIO_SECRET_KEY", "MINIO_BUCKET", "MC_BINARY", "KUBECTL", "KUBECONFIG",
    "KUBECTL_TIMEOUT_SECS", "POLL_INTERVAL_SECS", "BACKOFF_LIMIT", "ACTIVE_DEADLINE_SECS",
    "FORGEOP_LOG_FILE",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : CONFIG_ENV) unsetenv(name);
        dir_ = fs::temp_directory_path() / ("forgeop_config_test_" + std::to_string(getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        for (const char* name : CONFIG_ENV) unsetenv(name);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write_file(const std::string& content) {
        fs::path p = dir_ / "config.yaml";
        std::ofstream out(p);
        out << content;
        return p;
    }

    fs::path dir_;
};

} // namespace

TEST_F(ConfigTest, SiteDefaults) {
    auto r = Config::load_from(std::nullopt);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.kind(), WorkloadKind::Site);
    EXPECT_EQ(c.ns(), "static-hosting");
    EXPECT_EQ(c.image(), "quay.io/example/static-site-builder:latest");
    EXPECT_EQ(c.base_domain(), "sites.apps.example.com");
    EXPECT_EQ(c.storage().endpoint, "http://minio.minio.svc:9000");
    EXPECT_EQ(c.storage().bucket, "sites");
    EXPECT_EQ(c.storage().client, "mc");
    EXPECT_EQ(c.kubectl().binary, "kubectl");
    EXPECT_EQ(c.kubectl().request_timeout_secs, 30);
    EXPECT_EQ(c.monitor().poll_interval_secs, 10);
    EXPECT_EQ(c.monitor().message_cap, 500);
    EXPECT_EQ(c.job().backoff_limit, 3);
    EXPECT_EQ(c.job().active_deadline_secs, 1800);
    EXPECT_EQ(c.log_file(), "");
    EXPECT_FALSE(c.source_file().has_value());
}

TEST_F(ConfigTest, SessionDefaults) {
    setenv("CONTROLLER_KIND", "session", 1);
    auto r = Config::load_from(std::nullopt);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(r.value.kind(), WorkloadKind::Session);
    EXPECT_EQ(r.value.ns(), "default");
    EXPECT_EQ(r.value.image(), "claude-runner:latest");
}

TEST_F(ConfigTest, FileValuesApply) {
    auto path = write_file(R"(
kind: site
namespace: web
base_domain: pages.example.test
storage:
  endpoint: https://s3.example.test
  bucket: static
monitor:
  poll_interval_secs: 5
job:
  backoff_limit: 1
)");

    auto r = Config::load_from(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ns(), "web");
    EXPECT_EQ(r.value.base_domain(), "pages.example.test");
    EXPECT_EQ(r.value.storage().endpoint, "https://s3.example.test");
    EXPECT_EQ(r.value.storage().bucket, "static");
    EXPECT_EQ(r.value.monitor().poll_interval_secs, 5);
    EXPECT_EQ(r.value.job().backoff_limit, 1);
    ASSERT_TRUE(r.value.source_file().has_value());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = write_file("namespace: web\nbase_domain: from-file.test\n");
    setenv("NAMESPACE", "from-env", 1);

    auto r = Config::load_from(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ns(), "from-env");
    EXPECT_EQ(r.value.base_domain(), "from-file.test");
}

TEST_F(ConfigTest, ImagePrecedence) {
    setenv("BUILDER_IMAGE", "legacy:1", 1);
    auto legacy = Config::load_from(std::nullopt);
    ASSERT_TRUE(legacy.is_ok());
    EXPECT_EQ(legacy.value.image(), "legacy:1");

    auto path = write_file("image: file:1\n");
    auto from_file = Config::load_from(path);
    ASSERT_TRUE(from_file.is_ok());
    EXPECT_EQ(from_file.value.image(), "file:1");

    setenv("EXECUTION_IMAGE", "env:1", 1);
    auto from_env = Config::load_from(path);
    ASSERT_TRUE(from_env.is_ok());
    EXPECT_EQ(from_env.value.image(), "env:1");
}

TEST_F(ConfigTest, UnknownKindIsRejected) {
    setenv("CONTROLLER_KIND", "cronjob", 1);
    auto r = Config::load_from(std::nullopt);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("cronjob"), std::string::npos);
}

TEST_F(ConfigTest, BadIntegersAreRejected) {
    setenv("POLL_INTERVAL_SECS", "ten", 1);
    EXPECT_TRUE(Config::load_from(std::nullopt).is_err());

    setenv("POLL_INTERVAL_SECS", "0", 1);
    EXPECT_TRUE(Config::load_from(std::nullopt).is_err());

    setenv("POLL_INTERVAL_SECS", "15", 1);
    setenv("BACKOFF_LIMIT", "-1", 1);
    EXPECT_TRUE(Config::load_from(std::nullopt).is_err());

    setenv("BACKOFF_LIMIT", "0", 1);
    auto ok = Config::load_from(std::nullopt);
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.monitor().poll_interval_secs, 15);
    EXPECT_EQ(ok.value.job().backoff_limit, 0);
}

TEST_F(ConfigTest, IntervalsBeyondCapAreRejected) {
    // Seconds are converted to milliseconds in an int.
    setenv("POLL_INTERVAL_SECS", "2147484", 1);
    auto r = Config::load_from(std::nullopt);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("at most 86400"), std::string::npos);

    setenv("POLL_INTERVAL_SECS", "86400", 1);
    auto ok = Config::load_from(std::nullopt);
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.monitor().poll_interval_secs, 86400);

    setenv("KUBECTL_TIMEOUT_SECS", "2147483", 1);
    EXPECT_TRUE(Config::load_from(std::nullopt).is_err());
}

TEST_F(ConfigTest, MalformedFileIsRejected) {
    auto not_map = write_file("- a\n- b\n");
    EXPECT_TRUE(Config::load_from(not_map).is_err());

    auto nested = write_file("namespace: {a: b}\n");
    EXPECT_TRUE(Config::load_from(nested).is_err());
}

TEST_F(ConfigTest, ExplicitMissingFileIsRejected) {
    setenv("FORGEOP_CONFIG", (dir_ / "absent.yaml").c_str(), 1);
    EXPECT_TRUE(Config::load().is_err());
}

TEST_F(ConfigTest, DescribeMasksSecret) {
    setenv("MINIO_SECRET_KEY", "hunter2", 1);
    auto r = Config::load_from(std::nullopt);
    ASSERT_TRUE(r.is_ok());

    std::string text = r.value.describe();
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
    EXPECT_NE(text.find("****"), std::string::npos);
}

TEST(WorkloadKindNames, ParseAcceptsAliases) {
    WorkloadKind k;
    EXPECT_TRUE(parse_workload_kind("Site", k));
    EXPECT_EQ(k, WorkloadKind::Site);
    EXPECT_TRUE(parse_workload_kind("researchsession", k));
    EXPECT_EQ(k, WorkloadKind::Session);
    EXPECT_FALSE(parse_workload_kind("job", k));
}
