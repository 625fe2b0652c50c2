#include <gtest/gtest.h>
#include <surge/config/settings.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace surge;
using namespace surge::config;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
            hadOld_ = true;
        }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (hadOld_)
            ::setenv(name_, old_.c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::string old_;
    bool hadOld_ = false;
};

} // namespace

TEST(SettingsTest, DefaultsValidate) {
    Settings s;
    EXPECT_TRUE(validate(s).has_value());
    EXPECT_EQ(s.workload.loadMode, LoadMode::Concurrency);
    EXPECT_EQ(s.orchestrator.deadWorkerPolicy, DeadWorkerPolicy::Fail);
    EXPECT_EQ(s.findMax.maxBackoffAttempts, 0);
}

TEST(SettingsTest, ParsesSectionsAndSlo) {
    const auto sections = parseConfigText(R"(
# comment
[orchestrator]
worker_group_size = 3
min_workers = 2
dead_worker_policy = "degrade"

[workload]
load_mode = find_max
point_lookup_pct = 70
insert_pct = 30   # trailing comment

[find_max]
start_concurrency = 4
concurrency_increment = 6
max_concurrency = 40
step_duration_ms = 2000

[find_max.slo.point_lookup]
p99_ms = 25.5
)");
    auto parsed = settingsFromSections(sections);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    const auto& s = parsed.value();

    EXPECT_EQ(s.orchestrator.workerGroupSize, 3);
    EXPECT_EQ(s.orchestrator.minWorkers, 2);
    EXPECT_EQ(s.orchestrator.deadWorkerPolicy, DeadWorkerPolicy::Degrade);
    EXPECT_EQ(s.workload.loadMode, LoadMode::FindMax);
    EXPECT_DOUBLE_EQ(s.workload.mix.pointLookupPct, 70.0);
    EXPECT_DOUBLE_EQ(s.workload.mix.insertPct, 30.0);
    EXPECT_EQ(s.findMax.startConcurrency, 4);
    EXPECT_EQ(s.findMax.concurrencyIncrement, 6);
    EXPECT_EQ(s.findMax.stepDuration, std::chrono::milliseconds(2000));

    ASSERT_EQ(s.findMax.slo.count("POINT_LOOKUP"), 1u);
    const auto& slo = s.findMax.slo.at("POINT_LOOKUP");
    ASSERT_TRUE(slo.p99Ms.has_value());
    EXPECT_DOUBLE_EQ(*slo.p99Ms, 25.5);
    EXPECT_FALSE(slo.p95Ms.has_value());
}

TEST(SettingsTest, RejectsUnparseableValues) {
    auto bad = settingsFromSections(parseConfigText("[orchestrator]\nworker_group_size = lots\n"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);

    auto policy =
        settingsFromSections(parseConfigText("[orchestrator]\ndead_worker_policy = ignore\n"));
    EXPECT_FALSE(policy.has_value());
}

TEST(SettingsTest, ValidateRejectsImpossibleCombinations) {
    Settings s;
    s.orchestrator.workerGroupSize = 2;
    s.orchestrator.minWorkers = 3;
    EXPECT_FALSE(validate(s).has_value());

    s = Settings{};
    s.findMax.startConcurrency = 50;
    s.findMax.maxConcurrency = 10;
    EXPECT_FALSE(validate(s).has_value());

    s = Settings{};
    s.workload.mix = OperationMix{0, 0, 0, 0};
    EXPECT_FALSE(validate(s).has_value());

    s = Settings{};
    s.heartbeat.interval = std::chrono::milliseconds(2000);
    s.heartbeat.staleTimeout = std::chrono::milliseconds(2000);
    EXPECT_FALSE(validate(s).has_value());
}

TEST(SettingsTest, IntegersOutsideIntRangeAreRejected) {
    auto huge = settingsFromSections(
        parseConfigText("[orchestrator]\nworker_group_size = 4294967299\n"));
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(huge.error().message.find("worker_group_size"), std::string::npos);

    // Millisecond fields are 64-bit and keep large values.
    auto wide = settingsFromSections(parseConfigText("[store]\nbusy_timeout_ms = 4294967299\n"));
    ASSERT_TRUE(wide.has_value());
    EXPECT_EQ(wide.value().store.busyTimeout.count(), 4294967299LL);
}

TEST(SettingsTest, EnvironmentOverridesFileValues) {
    const auto dir = std::filesystem::temp_directory_path() / "surge_settings_test";
    std::filesystem::create_directories(dir);
    const auto file = dir / "config.toml";
    {
        std::ofstream out(file);
        out << "[store]\npath = \"/tmp/from-file.db\"\n[logging]\nlevel = warn\n";
    }

    ScopedEnv store("SURGE_STORE_PATH", "/tmp/from-env.db");
    auto loaded = loadSettings(file.string());
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().store.path, "/tmp/from-env.db");
    EXPECT_EQ(loaded.value().logging.level, "warn");

    std::filesystem::remove_all(dir);
}

TEST(SettingsTest, ExplicitMissingFileIsAnError) {
    auto loaded = loadSettings("/nonexistent/surge/config.toml");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::FileNotFound);
}

TEST(ConfigTextTest, QuotedValuesKeepHashes) {
    const auto sections = parseConfigText("top = 1\n[a.b]\nname = \"x # y\"\nbare = z # gone\n"
                                          "garbage line\n[broken\nother = 'q'\n");
    EXPECT_EQ(sections.at("").at("top"), "1");
    EXPECT_EQ(sections.at("a.b").at("name"), "x # y");
    EXPECT_EQ(sections.at("a.b").at("bare"), "z");
    EXPECT_EQ(sections.at("a.b").at("other"), "q");
    EXPECT_EQ(sections.at("a.b").count("garbage line"), 0u);
}

TEST(ConfigTextTest, HomeExpansion) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expandHome("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expandHome("~/runs/s.db"), std::filesystem::path("/home/tester/runs/s.db"));
    EXPECT_EQ(expandHome("~other/x"), std::filesystem::path("~other/x"));
    EXPECT_EQ(expandHome("/abs"), std::filesystem::path("/abs"));
    EXPECT_EQ(resolveConfigPath("~/c.toml"), std::filesystem::path("/home/tester/c.toml"));
}
