// tests/graph/test_engine_log.cpp - Tests for the engine's named logger
//
// The suite registers its own "critpath" logger (ostream sink) before the
// engine first asks for one, the way a host application would, and checks
// what the pipeline reports at each level.

#include <critpath/core/log.h>
#include <critpath/graph/analyse.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace critpath;
using namespace critpath::graph;

namespace {

issue task(std::string id, std::vector<std::string> blocked = {}) {
    return issue{.id = std::move(id), .duration_hours = 1.0, .blocks_ids = std::move(blocked)};
}

} // namespace

class EngineLogTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured_);
        auto logger = std::make_shared<spdlog::logger>(engine_logger_name, std::move(sink));
        logger->set_pattern("%l %v");
        spdlog::register_logger(logger);
    }

    static void TearDownTestSuite() { spdlog::drop(engine_logger_name); }

    void SetUp() override {
        captured_.str("");
        engine_log()->set_level(spdlog::level::warn);
    }

    static std::string output() { return captured_.str(); }

    static inline std::ostringstream captured_;
};

TEST_F(EngineLogTest, HostRegisteredLoggerIsUsed) {
    EXPECT_EQ(engine_log()->name(), "critpath");
    EXPECT_EQ(engine_log(), spdlog::get(engine_logger_name));
}

TEST_F(EngineLogTest, AcyclicBuildIsQuietAtWarn) {
    std::vector<issue> issues{task("A", {"B"}), task("B")};
    (void)analyse(issues);
    EXPECT_TRUE(output().empty()) << output();
}

TEST_F(EngineLogTest, CycleIsWarned) {
    std::vector<issue> issues{task("A", {"B"}), task("B", {"A"})};
    (void)analyse(issues);
    EXPECT_NE(output().find("warning cycle detection: 2 edge(s) on dependency cycles"),
              std::string::npos)
        << output();
}

TEST_F(EngineLogTest, DuplicateIdIsWarned) {
    std::vector<issue> issues{task("A"), task("A")};
    (void)build_graph(issues);
    EXPECT_NE(output().find("duplicate issue id 'A' ignored"), std::string::npos) << output();
}

TEST_F(EngineLogTest, BuildSummaryAtDebug) {
    engine_log()->set_level(spdlog::level::debug);
    std::vector<issue> issues{task("A", {"B", "ghost"}), task("B")};
    (void)analyse(issues);
    auto const out = output();
    EXPECT_NE(out.find("debug graph_builder: dropped dangling edge A -> ghost"), std::string::npos)
        << out;
    EXPECT_NE(out.find("debug graph_builder: 2 nodes, 1 edges"), std::string::npos) << out;
    EXPECT_NE(out.find("debug analyse: 2 nodes"), std::string::npos) << out;
}
