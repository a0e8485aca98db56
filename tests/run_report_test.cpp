#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include "../src/core/run_report.hpp"
#include "../src/core/simulation_engine.hpp"
#include "test_support.hpp"

using namespace trade_sim;
using namespace trade_sim::testing_support;

namespace {

class BuyOnceAgent : public DecisionMaker {
public:
    std::string name() const override { return "buy-once"; }

    std::vector<Order> decide(const MarketSnapshot& snapshot) override {
        std::vector<Order> out;
        if (snapshot.day_index == 0) {
            out.push_back(Order{"AAA", OrderSide::BUY, 300, std::nullopt, "entry"});
            out.push_back(Order{"AAA", OrderSide::SELL, 100, std::nullopt, "too-early"});
        }
        if (snapshot.day_index == 2) {
            out.push_back(Order{"AAA", OrderSide::SELL, 100, std::nullopt, "trim"});
        }
        return out;
    }
};

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST(RunReportTest, ReportCarriesRunHistory) {
    auto source = std::make_shared<InMemoryDataSource>();
    add_series(*source, "AAA", {10, 10.5, 11, 10.8});
    Config cfg;
    cfg.run.instruments = {"AAA"};
    SimulationEngine engine(cfg, source);
    BuyOnceAgent agent;
    auto metrics = engine.run(agent);

    auto report = build_run_report(engine.config(), agent.name(), engine.recorder(), engine.ledger(), metrics);
    EXPECT_EQ(report["agent"], "buy-once");
    EXPECT_EQ(report["period"]["start"], "2024-01-01");
    EXPECT_EQ(report["period"]["end"], "2024-01-04");
    EXPECT_EQ(report["settings"]["fill_price"], "close");
    EXPECT_EQ(report["snapshots"].size(), 4u);

    const auto& txs = report["transactions"];
    ASSERT_EQ(txs.size(), 2u);
    EXPECT_EQ(txs[0]["id"], "T000001");
    EXPECT_EQ(txs[0]["side"], "buy");
    EXPECT_EQ(txs[0]["settles_on"], "2024-01-02");
    EXPECT_EQ(txs[0]["tag"], "entry");
    EXPECT_FALSE(txs[0].contains("realized_pl"));
    EXPECT_EQ(txs[1]["side"], "sell");
    EXPECT_TRUE(txs[1].contains("realized_pl"));

    ASSERT_EQ(report["rejections"].size(), 1u);
    EXPECT_EQ(report["rejections"][0]["code"], "InsufficientSettledShares");
    EXPECT_EQ(report["rejections"][0]["order"]["tag"], "too-early");

    ASSERT_EQ(report["final_positions"].size(), 1u);
    EXPECT_EQ(report["final_positions"][0]["qty"], 200);
    EXPECT_DOUBLE_EQ(report["final_cash"].get<double>(), engine.ledger().cash());
    EXPECT_EQ(report["metrics"]["trade_count"], 2);
    EXPECT_EQ(report["metrics"]["rejection_count"], 1);
}

TEST(RunReportTest, SaveWritesParsableFile) {
    auto dir = std::filesystem::temp_directory_path() / "trade_sim_report_test";
    std::filesystem::remove_all(dir);
    auto path = (dir / "nested" / "report.json").string();

    nlohmann::json report{{"agent", "x"}, {"final_cash", 12.5}};
    save_run_report(report, path);
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    std::ifstream f(path);
    auto loaded = nlohmann::json::parse(f);
    EXPECT_EQ(loaded, report);
    std::filesystem::remove_all(dir);
}

TEST(RunReportTest, FailedWriteLeavesNoReport) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    auto dir = std::filesystem::temp_directory_path() / "trade_sim_report_full";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto path = (dir / "report.json").string();
    // every write through the temporary file hits a full device
    std::filesystem::create_symlink("/dev/full", path + ".tmp");

    nlohmann::json report{{"agent", "x"}, {"snapshots", std::vector<int>(1000, 1)}};
    EXPECT_THROW(save_run_report(report, path), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(path));
    std::filesystem::remove_all(dir);
}

TEST(RunJournalTest, WritesOneJsonObjectPerLine) {
    auto path = temp_path("trade_sim_journal_test.jsonl");
    {
        RunJournal journal(path);
        ASSERT_TRUE(journal.is_open());
        journal.append({{"event", "fill"}, {"qty", 100}});
        journal.append({{"event", "day_close"}});
        EXPECT_EQ(journal.entries(), 2u);
    }
    std::ifstream f(path);
    std::string line;
    std::vector<nlohmann::json> rows;
    while (std::getline(f, line)) rows.push_back(nlohmann::json::parse(line));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["qty"], 100);
    EXPECT_EQ(rows[1]["event"], "day_close");
    std::filesystem::remove(path);
}

TEST(RunJournalTest, RollsOverAtSizeLimit) {
    auto path = temp_path("trade_sim_journal_roll.jsonl");
    {
        RunJournal journal(path, 64);
        for (int i = 0; i < 10; ++i) {
            journal.append({{"event", "day_close"}, {"equity", 1000000.0 + i}});
        }
    }
    EXPECT_TRUE(std::filesystem::exists(path + ".1"));
    std::filesystem::remove(path);
    for (int i = 1; i < 10; ++i) std::filesystem::remove(path + "." + std::to_string(i));
}
