#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "agents/moving_average_agent.hpp"
#include "core/config.hpp"
#include "core/data_source_csv.hpp"
#include "core/run_journal.hpp"
#include "core/run_report.hpp"
#include "core/simulation_engine.hpp"

namespace {

void setup_logging(const trade_sim::LoggingConfig& cfg) {
    if (!cfg.file.empty()) {
        auto logger = spdlog::basic_logger_mt("trade_sim", cfg.file);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    try {
        trade_sim::Config cfg;
        trade_sim::load_config(cfg, config_path);
        setup_logging(cfg.logging);
        spdlog::info("Trade simulator starting. config={} data_dir={}", config_path, cfg.run.data_dir);

        auto source = std::make_shared<trade_sim::CsvDataSource>();
        source->load_directory(cfg.run.data_dir);
        if (cfg.run.instruments.empty()) {
            cfg.run.instruments = source->symbols();
            spdlog::info("No instruments configured, using all {} loaded symbols", cfg.run.instruments.size());
        }

        trade_sim::SimulationEngine engine(cfg, source);
        if (!cfg.run.journal_path.empty()) {
            engine.set_journal(std::make_shared<trade_sim::RunJournal>(cfg.run.journal_path));
        }

        trade_sim::MovingAverageAgent agent(cfg.agent);
        auto metrics = engine.run(agent);

        auto report = trade_sim::build_run_report(engine.config(), agent.name(), engine.recorder(),
                                                  engine.ledger(), metrics);
        trade_sim::save_run_report(report, cfg.run.report_path);
    } catch (const std::exception& e) {
        spdlog::error("Trade simulator failed: {}", e.what());
        return 1;
    }
    return 0;
}
