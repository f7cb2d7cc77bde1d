#include "system_manager.hpp"
#include "analysis_orchestrator.hpp"
#include "api/reasoning/chat_completion_client.hpp"
#include "configs/config_loader.hpp"
#include "logging/logs/system_logs.hpp"
#include "market_data/bars_csv_loader.hpp"
#include "report/report_assembler.hpp"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;
using QuantSignal::Logging::SystemLogs;

namespace QuantSignal {
namespace System {

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    try {
        // Logging context first - config loading already logs
        initialization_result.logging_context = std::make_shared<QuantSignal::Logging::LoggingContext>();
        QuantSignal::Logging::set_logging_context(*initialization_result.logging_context);

        int config_load_result = load_system_config(initialization_result.config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error("Config load failed with result: " + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        initialization_result.logger = QuantSignal::Logging::initialize_application_foundation(initialization_result.config);

        SystemLogs::log_application_header();
        SystemLogs::log_configuration_table(initialization_result.config);

    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        if (initialization_result.logger) {
            QuantSignal::Logging::shutdown_global_logger(*initialization_result.logger);
        }
        QuantSignal::Logging::clear_logging_context();
        throw;
    }

    return initialization_result;
}

QuantSignal::API::ReasoningServicePtr create_reasoning_service(const QuantSignal::Config::SystemConfig& config) {
    bool service_configured = config.reasoning.has_api_key();
    SystemLogs::log_reasoning_service_status(service_configured, config.reasoning);
    if (!service_configured) {
        return nullptr;
    }
    return std::make_unique<QuantSignal::API::ChatCompletionClient>(config.reasoning);
}

int run(const SystemInitializationResult& system, const std::string& bars_csv_path, const std::string& symbol) {
    try {
        QuantSignal::Core::PriceSeries bars = QuantSignal::Core::load_bars_from_csv(bars_csv_path);
        SystemLogs::log_bars_loaded(bars_csv_path, bars.size());

        AnalysisOrchestrator orchestrator(system.config, create_reasoning_service(system.config));
        AnalysisOutcome outcome = orchestrator.analyze_symbol(symbol, bars);

        if (!outcome.success || !outcome.result) {
            json failure_json = {{"success", false}, {"symbol", symbol}, {"error", outcome.error_message}};
            std::cout << failure_json.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return 1;
        }

        std::cout << QuantSignal::Core::ReportAssembler::analysis_result_to_json(*outcome.result).dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return 0;
    } catch (const std::exception& run_exception_error) {
        SystemLogs::log_fatal_error(run_exception_error.what());
        json failure_json = {{"success", false}, {"symbol", symbol}, {"error", run_exception_error.what()}};
        std::cout << failure_json.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return 1;
    }
}

void shutdown(SystemInitializationResult& system) {
    SystemLogs::log_shutdown();
    if (system.logger) {
        QuantSignal::Logging::shutdown_global_logger(*system.logger);
    }
    QuantSignal::Logging::clear_logging_context();
}

} // namespace System
} // namespace QuantSignal
