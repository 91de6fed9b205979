// =================================================================
// src/Tempo/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Tempo/CliParser.hpp"

namespace Tempo {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Tempo: adaptive caching, load balancing and monitoring for generation backends.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file")
        ->capture_default_str();
    m_app->add_option("--log-level", m_commands.log_level, "Console log level (debug, info, warning, error)");

    // Store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupValidateCommand(*m_app);
    setupGenerateCommand(*m_app);
    setupReplayCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupValidateCommand(CLI::App& app) {
    app.add_subcommand("validate", "Loads and validates the configuration file, then prints a summary.");
}

void CliParser::setupGenerateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("generate", "Runs a single request through the optimizer and prints the result as JSON.");
    sub->add_option("-t,--type", m_commands.analysis_type, "Analysis type of the request")->required();
    sub->add_option("content", m_commands.content, "Request content used as the cache key")->required();
    sub->add_option("-p,--prompt", m_commands.prompt, "Prompt sent to the backend (defaults to the content)");
    sub->add_option("-s,--session", m_commands.session_id, "Session identifier")->capture_default_str();
    sub->add_option("--max-tokens", m_commands.max_tokens, "Generation length limit")->check(CLI::PositiveNumber);
    sub->add_option("--temperature", m_commands.temperature, "Sampling temperature")->check(CLI::NonNegativeNumber);
}

void CliParser::setupReplayCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("replay", "Replays JSON-lines requests concurrently, then prints the performance report.");
    sub->add_option("requests", m_commands.requests_file, "File with one JSON request per line")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-j,--concurrency", m_commands.concurrency, "Number of concurrent callers")
        ->check(CLI::Range(1, 256))
        ->capture_default_str();
}

} // namespace Tempo
