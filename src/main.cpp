/**
 * Campaign Keeper - File-backed content store for tabletop campaigns
 * 
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <nlohmann/json.hpp>

#include <iostream>

#include "content/ContentService.hpp"
#include "content/ContentStore.hpp"
#include "content/FileLock.hpp"
#include "content/ModuleRegistry.hpp"
#include "content/RelationshipIndex.hpp"
#include "core/campaign/CampaignManager.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"

namespace {

void setupLogging(const std::filesystem::path& logDirectory) {
    // stdout carries command results, diagnostics go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    
    auto logPath = logDirectory / "campaign-keeper.log";
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    try {
        std::filesystem::create_directories(logPath.parent_path());
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        std::cerr << "Log file unavailable, logging to console only: " << e.what() << std::endl;
    }
    
    auto logger = std::make_shared<spdlog::logger>("keeper", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    
    spdlog::set_default_logger(logger);
    spdlog::debug("Campaign Keeper starting up...");
}

nlohmann::json metadataListJson(const std::vector<keeper::EntityMetadata>& items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(item.toJson());
    }
    return array;
}

nlohmann::json relatedJson(const keeper::RelatedEntities& related) {
    nlohmann::json obj;
    obj["references"] = metadataListJson(related.references);
    obj["referencedBy"] = metadataListJson(related.referencedBy);
    return obj;
}

/**
 * Print a result as JSON, or its error to stderr
 * 
 * @return Process exit code
 */
template <typename T, typename ToJson>
int report(const keeper::ContentResult<T>& result, ToJson&& toJson) {
    if (!result.isSuccess()) {
        std::cerr << keeper::contentErrorKindToString(result.error) << ": "
                  << result.errorMessage << std::endl;
        return 1;
    }
    std::cout << toJson(*result.value).dump(2) << std::endl;
    return 0;
}

/**
 * Parse --set key=value pairs; values are JSON, falling back to plain strings
 */
bool parseAssignments(const QStringList& assignments, nlohmann::json& frontmatter) {
    for (const auto& assignment : assignments) {
        int eq = assignment.indexOf('=');
        if (eq <= 0) {
            std::cerr << "Invalid --set value (expected key=value): "
                      << assignment.toStdString() << std::endl;
            return false;
        }
        std::string key = assignment.left(eq).toStdString();
        std::string value = assignment.mid(eq + 1).toStdString();
        
        auto parsed = nlohmann::json::parse(value, nullptr, false);
        frontmatter[key] = parsed.is_discarded() ? nlohmann::json(value) : parsed;
    }
    return true;
}

std::vector<std::string> splitList(const QString& value) {
    std::vector<std::string> items;
    for (const auto& part : value.split(',', Qt::SkipEmptyParts)) {
        items.push_back(part.trimmed().toStdString());
    }
    return items;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("Campaign Keeper");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("campaign-keeper");
    
    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "File-backed campaign content store\n\n"
        "Commands:\n"
        "  campaigns                     List campaigns\n"
        "  create-campaign <name>        Create a campaign (--modules)\n"
        "  list <module>                 List entities\n"
        "  get <module> <id>             Show an entity\n"
        "  create <module> <name>        Create an entity (--content, --set)\n"
        "  update <module> <id>          Update an entity (--name, --content, --set)\n"
        "  delete <module> <id>          Delete an entity\n"
        "  related <id>                  Show relationships of an entity\n"
        "  player-list <module>          List entities as players see them\n"
        "  player-get <module> <id>      Show an entity as players see it\n"
        "  search <query>                Search player-visible entities (--modules)");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "Command to run");
    parser.addPositionalArgument("arguments", "Command arguments", "[arguments...]");
    
    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);
    
    QCommandLineOption campaignsDirOption(
        QStringList() << "d" << "campaigns-directory",
        "Directory holding one folder per campaign",
        "path"
    );
    parser.addOption(campaignsDirOption);
    
    QCommandLineOption campaignOption(
        QStringList() << "campaign",
        "Campaign to work on (defaults to the configured active campaign)",
        "id"
    );
    parser.addOption(campaignOption);
    
    QCommandLineOption nameOption(QStringList() << "name", "Entity name", "name");
    parser.addOption(nameOption);
    
    QCommandLineOption contentOption(QStringList() << "content", "Entity body text", "text");
    parser.addOption(contentOption);
    
    QCommandLineOption setOption(
        QStringList() << "set",
        "Frontmatter field; value is JSON or a plain string, null removes it",
        "key=value"
    );
    parser.addOption(setOption);
    
    QCommandLineOption modulesOption(
        QStringList() << "modules",
        "Comma-separated module ids",
        "ids"
    );
    parser.addOption(modulesOption);
    
    parser.process(app);
    
    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = keeper::Platform::getConfigPath();
    }
    
    setupLogging(configPath / "logs");
    
    auto& configManager = keeper::ConfigManager::instance();
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }
    
    if (configManager.isFirstRun() && !configManager.save()) {
        spdlog::warn("Could not write default configuration");
    }
    
    auto config = configManager.programConfig();
    spdlog::set_level(keeper::logLevelFromString(config.logVerbosity));
    spdlog::info("Configuration loaded from: {}", configPath.string());
    
    if (parser.isSet(campaignsDirOption)) {
        config.campaignsDirectory = parser.value(campaignsDirOption).toStdString();
    }
    
    // Wire up the content stack
    auto locks = std::make_shared<keeper::FileLock>(
        std::chrono::seconds(config.lockStallWarningSeconds));
    keeper::ContentStore store(config.campaignsDirectory, locks, config.entityExtension);
    keeper::RelationshipIndex index(store);
    auto registry = keeper::ModuleRegistry::withBuiltinModules();
    registry.registerRelationships(index);
    registry.registerDerivedArtifacts(store);
    
    keeper::CampaignManager campaigns(config.campaignsDirectory);
    keeper::ContentService service(campaigns, store, index, registry);
    
    std::string campaignId = parser.isSet(campaignOption)
        ? parser.value(campaignOption).toStdString()
        : config.activeCampaign;
    if (!campaignId.empty() && !campaigns.setActive(campaignId)) {
        spdlog::warn("Campaign not found: {}", campaignId);
    }
    
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    
    const QString command = args.first();
    auto arg = [&](int i) { return args.value(i).toStdString(); };
    auto requireArgs = [&](int count) {
        if (args.size() < count + 1) {
            std::cerr << "Missing arguments for " << command.toStdString() << std::endl;
            return false;
        }
        return true;
    };
    
    if (command == "campaigns") {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& campaign : campaigns.list()) {
            array.push_back(nlohmann::json::parse(campaign.toJson()));
        }
        std::cout << array.dump(2) << std::endl;
        return 0;
    }
    
    if (command == "create-campaign") {
        if (!requireArgs(1)) return 1;
        keeper::CreateCampaignInput input;
        input.name = arg(1);
        if (parser.isSet(modulesOption)) {
            input.modules = splitList(parser.value(modulesOption));
        } else {
            for (const auto& module : registry.getAll()) {
                input.modules.push_back(module.dataFolder);
            }
        }
        auto created = campaigns.create(input);
        if (!created) {
            std::cerr << "Failed to create campaign" << std::endl;
            return 1;
        }
        std::cout << nlohmann::json::parse(created->toJson()).dump(2) << std::endl;
        return 0;
    }
    
    if (command == "list") {
        if (!requireArgs(1)) return 1;
        return report(service.listEntities(arg(1)), metadataListJson);
    }
    
    if (command == "get") {
        if (!requireArgs(2)) return 1;
        return report(service.getEntity(arg(1), arg(2)),
                      [](const keeper::Entity& e) { return e.toJson(); });
    }
    
    if (command == "create") {
        if (!requireArgs(2)) return 1;
        keeper::CreateEntityInput input;
        input.name = arg(2);
        input.content = parser.value(contentOption).toStdString();
        if (!parseAssignments(parser.values(setOption), input.frontmatter)) return 1;
        return report(service.createEntity(arg(1), input),
                      [](const keeper::Entity& e) { return e.toJson(); });
    }
    
    if (command == "update") {
        if (!requireArgs(2)) return 1;
        keeper::UpdateEntityInput update;
        if (parser.isSet(nameOption)) {
            update.name = parser.value(nameOption).toStdString();
        }
        if (parser.isSet(contentOption)) {
            update.content = parser.value(contentOption).toStdString();
        }
        if (!parseAssignments(parser.values(setOption), update.frontmatter)) return 1;
        return report(service.updateEntity(arg(1), arg(2), update),
                      [](const keeper::Entity& e) { return e.toJson(); });
    }
    
    if (command == "delete") {
        if (!requireArgs(2)) return 1;
        return report(service.deleteEntity(arg(1), arg(2)),
                      [](bool deleted) { return nlohmann::json{{"deleted", deleted}}; });
    }
    
    if (command == "related") {
        if (!requireArgs(1)) return 1;
        return report(service.getRelated(arg(1)), relatedJson);
    }
    
    if (command == "player-list") {
        if (!requireArgs(1)) return 1;
        return report(service.listForPlayers(campaignId, arg(1)), metadataListJson);
    }
    
    if (command == "player-get") {
        if (!requireArgs(2)) return 1;
        return report(service.getForPlayers(campaignId, arg(1), arg(2)),
                      [](const keeper::Entity& e) { return e.toJson(); });
    }
    
    if (command == "search") {
        if (!requireArgs(1)) return 1;
        std::vector<std::string> modules;
        if (parser.isSet(modulesOption)) {
            modules = splitList(parser.value(modulesOption));
        }
        return report(service.searchForPlayers(campaignId, arg(1), modules),
            [](const std::vector<keeper::SearchResult>& results) {
                nlohmann::json array = nlohmann::json::array();
                for (const auto& result : results) {
                    array.push_back(result.toJson());
                }
                return array;
            });
    }
    
    std::cerr << "Unknown command: " << command.toStdString() << std::endl;
    return 1;
}
