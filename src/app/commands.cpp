// ==============================================================================
// commands.cpp - Команды приложения (lint, load)
// ==============================================================================

#include "sysguard/commands.hpp"

#include "sysguard/config.hpp"
#include "sysguard/output.hpp"
#include "sysguard/platform.hpp"
#include "sysguard/rule.hpp"
#include "sysguard/slot.hpp"
#include "sysguard/store.hpp"

#include <memory>
#include <rapidjson/document.h>
#include <string>
#include <vector>

namespace sysguard::app {

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    writer.info("Validating supplied system rules...");

    std::size_t count = 0;
    std::size_t failed = 0;
    bool parse_failed = false;

    for (const auto& path : cmd.paths) {
        auto loaded = config::load_rule_file(path);
        if (!loaded) {
            writer.error(loaded.error.format());
            parse_failed = true;
            continue;
        }

        const std::string file_name = platform::path_to_utf8(path.filename());
        for (const auto& r : loaded.rules) {
            if (auto err = rule::validate(r)) {
                ++failed;
                writer.warn(file_name + ": " + r.to_string() + ": " + err->message);
            } else {
                ++count;
                writer.debug(file_name + ": " + r.to_string());
            }
        }
    }

    writer.info("Validated " + std::to_string(count) + " rules out of " +
                std::to_string(count + failed));
    return parse_failed ? 1 : 0;
}

// ----------------------------------------------------------------------------
// load
// ----------------------------------------------------------------------------

namespace {

void print_rules(const std::vector<rule::Rule>& rules, const slot::SlotRegistry& registry,
                 bool json, output::Writer& out) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();

        rapidjson::Value rules_json(rapidjson::kArrayType);
        for (const auto& r : rules) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("id", rapidjson::Value(r.id.c_str(), alloc), alloc);
            obj.AddMember("metric_type",
                          rapidjson::Value(rule::to_string(r.metric_type).c_str(), alloc), alloc);
            obj.AddMember("trigger_count", r.trigger_count, alloc);
            obj.AddMember("strategy", rapidjson::Value(rule::to_string(r.strategy).c_str(), alloc),
                          alloc);
            obj.AddMember("resource", rapidjson::Value(r.resource_name().c_str(), alloc), alloc);
            rules_json.PushBack(obj, alloc);
        }
        doc.AddMember("rules", rules_json, alloc);

        rapidjson::Value resources_json(rapidjson::kArrayType);
        for (const auto& resource : registry.resources()) {
            resources_json.PushBack(rapidjson::Value(resource.c_str(), alloc), alloc);
        }
        doc.AddMember("registered_resources", resources_json, alloc);

        out.write_json_pretty(doc);
        return;
    }

    output::Table table;
    table.set_headers({"id", "metric_type", "trigger_count", "strategy", "resource"});
    for (const auto& r : rules) {
        table.add_row({r.id, rule::to_string(r.metric_type), std::to_string(r.trigger_count),
                       rule::to_string(r.strategy), r.resource_name()});
    }
    table.print(out);
}

}  // namespace

int run_load(const cli::LoadCommand& cmd, output::Writer& writer) {
    // Результаты - в файл, если задан --output; диагностика остаётся в writer
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        out_cfg.log_path.reset();
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Failed to open output file: " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    slot::SlotRegistry registry;
    store::RuleStore store(registry, writer);

    for (const auto& path : cmd.paths) {
        auto loaded = config::load_rule_file(path);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }

        writer.info("Loading " + std::to_string(loaded.rules.size()) + " rules from " +
                    platform::path_to_utf8(path));
        auto result = store.load_rules(loaded.rules);
        if (!result) {
            writer.error(result.error.format());
            return 1;
        }
    }

    auto rules = store.rules();
    writer.info("Active rules: " + std::to_string(rules.size()));

    std::string resources;
    for (const auto& resource : registry.resources()) {
        resources += resources.empty() ? resource : ", " + resource;
    }
    writer.info("Registered check slots (" + std::string(slot::DEFAULT_ADAPTIVE_SLOT) +
                "): " + (resources.empty() ? std::string("none") : resources));
    const bool json = cmd.json || out->config().format == output::Format::Json;
    print_rules(rules, registry, json, *out);
    return 0;
}

}  // namespace sysguard::app
