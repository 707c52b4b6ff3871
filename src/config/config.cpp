// ==============================================================================
// config.cpp - Загрузка системных правил из YAML
// ==============================================================================

#include <sysguard/config.hpp>
#include <sysguard/platform.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sysguard::config {

std::string ConfigError::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

namespace {

// Разобрать одно правило; std::runtime_error при ошибке структуры
rule::Rule parse_rule_yaml(const YAML::Node& node, std::size_t position) {
    const std::string where = "rule #" + std::to_string(position + 1);

    if (!node.IsMap()) {
        throw std::runtime_error(where + ": expected a mapping");
    }
    if (!node["metric_type"]) {
        throw std::runtime_error(where + ": missing 'metric_type'");
    }
    if (!node["trigger_count"]) {
        throw std::runtime_error(where + ": missing 'trigger_count'");
    }

    rule::Rule r;
    r.id = node["id"].as<std::string>("");
    r.resource = node["resource"].as<std::string>("");

    try {
        r.metric_type = rule::parse_metric_type(node["metric_type"].as<std::string>());
        if (node["strategy"]) {
            r.strategy = rule::parse_strategy(node["strategy"].as<std::string>());
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(where + ": " + e.what());
    }

    try {
        r.trigger_count = node["trigger_count"].as<double>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error(where + ": 'trigger_count' must be a number");
    }

    return r;
}

ConfigResult parse_document(const YAML::Node& root) {
    ConfigResult result;

    YAML::Node rules_node = root;
    if (root.IsMap()) {
        rules_node = root["rules"];
        if (!rules_node) {
            result.error.message = "missing 'rules' key";
            return result;
        }
    }

    // Пустой список (или "rules:" без значения) - допустимый способ очистки
    if (rules_node.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!rules_node.IsSequence()) {
        result.error.message = "'rules' must be a sequence";
        return result;
    }

    try {
        for (std::size_t i = 0; i < rules_node.size(); ++i) {
            result.rules.push_back(parse_rule_yaml(rules_node[i], i));
        }
    } catch (const std::runtime_error& e) {
        result.rules.clear();
        result.error.message = e.what();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

ConfigResult parse_rules(std::string_view yaml) {
    try {
        return parse_document(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error.message = std::string("invalid YAML: ") + e.what();
        return result;
    }
}

ConfigResult load_rule_file(const std::filesystem::path& path) {
    ConfigResult result;
    const std::string path_str = platform::path_to_utf8(path);

    const auto ext = path.extension().string();
    if (ext != ".yml" && ext != ".yaml") {
        result.error = {"rule file must have a .yml or .yaml extension", path_str};
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = {"failed to open file", path_str};
        return result;
    }

    std::ostringstream content;
    content << file.rdbuf();

    result = parse_rules(content.str());
    if (!result.ok) {
        result.error.path = path_str;
    }
    return result;
}

}  // namespace sysguard::config
