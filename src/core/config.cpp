#include <libprecise++/core/config.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace libprecise {

namespace {

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

bool readStringList(const YAML::Node& node, const std::string& key,
                    std::vector<std::string>& out, std::string* error) {
    if (!node.IsSequence()) {
        setError(error, "'" + key + "' must be a list");
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            setError(error, "'" + key + "' must contain only strings");
            return false;
        }
        values.push_back(item.as<std::string>());
    }
    out = values;
    return true;
}

bool applyYaml(const YAML::Node& root, ResolverConfig& config, std::string* error) {
    if (root.IsNull()) {
        return true; // Empty document: keep defaults
    }
    if (!root.IsMap()) {
        setError(error, "configuration root must be a map");
        return false;
    }

    if (const auto categories = root["required_categories"]) {
        std::vector<std::string> values;
        if (!readStringList(categories, "required_categories", values, error)) {
            return false;
        }
        if (values.empty()) {
            setError(error, "'required_categories' must not be empty");
            return false;
        }
        config.required_categories = std::set<std::string>(values.begin(), values.end());
    }

    if (const auto priority = root["priority"]) {
        if (!priority.IsMap()) {
            setError(error, "'priority' must be a map");
            return false;
        }
        if (const auto projects = priority["project_types"]) {
            if (!readStringList(projects, "priority.project_types", config.priority.project_types, error)) {
                return false;
            }
        }
        if (const auto solutions = priority["solution_types"]) {
            if (!readStringList(solutions, "priority.solution_types", config.priority.solution_types, error)) {
                return false;
            }
        }
    }

    if (const auto listing = root["listing"]) {
        if (!listing.IsMap()) {
            setError(error, "'listing' must be a map");
            return false;
        }
        if (const auto workers = listing["workers"]) {
            const int value = workers.as<int>();
            if (value < 1) {
                setError(error, "'listing.workers' must be at least 1");
                return false;
            }
            config.listing_workers = value;
        }
    }

    return true;
}

} // namespace

bool parseConfig(const std::string& yaml_text, ResolverConfig& config, std::string* error) {
    ResolverConfig parsed = config;
    try {
        if (!applyYaml(YAML::Load(yaml_text), parsed, error)) {
            return false;
        }
    } catch (const YAML::Exception& e) {
        setError(error, e.what());
        return false;
    }

    config = parsed;
    return true;
}

bool loadConfig(const std::string& filename, ResolverConfig& config, std::string* error) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        setError(error, "cannot open " + filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str(), config, error);
}

} // namespace libprecise
