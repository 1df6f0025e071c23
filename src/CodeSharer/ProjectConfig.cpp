// =================================================================
// src/CodeSharer/ProjectConfig.cpp
// =================================================================
// Implementation for loading and serializing the configuration.

#include "CodeSharer/ProjectConfig.hpp"
#include "CodeSharer/Errors.hpp"
#include "CodeSharer/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace CodeSharer {

namespace {

std::set<std::string> readStringSet(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        throw ConfigError("'" + key + "' must be a sequence");
    }
    std::set<std::string> values;
    for (const auto& item : node) {
        values.insert(item.as<std::string>());
    }
    return values;
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        throw ConfigError("'" + key + "' must be a sequence");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

size_t readCount(const YAML::Node& node, const std::string& key, bool allow_zero) {
    long long value = node.as<long long>();
    if (value < 0 || (value == 0 && !allow_zero)) {
        throw ConfigError("'" + key + "' must be " + (allow_zero ? "non-negative" : "positive") +
                          ", got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

template <typename Container>
void emitSequence(YAML::Emitter& out, const std::string& key, const Container& values) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& value : values) {
        out << value;
    }
    out << YAML::EndSeq;
}

} // namespace

ProjectConfig ProjectConfig::defaults() {
    ProjectConfig config;

    config.skip_dirs = {
        ".git", ".venv", "venv", "node_modules", "__pycache__",
        "build", "dist", ".vscode", ".idea", "target",
        "bin", "obj", ".pytest_cache"
    };

    config.skip_files = {
        ".gitignore", ".pyc", ".exe", ".dll", ".so",
        "context.md", ".DS_Store", "Thumbs.db", ".env",
        "package-lock.json", "yarn.lock", "poetry.lock", "Pipfile.lock",
        ProjectConfig::DEFAULT_CONFIG_FILE
    };

    config.allowed_extensions = {
        ".cpp", ".c", ".cc", ".cxx",
        ".h", ".hpp", ".hxx",
        ".py", ".pyx",
        ".js", ".jsx", ".ts", ".tsx",
        ".md", ".txt", ".rst",
        ".qml", ".qrc",
        ".cmake",
        ".json", ".yaml", ".yml",
        ".sql", ".sh", ".bat",
        ".css", ".scss", ".less",
        ".html", ".htm"
    };

    config.ignore_files = {".gitignore"};
    config.project_markers = {".git", ".hg", ".svn"};
    config.language_tags = defaultLanguageTags();

    return config;
}

ProjectConfig ProjectConfig::loadFromFile(const std::string& config_path) {
    ProjectConfig config = defaults();

    try {
        YAML::Node root = YAML::LoadFile(config_path);

        if (root.IsNull()) {
            Logger::getInstance().warning("ProjectConfig", "Configuration file is empty, using defaults", config_path);
            return config;
        }
        if (!root.IsMap()) {
            throw ConfigError("Configuration root must be a mapping");
        }

        if (root["skip_dirs"]) {
            config.skip_dirs = readStringSet(root["skip_dirs"], "skip_dirs");
        }
        if (root["skip_files"]) {
            config.skip_files = readStringSet(root["skip_files"], "skip_files");
        }
        if (root["allowed_extensions"]) {
            config.allowed_extensions = readStringSet(root["allowed_extensions"], "allowed_extensions");
        }
        if (root["max_chars_per_file"]) {
            config.max_chars_per_file = readCount(root["max_chars_per_file"], "max_chars_per_file", false);
        }
        if (root["structure_max_depth"]) {
            config.structure_max_depth = readCount(root["structure_max_depth"], "structure_max_depth", true);
        }
        if (root["ignore_files"]) {
            config.ignore_files = readStringList(root["ignore_files"], "ignore_files");
        }
        if (root["project_markers"]) {
            config.project_markers = readStringList(root["project_markers"], "project_markers");
        }
        if (root["output"]) {
            config.output = root["output"].as<std::string>();
        }

        const YAML::Node& tags = root["language_tags"];
        if (tags) {
            if (!tags.IsMap()) {
                throw ConfigError("'language_tags' must be a mapping");
            }
            for (YAML::const_iterator it = tags.begin(); it != tags.end(); ++it) {
                std::string extension = RuleSet::normalizeExtension(it->first.as<std::string>());
                config.language_tags[extension] = it->second.as<std::string>();
            }
        }
    } catch (const ConfigError& e) {
        throw ConfigError(config_path + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigError(config_path + ": " + e.what());
    }

    std::vector<std::string> problems = config.validate();
    if (!problems.empty()) {
        throw ConfigError(config_path + ": " + problems.front());
    }

    Logger::getInstance().info("ProjectConfig", "Loaded configuration", config_path);
    return config;
}

ProjectConfig ProjectConfig::resolve(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(explicit_path, ec)) {
            throw ConfigError("Configuration file not found: " + explicit_path);
        }
        return loadFromFile(explicit_path);
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(DEFAULT_CONFIG_FILE, ec)) {
        return loadFromFile(DEFAULT_CONFIG_FILE);
    }

    LOG_DEBUG("ProjectConfig", "No configuration file, using defaults");
    return defaults();
}

std::vector<std::string> ProjectConfig::validate() const {
    std::vector<std::string> problems;

    if (max_chars_per_file == 0) {
        problems.push_back("max_chars_per_file must be greater than 0");
    }

    for (const auto& extension : allowed_extensions) {
        if (extension.find('/') != std::string::npos || extension.find('\\') != std::string::npos) {
            problems.push_back("allowed extension '" + extension + "' contains a path separator");
        }
    }

    for (const auto& dir : skip_dirs) {
        if (dir.empty()) {
            problems.push_back("skip_dirs contains an empty name");
        }
    }

    if (output.empty()) {
        problems.push_back("output cannot be empty");
    }

    return problems;
}

RuleSet ProjectConfig::toRuleSet() const {
    try {
        return RuleSet(skip_dirs, skip_files, allowed_extensions, max_chars_per_file);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

std::string ProjectConfig::languageTagFor(const std::string& extension) const {
    auto it = language_tags.find(RuleSet::normalizeExtension(extension));
    if (it != language_tags.end() && !it->second.empty()) {
        return it->second;
    }
    return FALLBACK_LANGUAGE_TAG;
}

std::string ProjectConfig::toYaml() const {
    YAML::Emitter out;
    out << YAML::Comment("CodeSharer configuration");
    out << YAML::BeginMap;

    emitSequence(out, "skip_dirs", skip_dirs);
    emitSequence(out, "skip_files", skip_files);
    emitSequence(out, "allowed_extensions", allowed_extensions);
    out << YAML::Key << "max_chars_per_file" << YAML::Value << max_chars_per_file;
    out << YAML::Key << "structure_max_depth" << YAML::Value << structure_max_depth;
    emitSequence(out, "ignore_files", ignore_files);
    emitSequence(out, "project_markers", project_markers);

    out << YAML::Key << "language_tags" << YAML::Value << YAML::BeginMap;
    for (const auto& [extension, tag] : language_tags) {
        out << YAML::Key << extension << YAML::Value << tag;
    }
    out << YAML::EndMap;

    out << YAML::Key << "output" << YAML::Value << output;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

std::map<std::string, std::string> ProjectConfig::defaultLanguageTags() {
    return {
        {".py", "python"}, {".pyx", "cython"},
        {".js", "javascript"}, {".jsx", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"},
        {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"},
        {".hpp", "cpp"}, {".hxx", "cpp"},
        {".c", "c"}, {".h", "c"},
        {".css", "css"}, {".scss", "scss"}, {".less", "less"},
        {".html", "html"}, {".htm", "html"}, {".xml", "xml"}, {".qrc", "xml"},
        {".json", "json"}, {".yaml", "yaml"}, {".yml", "yaml"},
        {".md", "markdown"}, {".rst", "rst"}, {".txt", "text"},
        {".sql", "sql"}, {".sh", "bash"}, {".bat", "batch"},
        {".qml", "qml"}, {".cmake", "cmake"}
    };
}

} // namespace CodeSharer
