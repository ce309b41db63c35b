#pragma once

#include "metercalc/v1/case_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace metercalc::v1::parser {

struct YamlParserOptions {
    bool strict = true;              // Fail on unknown fields
};

/// Loads `metercalc-v1` case files. Problems are collected, not thrown;
/// a case is usable only when errors() is empty.
class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    CaseFile load(const std::filesystem::path& path);

    // Parse from string
    CaseFile load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, CaseFile& case_file);
};

}  // namespace metercalc::v1::parser
