#include "run_config.h"
#include "duplex_error.h"

#include <algorithm>
#include <cctype>

std::string normalize_option(const std::string& arg) {
    std::string normalized = arg;
    while (!normalized.empty() && normalized[0] == '-') normalized.erase(0, 1);
    normalized.erase(std::remove_if(normalized.begin(), normalized.end(),
                                    [](char c) { return c == '-' || c == '_'; }),
                     normalized.end());
    std::string lower;
    for (char c : normalized) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

// ============================================================================
// Value Parsing
// ============================================================================

DuplexScope RunConfig::parse_scope(const std::string& value) {
    std::string v = normalize_option(value);
    if (v == "global") return DuplexScope::GLOBAL;
    if (v == "perbatch" || v == "batch") return DuplexScope::PER_BATCH;
    throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config",
                      "Unknown duplex scope '" + value + "' (expected global or per_batch)");
}

OutputLayout RunConfig::parse_layout(const std::string& value) {
    std::string v = normalize_option(value);
    if (v == "auto") return OutputLayout::AUTO;
    if (v == "separate") return OutputLayout::SEPARATE;
    if (v == "batched" || v == "batch") return OutputLayout::BATCHED;
    throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config",
                      "Unknown layout '" + value + "' (expected auto, separate or batched)");
}

bool RunConfig::parse_bool(const std::string& option, const std::string& value) {
    std::string v;
    for (char c : value) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config",
                      "Option " + option + " expects true or false, got '" + value + "'");
}

int RunConfig::parse_int(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config",
                          "Option " + option + " expects an integer, got '" + value + "'");
    }
    return result;
}

const char* scope_name(DuplexScope scope) {
    return scope == DuplexScope::GLOBAL ? "global" : "per_batch";
}

const char* layout_name(OutputLayout layout) {
    switch (layout) {
    case OutputLayout::AUTO: return "auto";
    case OutputLayout::SEPARATE: return "separate";
    case OutputLayout::BATCHED: return "batched";
    }
    return "auto";
}

// ============================================================================
// Validation
// ============================================================================

void RunConfig::validate() const {
    auto fail = [](const std::string& message) {
        throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config", message);
    };

    if (rotationAngle != 90 && rotationAngle != 180 && rotationAngle != 270) {
        fail("Rotation angle must be 90, 180, or 270 degrees (got " +
             std::to_string(rotationAngle) + ")");
    }
    if (batchSize <= 0) {
        fail("Batch size must be > 0 (got " + std::to_string(batchSize) + ")");
    }
    if (duplexScope == DuplexScope::PER_BATCH && batchSize % 2 != 0) {
        fail("Batch size must be even when duplex scope is per_batch (got " +
             std::to_string(batchSize) + ")");
    }
    if (numberFontSize <= 0 || titleFontSize <= 0) {
        fail("Font sizes must be > 0");
    }
    if (jobs <= 0) {
        fail("Jobs must be > 0 (got " + std::to_string(jobs) + ")");
    }
}

OutputLayout RunConfig::resolveLayout(size_t documentCount) const {
    if (layout != OutputLayout::AUTO) return layout;
    return documentCount > 1 ? OutputLayout::BATCHED : OutputLayout::SEPARATE;
}

// ============================================================================
// Command-Line Parsing
// ============================================================================

void parse_config_args(int argc, char* argv[], int start_index,
                       RunConfig& config, std::vector<std::string>& rest) {
    for (int i = start_index; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = normalize_option(arg);
        bool is_option = !arg.empty() && arg[0] == '-';
        bool has_value = i + 1 < argc;

        // Flags without a value
        if (is_option && name == "notrim") {
            config.removeFirstLast = false;
            continue;
        }
        if (is_option && name == "nowatermarks") {
            config.addWatermarks = false;
            continue;
        }
        if (is_option && name == "overwrite") {
            config.overwrite = true;
            continue;
        }

        bool known = name == "removefirstlast" || name == "addwatermarks" ||
                     name == "rotationangle" || name == "batchsize" ||
                     name == "fontsize" || name == "numberfontsize" ||
                     name == "titlefontsize" || name == "duplexscope" ||
                     name == "layout" || name == "illustration" || name == "jobs";
        if (!is_option || !known) {
            rest.push_back(arg);
            continue;
        }
        if (!has_value) {
            throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "config",
                              "Option " + arg + " requires a value");
        }

        std::string value = argv[++i];
        if (name == "removefirstlast") {
            config.removeFirstLast = RunConfig::parse_bool(arg, value);
        } else if (name == "addwatermarks") {
            config.addWatermarks = RunConfig::parse_bool(arg, value);
        } else if (name == "rotationangle") {
            config.rotationAngle = RunConfig::parse_int(arg, value);
        } else if (name == "batchsize") {
            config.batchSize = RunConfig::parse_int(arg, value);
        } else if (name == "fontsize" || name == "numberfontsize") {
            config.numberFontSize = RunConfig::parse_int(arg, value);
        } else if (name == "titlefontsize") {
            config.titleFontSize = RunConfig::parse_int(arg, value);
        } else if (name == "duplexscope") {
            config.duplexScope = RunConfig::parse_scope(value);
        } else if (name == "layout") {
            config.layout = RunConfig::parse_layout(value);
        } else if (name == "illustration") {
            config.illustrationPath = value;
        } else if (name == "jobs") {
            config.jobs = RunConfig::parse_int(arg, value);
        }
    }
}
