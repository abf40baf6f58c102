#ifndef RUN_CONFIG_H
#define RUN_CONFIG_H

#include <string>
#include <vector>

enum class DuplexScope {
    GLOBAL,      // split once over the merged sequence, then chunk
    PER_BATCH    // chunk the merged sequence, then split each window
};

enum class OutputLayout {
    AUTO,        // SEPARATE for a single document, BATCHED otherwise
    SEPARATE,    // odd_pages.pdf + even_pages_rotated.pdf
    BATCHED      // Batch_1.pdf ... Batch_N.pdf
};

struct RunConfig {
    bool removeFirstLast = true;
    bool addWatermarks = true;
    int rotationAngle = 180;        // back-page rotation: 90, 180 or 270
    int batchSize = 20;
    int numberFontSize = 12;        // page-number watermark
    int titleFontSize = 36;
    DuplexScope duplexScope = DuplexScope::GLOBAL;
    OutputLayout layout = OutputLayout::AUTO;
    bool overwrite = false;
    std::string illustrationPath;   // empty: look for frontpage.png
    int jobs = 1;                   // concurrent document preprocessing

    // Throws DuplexError(INVALID_CONFIGURATION)
    void validate() const;

    // Layout for a run over documentCount documents
    OutputLayout resolveLayout(size_t documentCount) const;

    static DuplexScope parse_scope(const std::string& value);
    static OutputLayout parse_layout(const std::string& value);
    static bool parse_bool(const std::string& option, const std::string& value);
    static int parse_int(const std::string& option, const std::string& value);
};

const char* scope_name(DuplexScope scope);
const char* layout_name(OutputLayout layout);

// Parses configuration options from argv[start_index..]. Options start with
// '-' and are matched case-insensitively ("--BatchSize 20", "-batch-size 20").
// Arguments that are not configuration options are appended to rest in
// order. Throws DuplexError(INVALID_CONFIGURATION).
void parse_config_args(int argc, char* argv[], int start_index,
                       RunConfig& config, std::vector<std::string>& rest);

// Lowercase with leading dashes and inner '-' / '_' removed
std::string normalize_option(const std::string& arg);

#endif // RUN_CONFIG_H
