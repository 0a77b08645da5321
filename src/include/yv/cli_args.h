#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace yv {

// Parses command-line arguments for yv-validate.
// Throws std::invalid_argument on usage errors.
class CliArgs {
  public:
    enum class Action {
        HELP,     // Show help message
        VALIDATE  // Validate files against a schema (default)
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::vector<std::string>& getSchemaFiles() const { return schemaFiles_; }
    const std::string& getUri() const { return uri_; }
    const std::vector<std::string>& getFiles() const { return files_; }
    std::size_t getMaxDepth() const { return maxDepth_; }
    bool hasMaxDepth() const { return hasMaxDepth_; }

    static std::string usage();

  private:
    Action action_ = Action::HELP;
    std::vector<std::string> schemaFiles_;
    std::string uri_;
    std::vector<std::string> files_;
    std::size_t maxDepth_ = 0;
    bool hasMaxDepth_ = false;
};

// Closest entry of `options` to `arg` by edit distance, or "" if none is close.
std::string suggest_similar_option(const std::string& arg, const std::vector<std::string>& options);

}  // namespace yv
