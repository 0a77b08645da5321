#include <yv/cli_args.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace yv {

namespace {
    const std::vector<std::string> valid_options = {"--schema", "-s", "--uri", "-u", "--max-depth", "--help", "-h"};

    std::size_t edit_distance(const std::string& a, const std::string& b) {
        // single row of the Levenshtein table
        std::vector<std::size_t> row(b.size() + 1);
        for (std::size_t j = 0; j <= b.size(); ++j) row[j] = j;
        for (std::size_t i = 1; i <= a.size(); ++i) {
            std::size_t diagonal = row[0];
            row[0] = i;
            for (std::size_t j = 1; j <= b.size(); ++j) {
                std::size_t above = row[j];
                if (a[i - 1] == b[j - 1])
                    row[j] = diagonal;
                else
                    row[j] = 1 + std::min({diagonal, above, row[j - 1]});
                diagonal = above;
            }
        }
        return row[b.size()];
    }

    std::string next_value(int& i, int argc, const char* argv[], const std::string& flag, const char* what) {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires " + what);
        return argv[++i];
    }

    std::size_t parse_depth(const std::string& text) {
        bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!digits) throw std::invalid_argument("--max-depth requires a non-negative integer, got '" + text + "'");
        try {
            return static_cast<std::size_t>(std::stoull(text));
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("--max-depth value '" + text + "' is too large");
        }
    }
}

std::string suggest_similar_option(const std::string& arg, const std::vector<std::string>& options) {
    std::size_t best = std::numeric_limits<std::size_t>::max();
    std::string match;
    for (auto const& option : options) {
        std::size_t d = edit_distance(arg, option);
        if (d < best) {
            best = d;
            match = option;
        }
    }
    std::size_t threshold = std::max<std::size_t>(3, arg.size() * 4 / 10);
    return best <= threshold ? match : std::string();
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        } else if (arg == "--schema" || arg == "-s") {
            schemaFiles_.push_back(next_value(i, argc, argv, arg, "a file argument"));
        } else if (arg == "--uri" || arg == "-u") {
            uri_ = next_value(i, argc, argv, arg, "a schema uri argument");
        } else if (arg == "--max-depth") {
            maxDepth_ = parse_depth(next_value(i, argc, argv, arg, "a number argument"));
            hasMaxDepth_ = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::string error = "Unknown argument: " + arg;
            std::string suggestion = suggest_similar_option(arg, valid_options);
            if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
            throw std::invalid_argument(error);
        } else {
            files_.push_back(arg);
        }
    }

    action_ = Action::VALIDATE;
    if (schemaFiles_.empty()) throw std::invalid_argument("at least one --schema file is required");
    if (uri_.empty()) throw std::invalid_argument("--uri is required to select the schema to validate against");
    if (files_.empty()) throw std::invalid_argument("no files to validate were given");
}

std::string CliArgs::usage() {
    return "yv-validate - validate YAML/JSON documents against yamlvalidator schemas\n\n"
           "Usage:\n"
           "  yv-validate -s <schema> [-s <schema> ...] -u <uri> [--max-depth <n>] <file>...\n"
           "  yv-validate --help\n\n"
           "Options:\n"
           "  --schema, -s <file>   Schema file to load (repeatable, loaded in order)\n"
           "  --uri, -u <uri>       Schema to validate the files against\n"
           "  --max-depth <n>       Maximum nested $ref resolutions (0 = unlimited, default 256)\n"
           "  --help, -h            Show this message\n\n"
           "Environment:\n"
           "  YV_DEBUG              Trace schema loading and reference resolution to stderr\n";
}

}  // namespace yv
