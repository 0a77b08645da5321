// yv-validate - validate YAML/JSON documents against compiled schemas

#include <yv/validator.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    // Every document of every file, in argument order. Throws on unreadable or malformed input.
    std::vector<yv::Node> load_files(const std::vector<std::string>& paths) {
        std::vector<yv::Node> out;
        for (auto const& path : paths) {
            std::vector<yv::Node> docs;
            try {
                docs = yv::load_documents(yv::read_file(path));
            } catch (const std::exception& e) {
                throw std::runtime_error(path + ": " + e.what());
            }
            if (yv::debug_enabled()) std::cerr << "[yv] loaded " << docs.size() << " document(s) from " << path << "\n";
            for (auto& doc : docs) out.push_back(std::move(doc));
        }
        return out;
    }
}

int main(int argc, const char* argv[]) {
    std::optional<yv::CliArgs> args;
    try {
        args.emplace(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n\n" << yv::CliArgs::usage();
        return 2;
    }

    if (args->getAction() == yv::CliArgs::Action::HELP) {
        std::cout << yv::CliArgs::usage();
        return 0;
    }

    // The context borrows from these documents; they stay alive until exit.
    std::vector<yv::Node> schema_documents;
    yv::Context context;
    try {
        schema_documents = load_files(args->getSchemaFiles());
        context = yv::Context::compile(schema_documents);
    } catch (const yv::SchemaException& e) {
        std::cerr << e.what();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    if (args->hasMaxDepth()) context.setMaxReferenceDepth(args->getMaxDepth());

    const yv::Schema* schema = context.lookup(args->getUri());
    if (schema == nullptr) {
        std::cerr << "schema referenced by uri `" << args->getUri() << "` not found in context\n";
        return 1;
    }

    bool failed = false;
    for (auto const& path : args->getFiles()) {
        std::vector<yv::Node> documents;
        try {
            documents = yv::load_documents(yv::read_file(path));
        } catch (const std::exception& e) {
            std::cerr << path << ": " << e.what() << "\n";
            failed = true;
            continue;
        }

        for (std::size_t i = 0; i < documents.size(); ++i) {
            auto err = schema->validate(context, documents[i]);
            if (!err) continue;
            failed = true;
            if (documents.size() > 1)
                std::cerr << path << "[" << i << "]:\n" << *err;
            else
                std::cerr << path << ":\n" << *err;
        }
    }

    if (failed) return 1;
    std::cout << "all files validated successfully!\n";
    return 0;
}
