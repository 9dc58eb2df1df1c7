#include "core/DedupRunner.hpp"
#include "core/ImageLoader.hpp"
#include "utils/ArgParser.h"
#include "utils/DedupConfig.hpp"

#include <iostream>

using namespace PerceptualDedup;

namespace {

int runHash(const ArgParser::Arguments& args) {
    LoaderOptions options;
    auto hs = args.intArgs.find("hash_size");
    if (hs != args.intArgs.end()) options.hashSize = hs->second;
    if (options.hashSize < 1 || options.hashSize > MAX_HASH_SIZE) {
        throw DedupException("hash_size must be in [1, " + std::to_string(MAX_HASH_SIZE) + "]");
    }

    ImageLoader loader(options);
    int failures = 0;
    for (const auto& path : args.vectorArgs.at("input_path")) {
        ImageRecord record = loader.load(path);
        if (record.fingerprint) {
            std::cout << record.fingerprint->toHex() << "  " << path << std::endl;
        } else {
            std::cerr << "Error processing " << path << ": " << record.failureMessage << std::endl;
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    ArgParser parser;
    ArgParser::Arguments args;
    try {
        args = parser.parseArgs(argc, argv);
    } catch (const std::runtime_error& e) {
        if (std::string(e.what()) == "Help displayed.") return 0;
        std::cerr << e.what() << std::endl;
        return 1;
    }

    try {
        if (args.command == "hash") {
            return runHash(args);
        }

        DedupRunner runner(DedupConfig::fromArguments(args));
        runner.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
