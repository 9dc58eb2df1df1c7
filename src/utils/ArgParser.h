#ifndef PERCEPTUAL_DEDUP_ARG_PARSER_H
#define PERCEPTUAL_DEDUP_ARG_PARSER_H

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include "cxxopts.hpp"

namespace PerceptualDedup
{

/**
 * @brief Utility class to parse command line arguments using cxxopts.
 *
 * Commands:
 *   dedup --input_dir D --output_dir O [options]
 *   hash  [--hash_size N] FILE...
 *
 * Only options that were actually given end up in the Arguments maps, so
 * a caller can tell "not given" apart from "given with the default value".
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string command;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, std::vector<std::string>> vectorArgs;
        std::map<std::string, bool> boolArgs;
        std::map<std::string, int> intArgs;
        std::map<std::string, std::uint64_t> sizeArgs;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @throws std::runtime_error on missing/invalid arguments or when help was shown.
     */
    Arguments parseArgs(int argc, char** argv);

private:
    cxxopts::Options m_options;

    void addDedupArgs(cxxopts::Options& options);
    void addHashArgs(cxxopts::Options& options);

    Arguments mapResults(const cxxopts::ParseResult& result, const std::string& command);
};

} // namespace PerceptualDedup

#endif // PERCEPTUAL_DEDUP_ARG_PARSER_H
