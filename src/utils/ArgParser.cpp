#include "ArgParser.h"
#include <iostream>

using namespace std;

namespace PerceptualDedup
{

// --- Helper Functions ---

namespace {

bool checkRequired(const cxxopts::ParseResult& result, const std::string& name, const std::string& command) {
    if (!result.count(name)) {
        cerr << "Argument error: --" << name << " is required for command '" << command << "'" << endl;
        return false;
    }
    return true;
}

} // namespace

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options("perceptual_dedup", "Remove visually near-duplicate images from a batch.")
{
    m_options.add_options()
        ("command", "Command to execute (dedup, hash)", cxxopts::value<std::string>())
        ("h,help", "Display this help menu");
    m_options.parse_positional({"command"});
    m_options.positional_help("<dedup|hash> [options]");
    m_options.allow_unrecognised_options();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            if (result.count("command")) {
                std::string command = result["command"].as<std::string>();
                cxxopts::Options commandOptions("perceptual_dedup " + command, "Arguments for " + command);
                if (command == "dedup") addDedupArgs(commandOptions);
                else if (command == "hash") addHashArgs(commandOptions);
                std::cout << commandOptions.help() << std::endl;
            } else {
                std::cout << m_options.help() << std::endl;
            }
            throw std::runtime_error("Help displayed.");
        }

        if (!result.count("command")) {
            std::cout << m_options.help() << std::endl;
            throw std::runtime_error("No command specified.");
        }

        std::string command = result["command"].as<std::string>();
        cxxopts::Options commandOptions("perceptual_dedup " + command, "Arguments for " + command);

        if (command == "dedup") addDedupArgs(commandOptions);
        else if (command == "hash") addHashArgs(commandOptions);
        else throw std::runtime_error("Unknown command: " + command);

        // Re-parse the full command line against the command's own options
        auto finalResult = commandOptions.parse(argc, argv);

        if (command == "dedup" && !checkRequired(finalResult, "input_dir", command)) throw std::runtime_error("Missing required args.");
        if (command == "dedup" && !checkRequired(finalResult, "output_dir", command)) throw std::runtime_error("Missing required args.");
        if (command == "hash" && !checkRequired(finalResult, "input_path", command)) throw std::runtime_error("Missing required args.");

        return mapResults(finalResult, command);

    } catch (const cxxopts::exceptions::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(e.what());
    }
}

void ArgParser::addDedupArgs(cxxopts::Options& options) {
    options.add_options()
        ("command", "Command to execute", cxxopts::value<std::string>())
        ("input_dir", "Directory with the (extracted) images to deduplicate", cxxopts::value<std::string>())
        ("output_dir", "Directory to write the unique images to", cxxopts::value<std::string>())
        ("config", "JSON file with run settings (command line options take precedence)", cxxopts::value<std::string>())
        ("report", "Write a JSON report of all verdicts to this file", cxxopts::value<std::string>())
        ("hash_size", "Fingerprint grid side length (default 8 -> 64 bits)", cxxopts::value<int>())
        ("threshold", "Maximum Hamming distance for two images to count as duplicates (default 5)", cxxopts::value<int>())
        ("max_image_size", "Maximum individual image size in bytes", cxxopts::value<std::uint64_t>())
        ("max_archive_size", "Maximum total size of the input batch in bytes", cxxopts::value<std::uint64_t>())
        ("workers", "Number of threads used for fingerprinting", cxxopts::value<int>())
        ("timeout_ms", "Per-image processing budget in milliseconds (0 = unbounded)", cxxopts::value<int>())
        ("extensions", "Comma separated image extensions to consider", cxxopts::value<std::vector<std::string>>())
        ("quiet", "Only print the final summary", cxxopts::value<bool>()->implicit_value("true")->default_value("false"));
    options.parse_positional({"command"});
}

void ArgParser::addHashArgs(cxxopts::Options& options) {
    options.add_options()
        ("command", "Command to execute", cxxopts::value<std::string>())
        ("input_path", "Image file(s) to fingerprint", cxxopts::value<std::vector<std::string>>())
        ("hash_size", "Fingerprint grid side length (default 8 -> 64 bits)", cxxopts::value<int>());
    options.parse_positional({"command", "input_path"});
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result, const std::string& command) {
    Arguments args;
    args.command = command;

    // --- Dedup Command ---
    if (command == "dedup") {
        for (const char* name : {"input_dir", "output_dir", "config", "report"}) {
            if (result.count(name)) args.stringArgs[name] = result[name].as<std::string>();
        }
        for (const char* name : {"hash_size", "threshold", "workers", "timeout_ms"}) {
            if (result.count(name)) args.intArgs[name] = result[name].as<int>();
        }
        for (const char* name : {"max_image_size", "max_archive_size"}) {
            if (result.count(name)) args.sizeArgs[name] = result[name].as<std::uint64_t>();
        }
        if (result.count("extensions")) {
            args.vectorArgs["extensions"] = result["extensions"].as<std::vector<std::string>>();
        }
        args.boolArgs["quiet"] = result["quiet"].as<bool>();
    }

    // --- Hash Command ---
    else if (command == "hash") {
        args.vectorArgs["input_path"] = result["input_path"].as<std::vector<std::string>>();
        if (result.count("hash_size")) args.intArgs["hash_size"] = result["hash_size"].as<int>();
    }

    return args;
}

} // namespace PerceptualDedup
