#include "DedupConfig.hpp"

#include <fstream>

namespace PerceptualDedup
{

namespace {

template <typename T>
void readKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw DedupException(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

void DedupConfig::applyJson(const json& j) {
    if (!j.is_object()) {
        throw DedupException("config must be a JSON object");
    }
    readKey(j, "hash_size", hashSize);
    readKey(j, "distance_threshold", distanceThreshold);
    readKey(j, "max_image_size", maxImageSize);
    readKey(j, "max_archive_size", maxArchiveSize);
    readKey(j, "workers", workers);
    readKey(j, "item_timeout_ms", itemTimeoutMs);
    readKey(j, "extensions", extensions);
    readKey(j, "report", reportPath);
}

void DedupConfig::applyJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw DedupException("config file not found: " + path);
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw DedupException("could not parse config '" + path + "': " + e.what());
    }
    applyJson(j);
}

void DedupConfig::applyArguments(const ArgParser::Arguments& args) {
    auto str = [&](const char* key, std::string& target) {
        auto it = args.stringArgs.find(key);
        if (it != args.stringArgs.end()) target = it->second;
    };
    auto num = [&](const char* key, int& target) {
        auto it = args.intArgs.find(key);
        if (it != args.intArgs.end()) target = it->second;
    };
    auto size = [&](const char* key, std::uintmax_t& target) {
        auto it = args.sizeArgs.find(key);
        if (it != args.sizeArgs.end()) target = it->second;
    };

    str("input_dir", inputDir);
    str("output_dir", outputDir);
    str("report", reportPath);
    num("hash_size", hashSize);
    num("threshold", distanceThreshold);
    num("workers", workers);
    num("timeout_ms", itemTimeoutMs);
    size("max_image_size", maxImageSize);
    size("max_archive_size", maxArchiveSize);

    auto ext = args.vectorArgs.find("extensions");
    if (ext != args.vectorArgs.end()) extensions = ext->second;

    auto q = args.boolArgs.find("quiet");
    if (q != args.boolArgs.end()) quiet = q->second;
}

void DedupConfig::validate() const {
    if (hashSize < 1 || hashSize > MAX_HASH_SIZE)
        throw DedupException("hash_size must be in [1, " + std::to_string(MAX_HASH_SIZE) + "]");
    if (distanceThreshold < 0)
        throw DedupException("distance_threshold must be >= 0");
    if (maxImageSize == 0)
        throw DedupException("max_image_size must be > 0");
    if (maxArchiveSize == 0)
        throw DedupException("max_archive_size must be > 0");
    if (workers < 1)
        throw DedupException("workers must be >= 1");
    if (itemTimeoutMs < 0)
        throw DedupException("item_timeout_ms must be >= 0");
    if (normalize_extensions(extensions).empty())
        throw DedupException("extensions must not be empty");
}

json DedupConfig::toJson() const {
    return json{
        {"hash_size", hashSize},
        {"distance_threshold", distanceThreshold},
        {"max_image_size", maxImageSize},
        {"max_archive_size", maxArchiveSize},
        {"workers", workers},
        {"item_timeout_ms", itemTimeoutMs},
        {"extensions", extensions}
    };
}

DedupConfig DedupConfig::fromArguments(const ArgParser::Arguments& args) {
    DedupConfig config;
    auto cfg = args.stringArgs.find("config");
    if (cfg != args.stringArgs.end()) {
        config.applyJsonFile(cfg->second);
    }
    config.applyArguments(args);
    return config;
}

} // namespace PerceptualDedup
