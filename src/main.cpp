#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/CacheFactory.hpp"
#include "config/AppConfig.hpp"
#include "core/CacheErrors.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

const char* USAGE =
    "Usage: distcache_cli cmd=<op> [key=..] [value=..] [ttl=..] [pattern=..] [delta=..] [expected=..] [namespace=..] [ns=..] "
    "[<config_key>=<value> ...]\n"
    "Operations: get set delete exists ttl expire incr decr setnx cas keys count delete-matching "
    "clear-namespace stats flush ping";

// Returns the argument or throws ValidationError naming the missing one.
const string& requireArg(const map<string, string>& args, const string& name) {
    auto it = args.find(name);
    if (it == args.end()) {
        throw ValidationError("Missing argument '" + name + "'");
    }
    return it->second;
}

// Values are JSON when they parse as JSON, plain strings otherwise.
CacheValue parseValue(const string& raw) {
    json parsed = json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return CacheValue(raw);
    }
    return parsed;
}

int64_t parseInt64Arg(const map<string, string>& args, const string& name) {
    const string& raw = requireArg(args, name);
    auto parsed = Utils::stringToInt64(raw);
    if (!parsed) {
        throw ValidationError("Argument '" + name + "' is not an integer: " + raw);
    }
    return *parsed;
}

optional<int64_t> optionalTtl(const map<string, string>& args) {
    if (args.find("ttl") == args.end()) {
        return nullopt;
    }
    return parseInt64Arg(args, "ttl");
}

json toJson(const set<string>& keys) {
    json out = json::array();
    for (const auto& key : keys) {
        out.push_back(key);
    }
    return out;
}

json execute(CacheInterface& cache, const string& cmd, const map<string, string>& args) {
    if (cmd == "get") {
        auto value = cache.get(requireArg(args, "key"));
        return value ? *value : json(nullptr);
    }
    if (cmd == "set") {
        cache.set(requireArg(args, "key"), parseValue(requireArg(args, "value")), optionalTtl(args));
        return true;
    }
    if (cmd == "delete") {
        return cache.remove(requireArg(args, "key"));
    }
    if (cmd == "exists") {
        return cache.exists(requireArg(args, "key"));
    }
    if (cmd == "ttl") {
        auto left = cache.ttl(requireArg(args, "key"));
        return left ? json(*left) : json(nullptr);
    }
    if (cmd == "expire") {
        return cache.expire(requireArg(args, "key"), parseInt64Arg(args, "ttl"));
    }
    if (cmd == "incr" || cmd == "decr") {
        int64_t delta = args.count("delta") ? parseInt64Arg(args, "delta") : 1;
        const string& key = requireArg(args, "key");
        return cmd == "incr" ? cache.increment(key, delta) : cache.decrement(key, delta);
    }
    if (cmd == "setnx") {
        return cache.set_if_absent(requireArg(args, "key"), parseValue(requireArg(args, "value")), optionalTtl(args));
    }
    if (cmd == "cas") {
        return cache.compare_and_swap(requireArg(args, "key"),
                                      parseValue(requireArg(args, "expected")),
                                      parseValue(requireArg(args, "value")));
    }
    if (cmd == "keys") {
        return toJson(cache.keys_matching(requireArg(args, "pattern")));
    }
    if (cmd == "count") {
        return cache.count_matching(requireArg(args, "pattern"));
    }
    if (cmd == "delete-matching") {
        return cache.delete_matching(requireArg(args, "pattern"));
    }
    if (cmd == "clear-namespace") {
        return cache.clear_namespace(requireArg(args, "namespace"));
    }
    if (cmd == "stats") {
        return cache.cache_stats().to_json();
    }
    if (cmd == "flush") {
        return cache.flush_all();
    }
    if (cmd == "ping") {
        return cache.ping();
    }
    throw ValidationError("Unknown command '" + cmd + "'");
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    vector<string> args_vec;
    for (int i = 1; i < argc; ++i) {
        args_vec.push_back(argv[i]);
    }

    optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
    if (!parsedArgsOpt || parsedArgsOpt->count("cmd") == 0) {
        cerr << USAGE << endl;
        return 2;
    }
    const map<string, string>& arguments = parsedArgsOpt.value();

    // Load Configuration
    AppConfig config_ = Utils::loadConfiguration(arguments);

    // Initialize the main logger *after* loading the config
    std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
    logger_->setup("Configuration loaded.");
    logger_->setup(config_.to_string());

    std::shared_ptr<CacheInterface> cache_instance;
    try {
        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        cache_instance = initializeCache(config_, logger_, statsd_client);

        std::shared_ptr<CacheInterface> target = cache_instance;
        auto ns = arguments.find("ns");
        if (ns != arguments.end()) {
            target = cache_instance->with_namespace(ns->second);
        }

        json result = execute(*target, arguments.at("cmd"), arguments);
        cout << result.dump() << endl;
        cache_instance->close();
        return 0;
    } catch (const ValidationError& e) {
        logger_->error(std::string("Invalid request: ") + e.what());
        if (cache_instance) cache_instance->close();
        return 2;
    } catch (const ConnectionError& e) {
        logger_->error(std::string("Cache backend unreachable: ") + e.what());
        if (cache_instance) cache_instance->close();
        return 3;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        logger_->error(ss.str());
        if (cache_instance) cache_instance->close();
        return 1;
    }
}
