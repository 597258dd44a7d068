#include "ConfigYAML.hpp"
#include <cctype>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

static std::string to_lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static spdlog::level::level_enum parse_level(const std::string& s) {
    auto v = to_lower(s);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error")
        return spdlog::level::err;
    if (v == "off" || v == "quiet")
        return spdlog::level::off;
    throw std::runtime_error("log.level: unknown level '" + s + "'");
}

AppConfig load_config_from_yaml(const std::string& path) {
    spdlog::info("Loading config from '{}'", path);
    return load_config_from_node(YAML::LoadFile(path));
}

AppConfig load_config_from_node(const YAML::Node& root) {
    AppConfig cfg;

    if (auto s = root["scheduler"]) {
        auto& p = cfg.scheduler;
        if (auto n = s["request_retention"])
            p.request_retention = n.as<double>();
        if (auto n = s["maximum_interval"])
            p.maximum_interval = n.as<double>();
        if (auto n = s["learning_steps"])
            p.learning_steps = n.as<std::vector<double>>();
        if (auto n = s["relearning_steps"])
            p.relearning_steps = n.as<std::vector<double>>();
        if (auto n = s["graduating_interval"])
            p.graduating_interval = n.as<double>();
        if (auto n = s["easy_interval"])
            p.easy_interval = n.as<double>();
        if (auto n = s["weights"]) {
            auto v = n.as<std::vector<double>>();
            if (v.size() != p.w.size())
                throw std::runtime_error("scheduler.weights: expected " + std::to_string(p.w.size())
                + " values, got " + std::to_string(v.size()));
            for (std::size_t i = 0; i < v.size(); ++i)
                p.w[i] = v[i];
        }

        try {
            validateParams(p);
        }
        catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("scheduler.") + e.what());
        }
    }

    if (auto q = root["queue"]) {
        if (auto n = q["limit"]) {
            int limit = n.as<int>();
            if (limit < 1)
                throw std::runtime_error("queue.limit must be at least 1");
            cfg.queue_limit = static_cast<std::size_t>(limit);
        }
    }

    if (auto l = root["log"]) {
        if (auto n = l["path"])
            cfg.log.path = n.as<std::string>();
        if (auto n = l["level"])
            cfg.log.level = parse_level(n.as<std::string>());
    }

    if (auto st = root["storage"]) {
        if (auto n = st["path"])
            cfg.storage_path = n.as<std::string>();
    }

    return cfg;
}
