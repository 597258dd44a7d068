#pragma once
#include <cstddef>
#include <string>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>
#include "../core/Scheduler.hpp"

/*
  YAML -> AppConfig loader for the study CLI.

  Schema:

    scheduler:
      request_retention: 0.9      # (0, 1)
      maximum_interval: 36500     # days
      learning_steps: [1, 10]     # minutes
      relearning_steps: [10]      # minutes
      graduating_interval: 1      # days
      easy_interval: 4            # days
      weights: [ ... 17 numbers ... ]
    queue:
      limit: 20
    log:
      path: sage.log
      level: info                 # trace | debug | info | warn | error | off
    storage:
      path: sage_store.dat

  Missing keys keep their defaults. Out-of-range values throw std::runtime_error
  naming the key; malformed YAML throws YAML::Exception.
*/

struct AppConfig {
    SchedulerParams scheduler;

    std::size_t queue_limit = 20;

    struct Log {
        std::string path = "sage.log";
        spdlog::level::level_enum level = spdlog::level::info;
    } log;

    std::string storage_path = "sage_store.dat";
};

AppConfig load_config_from_yaml(const std::string& path);
AppConfig load_config_from_node(const YAML::Node& root);
