#pragma once

#include <string>
#include <vector>

#include <ryml.hpp>

#include "data_types.hpp"

struct Config
{
    std::string log_level = "info";
    // Posts fetched per account on each refresh.
    int post_limit = 50;
    // Capacity of both sync worker queues.
    int queue_capacity = 32;
    std::string secrets_path = "secrets.yaml";
    // Where scheduled posts are kept.
    std::string schedule_path = "schedule.json";
    std::vector<Account> accounts;

    static Config& get();
    // Replace the whole config with the content of a YAML file. Keys
    // missing from the file keep their defaults. Throws
    // std::runtime_error on failure.
    void load(const std::string& path);
};

std::string readFile(const std::string& path);

// Parse YAML into a tree that owns its data. Throws
// std::runtime_error on malformed input.
ryml::Tree parseYaml(const std::string& content);
