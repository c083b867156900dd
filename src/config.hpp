#pragma once

#include <string>

#include "error.hpp"

struct StorageConfig
{
    // One of “memory”, “filesystem”, or “sqlite”.
    std::string backend = "memory";
    std::string root_dir = "./was-data";
    std::string db_path = "./was.db";
};

struct Config
{
    std::string listen_address = "0.0.0.0";
    int port = 8080;
    // Tolerance applied to the created, expires, and Date checks of a
    // signature.
    int clock_skew_seconds = 60;
    std::string log_level = "info";
    StorageConfig storage;

    static Config& get();
    E<void> load(const std::string& path);
    // Apply the WAS_STORAGE_* environment variables on top of whatever
    // was loaded.
    void applyEnv();
};
