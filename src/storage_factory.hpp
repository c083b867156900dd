#pragma once

#include <memory>

#include "config.hpp"
#include "error.hpp"
#include "storage.hpp"

// Build and initialize the backend named in “config”. This is the only
// place that knows about concrete backends.
E<std::unique_ptr<StorageInterface>> createStorage(const StorageConfig& config);
