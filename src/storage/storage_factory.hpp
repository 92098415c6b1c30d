#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "storage/storage_backend.hpp"

namespace codeexec::storage {

std::unique_ptr<StorageBackend> CreateStorage(const config::StorageConfig& config);

}  // namespace codeexec::storage
