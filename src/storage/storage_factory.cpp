#include "storage/storage_factory.hpp"

#include "storage/gcs_storage.hpp"
#include "storage/local_storage.hpp"

namespace codeexec::storage {

std::unique_ptr<StorageBackend> CreateStorage(const config::StorageConfig& config) {
    switch (config.kind) {
        case config::StorageKind::kGcs:
            return std::make_unique<GcsStorage>(config.gcs);
        case config::StorageKind::kLocal:
            break;
    }
    return std::make_unique<LocalStorage>(config.path);
}

}  // namespace codeexec::storage
