#pragma once

#include <filesystem>
#include <string>

namespace codeexec::utils {

std::string Sha256Hex(const std::string& data);

// Streams the file through SHA-256. Throws ServiceError(kStorageFailure) when unreadable.
std::string Sha256File(const std::filesystem::path& path);

// Random version 4 UUID in canonical 8-4-4-4-12 form.
std::string RandomUuid();

bool ConstantTimeEquals(const std::string& left, const std::string& right);

}  // namespace codeexec::utils
