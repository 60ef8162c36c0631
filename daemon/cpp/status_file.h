// daemon/cpp/status_file.h
#ifndef HUSH_STATUS_FILE_H
#define HUSH_STATUS_FILE_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

// Writes to <path>.tmp and renames over path, so readers never see a
// half-written snapshot.
bool write_status_file(const std::string& path, const json& payload);
std::optional<json> read_status_file(const std::string& path);

// Payload with the per-tick timing fields stripped; equal signatures mean
// nothing a reader cares about has changed.
json status_signature(const json& payload);

#endif //HUSH_STATUS_FILE_H
