#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devtel::util {

// (device id, revision id) -> marketing name, parsed from libdrm's
// amdgpu.ids. Read-only after load; safe to share between threads.
class IdTable {
public:
  IdTable() = default;

  // Process-wide table, loaded on first use from default_paths(). Concurrent
  // first callers block on the same load; nobody reloads.
  static const IdTable& shared();

  // Candidate locations: $DEVTEL_AMDGPU_IDS first if set, then the libdrm
  // install paths.
  static std::vector<std::string> default_paths();

  // Load from the first candidate that opens. Returns false (and records
  // error()) when none can be opened. Malformed lines are skipped.
  bool load(const std::vector<std::string>& paths);

  // Parse already-read file content (one record per line).
  void parse(const std::string& content);

  bool available() const { return available_; }
  const std::string& error() const { return error_; }
  const std::string& source() const { return source_; }
  size_t size() const { return names_.size(); }

  std::optional<std::string> lookup(uint32_t device_id, uint32_t revision_id) const;

private:
  static uint64_t key(uint32_t dev, uint32_t rev) { return (static_cast<uint64_t>(dev) << 32) | rev; }

  std::unordered_map<uint64_t, std::string> names_;
  bool available_{false};
  std::string error_;
  std::string source_;
};

} // namespace devtel::util
