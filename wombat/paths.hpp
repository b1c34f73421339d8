#pragma once

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>

namespace wombat::paths {

// Where the game writes combat logs for this user.
inline std::filesystem::path resolve_log_dir() {
  if (const char* env = std::getenv("WOMBAT_LOG_DIR"); env && *env) {
    return std::filesystem::path(env);
  }
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "wombat" / "CombatLogs";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".local" / "share" / "wombat" / "CombatLogs";
  }
  return std::filesystem::path(".") / "wombat" / "CombatLogs";
}

// Most recently modified regular file in `dir`, if any.
inline std::optional<std::filesystem::path> latest_log_file(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return std::nullopt;

  std::optional<std::filesystem::path> best;
  std::filesystem::file_time_type best_time{};
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code fec;
    if (!entry.is_regular_file(fec) || fec) continue;
    const auto t = entry.last_write_time(fec);
    if (fec) continue;
    if (!best || t > best_time) {
      best = entry.path();
      best_time = t;
    }
  }
  if (ec) return std::nullopt;
  return best;
}

} // namespace wombat::paths
