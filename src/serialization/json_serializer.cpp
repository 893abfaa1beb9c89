/// @file json_serializer.cpp
/// @brief Report export to disk.

#include "serialization/json_serializer.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace opscope {

namespace {

auto utc_timestamp() -> std::string {
  const auto now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::gmtime_r(&now, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace

auto export_report(const MetricsReport &report,
                   const std::filesystem::path &path)
    -> std::expected<void, std::error_code> {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(ec);
    }
  }

  nlohmann::json doc;
  doc["export_timestamp"] = utc_timestamp();
  doc["operations"] = report_to_json(report);

  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return std::unexpected(
        std::make_error_code(std::errc::permission_denied));
  }
  out << doc.dump(2) << '\n';
  if (!out) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }
  return {};
}

} // namespace opscope
