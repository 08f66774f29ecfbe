#include "orrery/out/Output.h"

#include "orrery/core/Log.h"

#include <limits>
#include <sstream>
#include <system_error>

namespace orrery::out {

std::filesystem::path framePath(const std::filesystem::path& root, std::string_view observatory,
                                double timeHours, std::string_view extension) {
  std::ostringstream name;
  name.precision(std::numeric_limits<double>::max_digits10);
  name << timeHours << "." << extension;
  return root / std::string(observatory) / name.str();
}

bool createObservatoryDirs(const std::filesystem::path& root, const std::vector<std::string>& observatories) {
  for (const auto& name : observatories) {
    std::error_code ec;
    std::filesystem::create_directories(root / name, ec);
    if (ec) {
      core::log(core::LogLevel::Error, "Output: cannot create " + (root / name).string() + ": " + ec.message());
      return false;
    }
  }
  return true;
}

} // namespace orrery::out
