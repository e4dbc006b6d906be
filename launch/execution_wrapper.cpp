#include "launch/execution_wrapper.h"

#include "absl/strings/ascii.h"

namespace launch {

absl::StatusOr<ExecutionWrapper> ExecutionWrapper::parse(
    const std::string& name, const std::filesystem::path& sandboxie_exe,
    const std::string& box_name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "none") return None();
  if (lower == "wine") return Wine();
  if (lower == "sandboxie") {
    if (sandboxie_exe.empty() || box_name.empty()) {
      return absl::InvalidArgumentError(
          "The sandboxie wrapper needs both its executable and a box name");
    }
    return Sandboxie(sandboxie_exe, box_name);
  }
  return absl::InvalidArgumentError("Unknown execution wrapper '" + name +
                                    "', expected none, wine or sandboxie");
}

std::vector<std::string> ExecutionWrapper::wrap(
    const std::filesystem::path& exe) const {
  switch (kind_) {
    case Kind::NONE:
      return {exe.string()};
    case Kind::WINE:
      return {"wine", exe.string()};
    case Kind::SANDBOXIE:
      return {executable_.string(), "/wait", "/silent", "/box:" + box_name_,
              exe.string()};
  }
  return {exe.string()};
}

}  // namespace launch
