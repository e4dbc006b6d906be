#ifndef LAUNCH_EXECUTION_WRAPPER_H_
#define LAUNCH_EXECUTION_WRAPPER_H_

#include <filesystem>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace launch {

// Runs Windows executables either directly, under wine, or inside a
// Sandboxie box.
class ExecutionWrapper {
 public:
  enum class Kind {
    NONE = 0,
    WINE = 1,
    SANDBOXIE = 2,
  };

  static ExecutionWrapper None() { return ExecutionWrapper(Kind::NONE); }
  static ExecutionWrapper Wine() { return ExecutionWrapper(Kind::WINE); }
  static ExecutionWrapper Sandboxie(const std::filesystem::path& executable,
                                    const std::string& box_name) {
    return ExecutionWrapper(Kind::SANDBOXIE, executable, box_name);
  }

  // Parses "none", "wine" or "sandboxie". Sandboxie needs its executable and
  // a box name.
  static absl::StatusOr<ExecutionWrapper> parse(
      const std::string& name, const std::filesystem::path& sandboxie_exe,
      const std::string& box_name);

  // Returns the command line prefix that runs 'exe' under this wrapper.
  std::vector<std::string> wrap(const std::filesystem::path& exe) const;

  Kind kind() const { return kind_; }

 private:
  explicit ExecutionWrapper(Kind kind, std::filesystem::path executable = {},
                            std::string box_name = "")
      : kind_(kind),
        executable_(std::move(executable)),
        box_name_(std::move(box_name)) {}

  Kind kind_ = Kind::NONE;
  std::filesystem::path executable_;
  std::string box_name_;
};

}  // namespace launch

#endif
