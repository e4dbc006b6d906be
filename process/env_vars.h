#ifndef PROCESS_ENV_VARS_H_
#define PROCESS_ENV_VARS_H_

#include <optional>
#include <string>
#include <vector>

class EnvVars {
 public:
  // Copies the given env vars into a new EnvVars instance. A null 'env'
  // creates an empty environment.
  explicit EnvVars(char** env = nullptr);
  ~EnvVars();

  // Delete copies.
  EnvVars(const EnvVars&) = delete;
  EnvVars& operator=(const EnvVars&) = delete;

  EnvVars(EnvVars&& other) noexcept;
  EnvVars& operator=(EnvVars&& other) noexcept;

  // Sets the given variable to 'val', replacing any earlier value.
  void set_var(const std::string& var, const std::string& val);

  // Returns the variable's value if it's set.
  std::optional<std::string> get_var(const std::string& var) const;

  // Returns a copy of the process's environment.
  static EnvVars environ();

  // Returns the env vars as a null terminated char**.
  char** vars();

 private:
  void free_vars();

  std::vector<char*> vars_;
};

#endif
