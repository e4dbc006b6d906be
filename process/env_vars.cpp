#include "process/env_vars.h"

#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace {
// Returns whether 'entry' has the form "var=...".
bool entry_is_var(const char* entry, const std::string& var) {
  return strncmp(entry, var.c_str(), var.size()) == 0 &&
         entry[var.size()] == '=';
}
}  // namespace

EnvVars::EnvVars(char** env) {
  for (size_t i = 0; env && env[i]; ++i) {
    vars_.push_back(strdup(env[i]));
  }
  vars_.push_back(nullptr);
}

EnvVars::~EnvVars() { free_vars(); }

EnvVars::EnvVars(EnvVars&& other) noexcept : vars_(std::move(other.vars_)) {
  other.vars_ = {nullptr};
}

EnvVars& EnvVars::operator=(EnvVars&& other) noexcept {
  if (this != &other) {
    free_vars();
    vars_ = std::move(other.vars_);
    other.vars_ = {nullptr};
  }
  return *this;
}

void EnvVars::set_var(const std::string& var, const std::string& val) {
  std::string c_val = var + "=" + val;
  for (size_t i = 0; i + 1 < vars_.size(); ++i) {
    if (entry_is_var(vars_[i], var)) {
      free(vars_[i]);
      vars_[i] = strdup(c_val.c_str());
      return;
    }
  }
  vars_.back() = strdup(c_val.c_str());
  vars_.push_back(nullptr);
}

std::optional<std::string> EnvVars::get_var(const std::string& var) const {
  for (size_t i = 0; i + 1 < vars_.size(); ++i) {
    if (entry_is_var(vars_[i], var)) {
      return std::string(vars_[i] + var.size() + 1);
    }
  }
  return std::nullopt;
}

EnvVars EnvVars::environ() { return EnvVars(::environ); }

char** EnvVars::vars() { return &vars_[0]; }

void EnvVars::free_vars() {
  for (size_t i = 0; i < vars_.size(); ++i) {
    free(vars_[i]);
    vars_[i] = nullptr;
  }
}
