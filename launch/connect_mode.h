#ifndef LAUNCH_CONNECT_MODE_H_
#define LAUNCH_CONNECT_MODE_H_

#include <string>

namespace launch {

enum class Role {
  // Creates the game. Exactly one participant hosts, unless a human does.
  HOST = 0,
  // Joins the game created by the host.
  JOIN = 1,
};

struct ConnectMode {
  static ConnectMode Host(const std::string& map, int player_count) {
    return ConnectMode{
        .role = Role::HOST, .map = map, .player_count = player_count};
  }
  static ConnectMode Join() { return ConnectMode{.role = Role::JOIN}; }

  Role role = Role::JOIN;
  // Host only.
  std::string map;
  int player_count = 0;
};

inline const char* to_string(Role role) {
  return role == Role::HOST ? "host" : "join";
}

}  // namespace launch

#endif
