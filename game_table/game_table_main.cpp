// Prints the current BWAPI game table.
// Example usage:
// $ game_table_dump --game_table_name=/bwapi_shared_memory_game_list

#include <stdio.h>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "game_table/shared_game_table.h"

ABSL_FLAG(std::string, game_table_name, game_table::kDefaultSharedMemoryName,
          "Name of the shared memory segment holding the game table.");

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);

  game_table::SharedGameTable reader(absl::GetFlag(FLAGS_game_table_name));
  absl::StatusOr<game_table::GameTable> table = reader.snapshot();
  if (!table.ok()) {
    fprintf(stderr, "%s\n", table.status().ToString().c_str());
    return 1;
  }
  printf("%s", table->to_string().c_str());
  return 0;
}
