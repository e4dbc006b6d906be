#include "bot/prepared_bot.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

#include "bot/race.h"
#include "bot/tournament_module.h"
#include "util/status_gtest.h"

namespace bot {
namespace {

class PreparedBotTest : public testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("prepared_bot_test_" + std::to_string(getpid()));
    std::filesystem::remove_all(root_);
    bot_dir_ = root_ / "bots" / "Stardust";
    tm_dir_ = root_ / "tools" / "tm";
    std::filesystem::create_directories(bot_dir_ / "bwapi-data" / "AI");
    std::filesystem::create_directories(tm_dir_);
    write(bot_dir_ / "bwapi-data" / "BWAPI.dll", "bwapi 4.4.0");
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  static void write(const std::filesystem::path& path,
                    const std::string& contents) {
    std::ofstream(path, std::ios::binary) << contents;
  }

  std::filesystem::path root_;
  std::filesystem::path bot_dir_;
  std::filesystem::path tm_dir_;
};

TEST(Race, ParsesNamesAndLetters) {
  EXPECT_EQ(*parse_race("Protoss"), Race::PROTOSS);
  EXPECT_EQ(*parse_race("t"), Race::TERRAN);
  EXPECT_EQ(*parse_race("ZERG"), Race::ZERG);
  EXPECT_EQ(*parse_race("R"), Race::RANDOM);
  EXPECT_EQ(parse_race("elves").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(Race, PrintsBwapiNames) {
  EXPECT_EQ(to_string(Race::PROTOSS), "Protoss");
  EXPECT_EQ(to_string(Race::TERRAN), "Terran");
  EXPECT_EQ(to_string(Race::ZERG), "Zerg");
  EXPECT_EQ(to_string(Race::RANDOM), "Random");
}

TEST(TournamentModule, Crc32MatchesZlib) {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() /
      ("crc_test_" + std::to_string(getpid()));
  std::ofstream(path, std::ios::binary) << "123456789";
  ASSERT_OK_AND_ASSIGN(uint32_t crc, file_crc32(path));
  EXPECT_EQ(crc, 0xCBF43926u);
  std::filesystem::remove(path);
}

TEST(TournamentModule, LooksUpByChecksum) {
  std::vector<TournamentModuleVersion> table = {
      {1, "4.1.2", "TM_4.1.2.dll"}, {2, "4.4.0", "TM_4.4.0.dll"}};
  EXPECT_EQ(find_tournament_module(2, table)->bwapi_version, "4.4.0");
  EXPECT_FALSE(find_tournament_module(3, table).has_value());
}

TEST_F(PreparedBotTest, LoadsVersionTable) {
  write(tm_dir_ / kTournamentModuleTable,
        "# crc32 version module\n"
        "\n"
        "cbf43926 4.4.0 TM_4.4.0.dll\n"
        "  0000abcd\t4.1.2   TM_4.1.2.dll  \n");

  std::filesystem::path file = tm_dir_ / kTournamentModuleTable;
  ASSERT_OK_AND_ASSIGN(std::vector<TournamentModuleVersion> table,
                       load_tournament_modules(file));

  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[0].bwapi_crc32, 0xCBF43926u);
  EXPECT_EQ(table[0].module_file, "TM_4.4.0.dll");
  EXPECT_EQ(table[1].bwapi_crc32, 0xABCDu);
  EXPECT_EQ(table[1].bwapi_version, "4.1.2");
}

TEST_F(PreparedBotTest, RejectsMalformedVersionTable) {
  write(tm_dir_ / kTournamentModuleTable, "cbf43926 4.4.0\n");
  absl::StatusOr<std::vector<TournamentModuleVersion>> table =
      load_tournament_modules(tm_dir_ / kTournamentModuleTable);
  EXPECT_EQ(table.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_NE(table.status().message().find(":1:"), std::string::npos);

  EXPECT_EQ(load_tournament_modules(tm_dir_ / "missing.txt").status().code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST_F(PreparedBotTest, CreatesFoldersAndResolvesBinary) {
  write(bot_dir_ / "bwapi-data" / "AI" / "Stardust.dll", "dll");
  BotConfig config{.name = "Stardust"};

  ASSERT_OK_AND_ASSIGN(
      PreparedBot bot,
      PreparedBot::prepare(config, bot_dir_,
                           BotDefinition{.race = Race::PROTOSS}, {}));

  EXPECT_EQ(bot.name, "Stardust");
  EXPECT_EQ(bot.race, Race::PROTOSS);
  EXPECT_EQ(bot.binary.kind, Binary::Kind::DLL);
  EXPECT_EQ(bot.working_dir, bot_dir_);
  EXPECT_TRUE(std::filesystem::is_directory(bot_dir_ / "bwapi-data" / "read"));
  EXPECT_TRUE(
      std::filesystem::is_directory(bot_dir_ / "bwapi-data" / "write"));
  EXPECT_TRUE(std::filesystem::is_directory(bot_dir_ / "logs"));
  EXPECT_FALSE(bot.tournament_module.has_value());
}

TEST_F(PreparedBotTest, ConfigOverridesNameAndRace) {
  write(bot_dir_ / "bwapi-data" / "AI" / "Stardust.dll", "dll");
  BotConfig config{.name = "Stardust",
                   .player_name = "Dusty",
                   .race = Race::ZERG,
                   .headful = true};

  ASSERT_OK_AND_ASSIGN(
      PreparedBot bot,
      PreparedBot::prepare(config, bot_dir_,
                           BotDefinition{.race = Race::RANDOM}, {}));

  EXPECT_EQ(bot.name, "Dusty");
  EXPECT_EQ(bot.race, Race::ZERG);
  EXPECT_TRUE(bot.headful);
}

TEST_F(PreparedBotTest, ExplicitExecutableSkipsSearch) {
  // Two candidates would be ambiguous, but the override wins without a scan.
  write(bot_dir_ / "bwapi-data" / "AI" / "a.exe", "exe");
  write(bot_dir_ / "bwapi-data" / "AI" / "b.exe", "exe");

  ASSERT_OK_AND_ASSIGN(
      PreparedBot bot,
      PreparedBot::prepare({.name = "Stardust"}, bot_dir_,
                           BotDefinition{.executable = "client/Bot.jar"}, {}));

  EXPECT_EQ(bot.binary.kind, Binary::Kind::JAR);
  EXPECT_EQ(bot.binary.path, bot_dir_ / "client" / "Bot.jar");
}

TEST_F(PreparedBotTest, ExplicitExecutableNeedsKnownExtension) {
  absl::StatusOr<PreparedBot> bot =
      PreparedBot::prepare({.name = "Stardust"}, bot_dir_,
                           BotDefinition{.executable = "bot.py"}, {});
  EXPECT_EQ(bot.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(PreparedBotTest, MissingBinaryFails) {
  absl::StatusOr<PreparedBot> bot =
      PreparedBot::prepare({.name = "Stardust"}, bot_dir_, {}, {});
  EXPECT_EQ(bot.status().code(), absl::StatusCode::kNotFound);
}

TEST_F(PreparedBotTest, PicksMatchingTournamentModule) {
  write(bot_dir_ / "bwapi-data" / "AI" / "Stardust.dll", "dll");
  write(tm_dir_ / "TM_4.4.0.dll", "tm");
  ASSERT_OK_AND_ASSIGN(uint32_t crc,
                       file_crc32(bot_dir_ / "bwapi-data" / "BWAPI.dll"));
  std::vector<TournamentModuleVersion> table = {
      {crc, "4.4.0", "TM_4.4.0.dll"}};

  ASSERT_OK_AND_ASSIGN(
      PreparedBot bot,
      PreparedBot::prepare({.name = "Stardust"}, bot_dir_, {},
                           PrepareOptions{.tournament_module = true,
                                          .tm_dir = tm_dir_,
                                          .tm_table = table}));

  ASSERT_TRUE(bot.tournament_module.has_value());
  EXPECT_EQ(*bot.tournament_module, tm_dir_ / "TM_4.4.0.dll");
}

TEST_F(PreparedBotTest, UnknownBwapiRunsWithoutTournamentModule) {
  write(bot_dir_ / "bwapi-data" / "AI" / "Stardust.dll", "dll");
  std::vector<TournamentModuleVersion> table;

  ASSERT_OK_AND_ASSIGN(
      PreparedBot bot,
      PreparedBot::prepare({.name = "Stardust"}, bot_dir_, {},
                           PrepareOptions{.tournament_module = true,
                                          .tm_dir = tm_dir_,
                                          .tm_table = table}));

  EXPECT_FALSE(bot.tournament_module.has_value());
}

TEST_F(PreparedBotTest, MissingTournamentModuleFileFails) {
  write(bot_dir_ / "bwapi-data" / "AI" / "Stardust.dll", "dll");
  ASSERT_OK_AND_ASSIGN(uint32_t crc,
                       file_crc32(bot_dir_ / "bwapi-data" / "BWAPI.dll"));
  std::vector<TournamentModuleVersion> table = {
      {crc, "4.4.0", "TM_4.4.0.dll"}};

  absl::StatusOr<PreparedBot> bot = PreparedBot::prepare(
      {.name = "Stardust"}, bot_dir_, {},
      PrepareOptions{.tournament_module = true,
                     .tm_dir = tm_dir_,
                     .tm_table = table});

  EXPECT_EQ(bot.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_NE(bot.status().message().find("TM_4.4.0.dll"), std::string::npos);
}

TEST_F(PreparedBotTest, UncheckableTournamentModuleFails) {
  ASSERT_OK_AND_ASSIGN(uint32_t crc,
                       file_crc32(bot_dir_ / "bwapi-data" / "BWAPI.dll"));
  std::string module_file(300, 'm');
  std::vector<TournamentModuleVersion> table = {{crc, "4.4.0", module_file}};

  absl::StatusOr<std::optional<std::filesystem::path>> module =
      resolve_tournament_module(bot_dir_ / "bwapi-data" / "BWAPI.dll", tm_dir_,
                                table);

  EXPECT_EQ(module.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_NE(module.status().message().find(module_file), std::string::npos);
}

}  // namespace
}  // namespace bot
