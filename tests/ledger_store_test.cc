#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "ledger_store.hh"
#include "processor.hh"

using namespace punchcard;

class LedgerStoreTest : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("punchcard-store-" + Address::Random().ToBase58());
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  void WriteFile(const std::string &name, const std::string &contents) {
    std::ofstream{dir_ / name} << contents;
  }
};

TEST_F(LedgerStoreTest, SavedLedgerLoadsBack) {
  Ledger ledger;
  Address payer = Address::Random(), card = Address::Random();

  ASSERT_EQ(ledger.Airdrop(payer, 1'000'000'000), std::nullopt);
  ASSERT_EQ(ledger.Execute(MakeCreateInstruction(payer, card, 20)),
            std::nullopt);
  ASSERT_EQ(ledger.Execute(MakeClaimInstruction(payer, card, {2, 19})),
            std::nullopt);

  ASSERT_TRUE(SaveLedger(ledger, dir_ / "ledger.json"));

  Ledger loaded;
  ASSERT_TRUE(LoadLedger(loaded, dir_ / "ledger.json"));

  EXPECT_EQ(loaded.GetAccount(payer), ledger.GetAccount(payer));
  EXPECT_EQ(loaded.GetAccount(card), ledger.GetAccount(card));
  EXPECT_EQ(loaded.Accounts().size(), 2u);

  // The restored record keeps working.
  EXPECT_EQ(loaded.Execute(MakeClaimInstruction(payer, card, {3})),
            std::nullopt);
}

TEST_F(LedgerStoreTest, JsonLayout) {
  Ledger ledger;
  Address owner = ProgramId(), address = Address::Random();
  ledger.SetAccount(address, Account{7, {0x00, 0xab}, owner});

  auto json = LedgerToJson(ledger);

  ASSERT_EQ(json["accounts"].size(), 1u);
  const auto &entry = json["accounts"][0];
  EXPECT_EQ(entry["address"], address.ToBase58());
  EXPECT_EQ(entry["owner"], owner.ToBase58());
  EXPECT_EQ(entry["lamports"], 7u);
  EXPECT_EQ(entry["data"], "00ab");
}

TEST_F(LedgerStoreTest, RejectsMalformedFiles) {
  WriteFile("garbage.json", "{ not json");
  WriteFile("wrong_shape.json", R"({"accounts": {}})");
  WriteFile("bad_hex.json",
            R"({"accounts": [{"address": "11111111111111111111111111111112",
                              "owner": "11111111111111111111111111111111",
                              "lamports": 5, "data": "0g"}]})");

  for (const auto *name : {"garbage.json", "wrong_shape.json", "bad_hex.json",
                           "missing.json"}) {
    SCOPED_TRACE(name);
    Ledger ledger;
    EXPECT_FALSE(LoadLedger(ledger, dir_ / name));
    EXPECT_TRUE(ledger.Accounts().empty());
  }
}

// One bad entry keeps the good ones out too.
TEST_F(LedgerStoreTest, LoadIsAllOrNothing) {
  Ledger ledger;
  nlohmann::json json = {
      {"accounts",
       {{{"address", Address::Random().ToBase58()},
         {"owner", SystemProgramId().ToBase58()},
         {"lamports", 5u},
         {"data", ""}},
        {{"address", "not base58!"},
         {"owner", SystemProgramId().ToBase58()},
         {"lamports", 5u},
         {"data", ""}}}}};

  EXPECT_FALSE(LedgerFromJson(ledger, json));
  EXPECT_TRUE(ledger.Accounts().empty());
}
