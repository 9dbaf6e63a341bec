#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hh"
#include "ledger.hh"
#include "ledger_store.hh"
#include "processor.hh"
#include "punchcard.hh"
#include "util.hh"

using namespace punchcard;

namespace {
enum ExitCode { kSuccess = 0, kFailure = 1, kUsage = 2 };

void PrintUsage() {
  std::cerr << "usage: punchcardctl <command> [args]\n"
               "\n"
               "  address                               print a fresh address\n"
               "  airdrop <address> <lamports>          fund an address\n"
               "  balance <address>                     print a balance\n"
               "  create <payer> <punchcard> <capacity> create a punchcard\n"
               "  claim <authority> <punchcard> <index>...\n"
               "                                        claim slots\n"
               "  show <punchcard>                      print a punchcard\n";
}

std::optional<u64> ParseU64(std::string_view str) {
  u64 value = 0;
  auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || end != str.data() + str.size()) return std::nullopt;
  return value;
}

std::optional<Address> ParseAddress(std::string_view str) {
  auto address = Address::FromBase58(str);
  if (!address) LogError() << "Not an address: " << str << std::endl;
  return address;
}

class Session {
  Ledger ledger_;
  std::filesystem::path path_;

 public:
  inline Session(const Config &config)
      : ledger_(config.GetRent()), path_(config.LedgerPath()) {}

  inline bool Open() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
      LogInfo() << "Starting a new ledger at " << path_ << std::endl;
      return true;
    }

    return LoadLedger(ledger_, path_);
  }

  inline bool Save() { return SaveLedger(ledger_, path_); }

  inline Ledger &GetLedger() { return ledger_; }

  inline int Commit(Status status) {
    if (status) {
      LogError() << "Failed: " << *status << std::endl;
      return kFailure;
    }

    return Save() ? kSuccess : kFailure;
  }
};

int Airdrop(Session &session, const std::vector<std::string_view> &args) {
  if (args.size() != 2) return kUsage;

  auto address = ParseAddress(args[0]);
  auto lamports = ParseU64(args[1]);
  if (!address || !lamports) return kUsage;

  return session.Commit(session.GetLedger().Airdrop(*address, *lamports));
}

int Balance(Session &session, const std::vector<std::string_view> &args) {
  if (args.size() != 1) return kUsage;

  auto address = ParseAddress(args[0]);
  if (!address) return kUsage;

  auto account = session.GetLedger().GetAccount(*address);
  std::cout << (account ? account->lamports : 0) << std::endl;
  return kSuccess;
}

int Create(Session &session, const std::vector<std::string_view> &args) {
  if (args.size() != 3) return kUsage;

  auto payer = ParseAddress(args[0]);
  auto card = ParseAddress(args[1]);
  auto capacity = ParseU64(args[2]);
  if (!payer || !card || !capacity) return kUsage;

  return session.Commit(session.GetLedger().Execute(
      MakeCreateInstruction(*payer, *card, *capacity)));
}

int Claim(Session &session, const std::vector<std::string_view> &args) {
  if (args.size() < 3) return kUsage;

  auto authority = ParseAddress(args[0]);
  auto card = ParseAddress(args[1]);
  if (!authority || !card) return kUsage;

  std::vector<u64> indices;
  for (size_t i = 2; i < args.size(); i++) {
    auto index = ParseU64(args[i]);
    if (!index) return kUsage;
    indices.push_back(*index);
  }

  return session.Commit(session.GetLedger().Execute(
      MakeClaimInstruction(*authority, *card, std::move(indices))));
}

int Show(Session &session, const std::vector<std::string_view> &args) {
  if (args.size() != 1) return kUsage;

  auto address = ParseAddress(args[0]);
  if (!address) return kUsage;

  auto account = session.GetLedger().GetAccount(*address);
  if (!account) {
    LogError() << "No account at " << *address << std::endl;
    return kFailure;
  }

  if (account->owner != ProgramId()) {
    LogError() << *address << " is not a punchcard" << std::endl;
    return kFailure;
  }

  auto parsed = Punchcard::FromBytes(account->data);
  if (auto *err = std::get_if<ProgramError>(&parsed)) {
    LogError() << *address << " is corrupt: " << *err << std::endl;
    return kFailure;
  }

  const auto &card = std::get<Punchcard>(parsed);
  const auto &header = card.Header();

  std::cout << "authority: " << header.authority << "\n"
            << "capacity:  " << header.capacity << "\n"
            << "claimed:   " << header.claimed << "\n"
            << "deposit:   " << account->lamports << "\n"
            << "slots:    ";

  auto bits = card.Bits().Snapshot();
  for (auto slot = bits.find_first(); slot != boost::dynamic_bitset<u8>::npos;
       slot = bits.find_next(slot))
    std::cout << " " << slot;

  std::cout << std::endl;
  return kSuccess;
}
}  // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return kUsage;
  }

  std::string_view command = argv[1];
  std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "address") {
    std::cout << Address::Random() << std::endl;
    return kSuccess;
  }

  Session session{Config::Get()};
  if (!session.Open()) return kFailure;

  int ret = kUsage;

  if (command == "airdrop")
    ret = Airdrop(session, args);
  else if (command == "balance")
    ret = Balance(session, args);
  else if (command == "create")
    ret = Create(session, args);
  else if (command == "claim")
    ret = Claim(session, args);
  else if (command == "show")
    ret = Show(session, args);

  if (ret == kUsage) PrintUsage();

  return ret;
}
