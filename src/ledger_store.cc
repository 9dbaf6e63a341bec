#include "ledger_store.hh"

#include <algorithm>
#include <fstream>
#include <optional>
#include <string>

#include "util.hh"

namespace punchcard {
namespace {
constexpr char kHexDigits[] = "0123456789abcdef";

std::string ToHex(const std::vector<u8> &bytes) {
  std::string hex;
  hex.reserve(bytes.size() * 2);

  for (u8 byte : bytes) {
    hex += kHexDigits[byte >> 4];
    hex += kHexDigits[byte & 0xf];
  }

  return hex;
}

std::optional<u8> HexNibble(char chr) {
  if ('0' <= chr && chr <= '9') return chr - '0';
  if ('a' <= chr && chr <= 'f') return chr - 'a' + 10;
  if ('A' <= chr && chr <= 'F') return chr - 'A' + 10;
  return std::nullopt;
}

std::optional<std::vector<u8>> FromHex(const std::string &hex) {
  if (hex.size() % 2) return std::nullopt;

  std::vector<u8> bytes;
  bytes.reserve(hex.size() / 2);

  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = HexNibble(hex[i]), low = HexNibble(hex[i + 1]);
    if (!high || !low) return std::nullopt;
    bytes.push_back(u8(*high << 4 | *low));
  }

  return bytes;
}

std::optional<std::pair<Address, Account>> EntryFromJson(
    const nlohmann::json &entry) {
  if (!entry.is_object()) return std::nullopt;

  auto address = entry.find("address");
  auto owner = entry.find("owner");
  auto lamports = entry.find("lamports");
  auto data = entry.find("data");

  if (address == entry.end() || !address->is_string() || owner == entry.end() ||
      !owner->is_string() || lamports == entry.end() ||
      !lamports->is_number_unsigned() || data == entry.end() ||
      !data->is_string())
    return std::nullopt;

  auto key = Address::FromBase58(address->get<std::string>());
  auto owner_key = Address::FromBase58(owner->get<std::string>());
  auto bytes = FromHex(data->get<std::string>());

  if (!key || !owner_key || !bytes) return std::nullopt;

  return std::pair{*key, Account{lamports->get<u64>(), std::move(*bytes),
                                 *owner_key}};
}
}  // namespace

nlohmann::json LedgerToJson(const Ledger &ledger) {
  auto accounts = ledger.Accounts();

  // Stable output for a stable file.
  std::sort(accounts.begin(), accounts.end(),
            [](const auto &a, const auto &b) { return a.first.bytes < b.first.bytes; });

  nlohmann::json entries = nlohmann::json::array();

  for (const auto &[address, account] : accounts)
    entries.push_back({{"address", address.ToBase58()},
                       {"owner", account.owner.ToBase58()},
                       {"lamports", account.lamports},
                       {"data", ToHex(account.data)}});

  return {{"accounts", std::move(entries)}};
}

bool LedgerFromJson(Ledger &ledger, const nlohmann::json &json) {
  if (!json.is_object()) return false;

  auto entries = json.find("accounts");
  if (entries == json.end() || !entries->is_array()) return false;

  std::vector<std::pair<Address, Account>> accounts;

  for (const auto &entry : *entries) {
    auto parsed = EntryFromJson(entry);
    if (!parsed) return false;
    accounts.push_back(std::move(*parsed));
  }

  for (auto &[address, account] : accounts)
    ledger.SetAccount(address, std::move(account));

  return true;
}

bool SaveLedger(const Ledger &ledger, const std::filesystem::path &path) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream stream{tmp_path, std::ios::trunc};
    if (!stream) {
      LogError() << "Could not open " << tmp_path << " for writing" << std::endl;
      return false;
    }

    stream << LedgerToJson(ledger).dump(2) << std::endl;

    if (!stream) {
      LogError() << "Could not write " << tmp_path << std::endl;
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);

  if (ec) {
    LogError() << "Could not replace " << path << ": " << ec.message()
               << std::endl;
    return false;
  }

  return true;
}

bool LoadLedger(Ledger &ledger, const std::filesystem::path &path) {
  std::ifstream stream{path};
  if (!stream) {
    LogError() << "Could not open " << path << std::endl;
    return false;
  }

  nlohmann::json json;

  try {
    json = nlohmann::json::parse(stream);
  } catch (const nlohmann::json::exception &ex) {
    LogError() << "Could not parse " << path << ": " << ex.what() << std::endl;
    return false;
  }

  if (!LedgerFromJson(ledger, json)) {
    LogError() << path << " is not a ledger file" << std::endl;
    return false;
  }

  return true;
}
}  // namespace punchcard
