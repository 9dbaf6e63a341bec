#ifndef __PUNCHCARD_LEDGER_STORE_HH__
#define __PUNCHCARD_LEDGER_STORE_HH__

#include <filesystem>
#include <nlohmann/json.hpp>

#include "ledger.hh"

namespace punchcard {
nlohmann::json LedgerToJson(const Ledger &ledger);

// Fills `ledger` only if every entry of `json` is well formed.
bool LedgerFromJson(Ledger &ledger, const nlohmann::json &json);

bool SaveLedger(const Ledger &ledger, const std::filesystem::path &path);
bool LoadLedger(Ledger &ledger, const std::filesystem::path &path);
}  // namespace punchcard

#endif /* __PUNCHCARD_LEDGER_STORE_HH__ */
