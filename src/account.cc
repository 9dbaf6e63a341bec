#include "account.hh"

#include <cmath>
#include <limits>

namespace punchcard {
u64 Rent::MinimumBalance(size_t data_len) const {
  constexpr u64 kMax = std::numeric_limits<u64>::max();

  auto bytes = CheckedAdd(kAccountStorageOverhead, u64(data_len));
  if (!bytes) return kMax;

  if (lamports_per_byte_year != 0 && *bytes > kMax / lamports_per_byte_year)
    return kMax;

  double balance = double(*bytes * lamports_per_byte_year) * exemption_threshold;

  // 2^64 is the first double that no longer fits.
  if (!(balance < 18446744073709551616.0)) return kMax;

  // The ledger drops accounts holding no lamports, so a deposit is never 0.
  if (!(balance >= 1)) return 1;

  return u64(balance);
}
}  // namespace punchcard
