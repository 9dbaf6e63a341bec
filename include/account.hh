#ifndef __PUNCHCARD_ACCOUNT_HH__
#define __PUNCHCARD_ACCOUNT_HH__

#include <span>
#include <vector>

#include "address.hh"
#include "util.hh"

namespace punchcard {

// Per-account bookkeeping the ledger charges for on top of the data itself.
constexpr u64 kAccountStorageOverhead = 128;

constexpr size_t kMaxPermittedDataLength = 10 * 1024 * 1024;

struct Account {
  u64 lamports{0};
  std::vector<u8> data;
  Address owner{SystemProgramId()};

  inline bool operator==(const Account &account) const = default;
};

// An account as seen by a program while one instruction executes.
struct AccountInfo {
  Address key;
  bool is_signer{false};
  bool is_writable{false};
  Account account;

  inline bool IsOwnedBy(const Address &program_id) const {
    return account.owner == program_id;
  }

  inline std::span<u8> Data() { return account.data; }

  // Hands the account back to the system program with no data. Its lamports
  // must already have been moved out.
  inline void Close() {
    account.owner = SystemProgramId();
    account.data.clear();
    account.data.shrink_to_fit();
  }
};

struct AccountMeta {
  Address address;
  bool is_signer;
  bool is_writable;
};

struct TransactionInstruction {
  Address program_id;
  std::vector<AccountMeta> accounts;
  std::vector<u8> data;
};

struct Rent {
  u64 lamports_per_byte_year{3480};
  double exemption_threshold{2.0};

  // Deposit that keeps an account of data_len bytes alive indefinitely. At
  // least 1 whatever the rates.
  u64 MinimumBalance(size_t data_len) const;
};
}  // namespace punchcard

#endif /* __PUNCHCARD_ACCOUNT_HH__ */
