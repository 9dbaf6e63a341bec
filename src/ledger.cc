#include "ledger.hh"

#include <unordered_set>

#include "processor.hh"
#include "util.hh"

namespace punchcard {
Ledger::Ledger(Rent rent) : rent_(rent) {
  programs_[ProgramId()] = Process;
}

void Ledger::RegisterProgram(const Address &program_id, Entrypoint entrypoint) {
  std::unique_lock lock{mutex_};
  programs_[program_id] = std::move(entrypoint);
}

Status Ledger::Airdrop(const Address &address, u64 lamports) {
  std::unique_lock lock{mutex_};

  if (lamports == 0) return std::nullopt;

  auto found = accounts_.find(address);
  u64 current = found != accounts_.end() ? found->second.lamports : 0;

  auto total = CheckedAdd(current, lamports);
  if (!total) return ProgramError(ErrorKind::kArithmeticOverflow);

  accounts_[address].lamports = *total;
  return std::nullopt;
}

std::optional<Account> Ledger::GetAccount(const Address &address) const {
  std::unique_lock lock{mutex_};

  if (auto found = accounts_.find(address); found != accounts_.end())
    return found->second;

  return std::nullopt;
}

void Ledger::SetAccount(const Address &address, Account account) {
  std::unique_lock lock{mutex_};

  if (account.lamports == 0)
    accounts_.erase(address);
  else
    accounts_[address] = std::move(account);
}

std::vector<std::pair<Address, Account>> Ledger::Accounts() const {
  std::unique_lock lock{mutex_};
  return {accounts_.begin(), accounts_.end()};
}

Status Ledger::ExecuteInstruction(const TransactionInstruction &instruction,
                                  AccountMap &staged) const {
  auto program = programs_.find(instruction.program_id);
  if (program == programs_.end())
    return ProgramError(ErrorKind::kUnsupportedProgramId);

  std::unordered_set<Address> seen;
  std::vector<AccountInfo> infos;
  infos.reserve(instruction.accounts.size());

  for (const auto &meta : instruction.accounts) {
    if (!seen.insert(meta.address).second)
      return ProgramError(ErrorKind::kAccountLoadedTwice);

    AccountInfo info{meta.address, meta.is_signer, meta.is_writable, {}};

    if (auto found = staged.find(meta.address); found != staged.end())
      info.account = found->second;
    else if (auto stored = accounts_.find(meta.address);
             stored != accounts_.end())
      info.account = stored->second;

    infos.push_back(std::move(info));
  }

  std::vector<Account> before;
  before.reserve(infos.size());
  for (const auto &info : infos) before.push_back(info.account);

  auto sum_lamports = [](const auto &accounts, auto get) -> std::optional<u64> {
    u64 sum = 0;
    for (const auto &entry : accounts) {
      auto next = CheckedAdd(sum, get(entry));
      if (!next) return std::nullopt;
      sum = *next;
    }
    return sum;
  };

  auto lamports_before = sum_lamports(
      before, [](const Account &account) { return account.lamports; });
  if (!lamports_before) return ProgramError(ErrorKind::kArithmeticOverflow);

  if (auto err = program->second(instruction.program_id, infos,
                                 instruction.data, rent_))
    return err;

  for (size_t i = 0; i < infos.size(); i++) {
    if (infos[i].is_writable) continue;

    if (infos[i].account.lamports != before[i].lamports)
      return ProgramError(ErrorKind::kReadonlyLamportChange);

    if (infos[i].account.data != before[i].data ||
        infos[i].account.owner != before[i].owner)
      return ProgramError(ErrorKind::kReadonlyDataModified);
  }

  auto lamports_after = sum_lamports(
      infos, [](const AccountInfo &info) { return info.account.lamports; });
  if (lamports_after != lamports_before)
    return ProgramError(ErrorKind::kUnbalancedInstruction);

  for (auto &info : infos) staged[info.key] = std::move(info.account);

  return std::nullopt;
}

Status Ledger::Execute(const TransactionInstruction &instruction) {
  return ExecuteTransaction(std::span{&instruction, 1});
}

Status Ledger::ExecuteTransaction(
    std::span<const TransactionInstruction> instructions) {
  std::unique_lock lock{mutex_};

  AccountMap staged;

  for (size_t i = 0; i < instructions.size(); i++) {
    if (auto err = ExecuteInstruction(instructions[i], staged)) {
      LogError() << "Transaction failed at instruction " << i << ": " << *err
                 << std::endl;
      return err;
    }
  }

  for (auto &[address, account] : staged) {
    if (account.lamports == 0)
      accounts_.erase(address);
    else
      accounts_[address] = std::move(account);
  }

  return std::nullopt;
}
}  // namespace punchcard
