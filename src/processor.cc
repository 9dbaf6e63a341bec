#include "processor.hh"

#include <utility>

#include "punchcard.hh"
#include "system_program.hh"
#include "util.hh"

namespace punchcard {
const Address &ProgramId() {
  static const Address id =
      Address::FromBase58("pcWKVSdcdDUKabPz4pVfaQ2jMod1kWv3LqeQivjKXiF").value();
  return id;
}

Status Process(const Address &program_id, std::span<AccountInfo> accounts,
               std::span<const u8> data, const Rent &rent) {
  auto decoded = DecodeInstruction(data);
  if (auto *err = std::get_if<ProgramError>(&decoded)) return *err;

  return std::visit(
      Overloaded{[&](const CreateInstruction &create) {
                   LogInfo() << "Instruction: Create " << create.capacity
                             << std::endl;
                   return ProcessCreate(program_id, accounts, create.capacity,
                                        rent);
                 },
                 [&](const ClaimInstruction &claim) {
                   LogInfo() << "Instruction: Claim " << claim.indices.size()
                             << " indices" << std::endl;
                   return ProcessClaim(program_id, accounts, claim.indices);
                 }},
      std::get<Instruction>(decoded));
}

Status ProcessCreate(const Address &program_id,
                     std::span<AccountInfo> accounts, u64 capacity,
                     const Rent &rent) {
  if (accounts.size() != 3)
    return ProgramError(ErrorKind::kNotEnoughAccountKeys);

  auto &payer = accounts[0];
  auto &card = accounts[1];
  auto &system_program = accounts[2];

  if (system_program.key != SystemProgramId())
    return ProgramError(ErrorKind::kIncorrectProgramId);

  auto space = Punchcard::Space(capacity);
  if (!space) return PunchcardError::kInvalidCapacity;

  u64 deposit = rent.MinimumBalance(*space);

  if (auto err =
          system::CreateAccount(payer, card, deposit, *space, program_id))
    return err;

  auto split = Punchcard::Split(card.Data());
  if (auto *err = std::get_if<ProgramError>(&split)) return *err;

  auto [header, bits] = std::get<Punchcard::Parts>(split);
  header->authority = payer.key;
  header->capacity = capacity;
  header->claimed = 0;
  BitVectorView(bits).Clear();

  return std::nullopt;
}

Status ProcessClaim(const Address &program_id, std::span<AccountInfo> accounts,
                    std::span<const u64> indices) {
  if (accounts.size() != 2)
    return ProgramError(ErrorKind::kNotEnoughAccountKeys);

  auto &authority = accounts[0];
  auto &card_info = accounts[1];

  if (!authority.is_signer)
    return ProgramError(ErrorKind::kMissingRequiredSignature);

  if (!card_info.IsOwnedBy(program_id))
    return ProgramError(ErrorKind::kIncorrectProgramId);

  bool full;

  {
    auto parsed = Punchcard::FromBytes(card_info.Data());
    if (auto *err = std::get_if<ProgramError>(&parsed)) return *err;

    auto &card = std::get<Punchcard>(parsed);

    if (card.Header().authority != authority.key)
      return PunchcardError::kInvalidAuthority;

    for (u64 index : indices) {
      if (index >= card.Header().capacity)
        return PunchcardError::kIndexOutOfBounds;

      if (auto err = card.Claim(index)) return err;
    }

    full = card.IsFull();
  }

  if (full) {
    auto total = CheckedAdd(authority.account.lamports,
                            card_info.account.lamports);
    if (!total) return ProgramError(ErrorKind::kArithmeticOverflow);

    LogInfo() << "Punchcard " << card_info.key << " fully claimed, returning "
              << card_info.account.lamports << " lamports" << std::endl;

    authority.account.lamports = *total;
    card_info.account.lamports = 0;
    BitVectorView(card_info.Data()).Clear();
    card_info.Close();
  }

  return std::nullopt;
}

TransactionInstruction MakeCreateInstruction(const Address &payer,
                                             const Address &card,
                                             u64 capacity) {
  return TransactionInstruction{
      .program_id = ProgramId(),
      .accounts = {{payer, true, true},
                   {card, true, true},
                   {SystemProgramId(), false, false}},
      .data = EncodeInstruction(CreateInstruction{capacity})};
}

TransactionInstruction MakeClaimInstruction(const Address &authority,
                                            const Address &card,
                                            std::vector<u64> indices) {
  return TransactionInstruction{
      .program_id = ProgramId(),
      .accounts = {{authority, true, true}, {card, false, true}},
      .data = EncodeInstruction(ClaimInstruction{std::move(indices)})};
}
}  // namespace punchcard
