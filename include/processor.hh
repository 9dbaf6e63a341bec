#ifndef __PUNCHCARD_PROCESSOR_HH__
#define __PUNCHCARD_PROCESSOR_HH__

#include <span>
#include <vector>

#include "account.hh"
#include "error.hh"
#include "instruction.hh"

namespace punchcard {

const Address &ProgramId();

// Decodes `data` and runs the instruction against `accounts`.
//
// Create: [payer (signer), punchcard (signer), system program]
// Claim:  [authority (signer), punchcard]
//
// On error the accounts may be partially modified; the caller discards them.
Status Process(const Address &program_id, std::span<AccountInfo> accounts,
               std::span<const u8> data, const Rent &rent);

Status ProcessCreate(const Address &program_id,
                     std::span<AccountInfo> accounts, u64 capacity,
                     const Rent &rent);

Status ProcessClaim(const Address &program_id, std::span<AccountInfo> accounts,
                    std::span<const u64> indices);

TransactionInstruction MakeCreateInstruction(const Address &payer,
                                             const Address &card,
                                             u64 capacity);

TransactionInstruction MakeClaimInstruction(const Address &authority,
                                            const Address &card,
                                            std::vector<u64> indices);
}  // namespace punchcard

#endif /* __PUNCHCARD_PROCESSOR_HH__ */
