#ifndef __PUNCHCARD_SYSTEM_PROGRAM_HH__
#define __PUNCHCARD_SYSTEM_PROGRAM_HH__

#include "account.hh"
#include "error.hh"

namespace punchcard::system {

// Funds `to` with `lamports` taken from `from`, gives it `space` zeroed bytes
// and assigns it to `owner`. Both accounts must have signed and `to` must be
// unused. Nothing is modified on failure.
Status CreateAccount(AccountInfo &from, AccountInfo &to, u64 lamports,
                     size_t space, const Address &owner);

Status Transfer(AccountInfo &from, AccountInfo &to, u64 lamports);
}  // namespace punchcard::system

#endif /* __PUNCHCARD_SYSTEM_PROGRAM_HH__ */
