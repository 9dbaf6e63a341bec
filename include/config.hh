#ifndef __PUNCHCARD_CONFIG_HH__
#define __PUNCHCARD_CONFIG_HH__

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "account.hh"

namespace punchcard {
std::filesystem::path GetConfigDirectory();

class Config {
  nlohmann::json json_;
  mutable std::mutex mutex_;

  Config();
  void operator=(const Config &) = delete;
  Config(const Config &) = delete;

 public:
  static Config &Get();

  // Returns false when there is no punchcard.json; defaults then apply.
  bool Reload();

  inline std::filesystem::path LedgerPath() const {
    std::unique_lock lock{mutex_};
    if (auto ent = json_.find("ledger_path");
        ent != json_.end() && ent->is_string())
      return ent->template get<std::string>();
    return "punchcard-ledger.json";
  }

  inline u64 LamportsPerByteYear() const {
    std::unique_lock lock{mutex_};
    if (auto ent = json_.find("lamports_per_byte_year");
        ent != json_.end() && ent->is_number_unsigned())
      return ent->template get<u64>();
    return Rent{}.lamports_per_byte_year;
  }

  inline double ExemptionThreshold() const {
    std::unique_lock lock{mutex_};
    if (auto ent = json_.find("exemption_threshold");
        ent != json_.end() && ent->is_number() &&
        ent->template get<double>() >= 0)
      return ent->template get<double>();
    return Rent{}.exemption_threshold;
  }

  inline Rent GetRent() const {
    return Rent{LamportsPerByteYear(), ExemptionThreshold()};
  }
};
}  // namespace punchcard

#endif /* __PUNCHCARD_CONFIG_HH__ */
