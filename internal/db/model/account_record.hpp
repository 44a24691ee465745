#pragma once

#include <cstdint>
#include <string>

namespace market::db::model {

struct AccountRecord {
  std::string id;
  int64_t     balance_micros   = 0;
  int64_t     deposited_micros = 0;
  int64_t     withdrawn_micros = 0;
  int64_t     earned_micros    = 0;
  int64_t     committed_micros = 0;
  int64_t     spent_micros     = 0;
  uint64_t    created_at_ms    = 0;
  uint64_t    updated_at_ms    = 0;
};

} // namespace market::db::model
