#include "escrow_ledger.hpp"

#include <algorithm>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace market::ledger {

using market::v1::CHANNEL_STATE_CLOSED;
using market::v1::CHANNEL_STATE_ESCROWED;
using market::v1::CHANNEL_STATE_OPEN;
using market::v1::CHANNEL_STATE_OPENING;
using market::v1::CHANNEL_STATE_SETTLING;

namespace {

db::model::AccountRecord ToRecord(const Account& a) {
  db::model::AccountRecord r;
  r.id               = a.owner_id;
  r.balance_micros   = a.balance;
  r.deposited_micros = a.deposited;
  r.withdrawn_micros = a.withdrawn;
  r.earned_micros    = a.earned;
  r.committed_micros = a.committed;
  r.spent_micros     = a.spent;
  r.created_at_ms    = util::ToUnixMillis(a.created_at);
  r.updated_at_ms    = util::ToUnixMillis(a.updated_at);
  return r;
}

Account FromRecord(const db::model::AccountRecord& r) {
  Account a;
  a.owner_id   = r.id;
  a.balance    = r.balance_micros;
  a.deposited  = r.deposited_micros;
  a.withdrawn  = r.withdrawn_micros;
  a.earned     = r.earned_micros;
  a.committed  = r.committed_micros;
  a.spent      = r.spent_micros;
  a.created_at = util::FromUnixMillis(r.created_at_ms);
  a.updated_at = util::FromUnixMillis(r.updated_at_ms);
  return a;
}

db::model::ChannelRecord ToRecord(const Channel& c) {
  db::model::ChannelRecord r;
  r.id                    = c.id;
  r.payer_id              = c.payer_id;
  r.payee_id              = c.payee_id;
  r.auction_id            = c.auction_ref;
  r.state                 = static_cast<int32_t>(c.state);
  r.deposit_micros        = c.total_deposit;
  r.balance_micros        = c.current_balance;
  r.escrowed_micros       = c.escrowed;
  r.released_micros       = c.total_settled;
  r.total_refunded_micros = c.total_refunded;
  r.frozen                = c.frozen;
  r.sequence              = c.sequence;
  r.created_at_ms         = util::ToUnixMillis(c.created_at);
  r.updated_at_ms         = util::ToUnixMillis(c.updated_at);

  r.holds.reserve(c.holds.size());
  for (const auto& [task_id, hold] : c.holds) {
    db::model::HoldRecord h;
    h.task_id         = task_id;
    h.amount_micros   = hold.amount;
    h.state           = static_cast<int32_t>(hold.state);
    h.payee_micros    = hold.paid;
    h.refunded_micros = hold.refunded;
    h.locked_at_ms    = util::ToUnixMillis(hold.locked_at);
    h.deadline_ms     = util::ToUnixMillis(hold.deadline);
    h.resolved_at_ms  = hold.Active() ? 0 : util::ToUnixMillis(hold.resolved_at);
    r.holds.push_back(std::move(h));
  }
  return r;
}

db::model::ChannelEntryRecord ToRecord(const LedgerEntry& e) {
  db::model::ChannelEntryRecord r;
  r.channel_id            = e.channel_id;
  r.sequence              = e.sequence;
  r.tx_id                 = e.id;
  r.type                  = static_cast<int32_t>(e.type);
  r.task_id               = e.task_id;
  r.amount_micros         = e.amount;
  r.reason                = e.reason;
  r.at_ms                 = util::ToUnixMillis(e.at);
  r.balance_after_micros  = e.balance_after;
  r.escrowed_after_micros = e.escrowed_after;
  r.settled_after_micros  = e.settled_after;
  return r;
}

LedgerEntry FromRecord(const db::model::ChannelEntryRecord& r) {
  LedgerEntry e;
  e.id             = r.tx_id;
  e.channel_id     = r.channel_id;
  e.type           = static_cast<market::v1::LedgerEntryType>(r.type);
  e.amount         = r.amount_micros;
  e.task_id        = r.task_id;
  e.reason         = r.reason;
  e.at             = util::FromUnixMillis(r.at_ms);
  e.sequence       = r.sequence;
  e.balance_after  = r.balance_after_micros;
  e.escrowed_after = r.escrowed_after_micros;
  e.settled_after  = r.settled_after_micros;
  return e;
}

Channel FromRecord(const db::model::ChannelRecord& r, const std::vector<db::model::ChannelEntryRecord>& entries) {
  Channel c;
  c.id              = r.id;
  c.payer_id        = r.payer_id;
  c.payee_id        = r.payee_id;
  c.auction_ref     = r.auction_id;
  c.state           = static_cast<market::v1::ChannelState>(r.state);
  c.total_deposit   = r.deposit_micros;
  c.current_balance = r.balance_micros;
  c.escrowed        = r.escrowed_micros;
  c.total_settled   = r.released_micros;
  c.total_refunded  = r.total_refunded_micros;
  c.frozen          = r.frozen;
  c.sequence        = r.sequence;
  c.created_at      = util::FromUnixMillis(r.created_at_ms);
  c.updated_at      = util::FromUnixMillis(r.updated_at_ms);

  for (const auto& h : r.holds) {
    EscrowHold hold;
    hold.task_id     = h.task_id;
    hold.amount      = h.amount_micros;
    hold.state       = static_cast<HoldState>(h.state);
    hold.paid        = h.payee_micros;
    hold.refunded    = h.refunded_micros;
    hold.locked_at   = util::FromUnixMillis(h.locked_at_ms);
    hold.deadline    = util::FromUnixMillis(h.deadline_ms);
    hold.resolved_at = util::FromUnixMillis(h.resolved_at_ms);
    c.holds.emplace(hold.task_id, std::move(hold));
  }

  c.entries.reserve(entries.size());
  for (const auto& e : entries) {
    c.entries.push_back(FromRecord(e));
  }
  return c;
}

// Bumps the channel sequence and records the resulting totals.
LedgerEntry AppendEntry(Channel& channel, market::v1::LedgerEntryType type, Micros amount, const std::string& task_id, std::string reason,
                        util::TimePoint now) {
  ++channel.sequence;
  channel.updated_at = now;

  LedgerEntry entry;
  entry.id             = util::NewId("tx");
  entry.channel_id     = channel.id;
  entry.type           = type;
  entry.amount         = amount;
  entry.task_id        = task_id;
  entry.reason         = std::move(reason);
  entry.at             = now;
  entry.sequence       = channel.sequence;
  entry.balance_after  = channel.current_balance;
  entry.escrowed_after = channel.escrowed;
  entry.settled_after  = channel.total_settled;

  channel.entries.push_back(entry);
  return entry;
}

std::string_view StateName(market::v1::ChannelState state) {
  switch (state) {
    case CHANNEL_STATE_OPENING:
      return "opening";
    case CHANNEL_STATE_OPEN:
      return "open";
    case CHANNEL_STATE_ESCROWED:
      return "escrowed";
    case CHANNEL_STATE_SETTLING:
      return "settling";
    case CHANNEL_STATE_CLOSED:
      return "closed";
    default:
      return "unspecified";
  }
}

// Lifetime inflow (deposited + earned) bounds every other account figure.
void RequireInflowHeadroom(const Account& account, Micros amount, std::string_view op) {
  const Micros headroom = std::numeric_limits<Micros>::max() - account.deposited - account.earned;
  if (amount > headroom) {
    throw util::InvalidAmount(std::string(op) + ": amount " + std::to_string(amount) + " would overflow account " + account.owner_id);
  }
}

} // namespace

EscrowLedger::EscrowLedger(std::shared_ptr<db::Repository> repository, LedgerOptions options)
    : repository_(std::move(repository)), options_(options) {
}

// ------------------------------------------------------------------
// Lookup
// ------------------------------------------------------------------

std::shared_ptr<EscrowLedger::AccountSlot> EscrowLedger::FindAccount(const std::string& owner_id) const {
  std::shared_lock lock(mutex_);
  auto             it = accounts_.find(owner_id);
  return it == accounts_.end() ? nullptr : it->second;
}

std::shared_ptr<EscrowLedger::AccountSlot> EscrowLedger::AccountFor(const std::string& owner_id) {
  if (auto slot = FindAccount(owner_id)) {
    return slot;
  }
  std::unique_lock lock(mutex_);
  auto&            slot = accounts_[owner_id];
  if (!slot) {
    slot                     = std::make_shared<AccountSlot>();
    slot->account.owner_id   = owner_id;
    slot->account.created_at = util::Now();
    slot->account.updated_at = slot->account.created_at;
  }
  return slot;
}

std::shared_ptr<EscrowLedger::ChannelSlot> EscrowLedger::FindChannel(const std::string& channel_id) const {
  std::shared_lock lock(mutex_);
  auto             it = channels_.find(channel_id);
  if (it == channels_.end()) {
    throw util::NotFound("channel not found: " + channel_id);
  }
  return it->second;
}

// ------------------------------------------------------------------
// Invariants
// ------------------------------------------------------------------

std::optional<std::string> EscrowLedger::ChannelViolation(const Channel& c) const {
  if (c.current_balance < 0 || c.escrowed < 0 || c.total_settled < 0 || c.total_refunded < 0) {
    return "negative amount (balance=" + std::to_string(c.current_balance) + " escrowed=" + std::to_string(c.escrowed) +
           " settled=" + std::to_string(c.total_settled) + " refunded=" + std::to_string(c.total_refunded) + ")";
  }

  const Micros accounted = c.current_balance + c.escrowed + c.total_settled + c.total_refunded;
  if (accounted != c.total_deposit) {
    return "total_deposit " + std::to_string(c.total_deposit) + " != balance+escrowed+settled+refunded " + std::to_string(accounted);
  }

  Micros held = 0;
  for (const auto& [_, hold] : c.holds) {
    if (hold.Active()) held += hold.amount;
  }
  if (held != c.escrowed) {
    return "escrowed " + std::to_string(c.escrowed) + " != active holds " + std::to_string(held);
  }
  return std::nullopt;
}

std::optional<std::string> EscrowLedger::AccountViolation(const Account& a) const {
  if (a.balance < 0 || a.committed < 0) {
    return "negative amount (balance=" + std::to_string(a.balance) + " committed=" + std::to_string(a.committed) + ")";
  }
  const Micros expected = a.deposited + a.earned - a.withdrawn - a.spent - a.committed;
  if (expected != a.balance) {
    return "balance " + std::to_string(a.balance) + " != deposited+earned-withdrawn-spent-committed " + std::to_string(expected);
  }
  return std::nullopt;
}

void EscrowLedger::Freeze(ChannelSlot& slot, const std::string& detail) {
  auto& channel  = slot.channel;
  channel.frozen = true;

  ++invariant_violations_;
  observability::Metrics::Instance().RecordInvariantViolation();
  MARKET_LOG_CRITICAL("ledger invariant violated, channel frozen",
                      {observability::StringField("channel_id", channel.id), observability::StringField("detail", detail),
                       observability::IntField("sequence", static_cast<int64_t>(channel.sequence))});

  try {
    Persist(&channel, nullptr, {});
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("failed to persist frozen channel",
                     {observability::StringField("channel_id", channel.id), observability::StringField("error", e.what())});
  }

  throw util::InvariantViolation("channel " + channel.id + ": " + detail);
}

void EscrowLedger::VerifyBefore(ChannelSlot& slot, std::string_view op) {
  if (!options_.verify_after_mutation) {
    return;
  }
  if (auto violation = ChannelViolation(slot.channel)) {
    Freeze(slot, "before " + std::string(op) + ": " + *violation);
  }
}

void EscrowLedger::VerifyAfter(ChannelSlot& slot, const Channel& next, std::string_view op) {
  if (!options_.verify_after_mutation) {
    return;
  }
  if (auto violation = ChannelViolation(next)) {
    Freeze(slot, "after " + std::string(op) + ": " + *violation);
  }
}

void EscrowLedger::VerifyAfter(const Account& next, std::string_view op) {
  if (!options_.verify_after_mutation) {
    return;
  }
  if (auto violation = AccountViolation(next)) {
    ++invariant_violations_;
    observability::Metrics::Instance().RecordInvariantViolation();
    MARKET_LOG_CRITICAL("account invariant violated",
                        {observability::StringField("owner_id", next.owner_id), observability::StringField("op", op),
                         observability::StringField("detail", *violation)});
    throw util::InvariantViolation("account " + next.owner_id + ": " + *violation);
  }
}

void EscrowLedger::VerifyInvariant(const std::string& channel_id) {
  auto            slot = FindChannel(channel_id);
  std::lock_guard lock(slot->mutex);
  if (auto violation = ChannelViolation(slot->channel)) {
    Freeze(*slot, *violation);
  }
}

void EscrowLedger::VerifyAccount(const std::string& owner_id) {
  auto slot = FindAccount(owner_id);
  if (!slot) {
    throw util::NotFound("account not found: " + owner_id);
  }
  std::lock_guard lock(slot->mutex);
  if (auto violation = AccountViolation(slot->account)) {
    ++invariant_violations_;
    observability::Metrics::Instance().RecordInvariantViolation();
    MARKET_LOG_CRITICAL("account invariant violated",
                        {observability::StringField("owner_id", owner_id), observability::StringField("detail", *violation)});
    throw util::InvariantViolation("account " + owner_id + ": " + *violation);
  }
}

void EscrowLedger::VerifyAll() {
  std::unique_lock audit(audit_mutex_);

  std::vector<std::string>                  channel_ids;
  std::vector<std::string>                  owner_ids;
  std::vector<std::shared_ptr<ChannelSlot>> channel_slots;
  std::vector<std::shared_ptr<AccountSlot>> account_slots;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, slot] : channels_) {
      channel_ids.push_back(id);
      channel_slots.push_back(slot);
    }
    for (const auto& [id, slot] : accounts_) {
      owner_ids.push_back(id);
      account_slots.push_back(slot);
    }
  }

  std::vector<std::string> failures;
  for (const auto& id : channel_ids) {
    try {
      VerifyInvariant(id);
    } catch (const util::InvariantViolation& e) {
      failures.emplace_back(e.what());
    }
  }
  for (const auto& id : owner_ids) {
    try {
      VerifyAccount(id);
    } catch (const util::InvariantViolation& e) {
      failures.emplace_back(e.what());
    }
  }

  // Money in == money still in the system.
  Micros deposited = 0, withdrawn = 0, balances = 0, in_channels = 0;
  for (const auto& slot : account_slots) {
    std::lock_guard lock(slot->mutex);
    deposited += slot->account.deposited;
    withdrawn += slot->account.withdrawn;
    balances += slot->account.balance;
  }
  for (const auto& slot : channel_slots) {
    std::lock_guard lock(slot->mutex);
    in_channels += slot->channel.current_balance + slot->channel.escrowed;
  }
  if (deposited - withdrawn != balances + in_channels) {
    ++invariant_violations_;
    observability::Metrics::Instance().RecordInvariantViolation();
    const std::string detail = "deposited-withdrawn " + std::to_string(deposited - withdrawn) + " != balances+channels " +
                               std::to_string(balances + in_channels);
    MARKET_LOG_CRITICAL("ledger conservation violated", {observability::StringField("detail", detail)});
    failures.push_back("conservation: " + detail);
  }

  if (!failures.empty()) {
    std::string message = std::to_string(failures.size()) + " ledger violation(s): " + failures.front();
    throw util::InvariantViolation(message);
  }
}

// ------------------------------------------------------------------
// Persistence
// ------------------------------------------------------------------

void EscrowLedger::Persist(const Channel* channel, const LedgerEntry* entry, std::initializer_list<const Account*> accounts) {
  if (!repository_) {
    return;
  }

  auto tx = repository_->Begin();
  for (const auto* account : accounts) {
    db::ThrowIfDbError(repository_->UpsertAccount(*tx, ToRecord(*account)), "persist account " + account->owner_id);
  }
  if (channel) {
    db::ThrowIfDbError(repository_->UpsertChannel(*tx, ToRecord(*channel)), "persist channel " + channel->id);
  }
  if (entry) {
    db::ThrowIfDbError(repository_->AppendChannelEntry(*tx, ToRecord(*entry)), "append channel entry " + entry->id);
  }
  tx->Commit();
}

void EscrowLedger::Hydrate() {
  if (!repository_) {
    return;
  }

  auto tx       = repository_->Begin();
  auto accounts = repository_->ListAccounts(*tx);
  auto channels = repository_->ListChannels(*tx);

  std::vector<Channel> loaded;
  loaded.reserve(channels.size());
  for (const auto& record : channels) {
    loaded.push_back(FromRecord(record, repository_->ListChannelEntries(*tx, record.id)));
  }
  tx->Commit();

  std::unique_lock audit(audit_mutex_);
  std::unique_lock lock(mutex_);

  accounts_.clear();
  channels_.clear();
  channels_by_owner_.clear();

  for (const auto& record : accounts) {
    auto slot            = std::make_shared<AccountSlot>();
    slot->account        = FromRecord(record);
    accounts_[record.id] = std::move(slot);
  }

  uint64_t closed = 0;
  Micros   locked = 0, released = 0, refunded = 0;
  for (auto& channel : loaded) {
    if (channel.state == CHANNEL_STATE_CLOSED) ++closed;
    for (const auto& [_, hold] : channel.holds) {
      locked += hold.amount;
      released += hold.paid;
      refunded += hold.refunded;
    }
    channels_by_owner_[channel.payer_id].push_back(channel.id);
    channels_by_owner_[channel.payee_id].push_back(channel.id);

    auto slot     = std::make_shared<ChannelSlot>();
    const auto id = channel.id;
    slot->channel = std::move(channel);
    channels_[id] = std::move(slot);
  }

  channels_opened_ = channels_.size();
  channels_closed_ = closed;
  escrow_locked_   = locked;
  escrow_released_ = released;
  escrow_refunded_ = refunded;

  MARKET_LOG_INFO("ledger hydrated", {observability::IntField("accounts", static_cast<int64_t>(accounts_.size())),
                                      observability::IntField("channels", static_cast<int64_t>(channels_.size()))});
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Account EscrowLedger::Deposit(const std::string& owner_id, Micros amount) {
  if (owner_id.empty()) {
    throw util::InvalidArgument("deposit: owner_id is required");
  }
  if (amount <= 0) {
    throw util::InvalidAmount("deposit amount must be positive");
  }

  std::shared_lock audit(audit_mutex_);
  auto             slot = AccountFor(owner_id);
  std::lock_guard  lock(slot->mutex);

  RequireInflowHeadroom(slot->account, amount, "deposit");

  Account next = slot->account;
  next.balance += amount;
  next.deposited += amount;
  next.updated_at = util::Now();
  VerifyAfter(next, "deposit");

  Persist(nullptr, nullptr, {&next});
  slot->account = next;

  MARKET_LOG_INFO("deposit", {observability::StringField("owner_id", owner_id), observability::IntField("amount_micros", amount),
                              observability::IntField("balance_micros", next.balance)});
  return next;
}

Account EscrowLedger::Withdraw(const std::string& owner_id, Micros amount) {
  if (amount <= 0) {
    throw util::InvalidAmount("withdraw amount must be positive");
  }

  std::shared_lock audit(audit_mutex_);
  auto             slot = FindAccount(owner_id);
  if (!slot) {
    throw util::InsufficientFunds("no account for " + owner_id);
  }
  std::lock_guard lock(slot->mutex);

  if (slot->account.balance < amount) {
    MARKET_LOG_WARN("withdraw rejected", {observability::StringField("owner_id", owner_id), observability::IntField("amount_micros", amount),
                                          observability::IntField("balance_micros", slot->account.balance)});
    throw util::InsufficientFunds("balance " + std::to_string(slot->account.balance) + " below withdrawal " + std::to_string(amount));
  }

  Account next = slot->account;
  next.balance -= amount;
  next.withdrawn += amount;
  next.updated_at = util::Now();
  VerifyAfter(next, "withdraw");

  Persist(nullptr, nullptr, {&next});
  slot->account = next;

  MARKET_LOG_INFO("withdraw", {observability::StringField("owner_id", owner_id), observability::IntField("amount_micros", amount),
                               observability::IntField("balance_micros", next.balance)});
  return next;
}

Micros EscrowLedger::GetBalance(const std::string& owner_id) const {
  auto slot = FindAccount(owner_id);
  if (!slot) {
    return 0;
  }
  std::lock_guard lock(slot->mutex);
  return slot->account.balance;
}

std::optional<Account> EscrowLedger::GetAccount(const std::string& owner_id) const {
  auto slot = FindAccount(owner_id);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard lock(slot->mutex);
  return slot->account;
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Channel EscrowLedger::OpenChannel(const std::string& payer_id, const std::string& payee_id, Micros deposit, const std::string& auction_ref) {
  if (payer_id.empty() || payee_id.empty()) {
    throw util::InvalidArgument("open channel: payer and payee are required");
  }
  if (payer_id == payee_id) {
    throw util::InvalidArgument("open channel: payer and payee must differ");
  }
  if (deposit <= 0) {
    throw util::InvalidAmount("channel deposit must be positive");
  }

  observability::SpanScope span("ledger.open_channel");
  span.SetAttribute("payer_id", payer_id);
  span.SetAttribute("deposit_micros", deposit);

  std::shared_lock audit(audit_mutex_);
  auto             payer = FindAccount(payer_id);
  if (!payer) {
    throw util::InsufficientFunds("no account for payer " + payer_id);
  }

  // Not yet published, so taking it before the account keeps the lock order.
  auto            slot = std::make_shared<ChannelSlot>();
  std::lock_guard channel_lock(slot->mutex);
  std::lock_guard account_lock(payer->mutex);

  if (payer->account.balance < deposit) {
    MARKET_LOG_WARN("open channel rejected", {observability::StringField("payer_id", payer_id), observability::IntField("deposit_micros", deposit),
                                              observability::IntField("balance_micros", payer->account.balance)});
    throw util::InsufficientFunds("payer " + payer_id + " balance " + std::to_string(payer->account.balance) + " below deposit " +
                                  std::to_string(deposit));
  }

  const auto now = util::Now();

  Channel next;
  next.id              = util::NewId("channel");
  next.payer_id        = payer_id;
  next.payee_id        = payee_id;
  next.auction_ref     = auction_ref;
  next.state           = CHANNEL_STATE_OPENING;
  next.total_deposit   = deposit;
  next.current_balance = deposit;
  next.created_at      = now;
  auto entry           = AppendEntry(next, market::v1::LEDGER_ENTRY_TYPE_DEPOSIT, deposit, "", "channel funded", now);
  next.state           = CHANNEL_STATE_OPEN;

  Account payer_next = payer->account;
  payer_next.balance -= deposit;
  payer_next.committed += deposit;
  payer_next.updated_at = now;

  VerifyAfter(*slot, next, "open channel");
  VerifyAfter(payer_next, "open channel");

  Persist(&next, &entry, {&payer_next});
  payer->account = payer_next;
  slot->channel  = next;

  {
    std::unique_lock lock(mutex_);
    channels_[next.id] = slot;
    channels_by_owner_[payer_id].push_back(next.id);
    channels_by_owner_[payee_id].push_back(next.id);
  }

  ++channels_opened_;
  observability::Metrics::Instance().RecordChannelOpened();
  MARKET_LOG_INFO("channel opened", {observability::StringField("channel_id", next.id), observability::StringField("payer_id", payer_id),
                                     observability::StringField("payee_id", payee_id), observability::IntField("deposit_micros", deposit),
                                     observability::StringField("auction_id", auction_ref)});
  return next;
}

Channel EscrowLedger::LockEscrow(const std::string& channel_id, const std::string& task_id, Micros amount) {
  if (amount <= 0) {
    throw util::InvalidAmount("escrow amount must be positive");
  }
  if (task_id.empty()) {
    throw util::InvalidArgument("lock escrow: task_id is required");
  }

  std::shared_lock audit(audit_mutex_);
  auto             slot = FindChannel(channel_id);
  std::lock_guard  lock(slot->mutex);
  const auto&      channel = slot->channel;

  if (channel.state == CHANNEL_STATE_CLOSED) {
    throw util::ChannelClosed("channel " + channel_id + " is closed");
  }
  if (channel.frozen) {
    throw util::ChannelFrozen("channel " + channel_id + " is frozen");
  }
  VerifyBefore(*slot, "lock escrow");

  if (auto it = channel.holds.find(task_id); it != channel.holds.end()) {
    throw util::AlreadyExists("escrow for task " + task_id + " already exists on channel " + channel_id);
  }
  if (amount > channel.current_balance) {
    MARKET_LOG_WARN("lock escrow rejected", {observability::StringField("channel_id", channel_id), observability::IntField("amount_micros", amount),
                                             observability::IntField("balance_micros", channel.current_balance)});
    throw util::InsufficientChannelBalance("channel " + channel_id + " balance " + std::to_string(channel.current_balance) +
                                           " below escrow " + std::to_string(amount));
  }

  const auto now  = util::Now();
  Channel    next = channel;

  EscrowHold hold;
  hold.task_id   = task_id;
  hold.amount    = amount;
  hold.locked_at = now;
  hold.deadline  = now + options_.max_escrow_hold;
  next.holds.emplace(task_id, hold);

  next.current_balance -= amount;
  next.escrowed += amount;
  next.state = CHANNEL_STATE_ESCROWED;
  auto entry = AppendEntry(next, market::v1::LEDGER_ENTRY_TYPE_ESCROW, amount, task_id, "escrow locked", now);

  VerifyAfter(*slot, next, "lock escrow");
  Persist(&next, &entry, {});
  slot->channel = next;

  escrow_locked_ += amount;
  observability::Metrics::Instance().AddEscrowLocked(amount);
  MARKET_LOG_INFO("escrow locked", {observability::StringField("channel_id", channel_id), observability::StringField("task_id", task_id),
                                    observability::IntField("amount_micros", amount),
                                    observability::IntField("sequence", static_cast<int64_t>(next.sequence))});
  return next;
}

ReleaseResult EscrowLedger::ReleaseEscrow(const std::string& channel_id, const std::string& task_id, bool success, std::string_view reason) {
  std::shared_lock audit(audit_mutex_);
  auto             slot = FindChannel(channel_id);
  std::lock_guard  lock(slot->mutex);
  return ReleaseLocked(*slot, task_id, success, reason);
}

ReleaseResult EscrowLedger::ReleaseLocked(ChannelSlot& slot, const std::string& task_id, bool success, std::string_view reason) {
  const auto& channel = slot.channel;
  auto        it      = channel.holds.find(task_id);
  if (it == channel.holds.end()) {
    throw util::NotFound("no escrow for task " + task_id + " on channel " + channel.id);
  }

  ReleaseResult result;
  result.channel_id = channel.id;
  result.task_id    = task_id;

  if (!it->second.Active()) {
    const auto& hold        = it->second;
    result.success          = hold.state == HoldState::kReleased;
    result.amount           = hold.amount;
    result.paid             = hold.paid;
    result.refunded         = hold.refunded;
    result.already_released = true;
    for (const auto& entry : channel.entries) {
      if (entry.task_id == task_id &&
          (entry.type == market::v1::LEDGER_ENTRY_TYPE_RELEASE || entry.type == market::v1::LEDGER_ENTRY_TYPE_REFUND)) {
        result.sequence = entry.sequence;
      }
    }
    return result;
  }

  if (channel.frozen) {
    throw util::ChannelFrozen("channel " + channel.id + " is frozen");
  }
  VerifyBefore(slot, "release escrow");

  const auto   now    = util::Now();
  Channel      next   = channel;
  auto&        hold   = next.holds.at(task_id);
  const Micros amount = hold.amount;

  hold.state       = success ? HoldState::kReleased : HoldState::kRefunded;
  hold.resolved_at = now;
  next.escrowed -= amount;
  if (success) {
    hold.paid = amount;
    next.total_settled += amount;
  } else {
    hold.refunded = amount;
    next.current_balance += amount;
  }
  if (next.ActiveHolds() == 0) {
    next.state = CHANNEL_STATE_SETTLING;
  }

  std::string why = reason.empty() ? (success ? "execution succeeded" : "execution failed") : std::string(reason);
  auto entry = AppendEntry(next, success ? market::v1::LEDGER_ENTRY_TYPE_RELEASE : market::v1::LEDGER_ENTRY_TYPE_REFUND, amount, task_id,
                           std::move(why), now);
  VerifyAfter(slot, next, "release escrow");

  result.success  = success;
  result.amount   = amount;
  result.paid     = success ? amount : 0;
  result.refunded = success ? 0 : amount;
  result.sequence = next.sequence;

  if (success) {
    auto payer = AccountFor(next.payer_id);
    auto payee = AccountFor(next.payee_id);

    std::scoped_lock accounts(payer->mutex, payee->mutex);
    RequireInflowHeadroom(payee->account, amount, "release escrow");

    Account payer_next = payer->account;
    payer_next.committed -= amount;
    payer_next.spent += amount;
    payer_next.updated_at = now;

    Account payee_next = payee->account;
    payee_next.balance += amount;
    payee_next.earned += amount;
    payee_next.updated_at = now;

    VerifyAfter(payer_next, "release escrow");
    VerifyAfter(payee_next, "release escrow");

    Persist(&next, &entry, {&payer_next, &payee_next});
    payer->account = payer_next;
    payee->account = payee_next;
    slot.channel   = std::move(next);
    escrow_released_ += amount;
  } else {
    Persist(&next, &entry, {});
    slot.channel = std::move(next);
    escrow_refunded_ += amount;
  }

  observability::Metrics::Instance().AddEscrowReleased(amount, success);
  MARKET_LOG_INFO(success ? "escrow released" : "escrow refunded",
                  {observability::StringField("channel_id", result.channel_id), observability::StringField("task_id", task_id),
                   observability::IntField("amount_micros", amount), observability::IntField("sequence", static_cast<int64_t>(result.sequence))});
  return result;
}

Channel EscrowLedger::CloseChannel(const std::string& channel_id) {
  std::shared_lock audit(audit_mutex_);
  auto             slot = FindChannel(channel_id);
  std::lock_guard  lock(slot->mutex);
  const auto&      channel = slot->channel;

  if (channel.state == CHANNEL_STATE_CLOSED) {
    throw util::ChannelClosed("channel " + channel_id + " is already closed");
  }
  if (channel.frozen) {
    throw util::ChannelFrozen("channel " + channel_id + " is frozen");
  }
  if (channel.state != CHANNEL_STATE_OPEN && channel.state != CHANNEL_STATE_SETTLING) {
    throw util::InvalidState("cannot close channel " + channel_id + " in state " + std::string(StateName(channel.state)) + " with " +
                             std::to_string(channel.ActiveHolds()) + " active escrow(s)");
  }
  VerifyBefore(*slot, "close channel");

  const auto   now       = util::Now();
  Channel      next      = channel;
  const Micros remainder = next.current_balance;

  next.current_balance = 0;
  next.total_refunded += remainder;
  next.state = CHANNEL_STATE_CLOSED;
  auto entry = AppendEntry(next, market::v1::LEDGER_ENTRY_TYPE_CLOSE, remainder, "", "channel closed", now);
  VerifyAfter(*slot, next, "close channel");

  auto            payer = AccountFor(next.payer_id);
  std::lock_guard account_lock(payer->mutex);
  Account         payer_next = payer->account;
  payer_next.balance += remainder;
  payer_next.committed -= remainder;
  payer_next.updated_at = now;
  VerifyAfter(payer_next, "close channel");

  Persist(&next, &entry, {&payer_next});
  payer->account = payer_next;
  slot->channel  = next;

  ++channels_closed_;
  observability::Metrics::Instance().RecordChannelClosed();
  MARKET_LOG_INFO("channel closed", {observability::StringField("channel_id", channel_id), observability::IntField("refunded_micros", remainder),
                                     observability::IntField("settled_micros", next.total_settled)});
  return next;
}

std::vector<ReleaseResult> EscrowLedger::ExpireStaleEscrows(util::TimePoint now) {
  std::vector<std::pair<std::string, std::string>> stale;
  {
    std::vector<std::shared_ptr<ChannelSlot>> slots;
    {
      std::shared_lock lock(mutex_);
      slots.reserve(channels_.size());
      for (const auto& [_, slot] : channels_) slots.push_back(slot);
    }
    for (const auto& slot : slots) {
      std::lock_guard lock(slot->mutex);
      if (slot->channel.frozen) continue;
      for (const auto& [task_id, hold] : slot->channel.holds) {
        if (hold.Active() && hold.deadline <= now) {
          stale.emplace_back(slot->channel.id, task_id);
        }
      }
    }
  }

  std::vector<ReleaseResult> refunded;
  for (const auto& [channel_id, task_id] : stale) {
    try {
      auto result = ReleaseEscrow(channel_id, task_id, false, "escrow hold expired");
      if (!result.already_released) {
        refunded.push_back(std::move(result));
      }
    } catch (const std::exception& e) {
      MARKET_LOG_ERROR("failed to expire escrow", {observability::StringField("channel_id", channel_id),
                                                   observability::StringField("task_id", task_id), observability::StringField("error", e.what())});
    }
  }

  if (!refunded.empty()) {
    MARKET_LOG_WARN("stale escrows refunded", {observability::IntField("count", static_cast<int64_t>(refunded.size()))});
  }
  return refunded;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

Channel EscrowLedger::GetChannel(const std::string& channel_id) const {
  auto            slot = FindChannel(channel_id);
  std::lock_guard lock(slot->mutex);
  return slot->channel;
}

std::vector<Channel> EscrowLedger::ListChannels() const {
  std::vector<std::shared_ptr<ChannelSlot>> slots;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [_, slot] : channels_) slots.push_back(slot);
  }

  std::vector<Channel> out;
  out.reserve(slots.size());
  for (const auto& slot : slots) {
    std::lock_guard lock(slot->mutex);
    out.push_back(slot->channel);
  }
  std::sort(out.begin(), out.end(), [](const Channel& a, const Channel& b) {
    return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
  });
  return out;
}

std::vector<LedgerEntry> EscrowLedger::TransactionHistory(const std::string& owner_id) const {
  std::vector<std::shared_ptr<ChannelSlot>> slots;
  {
    std::shared_lock lock(mutex_);
    auto             it = channels_by_owner_.find(owner_id);
    if (it == channels_by_owner_.end()) {
      return {};
    }
    for (const auto& id : it->second) {
      if (auto slot = channels_.find(id); slot != channels_.end()) {
        slots.push_back(slot->second);
      }
    }
  }

  std::vector<LedgerEntry> out;
  for (const auto& slot : slots) {
    std::lock_guard lock(slot->mutex);
    out.insert(out.end(), slot->channel.entries.begin(), slot->channel.entries.end());
  }
  std::sort(out.begin(), out.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
    if (a.at != b.at) return a.at < b.at;
    if (a.channel_id != b.channel_id) return a.channel_id < b.channel_id;
    return a.sequence < b.sequence;
  });
  return out;
}

LedgerStats EscrowLedger::Stats() const {
  LedgerStats stats;
  stats.channels_opened      = channels_opened_;
  stats.channels_closed      = channels_closed_;
  stats.escrow_locked        = escrow_locked_;
  stats.escrow_released      = escrow_released_;
  stats.escrow_refunded      = escrow_refunded_;
  stats.invariant_violations = invariant_violations_;

  std::vector<std::shared_ptr<ChannelSlot>> slots;
  {
    std::shared_lock lock(mutex_);
    stats.accounts = accounts_.size();
    for (const auto& [_, slot] : channels_) slots.push_back(slot);
  }
  for (const auto& slot : slots) {
    std::lock_guard lock(slot->mutex);
    if (slot->channel.frozen) ++stats.frozen_channels;
  }
  return stats;
}

} // namespace market::ledger
