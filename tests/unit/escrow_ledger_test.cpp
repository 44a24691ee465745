#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/escrow_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::ledger::EscrowLedger;
using market::ledger::LedgerOptions;
using market::ledger::Micros;
using market::ledger::ToMicros;
using namespace std::chrono_literals;

LedgerOptions Checked() {
  LedgerOptions options;
  options.verify_after_mutation = true;
  return options;
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestDepositAndWithdraw() {
  EscrowLedger ledger(nullptr, Checked());
  assert(ledger.GetBalance("alice") == 0);
  assert(!ledger.GetAccount("alice"));

  ledger.Deposit("alice", ToMicros(10.0));
  const auto account = ledger.Withdraw("alice", ToMicros(3.0));
  assert(account.balance == 7'000'000);
  assert(account.deposited == 10'000'000);
  assert(account.withdrawn == 3'000'000);
  assert(ledger.GetBalance("alice") == 7'000'000);

  ExpectThrows<market::util::InsufficientFunds>([&] { ledger.Withdraw("alice", ToMicros(8.0)); });
  ExpectThrows<market::util::InsufficientFunds>([&] { ledger.Withdraw("nobody", 1); });
  ExpectThrows<market::util::InvalidAmount>([&] { ledger.Deposit("alice", 0); });
  ExpectThrows<market::util::InvalidAmount>([&] { ledger.Withdraw("alice", -5); });
  assert(ledger.GetBalance("alice") == 7'000'000);

  ledger.VerifyAccount("alice");
  ExpectThrows<market::util::NotFound>([&] { ledger.VerifyAccount("nobody"); });
}

void TestCreditsNeverOverflowBalance() {
  LedgerOptions unchecked;
  unchecked.verify_after_mutation = false;
  EscrowLedger ledger(nullptr, unchecked);

  constexpr Micros kMax = std::numeric_limits<Micros>::max();
  ledger.Deposit("whale", kMax - 10);
  ExpectThrows<market::util::InvalidAmount>([&] { ledger.Deposit("whale", 100); });
  assert(ledger.GetBalance("whale") == kMax - 10);
  ledger.Deposit("whale", 10);
  assert(ledger.GetBalance("whale") == kMax);

  ledger.Deposit("payer", 1'000);
  auto channel = ledger.OpenChannel("payer", "whale", 1'000, "auction-overflow");
  ledger.LockEscrow(channel.id, "task-overflow", 500);
  ExpectThrows<market::util::InvalidAmount>([&] { ledger.ReleaseEscrow(channel.id, "task-overflow", true); });
  assert(ledger.GetBalance("whale") == kMax);
  assert(ledger.GetChannel(channel.id).escrowed == 500);

  const auto refund = ledger.ReleaseEscrow(channel.id, "task-overflow", false);
  assert(refund.refunded == 500);
  ledger.CloseChannel(channel.id);
  assert(ledger.GetBalance("payer") == 1'000);
  ledger.VerifyAccount("whale");
  ledger.VerifyAccount("payer");
  ledger.VerifyInvariant(channel.id);
}

void TestSuccessfulSettlementLifecycle() {
  EscrowLedger ledger(nullptr, Checked());
  ledger.Deposit("payer", 1'000'000);

  auto channel = ledger.OpenChannel("payer", "worker", 600'000, "auction-1");
  assert(channel.state == market::v1::CHANNEL_STATE_OPEN);
  assert(channel.sequence == 1);
  assert(channel.current_balance == 600'000);
  assert(ledger.GetBalance("payer") == 400'000);
  assert(ledger.GetAccount("payer")->committed == 600'000);

  channel = ledger.LockEscrow(channel.id, "task-1", 300'000);
  assert(channel.state == market::v1::CHANNEL_STATE_ESCROWED);
  assert(channel.sequence == 2);
  assert(channel.current_balance == 300'000);
  assert(channel.escrowed == 300'000);

  const auto result = ledger.ReleaseEscrow(channel.id, "task-1", true);
  assert(result.success);
  assert(!result.already_released);
  assert(result.paid == 300'000);
  assert(result.sequence == 3);
  assert(ledger.GetBalance("worker") == 300'000);
  assert(ledger.GetAccount("worker")->earned == 300'000);

  channel = ledger.GetChannel(channel.id);
  assert(channel.state == market::v1::CHANNEL_STATE_SETTLING);
  assert(channel.escrowed == 0);
  assert(channel.total_settled == 300'000);
  assert(channel.total_deposit == channel.current_balance + channel.escrowed + channel.total_settled);

  channel = ledger.CloseChannel(channel.id);
  assert(channel.state == market::v1::CHANNEL_STATE_CLOSED);
  assert(channel.sequence == 4);
  assert(channel.current_balance == 0);
  assert(channel.total_refunded == 300'000);

  const auto payer = *ledger.GetAccount("payer");
  assert(payer.balance == 700'000);
  assert(payer.committed == 0);
  assert(payer.spent == 300'000);

  assert(channel.entries.size() == 4);
  assert(channel.entries[0].type == market::v1::LEDGER_ENTRY_TYPE_DEPOSIT);
  assert(channel.entries[1].type == market::v1::LEDGER_ENTRY_TYPE_ESCROW);
  assert(channel.entries[2].type == market::v1::LEDGER_ENTRY_TYPE_RELEASE);
  assert(channel.entries[3].type == market::v1::LEDGER_ENTRY_TYPE_CLOSE);
  for (size_t i = 0; i < channel.entries.size(); ++i) {
    assert(channel.entries[i].sequence == i + 1);
  }
  assert(channel.entries[2].settled_after == 300'000);
  assert(channel.entries[3].balance_after == 0);

  ledger.VerifyAll();

  const auto stats = ledger.Stats();
  assert(stats.channels_opened == 1);
  assert(stats.channels_closed == 1);
  assert(stats.escrow_locked == 300'000);
  assert(stats.escrow_released == 300'000);
  assert(stats.escrow_refunded == 0);
  assert(stats.invariant_violations == 0);
}

void TestFailedExecutionRefundsChannel() {
  EscrowLedger ledger(nullptr, Checked());
  ledger.Deposit("payer", 500'000);
  const auto channel = ledger.OpenChannel("payer", "worker", 500'000, "auction-2");
  ledger.LockEscrow(channel.id, "task-2", 500'000);

  const auto result = ledger.ReleaseEscrow(channel.id, "task-2", false);
  assert(!result.success);
  assert(result.refunded == 500'000);
  assert(ledger.GetBalance("worker") == 0);

  const auto after = ledger.GetChannel(channel.id);
  assert(after.current_balance == 500'000);
  assert(after.total_settled == 0);
  assert(after.entries.back().type == market::v1::LEDGER_ENTRY_TYPE_REFUND);

  ledger.CloseChannel(channel.id);
  assert(ledger.GetBalance("payer") == 500'000);
  ledger.VerifyAll();
}

void TestReleaseIsExactlyOnce() {
  EscrowLedger ledger(nullptr, Checked());
  ledger.Deposit("payer", 1'000'000);
  const auto channel = ledger.OpenChannel("payer", "worker", 1'000'000, "auction-3");
  ledger.LockEscrow(channel.id, "task-3", 400'000);

  const auto first = ledger.ReleaseEscrow(channel.id, "task-3", true);
  const auto again = ledger.ReleaseEscrow(channel.id, "task-3", false);
  assert(again.already_released);
  assert(again.success);
  assert(again.amount == first.amount);
  assert(again.paid == first.paid);
  assert(again.sequence == first.sequence);

  assert(ledger.GetChannel(channel.id).sequence == first.sequence);
  assert(ledger.GetBalance("worker") == 400'000);
}

void TestConcurrentReleaseCreditsOnce() {
  EscrowLedger ledger(nullptr, Checked());
  ledger.Deposit("payer", 1'000'000);
  const auto channel = ledger.OpenChannel("payer", "worker", 1'000'000, "auction-race");
  ledger.LockEscrow(channel.id, "task-race", 750'000);

  std::atomic<int>         fresh{0};
  std::atomic<int>         successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&, i] {
      const auto result = ledger.ReleaseEscrow(channel.id, "task-race", i % 2 == 0);
      if (!result.already_released) ++fresh;
      if (result.success) ++successes;
    });
  }
  for (auto& t : threads) t.join();

  assert(fresh == 1);
  // Every caller sees the same outcome.
  assert(successes == 0 || successes == 16);

  const auto after = ledger.GetChannel(channel.id);
  assert(after.sequence == 3);
  if (successes == 16) {
    assert(ledger.GetBalance("worker") == 750'000);
  } else {
    assert(ledger.GetBalance("worker") == 0);
    assert(after.current_balance == 1'000'000);
  }
  ledger.VerifyAll();
}

void TestChannelErrors() {
  EscrowLedger ledger(nullptr, Checked());
  ledger.Deposit("payer", 1'000'000);

  ExpectThrows<market::util::InsufficientFunds>([&] { ledger.OpenChannel("payer", "worker", 2'000'000, "a"); });
  ExpectThrows<market::util::InsufficientFunds>([&] { ledger.OpenChannel("ghost", "worker", 1, "a"); });
  ExpectThrows<market::util::InvalidArgument>([&] { ledger.OpenChannel("payer", "payer", 1, "a"); });
  ExpectThrows<market::util::InvalidAmount>([&] { ledger.OpenChannel("payer", "worker", 0, "a"); });
  assert(ledger.GetBalance("payer") == 1'000'000);

  const auto channel = ledger.OpenChannel("payer", "worker", 500'000, "auction-4");

  ExpectThrows<market::util::InvalidAmount>([&] { ledger.LockEscrow(channel.id, "t", 0); });
  ExpectThrows<market::util::NotFound>([&] { ledger.LockEscrow("channel-missing", "t", 1); });
  ExpectThrows<market::util::InsufficientChannelBalance>([&] { ledger.LockEscrow(channel.id, "t", 500'001); });

  ledger.LockEscrow(channel.id, "t", 200'000);
  ExpectThrows<market::util::AlreadyExists>([&] { ledger.LockEscrow(channel.id, "t", 1); });
  ExpectThrows<market::util::InvalidState>([&] { ledger.CloseChannel(channel.id); });
  ExpectThrows<market::util::NotFound>([&] { ledger.ReleaseEscrow(channel.id, "other", true); });

  ledger.ReleaseEscrow(channel.id, "t", true);
  ledger.CloseChannel(channel.id);
  ExpectThrows<market::util::ChannelClosed>([&] { ledger.LockEscrow(channel.id, "t2", 1); });
  ExpectThrows<market::util::ChannelClosed>([&] { ledger.CloseChannel(channel.id); });

  // Two holds on one channel; settling only once both are resolved.
  const auto multi = ledger.OpenChannel("payer", "worker", 300'000, "auction-5");
  ledger.LockEscrow(multi.id, "x", 100'000);
  ledger.LockEscrow(multi.id, "y", 100'000);
  ledger.ReleaseEscrow(multi.id, "x", true);
  assert(ledger.GetChannel(multi.id).state == market::v1::CHANNEL_STATE_ESCROWED);
  ledger.ReleaseEscrow(multi.id, "y", false);
  assert(ledger.GetChannel(multi.id).state == market::v1::CHANNEL_STATE_SETTLING);

  ledger.VerifyAll();
}

void TestCorruptedChannelIsFrozen() {
  auto repo = std::make_shared<market::db::memory::MemoryRepository>();
  {
    market::db::model::ChannelRecord bad;
    bad.id             = "channel-bad";
    bad.payer_id       = "payer";
    bad.payee_id       = "worker";
    bad.state          = market::v1::CHANNEL_STATE_OPEN;
    bad.deposit_micros = 100;
    bad.balance_micros = 50;
    bad.sequence       = 1;

    auto tx = repo->Begin();
    assert(repo->UpsertChannel(*tx, bad));
    tx->Commit();
  }

  EscrowLedger ledger(repo, Checked());
  ledger.Hydrate();

  ExpectThrows<market::util::InvariantViolation>([&] { ledger.LockEscrow("channel-bad", "task", 10); });
  assert(ledger.GetChannel("channel-bad").frozen);
  ExpectThrows<market::util::ChannelFrozen>([&] { ledger.LockEscrow("channel-bad", "task", 10); });
  ExpectThrows<market::util::ChannelFrozen>([&] { ledger.CloseChannel("channel-bad"); });

  auto stats = ledger.Stats();
  assert(stats.invariant_violations == 1);
  assert(stats.frozen_channels == 1);

  {
    auto tx     = repo->Begin();
    auto stored = repo->GetChannel(*tx, "channel-bad");
    tx->Commit();
    assert(stored && stored->frozen);
  }

  ExpectThrows<market::util::InvariantViolation>([&] { ledger.VerifyInvariant("channel-bad"); });
  ExpectThrows<market::util::InvariantViolation>([&] { ledger.VerifyAll(); });
  assert(ledger.Stats().invariant_violations >= 3);
}

void TestWriteThroughAndHydrate() {
  auto repo = std::make_shared<market::db::memory::MemoryRepository>();

  std::string channel_id;
  {
    EscrowLedger ledger(repo, Checked());
    ledger.Deposit("payer", 2'000'000);
    channel_id = ledger.OpenChannel("payer", "worker", 1'000'000, "auction-6").id;
    ledger.LockEscrow(channel_id, "task-a", 250'000);
    ledger.LockEscrow(channel_id, "task-b", 250'000);
    ledger.ReleaseEscrow(channel_id, "task-a", true);
  }

  EscrowLedger restored(repo, Checked());
  restored.Hydrate();

  assert(restored.GetBalance("payer") == 1'000'000);
  assert(restored.GetBalance("worker") == 250'000);

  const auto channel = restored.GetChannel(channel_id);
  assert(channel.sequence == 4);
  assert(channel.entries.size() == 4);
  assert(channel.escrowed == 250'000);
  assert(channel.holds.size() == 2);
  assert(!channel.holds.at("task-a").Active());
  assert(channel.holds.at("task-b").Active());

  const auto replay = restored.ReleaseEscrow(channel_id, "task-a", false);
  assert(replay.already_released);
  assert(replay.success);

  restored.ReleaseEscrow(channel_id, "task-b", true);
  restored.CloseChannel(channel_id);
  restored.VerifyAll();

  const auto stats = restored.Stats();
  assert(stats.channels_opened == 1);
  assert(stats.channels_closed == 1);
  assert(stats.escrow_released == 500'000);
}

void TestStaleEscrowsAreRefunded() {
  LedgerOptions options   = Checked();
  options.max_escrow_hold = 1h;
  EscrowLedger ledger(nullptr, options);

  ledger.Deposit("payer", 1'000'000);
  const auto channel = ledger.OpenChannel("payer", "worker", 1'000'000, "auction-7");
  ledger.LockEscrow(channel.id, "slow-task", 600'000);

  assert(ledger.ExpireStaleEscrows(market::util::Now()).empty());

  const auto refunded = ledger.ExpireStaleEscrows(market::util::Now() + 2h);
  assert(refunded.size() == 1);
  assert(refunded[0].task_id == "slow-task");
  assert(!refunded[0].success);

  const auto after = ledger.GetChannel(channel.id);
  assert(after.current_balance == 1'000'000);
  assert(after.entries.back().reason == "escrow hold expired");
  assert(ledger.ExpireStaleEscrows(market::util::Now() + 3h).empty());
  ledger.VerifyAll();
}

void TestConcurrentChannelsConserveMoney() {
  EscrowLedger ledger(nullptr, Checked());

  constexpr int            kPayers = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < kPayers; ++i) {
    threads.emplace_back([&, i] {
      const std::string payer = "payer-" + std::to_string(i);
      ledger.Deposit(payer, 1'000'000);
      for (int round = 0; round < 5; ++round) {
        const auto        channel = ledger.OpenChannel(payer, "worker", 100'000, "auction");
        const std::string task    = payer + "-task-" + std::to_string(round);
        ledger.LockEscrow(channel.id, task, 60'000);
        ledger.ReleaseEscrow(channel.id, task, round % 2 == 0);
        ledger.CloseChannel(channel.id);
      }
    });
  }
  for (auto& t : threads) t.join();

  // Rounds 0, 2 and 4 pay 60'000 each.
  assert(ledger.GetBalance("worker") == kPayers * 3 * 60'000);
  for (int i = 0; i < kPayers; ++i) {
    const auto account = *ledger.GetAccount("payer-" + std::to_string(i));
    assert(account.balance == 1'000'000 - 3 * 60'000);
    assert(account.committed == 0);
    assert(account.balance >= 0);
  }
  ledger.VerifyAll();

  const auto history = ledger.TransactionHistory("payer-0");
  assert(history.size() == 5 * 4);
  for (size_t i = 1; i < history.size(); ++i) {
    assert(history[i - 1].at <= history[i].at);
  }
  assert(ledger.TransactionHistory("worker").size() == kPayers * 5 * 4);
  assert(ledger.TransactionHistory("stranger").empty());
}

} // namespace

int main() {
  TestDepositAndWithdraw();
  TestCreditsNeverOverflowBalance();
  TestSuccessfulSettlementLifecycle();
  TestFailedExecutionRefundsChannel();
  TestReleaseIsExactlyOnce();
  TestConcurrentReleaseCreditsOnce();
  TestChannelErrors();
  TestCorruptedChannelIsFrozen();
  TestWriteThroughAndHydrate();
  TestStaleEscrowsAreRefunded();
  TestConcurrentChannelsConserveMoney();

  std::cout << "market_unit_escrow_ledger: pass\n";
  return 0;
}
