#include "Processor.h"
#include <gtest/gtest.h>

#include <vector>

using payproc::Account;
using payproc::AccountActivity;
using payproc::Amount;
using payproc::Processor;
using payproc::Roe;
using payproc::VectorSource;

namespace {

Amount amount(const std::string &text) { return Amount::parse(text).value(); }

Processor::Report run(const std::vector<AccountActivity> &activities) {
  VectorSource source(activities);
  Processor processor;
  return processor.process(source);
}

const Account *findAccount(const Processor::Report &report,
                           payproc::ClientId clientId) {
  for (const auto &account : report.accounts) {
    if (account.getClientId() == clientId) {
      return &account;
    }
  }
  return nullptr;
}

} // namespace

TEST(ProcessorTest, EmptyInputProducesNoAccounts) {
  auto report = run({});
  EXPECT_TRUE(report.accounts.empty());
  EXPECT_TRUE(report.skipped.empty());
  EXPECT_EQ(report.recordCount, 0u);
}

TEST(ProcessorTest, DepositThenWithdrawal) {
  auto report = run({AccountActivity::deposit(1, 1, amount("100.0")),
                     AccountActivity::withdrawal(2, 1, amount("50.0"))});
  ASSERT_EQ(report.accounts.size(), 1u);
  const auto &account = report.accounts[0];
  EXPECT_EQ(account.getAvailable().toString(), "50.0");
  EXPECT_EQ(account.getHeld().toString(), "0.0");
  EXPECT_EQ(account.getTotal().toString(), "50.0");
  EXPECT_FALSE(account.isLocked());
  EXPECT_EQ(report.appliedCount, 2u);
}

TEST(ProcessorTest, DisputeChargebackAndLockedDeposit) {
  auto report = run({AccountActivity::deposit(1, 1, amount("100.0")),
                     AccountActivity::dispute(1, 1),
                     AccountActivity::chargeback(1, 1),
                     AccountActivity::deposit(2, 1, amount("50.0"))});
  ASSERT_EQ(report.accounts.size(), 1u);
  const auto &account = report.accounts[0];
  EXPECT_TRUE(account.getAvailable().isZero());
  EXPECT_TRUE(account.getHeld().isZero());
  EXPECT_TRUE(account.getTotal().isZero());
  EXPECT_TRUE(account.isLocked());

  ASSERT_EQ(report.skipped.size(), 1u);
  const auto &skipped = report.skipped[0];
  EXPECT_EQ(skipped.index, 3u);
  EXPECT_FALSE(skipped.parseFailure);
  EXPECT_EQ(skipped.kind, "deposit");
  EXPECT_EQ(skipped.transactionId, 2u);
  EXPECT_EQ(skipped.clientId, 1u);
  EXPECT_EQ(skipped.code, Account::E_FAILED_TRANSACTION);
}

TEST(ProcessorTest, InsufficientFundsCreatesEmptyAccount) {
  auto report = run({AccountActivity::withdrawal(1, 1, amount("50.0"))});
  ASSERT_EQ(report.accounts.size(), 1u);
  EXPECT_TRUE(report.accounts[0].getTotal().isZero());
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].code, Account::E_FAILED_TRANSACTION);
  EXPECT_EQ(report.appliedCount, 0u);
}

TEST(ProcessorTest, DuplicateDepositKeepsFirstAmount) {
  auto report = run({AccountActivity::deposit(1, 1, amount("10.0")),
                     AccountActivity::deposit(1, 1, amount("999.0"))});
  ASSERT_EQ(report.accounts.size(), 1u);
  EXPECT_EQ(report.accounts[0].getTotal().toString(), "10.0");
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].index, 1u);
}

TEST(ProcessorTest, ParseFailuresAreSkippedAndReported) {
  std::vector<Roe<AccountActivity>> records;
  records.emplace_back(AccountActivity::deposit(1, 1, amount("5.0")));
  records.emplace_back(payproc::Error(3, "unknown activity type: refund"));
  records.emplace_back(AccountActivity::deposit(2, 1, amount("1.0")));
  VectorSource source(std::move(records));

  Processor processor;
  auto report = processor.process(source);

  EXPECT_EQ(report.recordCount, 3u);
  EXPECT_EQ(report.appliedCount, 2u);
  ASSERT_EQ(report.skipped.size(), 1u);
  const auto &skipped = report.skipped[0];
  EXPECT_TRUE(skipped.parseFailure);
  EXPECT_EQ(skipped.index, 1u);
  EXPECT_EQ(skipped.code, 3);
  EXPECT_EQ(skipped.message, "unknown activity type: refund");
  EXPECT_TRUE(skipped.kind.empty());

  ASSERT_EQ(report.accounts.size(), 1u);
  EXPECT_EQ(report.accounts[0].getTotal().toString(), "6.0");
}

TEST(ProcessorTest, ParseFailureDoesNotCreateAccount) {
  std::vector<Roe<AccountActivity>> records;
  records.emplace_back(payproc::Error(1, "bad record"));
  VectorSource source(std::move(records));

  Processor processor;
  auto report = processor.process(source);
  EXPECT_TRUE(report.accounts.empty());
  EXPECT_EQ(report.skipped.size(), 1u);
}

TEST(ProcessorTest, AccountsOrderedByClientId) {
  auto report = run({AccountActivity::deposit(1, 9, amount("1")),
                     AccountActivity::deposit(2, 3, amount("1")),
                     AccountActivity::deposit(3, 65535, amount("1")),
                     AccountActivity::deposit(4, 0, amount("1"))});
  ASSERT_EQ(report.accounts.size(), 4u);
  EXPECT_EQ(report.accounts[0].getClientId(), 0u);
  EXPECT_EQ(report.accounts[1].getClientId(), 3u);
  EXPECT_EQ(report.accounts[2].getClientId(), 9u);
  EXPECT_EQ(report.accounts[3].getClientId(), 65535u);
}

TEST(ProcessorTest, ClientsAreIndependent) {
  auto report = run({AccountActivity::deposit(1, 1, amount("1.0")),
                     AccountActivity::deposit(2, 2, amount("2.0")),
                     AccountActivity::deposit(3, 1, amount("2.0")),
                     AccountActivity::deposit(4, 2, amount("3.0")),
                     AccountActivity::deposit(5, 1, amount("2.0")),
                     AccountActivity::withdrawal(6, 1, amount("1.5")),
                     AccountActivity::withdrawal(7, 2, amount("3.0"))});
  const Account *first = findAccount(report, 1);
  const Account *second = findAccount(report, 2);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(first->getAvailable().toString(), "3.5");
  EXPECT_EQ(first->getTotal().toString(), "3.5");
  EXPECT_EQ(second->getAvailable().toString(), "2.0");
  EXPECT_EQ(second->getTotal().toString(), "2.0");
  EXPECT_TRUE(report.skipped.empty());
}

TEST(ProcessorTest, DisputeAcrossClientsIsNoOp) {
  // Transaction ids are tracked per account
  auto report = run({AccountActivity::deposit(1, 1, amount("10.0")),
                     AccountActivity::dispute(1, 2)});
  const Account *owner = findAccount(report, 1);
  const Account *other = findAccount(report, 2);
  ASSERT_NE(owner, nullptr);
  ASSERT_NE(other, nullptr);
  EXPECT_EQ(owner->getAvailable().toString(), "10.0");
  EXPECT_TRUE(owner->getHeld().isZero());
  EXPECT_TRUE(other->getTotal().isZero());
}

TEST(ProcessorTest, ReferenceScenario) {
  auto report = run({AccountActivity::deposit(1, 1, amount("1.0")),
                     AccountActivity::deposit(2, 2, amount("2.0")),
                     AccountActivity::deposit(3, 1, amount("2.0")),
                     AccountActivity::withdrawal(4, 1, amount("1.5")),
                     AccountActivity::withdrawal(5, 2, amount("3.0")),
                     AccountActivity::deposit(6, 1, amount("49.5")),
                     AccountActivity::dispute(2, 2),
                     AccountActivity::chargeback(2, 2)});
  ASSERT_EQ(report.accounts.size(), 2u);

  const auto &first = report.accounts[0];
  EXPECT_EQ(first.getAvailable().toString(), "51.0");
  EXPECT_EQ(first.getHeld().toString(), "0.0");
  EXPECT_EQ(first.getTotal().toString(), "51.0");
  EXPECT_FALSE(first.isLocked());

  const auto &second = report.accounts[1];
  EXPECT_EQ(second.getAvailable().toString(), "0.0");
  EXPECT_EQ(second.getHeld().toString(), "0.0");
  EXPECT_EQ(second.getTotal().toString(), "0.0");
  EXPECT_TRUE(second.isLocked());

  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].index, 4u);
}

TEST(ProcessorTest, ReplayIsDeterministic) {
  std::vector<AccountActivity> activities = {
      AccountActivity::deposit(1, 4, amount("12.5")),
      AccountActivity::dispute(1, 4),
      AccountActivity::deposit(2, 2, amount("3.0")),
      AccountActivity::withdrawal(3, 2, amount("5.0")),
      AccountActivity::resolve(1, 4)};

  auto first = run(activities);
  auto second = run(activities);
  ASSERT_EQ(first.accounts.size(), second.accounts.size());
  for (size_t i = 0; i < first.accounts.size(); ++i) {
    EXPECT_EQ(first.accounts[i].getClientId(),
              second.accounts[i].getClientId());
    EXPECT_EQ(first.accounts[i].getAvailable(),
              second.accounts[i].getAvailable());
    EXPECT_EQ(first.accounts[i].getHeld(), second.accounts[i].getHeld());
    EXPECT_EQ(first.accounts[i].getTotal(), second.accounts[i].getTotal());
    EXPECT_EQ(first.accounts[i].isLocked(), second.accounts[i].isLocked());
  }
  EXPECT_EQ(first.skipped.size(), second.skipped.size());
}

TEST(ProcessorTest, ProcessorStartsFreshEachRun) {
  Processor processor;
  VectorSource firstSource(std::vector<AccountActivity>{
      AccountActivity::deposit(1, 1, amount("5.0"))});
  auto first = processor.process(firstSource);
  ASSERT_EQ(first.accounts.size(), 1u);

  VectorSource secondSource(std::vector<AccountActivity>{
      AccountActivity::deposit(1, 1, amount("5.0"))});
  auto second = processor.process(secondSource);
  ASSERT_EQ(second.accounts.size(), 1u);
  EXPECT_EQ(second.accounts[0].getTotal().toString(), "5.0");
  EXPECT_TRUE(second.skipped.empty());
}
