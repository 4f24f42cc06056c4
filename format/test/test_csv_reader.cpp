#include "CsvReader.h"
#include <gtest/gtest.h>

#include <sstream>
#include <variant>
#include <vector>

using payproc::AccountActivity;
using payproc::Amount;
using payproc::CsvReader;
using payproc::Roe;

namespace {

std::vector<Roe<AccountActivity>> readAll(CsvReader &reader) {
  std::vector<Roe<AccountActivity>> records;
  while (auto record = reader.next()) {
    records.push_back(*record);
  }
  return records;
}

Amount amount(const std::string &text) { return Amount::parse(text).value(); }

} // namespace

TEST(CsvReaderTest, ReadsAllActivityKinds) {
  std::istringstream input("type,client,tx,amount\n"
                           "deposit,1,1,1.0\n"
                           "withdrawal,1,2,0.5\n"
                           "dispute,1,1,\n"
                           "resolve,1,1,\n"
                           "chargeback,1,1,\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());

  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 5u);
  for (const auto &record : records) {
    ASSERT_TRUE(record.isOk());
  }
  EXPECT_EQ(records[0].value(), AccountActivity::deposit(1, 1, amount("1.0")));
  EXPECT_EQ(records[1].value(),
            AccountActivity::withdrawal(2, 1, amount("0.5")));
  EXPECT_EQ(records[2].value(), AccountActivity::dispute(1, 1));
  EXPECT_EQ(records[3].value(), AccountActivity::resolve(1, 1));
  EXPECT_EQ(records[4].value(), AccountActivity::chargeback(1, 1));
}

TEST(CsvReaderTest, TrimsWhitespaceAndSkipsBlankLines) {
  std::istringstream input("type, client, tx, amount\r\n"
                           "\n"
                           "  deposit ,  2 , 5 ,  3.25 \r\n"
                           "   \n"
                           "dispute, 2, 5\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());

  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 2u);
  ASSERT_TRUE(records[0].isOk());
  EXPECT_EQ(records[0].value(), AccountActivity::deposit(5, 2, amount("3.25")));
  ASSERT_TRUE(records[1].isOk());
  EXPECT_EQ(records[1].value(), AccountActivity::dispute(5, 2));
}

TEST(CsvReaderTest, ColumnsMayBeReordered) {
  std::istringstream input("tx,amount,type,client\n"
                           "7,12.5,deposit,3\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].isOk());
  EXPECT_EQ(records[0].value(), AccountActivity::deposit(7, 3, amount("12.5")));
}

TEST(CsvReaderTest, TypeIsCaseInsensitive) {
  std::istringstream input("TYPE,Client,Tx,Amount\nDeposit,1,1,2\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(records[0].isOk());
}

TEST(CsvReaderTest, NegativeAmountIsParsedForAccountToReject) {
  std::istringstream input("type,client,tx,amount\ndeposit,1,1,-4.0\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].isOk());
  auto *deposit = std::get_if<AccountActivity::Deposit>(
      &records[0].value().getVariant());
  ASSERT_NE(deposit, nullptr);
  EXPECT_TRUE(deposit->transaction.amount.isNegative());
}

TEST(CsvReaderTest, MalformedRecordsAreReportedAndReadingContinues) {
  std::istringstream input("type,client,tx,amount\n"
                           "refund,1,1,1.0\n"
                           "deposit,abc,2,1.0\n"
                           "deposit,70000,3,1.0\n"
                           "deposit,1,-4,1.0\n"
                           "deposit,1,5,\n"
                           "deposit,1,6,1.23456\n"
                           "deposit,1,7,1.0,extra\n"
                           "deposit,1,8,2.0\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());

  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 8u);
  for (size_t i = 0; i < 7; ++i) {
    ASSERT_TRUE(records[i].isError()) << "record " << i;
    EXPECT_EQ(records[i].error().code, CsvReader::E_RECORD) << "record " << i;
  }
  ASSERT_TRUE(records[7].isOk());
  EXPECT_EQ(records[7].value(), AccountActivity::deposit(8, 1, amount("2.0")));
}

TEST(CsvReaderTest, ErrorMessagesCarryLineNumbers) {
  std::istringstream input("type,client,tx,amount\n\nbogus,1,1,1\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto record = reader.next();
  ASSERT_TRUE(record.has_value());
  ASSERT_TRUE(record->isError());
  EXPECT_EQ(record->error().message.rfind("line 3: ", 0), 0u)
      << record->error().message;
  EXPECT_EQ(reader.getLineNumber(), 3u);
}

TEST(CsvReaderTest, MissingRequiredColumnRejectsHeader) {
  std::istringstream input("type,client,amount\ndeposit,1,1.0\n");
  CsvReader reader(input);
  auto header = reader.readHeader();
  ASSERT_TRUE(header.isError());
  EXPECT_EQ(header.error().code, CsvReader::E_HEADER);
  EXPECT_FALSE(reader.next().has_value());
}

TEST(CsvReaderTest, DuplicateColumnRejectsHeader) {
  std::istringstream input("type,client,tx,tx\n");
  CsvReader reader(input);
  auto header = reader.readHeader();
  ASSERT_TRUE(header.isError());
  EXPECT_EQ(header.error().code, CsvReader::E_HEADER);
}

TEST(CsvReaderTest, EmptyInputYieldsNothing) {
  std::istringstream input("");
  CsvReader reader(input);
  EXPECT_TRUE(reader.readHeader().isOk());
  EXPECT_FALSE(reader.next().has_value());
}

TEST(CsvReaderTest, HeaderReadLazilyByNext) {
  std::istringstream input("type,client,tx,amount\ndeposit,1,1,1.0\n");
  CsvReader reader(input);
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(records[0].isOk());
}

TEST(CsvReaderTest, LazyHeaderFailureIsReportedOnce) {
  std::istringstream input("foo,bar\n1,2\n");
  CsvReader reader(input);
  auto first = reader.next();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->isError());
  EXPECT_EQ(first->error().code, CsvReader::E_HEADER);
  EXPECT_FALSE(reader.next().has_value());
}

TEST(CsvReaderTest, AmountColumnIsOptionalForDisputes) {
  std::istringstream input("type,client,tx\ndispute,4,9\ndeposit,4,10\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 2u);
  ASSERT_TRUE(records[0].isOk());
  EXPECT_EQ(records[0].value(), AccountActivity::dispute(9, 4));
  EXPECT_TRUE(records[1].isError());
}

TEST(CsvReaderTest, ByteOrderMarkBeforeHeaderIsIgnored) {
  std::istringstream input("\xEF\xBB\xBF" "type,client,tx,amount\n"
                           "deposit,1,1,2.5\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  ASSERT_TRUE(records[0].isOk());
  EXPECT_EQ(records[0].value(), AccountActivity::deposit(1, 1, amount("2.5")));
}

TEST(CsvReaderTest, QuotedFieldsAreUnquoted) {
  std::istringstream input("\"type\",\"client\",\"tx\",\"amount\"\n"
                           "\"deposit\", \"3\" ,\"4\",\" 1.75 \"\n"
                           "\"dispute\",3,4,\"\"\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 2u);
  ASSERT_TRUE(records[0].isOk());
  EXPECT_EQ(records[0].value(),
            AccountActivity::deposit(4, 3, amount("1.75")));
  ASSERT_TRUE(records[1].isOk());
  EXPECT_EQ(records[1].value(), AccountActivity::dispute(4, 3));
}

TEST(CsvReaderTest, ByteOrderMarkOnlyStrippedFromFirstLine) {
  std::istringstream input("type,client,tx,amount\n"
                           "\xEF\xBB\xBF" "deposit,1,1,2.5\n");
  CsvReader reader(input);
  ASSERT_TRUE(reader.readHeader().isOk());
  auto records = readAll(reader);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(records[0].isError());
}
