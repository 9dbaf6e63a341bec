#include <gtest/gtest.h>

#include <cstring>
#include <limits>
#include <vector>

#include "punchcard.hh"

using namespace punchcard;

namespace {
// Lays out a record by hand, the way it sits in an account.
std::vector<u8> MakeRecord(u64 capacity, u64 claimed, size_t bits_len,
                           u8 authority_byte = 0xAA) {
  std::vector<u8> data(kPunchcardHeaderLen + bits_len, 0);
  std::memset(data.data(), authority_byte, kAddressLen);
  std::memcpy(data.data() + 32, &capacity, sizeof(capacity));
  std::memcpy(data.data() + 40, &claimed, sizeof(claimed));
  return data;
}

Punchcard Parse(std::vector<u8> &data) {
  auto parsed = Punchcard::FromBytes(data);
  if (auto *err = std::get_if<ProgramError>(&parsed))
    ADD_FAILURE() << "unexpected " << *err;
  return std::get<Punchcard>(parsed);
}

ProgramError ParseError(std::vector<u8> &data) {
  auto parsed = Punchcard::FromBytes(data);
  EXPECT_TRUE(std::holds_alternative<ProgramError>(parsed));
  return std::get<ProgramError>(parsed);
}
}  // namespace

class PunchcardTest : public ::testing::Test {
 protected:
  std::vector<u8> data_ = MakeRecord(16, 0, 2);
};

TEST_F(PunchcardTest, ReadsHeaderInPlace) {
  auto card = Parse(data_);

  EXPECT_EQ(card.Header().capacity, 16u);
  EXPECT_EQ(card.Header().claimed, 0u);
  EXPECT_EQ(card.Header().authority.bytes[0], 0xAA);
  EXPECT_EQ(card.Bits().SizeInBytes(), 2u);
  EXPECT_EQ(reinterpret_cast<u8 *>(&card.Header()), data_.data());
  EXPECT_EQ(card.Bits().Bytes().data(), data_.data() + kPunchcardHeaderLen);
}

TEST_F(PunchcardTest, ClaimSetsBitAndCountsIt) {
  auto card = Parse(data_);

  EXPECT_EQ(card.Claim(5), std::nullopt);

  EXPECT_EQ(data_[kPunchcardHeaderLen] & 0b00100000, 0b00100000);
  EXPECT_EQ(card.Header().claimed, 1u);

  u64 claimed;
  std::memcpy(&claimed, data_.data() + 40, sizeof(claimed));
  EXPECT_EQ(claimed, 1u);
}

TEST_F(PunchcardTest, SecondClaimOfSameSlotFails) {
  auto card = Parse(data_);

  ASSERT_EQ(card.Claim(12), std::nullopt);
  auto err = card.Claim(12);

  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->Is(PunchcardError::kAlreadyClaimed));
  EXPECT_EQ(err->Category(), ErrorCategory::kDomain);
  EXPECT_EQ(card.Header().claimed, 1u);
  EXPECT_EQ(data_[kPunchcardHeaderLen + 1], 0b00010000);
}

TEST_F(PunchcardTest, FullAfterEverySlotClaimed) {
  data_ = MakeRecord(4, 0, 1);
  auto card = Parse(data_);

  for (u64 i = 0; i < 4; i++) {
    EXPECT_FALSE(card.IsFull());
    ASSERT_EQ(card.Claim(i), std::nullopt);
  }

  EXPECT_TRUE(card.IsFull());
  EXPECT_EQ(data_[kPunchcardHeaderLen], 0b00001111);
}

// A counter that disagrees with the bitset must not push claimed past capacity.
TEST_F(PunchcardTest, ClaimRejectsCounterAlreadyAtCapacity) {
  data_ = MakeRecord(8, 8, 1);
  auto card = Parse(data_);

  auto err = card.Claim(3);

  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->Kind(), ErrorKind::kInvalidAccountData);
  EXPECT_EQ(card.Header().claimed, 8u);
  EXPECT_EQ(data_[kPunchcardHeaderLen], 0);
}

TEST_F(PunchcardTest, RejectsBufferShorterThanHeader) {
  std::vector<u8> data(kPunchcardHeaderLen - 1, 0);
  EXPECT_EQ(ParseError(data).Kind(), ErrorKind::kInvalidAccountData);

  std::vector<u8> empty;
  EXPECT_EQ(ParseError(empty).Kind(), ErrorKind::kInvalidAccountData);
}

TEST_F(PunchcardTest, RejectsMismatchedBitsetLength) {
  auto oversized = MakeRecord(0, 0, 1);
  EXPECT_EQ(ParseError(oversized).Kind(), ErrorKind::kInvalidAccountData);

  auto truncated = MakeRecord(16, 0, 1);
  EXPECT_EQ(ParseError(truncated).Kind(), ErrorKind::kInvalidAccountData);

  auto padded = MakeRecord(16, 0, 3);
  EXPECT_EQ(ParseError(padded).Kind(), ErrorKind::kInvalidAccountData);
}

TEST_F(PunchcardTest, RejectsUnsizableCapacity) {
  auto data = MakeRecord(std::numeric_limits<u64>::max(), 0, 0);
  auto err = ParseError(data);

  EXPECT_EQ(err.Kind(), ErrorKind::kInvalidAccountData);
  EXPECT_EQ(err.Category(), ErrorCategory::kStructural);
}

TEST_F(PunchcardTest, RejectsClaimedGreaterThanCapacity) {
  auto data = MakeRecord(0, 1, 0);
  EXPECT_EQ(ParseError(data).Kind(), ErrorKind::kInvalidAccountData);

  data = MakeRecord(9, 10, 2);
  EXPECT_EQ(ParseError(data).Kind(), ErrorKind::kInvalidAccountData);
}

TEST_F(PunchcardTest, RejectsMisalignedBuffer) {
  std::vector<u8> backing(data_.size() + 1, 0);
  std::memcpy(backing.data() + 1, data_.data(), data_.size());

  auto parsed = Punchcard::FromBytes(std::span(backing).subspan(1));
  ASSERT_TRUE(std::holds_alternative<ProgramError>(parsed));
  EXPECT_EQ(std::get<ProgramError>(parsed).Kind(),
            ErrorKind::kInvalidAccountData);
}

TEST_F(PunchcardTest, SplitOnlyChecksHeaderFits) {
  auto split = Punchcard::Split(data_);
  ASSERT_TRUE(std::holds_alternative<Punchcard::Parts>(split));

  auto [header, bits] = std::get<Punchcard::Parts>(split);
  EXPECT_EQ(reinterpret_cast<u8 *>(header), data_.data());
  EXPECT_EQ(bits.size(), 2u);
}
