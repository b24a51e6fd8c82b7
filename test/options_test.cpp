#include <gtest/gtest.h>

#include "options.hpp"
#include "test_util.hpp"

using namespace tftpff;

TEST(OptionsTest, NoOptionsMeansNothingToAcknowledge) {
  NegotiatedOptions accepted = negotiate_options(OptionList());
  EXPECT_TRUE(accepted.empty());
  EXPECT_FALSE(accepted.blksize());
  EXPECT_TRUE(accepted.to_option_list().empty());
}

TEST(OptionsTest, AcceptsInRangeValuesInRequestOrder) {
  NegotiatedOptions accepted =
      negotiate_options({{"tsize", "0"}, {"timeout", "3"}, {"blksize", "1428"}});
  ASSERT_EQ(accepted.order().size(), 3u);
  EXPECT_EQ(accepted.order()[0], OptionKind::TransferSize);
  EXPECT_EQ(accepted.order()[1], OptionKind::Timeout);
  EXPECT_EQ(accepted.order()[2], OptionKind::BlockSize);
  EXPECT_EQ(*accepted.blksize(), 1428u);
  EXPECT_EQ(*accepted.timeout(), 3u);
  EXPECT_EQ(*accepted.tsize(), 0u);

  OptionList expected = {{"tsize", "0"}, {"timeout", "3"}, {"blksize", "1428"}};
  EXPECT_EQ(accepted.to_option_list(), expected);
}

TEST(OptionsTest, NamesAreCaseInsensitiveAndEchoedInLowercase) {
  NegotiatedOptions accepted = negotiate_options({{"BlkSize", "1024"}});
  ASSERT_TRUE(accepted.blksize());
  EXPECT_EQ(accepted.to_option_list()[0].name, "blksize");
}

TEST(OptionsTest, BlksizeBounds) {
  EXPECT_FALSE(negotiate_options({{"blksize", "7"}}).blksize());
  EXPECT_EQ(*negotiate_options({{"blksize", "8"}}).blksize(), 8u);
  EXPECT_EQ(*negotiate_options({{"blksize", "65464"}}).blksize(), 65464u);
  EXPECT_FALSE(negotiate_options({{"blksize", "65465"}}).blksize());
}

TEST(OptionsTest, TimeoutBounds) {
  EXPECT_FALSE(negotiate_options({{"timeout", "0"}}).timeout());
  EXPECT_EQ(*negotiate_options({{"timeout", "1"}}).timeout(), 1u);
  EXPECT_EQ(*negotiate_options({{"timeout", "255"}}).timeout(), 255u);
  EXPECT_FALSE(negotiate_options({{"timeout", "256"}}).timeout());
}

TEST(OptionsTest, NonNumericValuesAreDropped) {
  NegotiatedOptions accepted = negotiate_options(
      {{"blksize", "-512"}, {"timeout", " 5"}, {"tsize", "12abc"}, {"blksize", ""}});
  EXPECT_TRUE(accepted.empty());
}

TEST(OptionsTest, UnknownOptionsAreDiscarded) {
  NegotiatedOptions accepted =
      negotiate_options({{"windowsize", "8"}, {"multicast", ""}, {"timeout", "2"}});
  ASSERT_EQ(accepted.order().size(), 1u);
  EXPECT_EQ(accepted.order()[0], OptionKind::Timeout);
}

TEST(OptionsTest, FirstAcceptedOccurrenceWins) {
  NegotiatedOptions accepted = negotiate_options({{"blksize", "1024"}, {"blksize", "2048"}});
  EXPECT_EQ(*accepted.blksize(), 1024u);
  EXPECT_EQ(accepted.order().size(), 1u);
}

TEST(OptionsTest, ServerCanOverrideTsizeWithoutReordering) {
  NegotiatedOptions accepted = negotiate_options({{"tsize", "0"}, {"blksize", "512"}});
  accepted.set_tsize(1025);
  OptionList expected = {{"tsize", "1025"}, {"blksize", "512"}};
  EXPECT_EQ(accepted.to_option_list(), expected);
}
