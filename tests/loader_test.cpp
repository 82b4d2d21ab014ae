// loader_test.cpp: CSV ingestion, column aliases, timeframe and datetime parsing

#include <gtest/gtest.h>

#include "core/loader.h"
#include "ind/errors.h"
#include "test_helpers.h"
#include "util/math.h"
#include "util/times.h"

#include <sstream>
#include <stdexcept>

using namespace test_helpers;

TEST(LoaderTest, NormalizesColumnAliases) {
  EXPECT_EQ(normalize_column(" Adj Close "), "close");
  EXPECT_EQ(normalize_column("Timestamp"), "date");
  EXPECT_EQ(normalize_column("Open Time"), "date");
  EXPECT_EQ(normalize_column("VOL"), "volume");
  EXPECT_EQ(normalize_column("o"), "open");
  EXPECT_EQ(normalize_column("Trend"), "trend");
}

TEST(LoaderTest, ReadsAndSortsBars) {
  std::istringstream in{
      "Date,Open,High,Low,Close,Volume,trend\n"
      "2024-01-03,11,12,10,11.5,300,up\n"
      "2024-01-01,10,11,9,10.5,100,down\n"
      "2024-01-02,10.5,11.5,10,11,200,up\n"};

  auto t = read_csv(in);
  ASSERT_EQ(t.size(), 3u);
  EXPECT_EQ(t.time(0), datetime_to_local("2024-01-01"));
  EXPECT_EQ(t.time(-1), datetime_to_local("2024-01-03"));
  EXPECT_DOUBLE_EQ(t.open(0), 10.0);
  EXPECT_DOUBLE_EQ(t.close(1), 11.0);
  EXPECT_DOUBLE_EQ(t.get(Field::Volume, 2), 300.0);
  EXPECT_EQ(t.trend(0), "down");
  EXPECT_EQ(t.trend(1), "up");
}

TEST(LoaderTest, AliasedHeadersAndDefaultVolume) {
  std::istringstream in{
      "timestamp,o,h,l,adj close\n"
      "2024-01-01 09:30:00,1,2,0.5,1.5\n"
      "2024-01-01 09:35:00,1.5,2.5,1,2\n"};

  auto t = read_csv(in);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_DOUBLE_EQ(t.close(-1), 2.0);
  EXPECT_DOUBLE_EQ(t.get(Field::Volume, 0), 0.0);
  EXPECT_FALSE(t.has_trend());
}

TEST(LoaderTest, BadNumbersBecomeMissingAndBadDatesAreDropped) {
  std::istringstream in{
      "date,open,high,low,close\n"
      "2024-01-01,1,2,0.5,abc\n"
      "not a date,1,2,0.5,1.5\n"
      "2024-01-02,1,2,0.5,\n"};

  auto t = read_csv(in);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_TRUE(missing(t.close(0)));
  EXPECT_TRUE(missing(t.close(1)));
  EXPECT_DOUBLE_EQ(t.open(1), 1.0);
}

TEST(LoaderTest, ReadsQuotedCells) {
  std::istringstream in{
      "\"Date\",\"Open\",\"High\",\"Low\",\"Close\",\"Volume\",\"trend\"\n"
      "\"2024-01-02 09:30:00\",\"10\",\"11\",\"9\",\"10.5\",\"100\",\"up, strong\"\n"
      "\"2024-01-01 09:30:00\",\"9\",\"10\",\"8\",\"9.5\",\"50\",\"say \"\"flat\"\"\"\n"};

  auto t = read_csv(in);
  ASSERT_EQ(t.size(), 2u);
  EXPECT_EQ(t.time(0), datetime_to_local("2024-01-01 09:30:00"));
  EXPECT_DOUBLE_EQ(t.open(0), 9.0);
  EXPECT_DOUBLE_EQ(t.close(1), 10.5);
  EXPECT_DOUBLE_EQ(t.get(Field::Volume, 1), 100.0);
  EXPECT_EQ(t.trend(0), "say \"flat\"");
  EXPECT_EQ(t.trend(1), "up, strong");
}

TEST(LoaderTest, SkipsUtf8ByteOrderMark) {
  std::istringstream in{
      "\xEF\xBB\xBF" "Date,Open,High,Low,Close\r\n"
      "2024-01-01,1,2,0.5,1.5\r\n"};

  auto t = read_csv(in);
  ASSERT_EQ(t.size(), 1u);
  EXPECT_EQ(t.time(0), datetime_to_local("2024-01-01"));
  EXPECT_DOUBLE_EQ(t.close(0), 1.5);
}

TEST(LoaderTest, MissingRequiredColumn) {
  std::istringstream in{
      "date,open,high,low\n"
      "2024-01-01,1,2,0.5\n"};

  try {
    read_csv(in);
    FAIL() << "expected MissingColumnError";
  } catch (const MissingColumnError& e) {
    EXPECT_EQ(e.column, "close");
  }
}

TEST(LoaderTest, UnreadableFile) {
  EXPECT_THROW(read_csv(std::string{"/nonexistent/bars.csv"}),
               std::runtime_error);
}

TEST(LoaderTest, DetectsTimeframe) {
  EXPECT_EQ(detect_timeframe(Table{make_zigzag(10)}), "1d");
  EXPECT_EQ(detect_timeframe(Table{make_zigzag(1)}), "unknown");

  std::istringstream in{
      "date,open,high,low,close\n"
      "2024-01-01 09:00:00,1,2,0.5,1.5\n"
      "2024-01-01 10:00:00,1,2,0.5,1.5\n"
      "2024-01-01 11:00:00,1,2,0.5,1.5\n"};
  EXPECT_EQ(detect_timeframe(read_csv(in)), "1h");
}

TEST(TimesTest, ParsesSupportedFormats) {
  auto day_only = datetime_to_local("2024-03-05");
  EXPECT_EQ(datetime_to_local("2024-03-05 00:00:00"), day_only);
  EXPECT_EQ(datetime_to_local("2024-03-05T00:00:00"), day_only);
  EXPECT_EQ(datetime_to_local("2024-03-05 01:30"), day_only + minutes{90});
  EXPECT_EQ(datetime_to_string(day_only + hours{13}), "2024-03-05 13:00:00");
  EXPECT_THROW(datetime_to_local("05/03/2024"), std::invalid_argument);
}

TEST(TimesTest, CalendarFields) {
  auto monday = datetime_to_local("2024-01-01");
  EXPECT_EQ(day_of_week(monday), 0);
  EXPECT_EQ(day_of_week(monday + 6 * D_1), 6);
  EXPECT_EQ(month_of(monday), 1);
  EXPECT_EQ(month_of(datetime_to_local("2024-12-31 23:59:59")), 12);
}
