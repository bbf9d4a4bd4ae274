#include "test/unit/openendf_unit_test.h"
#include "test/unit/framework/nuclear_data/endf/tape_builder.h"
#include "framework/nuclear_data/endf/tabulated_function.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include <gmock/gmock.h>

using namespace openendf;
using ::testing::ElementsAre;

class TabulatedFunctionTest : public OpenEndfUnitTest
{
};

TEST_F(TabulatedFunctionTest, PartialLastLine)
{
  TapeBuilder tape;
  tape.Tab1(0.0,
            0.0,
            0,
            0,
            {2, 4},
            {2, 5},
            {1.0e-5, 1.0, 1.0e6, 2.0e7},
            {2.43, 2.45, 2.6, 5.1},
            1,
            456)
    .Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto table = ReadTabulatedFunction(reader);

  EXPECT_EQ(table.GetNumRegions(), 2);
  EXPECT_EQ(table.GetNumPoints(), 4);
  EXPECT_THAT(table.nbt, ElementsAre(2, 4));
  EXPECT_THAT(table.interpolation, ElementsAre(2, 5));
  EXPECT_THAT(table.x, ElementsAre(1.0e-5, 1.0, 1.0e6, 2.0e7));
  EXPECT_THAT(table.y, ElementsAre(2.43, 2.45, 2.6, 5.1));

  // Header, one region line and two point lines
  EXPECT_EQ(reader.GetLineNumber(), 4);
  EXPECT_NO_THROW(reader.ReadSectionEnd());
}

TEST_F(TabulatedFunctionTest, FullLines)
{
  TapeBuilder tape;
  tape.Tab1(0.0,
            0.0,
            0,
            0,
            {1, 2, 3, 6},
            {1, 2, 2, 2},
            {1.0, 2.0, 3.0, 4.0, 5.0, 6.0},
            {0.1, 0.2, 0.3, 0.4, 0.5, 0.6},
            1,
            452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto table = reader.ReadTab1();

  EXPECT_THAT(table.nbt, ElementsAre(1, 2, 3, 6));
  EXPECT_THAT(table.interpolation, ElementsAre(1, 2, 2, 2));
  EXPECT_EQ(table.x.back(), 6.0);
  EXPECT_EQ(table.y.back(), 0.6);
  EXPECT_EQ(reader.GetLineNumber(), 5);
}

TEST_F(TabulatedFunctionTest, EmptyTable)
{
  TapeBuilder tape;
  tape.Cont(0.0, 0.0, 0, 0, 0, 0, 1, 452).Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto table = ReadTabulatedFunction(reader);

  EXPECT_EQ(table.GetNumRegions(), 0);
  EXPECT_EQ(table.GetNumPoints(), 0);
  EXPECT_EQ(reader.GetLineNumber(), 1);
}

TEST_F(TabulatedFunctionTest, NegativeCounts)
{
  TapeBuilder tape;
  tape.Cont(0.0, 0.0, 0, 0, 1, -2, 1, 452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_THROW(ReadTabulatedFunction(reader), MalformedFieldError);
}

TEST_F(TabulatedFunctionTest, BreakpointsNotIncreasing)
{
  TapeBuilder tape;
  tape.Tab1(0.0, 0.0, 0, 0, {3, 2}, {2, 2}, {1.0, 2.0, 3.0}, {1.0, 1.0, 1.0}, 1, 452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  try
  {
    ReadTabulatedFunction(reader);
    FAIL() << "Expected MalformedFieldError";
  }
  catch (const MalformedFieldError& err)
  {
    EXPECT_EQ(err.GetLineNumber(), 1);
  }
}

TEST_F(TabulatedFunctionTest, LastBreakpointDiffersFromPointCount)
{
  TapeBuilder tape;
  tape.Tab1(0.0, 0.0, 0, 0, {2}, {2}, {1.0, 2.0, 3.0}, {1.0, 1.0, 1.0}, 1, 452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_THROW(ReadTabulatedFunction(reader), MalformedFieldError);
}

TEST_F(TabulatedFunctionTest, TruncatedPoints)
{
  TapeBuilder tape;
  tape.Tab1(0.0,
            0.0,
            0,
            0,
            {4},
            {2},
            {1.0, 2.0, 3.0, 4.0},
            {1.0, 1.0, 1.0, 1.0},
            1,
            452);

  auto stream = MakeStream(tape.Str(1));
  RecordReader reader(stream);
  EXPECT_THROW(ReadTabulatedFunction(reader), UnexpectedEndOfStreamError);
}

TEST_F(TabulatedFunctionTest, TruncatedBySectionEnd)
{
  TapeBuilder tape;
  tape.Cont(0.0, 0.0, 0, 0, 1, 4, 1, 452)
    .Line(TapeBuilder::FormatInteger(4) + TapeBuilder::FormatInteger(2), 1, 452)
    .Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  try
  {
    ReadTabulatedFunction(reader);
    FAIL() << "Expected UnexpectedEndOfStreamError";
  }
  catch (const UnexpectedEndOfStreamError& err)
  {
    EXPECT_EQ(err.GetLineNumber(), 3);
  }
}

TEST_F(TabulatedFunctionTest, CheckRejectsMismatchedArrays)
{
  Tab1Record record;
  record.nbt = {2};
  record.interpolation = {2};
  record.x = {1.0, 2.0};
  record.y = {1.0};
  EXPECT_THROW(CheckTabulatedFunction(record, 7), MalformedFieldError);

  record.y.push_back(2.0);
  EXPECT_NO_THROW(CheckTabulatedFunction(record, 7));
}

TEST_F(TabulatedFunctionTest, HugePointCountFollowedBySectionEnd)
{
  TapeBuilder tape;
  tape.Cont(0.0, 0.0, 0, 0, 0, 2147483647, 1, 452).Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_THROW(ReadTabulatedFunction(reader), UnexpectedEndOfStreamError);
}

TEST_F(TabulatedFunctionTest, HugeRegionCountAtEndOfStream)
{
  TapeBuilder tape;
  tape.Cont(0.0, 0.0, 0, 0, 2147483647, 2147483647, 1, 452)
    .Line(TapeBuilder::FormatInteger(2) + TapeBuilder::FormatInteger(2), 1, 452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_THROW(ReadTabulatedFunction(reader), UnexpectedEndOfStreamError);
}
