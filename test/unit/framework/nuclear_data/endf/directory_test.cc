#include "test/unit/openendf_unit_test.h"
#include "test/unit/framework/nuclear_data/endf/tape_builder.h"
#include "framework/nuclear_data/endf/directory.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include "framework/utils/utils.h"
#include <gmock/gmock.h>

using namespace openendf;
using ::testing::ElementsAre;

class DirectoryTest : public OpenEndfUnitTest
{
protected:
  const Directory directory_ = {{1, 451, 12, 0}, {1, 452, 4, 0}, {3, 1, 100, 2}};
};

TEST_F(DirectoryTest, DescriptiveDataHeader)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto data = ReadDescriptiveData(reader);

  EXPECT_EQ(data.mat, 9228);
  EXPECT_EQ(data.za, 92235);
  EXPECT_DOUBLE_EQ(data.awr, 233.0248);
  EXPECT_EQ(data.lrp, 1);
  EXPECT_EQ(data.lfi, 1);
  EXPECT_EQ(data.nlib, 0);
  EXPECT_EQ(data.nmod, 1);
  EXPECT_EQ(data.nfor, 6);
  EXPECT_DOUBLE_EQ(data.awi, 1.0);
  EXPECT_DOUBLE_EQ(data.emax, 2.0e7);
  EXPECT_EQ(data.nsub, 10);
  EXPECT_EQ(data.nver, 8);
  EXPECT_EQ(data.nwd, 3);
  EXPECT_EQ(data.nxc, 3);
  EXPECT_TRUE(data.description.empty());
}

TEST_F(DirectoryTest, DescriptiveDataText)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto data = ReadDescriptiveData(reader);

  EXPECT_EQ(StringTrim(data.zsymam), "92-U -235");
  EXPECT_EQ(StringTrim(data.alab), "LANL");
  EXPECT_EQ(data.edate, "EVAL-AUG17");
  EXPECT_EQ(StringTrim(data.auth), "M.B. Chadwick, P. Talou");
  EXPECT_EQ(data.ref, "ENDF/B-VIII.0 release");
  EXPECT_EQ(data.ddate, "DIST-FEB18");
  EXPECT_EQ(data.rdate, "REV1-AUG17");
  EXPECT_EQ(data.endate, "20180202");
  EXPECT_EQ(StringTrim(data.hsub), "----ENDF/B-VIII.0      MATERIAL 9228");
}

TEST_F(DirectoryTest, DescriptionLines)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_, {" First comment line", "", " ***** Third *****"});

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto data = ReadDescriptiveData(reader);

  EXPECT_EQ(data.nwd, 6);
  ASSERT_EQ(data.description.size(), 3);
  EXPECT_EQ(StringTrim(data.description[0]), "First comment line");
  EXPECT_TRUE(IsBlank(data.description[1]));
  EXPECT_EQ(data.description[2].size(), 66);

  const auto directory = ReadDirectory(reader, data.nxc);
  EXPECT_EQ(directory, directory_);
}

TEST_F(DirectoryTest, TooFewTextRecords)
{
  TapeBuilder tape;
  tape.Cont(92235.0, 233.0248, 1, 1, 0, 1, 1, 451)
    .Cont(0.0, 0.0, 0, 0, 0, 6, 1, 451)
    .Cont(1.0, 2.0e7, 0, 0, 10, 8, 1, 451)
    .Cont(0.0, 0.0, 0, 0, 2, 0, 1, 451);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  try
  {
    ReadDescriptiveData(reader);
    FAIL() << "Expected MalformedFieldError";
  }
  catch (const MalformedFieldError& err)
  {
    EXPECT_EQ(err.GetLineNumber(), 4);
  }
}

TEST_F(DirectoryTest, Entries)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_).Cont(92235.0, 233.0248, 0, 1, 0, 0, 1, 452);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto data = ReadDescriptiveData(reader);
  const auto directory = ReadDirectory(reader, data.nxc);

  ASSERT_EQ(directory.size(), 3);
  EXPECT_EQ(directory[0].mf, 1);
  EXPECT_EQ(directory[0].mt, 451);
  EXPECT_EQ(directory[0].nc, 12);
  EXPECT_EQ(directory[2].mf, 3);
  EXPECT_EQ(directory[2].mt, 1);
  EXPECT_EQ(directory[2].nc, 100);
  EXPECT_EQ(directory[2].mod, 2);

  // The SEND record is consumed and the reader sits on the next section
  EXPECT_EQ(reader.GetLineNumber(), 11);
  EXPECT_EQ(reader.PeekTail().mt, 452);
}

TEST_F(DirectoryTest, ReadingTwiceGivesEqualResults)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_, {" comment"});

  Directory first;
  Directory second;
  for (auto* directory : {&first, &second})
  {
    auto stream = MakeStream(tape.Str());
    RecordReader reader(stream);
    const auto data = ReadDescriptiveData(reader);
    *directory = ReadDirectory(reader, data.nxc);
  }

  EXPECT_EQ(first, second);
  EXPECT_EQ(first, directory_);
}

TEST_F(DirectoryTest, CountDifferentFromHeader)
{
  TapeBuilder tape;
  tape.DirectoryLine(1, 451, 10, 0).DirectoryLine(1, 452, 4, 0).Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  const auto directory = ReadDirectory(reader, 5);

  EXPECT_EQ(directory.size(), 2);
}

TEST_F(DirectoryTest, EmptyDirectory)
{
  TapeBuilder tape;
  tape.Send(1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_TRUE(ReadDirectory(reader, 0).empty());
}

TEST_F(DirectoryTest, Unterminated)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_);

  // Drop the SEND record closing MF=1/MT=451
  auto stream = MakeStream(tape.Str(1));
  RecordReader reader(stream);
  const auto data = ReadDescriptiveData(reader);
  try
  {
    ReadDirectory(reader, data.nxc);
    FAIL() << "Expected UnterminatedDirectoryError";
  }
  catch (const UnterminatedDirectoryError& err)
  {
    EXPECT_EQ(err.GetLineNumber(), 11);
  }
}

TEST_F(DirectoryTest, TapeIdentification)
{
  TapeBuilder tape;
  tape.Tpid(" Synthetic U-235 tape").DescriptiveData(directory_);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);

  const auto tape_id = SeekDescriptiveData(reader);
  EXPECT_EQ(StringTrim(tape_id), "Synthetic U-235 tape");
  EXPECT_EQ(reader.GetLineNumber(), 1);
  EXPECT_EQ(ReadDescriptiveData(reader).za, 92235);
}

TEST_F(DirectoryTest, NoTapeIdentification)
{
  TapeBuilder tape;
  tape.DescriptiveData(directory_);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);

  EXPECT_TRUE(SeekDescriptiveData(reader).empty());
  EXPECT_EQ(reader.GetLineNumber(), 0);
}

TEST_F(DirectoryTest, MissingDescriptiveData)
{
  TapeBuilder tape;
  tape.Tpid(" Empty tape").Cont(0.0, 0.0, 0, 0, 0, 0, 3, 1);

  auto stream = MakeStream(tape.Str());
  RecordReader reader(stream);
  EXPECT_THROW(SeekDescriptiveData(reader), UnexpectedEndOfStreamError);
}

TEST_F(DirectoryTest, HugeTextCount)
{
  TapeBuilder tape;
  tape.Cont(92235.0, 233.0248, 1, 1, 0, 1, 1, 451)
    .Cont(0.0, 0.0, 0, 0, 0, 6, 1, 451)
    .Cont(1.0, 2.0e7, 0, 0, 10, 8, 1, 451)
    .Cont(0.0, 0.0, 0, 0, 2147483647, 1, 1, 451)
    .Text(" 92-U -235 LANL       EVAL-AUG17", 1, 451)
    .Text(" ENDF/B-VIII.0 release", 1, 451)
    .Text("----ENDF/B-VIII.0      MATERIAL 9228", 1, 451);

  {
    auto stream = MakeStream(tape.Str());
    RecordReader reader(stream);
    EXPECT_THROW(ReadDescriptiveData(reader), UnexpectedEndOfStreamError);
  }

  tape.DirectoryLine(1, 451, 10, 0).Send(1);
  {
    auto stream = MakeStream(tape.Str());
    RecordReader reader(stream);
    try
    {
      ReadDescriptiveData(reader);
      FAIL() << "Expected UnexpectedEndOfStreamError";
    }
    catch (const UnexpectedEndOfStreamError& err)
    {
      EXPECT_EQ(err.GetLineNumber(), 9);
    }
  }
}
