// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/evaluation_reader.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_names.h"
#include "framework/logging/log.h"
#include "framework/utils/timer.h"
#include "framework/utils/utils.h"
#include "framework/runtime.h"
#include "caliper/cali.h"
#include <fstream>

namespace openendf
{

EvaluationReader::EvaluationReader(EvaluationReaderOptions options)
  : options_(std::move(options)), dispatcher_(SectionDispatcher::MakeDefault())
{
}

EvaluationReader::EvaluationReader(EvaluationReaderOptions options, SectionDispatcher dispatcher)
  : options_(std::move(options)), dispatcher_(std::move(dispatcher))
{
}

Evaluation
EvaluationReader::Read(std::istream& stream) const
{
  CALI_CXX_MARK_SCOPE("EvaluationReader::Read");

  RecordReader reader(stream);

  auto tape_id = SeekDescriptiveData(reader);
  auto descriptive_data = ReadDescriptiveData(reader);
  auto directory = ReadDirectory(reader, descriptive_data.nxc);

  log.Log(options_.verbose ? Logger::LOG_0 : Logger::LOG_0VERBOSE_1)
    << "   MAT=" << descriptive_data.mat << " " << StringTrim(descriptive_data.zsymam) << " ("
    << LibraryName(descriptive_data.nlib) << "), " << directory.size() << " sections";

  auto files = dispatcher_.Dispatch(descriptive_data.mat,
                                    directory,
                                    reader,
                                    options_.selected_sections,
                                    options_.verbose);

  return {std::move(tape_id), std::move(descriptive_data), std::move(directory), std::move(files)};
}

Evaluation
EvaluationReader::ReadFile(const std::string& file_name) const
{
  AssertReadableFile(file_name);
  std::ifstream file(file_name);

  log.Log() << "Reading ENDF evaluation \"" << file_name << "\"";
  Timer timer;
  auto evaluation = Read(file);
  log.Log() << "Done reading " << evaluation.GetSummary() << " in " << timer.GetTime() << " ms";

  return evaluation;
}

} // namespace openendf
