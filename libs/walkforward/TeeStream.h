// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include <streambuf>
#include <vector>

namespace wfvalidator
{
  /**
   * @brief Unbuffered stream buffer that forwards every write to each branch.
   *
   * A write fails if any branch fails; the remaining branches still receive
   * the data.
   */
  class TeeBuf : public std::streambuf
  {
  public:
    explicit TeeBuf(const std::vector<std::streambuf*>& branches);

  protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char_type* s, std::streamsize count) override;
    int sync() override;

  private:
    std::vector<std::streambuf*> mBranches;
  };

  /**
   * @brief Run log that reaches the console and a log file at once.
   *
   * WalkForwardEngine::setLogFile() puts one of these in front of the
   * stream the engine was constructed with.
   */
  class TeeStream : public std::ostream
  {
  public:
    TeeStream(std::ostream& console, std::ostream& logFile);

  private:
    TeeBuf mTeeBuf;
  };
}
