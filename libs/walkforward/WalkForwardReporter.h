// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include "WalkForwardResult.h"

namespace wfvalidator
{
  /**
   * @brief Writes a human readable summary of a WalkForwardResult.
   *
   * Sections: run header, one row per window, per-metric stability and
   * significance, then degradation. Every ratio, score and p-value is
   * printed at four decimal digits.
   */
  class WalkForwardReporter
  {
  public:
    static void writeSummary(std::ostream& os, const WalkForwardResult& result);

    static void writeWindowTable(std::ostream& os, const WalkForwardResult& result);

    static void writeStatistics(std::ostream& os, const WalkForwardResult& result);

    static void writeDegradation(std::ostream& os, const WalkForwardResult& result);

  private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
    static std::string formatOptional(const std::optional<double>& value, const std::string& missing);
  };
}
