// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WalkForwardReporter.h"
#include <iomanip>
#include <sstream>
#include "ReportRounding.h"

namespace wfvalidator
{
  void WalkForwardReporter::writeSummary(std::ostream& os, const WalkForwardResult& result)
  {
    const WalkForwardConfig& config = result.getConfig();

    writeSectionHeader(os, "Walk-Forward Validation Summary");
    os << "Run Id: " << result.getRunIdString() << std::endl;
    os << "Symbols: ";
    for (std::size_t i = 0; i < config.symbols.size(); ++i)
      os << (i ? ";" : "") << config.symbols[i];
    os << std::endl;
    os << "Overall Range: [" << config.overallStartDate << ", " << config.overallEndDate << ")" << std::endl;
    os << "Train / Validate Months: " << config.trainPeriodMonths << " / "
       << config.validatePeriodMonths << std::endl;
    os << "Primary Metric: " << getMetricName(config.primaryMetric) << std::endl;
    os << "Outcome: " << getRunOutcomeName(result.getOutcome()) << std::endl;
    os << "Windows: " << result.getSummaryStatistics().getNumWindows()
       << " (scored " << result.getSummaryStatistics().getNumScoredWindows()
       << ", failed " << result.getSummaryStatistics().getNumFailedWindows() << ")" << std::endl;
    os << std::fixed << std::setprecision(3)
       << "Total Execution Time: " << result.getTotalExecutionTime().count() << " s" << std::endl;
    os << "Average Window Execution Time: " << result.getAverageWindowExecutionTime().count()
       << " s" << std::endl;
    os.unsetf(std::ios_base::floatfield);
    os << std::setprecision(6);
    writeSectionFooter(os);

    writeWindowTable(os, result);
    writeStatistics(os, result);
    writeDegradation(os, result);
  }

  void WalkForwardReporter::writeWindowTable(std::ostream& os, const WalkForwardResult& result)
  {
    const MetricType primary = result.getConfig().primaryMetric;

    writeSectionHeader(os, "Windows");
    os << std::left
       << std::setw(4) << "#"
       << std::setw(26) << "Train"
       << std::setw(26) << "Validate"
       << std::setw(10) << "State"
       << std::setw(12) << "Train PF"
       << std::setw(12) << "Valid PF"
       << std::setw(12) << "Ratio"
       << "Note" << std::endl;

    for (const auto& windowResult : result.getWindowResults())
      {
	const ValidationWindow& window = windowResult.getWindow();
	std::ostringstream trainRange, validateRange;
	trainRange << window.getTrainStart() << ".." << window.getTrainEnd();
	validateRange << window.getValidateStart() << ".." << window.getValidateEnd();

	os << std::setw(4) << window.getWindowNumber()
	   << std::setw(26) << trainRange.str()
	   << std::setw(26) << validateRange.str()
	   << std::setw(10) << getWindowStateName(windowResult.getState());

	if (windowResult.isScored())
	  {
	    std::ostringstream trainPF, validatePF;
	    trainPF << windowResult.getTrainMetrics().getProfitFactor();
	    validatePF << windowResult.getValidateMetrics().getProfitFactor();

	    os << std::setw(12) << trainPF.str()
	       << std::setw(12) << validatePF.str()
	       << std::setw(12) << formatOptional(windowResult.getPerformanceRatio(primary), "n/a")
	       << (windowResult.isDegraded() ? "DEGRADED" : "");
	  }
	else
	  os << std::setw(36) << "" << getWindowFailureKindName(windowResult.getFailureKind());

	os << std::endl;
      }

    os << std::right;
    writeSectionFooter(os);
  }

  void WalkForwardReporter::writeStatistics(std::ostream& os, const WalkForwardResult& result)
  {
    const SummaryStatistics& summary = result.getSummaryStatistics();
    const SignificanceSignal& significance = result.getSignificanceSignal();

    writeSectionHeader(os, "Metric Statistics (validate periods)");
    os << std::left
       << std::setw(18) << "Metric"
       << std::setw(12) << "Mean"
       << std::setw(12) << "Median"
       << std::setw(12) << "Min"
       << std::setw(12) << "Max"
       << std::setw(12) << "Avg Ratio"
       << std::setw(22) << "Stability (CV)"
       << "p-value" << std::endl;

    for (MetricType metric : kAllMetricTypes)
      {
	const MetricSummary metricSummary = summary.getValidateSummary(metric);
	const StabilitySignal& stability = result.getStabilitySignal(metric);

	std::string stabilityText = formatOptional(stability.getReportedScore(), "");
	if (!stability.isComputed())
	  stabilityText = getStabilityStatusName(stability.getStatus());

	std::string pValueText = "n/a";
	if (significance.hasResult(metric))
	  {
	    const SignificanceResult& sig = significance.getResult(metric);
	    pValueText = sig.isComputed() ? formatOptional(sig.getPValue(), "n/a")
					  : getSignificanceStatusName(sig.getStatus());
	  }

	os << std::setw(18) << getMetricName(metric)
	   << std::setw(12) << formatOptional(metricSummary.mean, "n/a")
	   << std::setw(12) << formatOptional(metricSummary.median, "n/a")
	   << std::setw(12) << formatOptional(metricSummary.min, "n/a")
	   << std::setw(12) << formatOptional(metricSummary.max, "n/a")
	   << std::setw(12) << formatOptional(summary.getAveragePerformanceRatio(metric), "n/a")
	   << std::setw(22) << stabilityText
	   << pValueText;

	if (metricSummary.numUnbounded > 0)
	  os << " (" << metricSummary.numUnbounded << " unbounded)";

	os << std::endl;
      }

    os << std::right;
    writeSectionFooter(os);
  }

  void WalkForwardReporter::writeDegradation(std::ostream& os, const WalkForwardResult& result)
  {
    const DegradationReport& report = result.getDegradationReport();

    writeSectionHeader(os, "Degradation");
    os << "Primary Metric: " << getMetricName(report.getPrimaryMetric())
       << ", threshold " << formatOptional(report.getThreshold(), "") << std::endl;
    os << "Degraded Windows: " << report.getDegradationCount() << " of "
       << report.getNumEvaluatedWindows() << " evaluated" << std::endl;
    os << "Degradation Percentage: " << formatOptional(report.getDegradationPercentage(), "n/a");
    if (report.getDegradationPercentage())
      os << "%";
    os << std::endl;

    if (!report.getDegradedWindowIndices().empty())
      {
	os << "Degraded Window Numbers:";
	for (unsigned int index : report.getDegradedWindowIndices())
	  os << " " << index + 1;
	os << std::endl;
      }

    writeSectionFooter(os);
    os << std::endl;
  }

  void WalkForwardReporter::writeSectionHeader(std::ostream& os, const std::string& title)
  {
    os << "=== " << title << " ===" << std::endl;
  }

  void WalkForwardReporter::writeSectionFooter(std::ostream& os)
  {
    os << "===================================" << std::endl;
  }

  std::string WalkForwardReporter::formatOptional(const std::optional<double>& value,
						  const std::string& missing)
  {
    if (!value)
      return missing;

    std::ostringstream out;
    out << std::fixed << std::setprecision(kReportDecimalPlaces) << roundForReport(*value);
    return out.str();
  }
}
