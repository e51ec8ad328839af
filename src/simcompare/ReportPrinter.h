#pragma once

#include <ostream>
#include <vector>
#include "DistributionAnalyzer.h"
#include "GatheredDataset.h"
#include "ImplementationComparator.h"
#include "NumericMatrix.h"
#include "OutputNames.h"
#include "PairwiseConflictMatrix.h"

namespace simcompare {

/**
 * Plain-text rendering of run results for the terminal.
 */
class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& os);

    void printDatasetSummary(const GatheredDataset& dataset);
    void printAnalysis(const AnalysisResult& analysis, const GatheredDataset& dataset);
    void printComparison(const ComparisonResult& comparison, const GatheredDataset& reference);
    void printConflicts(const ConflictMatrix& conflicts);
    void printAverages(const std::vector<NumericMatrix>& averages,
                       const std::vector<std::string>& implementationNames,
                       const OutputNames& outputs);

private:
    static std::string formatValue(double value);

    std::ostream& mOut;
};

} // namespace simcompare
