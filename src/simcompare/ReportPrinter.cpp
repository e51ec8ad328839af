#include "ReportPrinter.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace simcompare {

ReportPrinter::ReportPrinter(std::ostream& os)
    : mOut(os)
{
}

std::string ReportPrinter::formatValue(double value) {
    if (std::isnan(value))
        return "NaN";

    std::ostringstream ss;
    ss << std::setprecision(6) << value;
    return ss.str();
}

void ReportPrinter::printDatasetSummary(const GatheredDataset& dataset) {
    mOut << "Dataset '" << dataset.getName() << "': "
         << dataset.getNumObservations() << " observations, "
         << dataset.getNumOutputs() << " outputs x "
         << dataset.getNumSummaries() << " summaries" << std::endl;
}

void ReportPrinter::printAnalysis(const AnalysisResult& analysis, const GatheredDataset& dataset) {
    const auto& summaries = dataset.getSummaryNames().text;
    const auto& outputs = dataset.getOutputs();

    mOut << "\n=== Distribution analysis: " << analysis.getName()
         << " (alpha = " << analysis.getAlpha() << ") ===" << std::endl;

    for (std::size_t o = 0; o < analysis.getNumOutputs(); ++o) {
        mOut << "Output " << outputs[o] << std::endl;
        mOut << std::left << std::setw(10) << "  stat"
             << std::setw(14) << "mean"
             << std::setw(14) << "variance"
             << std::setw(28) << "t-interval"
             << std::setw(28) << "willink"
             << std::setw(12) << "SW p"
             << "skew" << std::endl;

        for (std::size_t s = 0; s < analysis.getNumSummaries(); ++s) {
            const FocalMeasureAnalysis& fm = analysis.get(o, s);
            const std::string tInt = "[" + formatValue(fm.tInterval.lower) + ", "
                + formatValue(fm.tInterval.upper) + "]";
            const std::string wInt = "[" + formatValue(fm.willinkInterval.lower) + ", "
                + formatValue(fm.willinkInterval.upper) + "]";

            mOut << "  " << std::left << std::setw(8) << summaries[s]
                 << std::setw(14) << formatValue(fm.mean)
                 << std::setw(14) << formatValue(fm.variance)
                 << std::setw(28) << tInt
                 << std::setw(28) << wInt
                 << std::setw(12) << formatValue(fm.normalityPValue)
                 << formatValue(fm.skewness) << std::endl;
        }
    }
}

void ReportPrinter::printComparison(const ComparisonResult& comparison, const GatheredDataset& reference) {
    const auto& summaries = reference.getSummaryNames().text;
    const auto& outputs = reference.getOutputs();

    mOut << "\n=== Comparison (" 
         << (comparison.getTestFamily() == TestFamily::TwoSample ? "two-sample" : "multi-sample")
         << " tests, alpha = " << comparison.getAlpha() << "):";
    for (const auto& name : comparison.getDatasetNames())
        mOut << " " << name;
    mOut << " ===" << std::endl;

    mOut << std::left << std::setw(10) << "output";
    for (const auto& s : summaries)
        mOut << std::setw(12) << s;
    mOut << std::endl;

    for (std::size_t o = 0; o < outputs.size(); ++o) {
        mOut << std::left << std::setw(10) << outputs[o];
        for (std::size_t s = 0; s < summaries.size(); ++s) {
            const double p = comparison.getPValue(o, s);
            std::string cell = formatValue(p);
            if (!std::isnan(p) && p < comparison.getAlpha())
                cell += "*";
            mOut << std::setw(12) << cell;
        }
        mOut << std::endl;
    }

    mOut << "Focal measures with p < alpha: " << comparison.getFailCount() << std::endl;
}

void ReportPrinter::printConflicts(const ConflictMatrix& conflicts) {
    const auto& names = conflicts.getDatasetNames();

    mOut << "\n=== Pairwise conflicts ===" << std::endl;
    mOut << std::left << std::setw(16) << "";
    for (const auto& n : names)
        mOut << std::setw(16) << n;
    mOut << "total" << std::endl;

    for (std::size_t i = 0; i < conflicts.size(); ++i) {
        mOut << std::left << std::setw(16) << names[i];
        for (std::size_t j = 0; j < conflicts.size(); ++j)
            mOut << std::setw(16) << conflicts(i, j);
        mOut << conflicts.getTotalConflicts(i) << std::endl;
    }
}

void ReportPrinter::printAverages(const std::vector<NumericMatrix>& averages,
                                  const std::vector<std::string>& implementationNames,
                                  const OutputNames& outputs) {
    mOut << "\n=== Averaged outputs ===" << std::endl;

    for (std::size_t i = 0; i < averages.size(); ++i) {
        const NumericMatrix& m = averages[i];
        mOut << "# " << implementationNames[i] << std::endl;
        mOut << "iter";
        for (std::size_t o = 0; o < outputs.size(); ++o)
            mOut << '\t' << outputs[o];
        mOut << std::endl;

        for (std::size_t t = 0; t < m.getNumColumns(); ++t) {
            mOut << (t + 1);
            for (std::size_t o = 0; o < m.getNumRows(); ++o)
                mOut << '\t' << formatValue(m(o, t));
            mOut << std::endl;
        }
    }
}

} // namespace simcompare
