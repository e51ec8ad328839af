// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "GatheredDataset.h"
#include "SimStatsException.h"

namespace simcompare
{
  GatheredDataset::GatheredDataset(std::string name,
				   OutputNames outputs,
				   SummaryNames summaryNames,
				   NumericMatrix data)
    : mName(std::move(name)),
      mOutputs(std::move(outputs)),
      mSummaryNames(std::move(summaryNames)),
      mData(std::move(data))
  {
    if (mSummaryNames.text.size() != mSummaryNames.latex.size())
      throw ArgumentMismatchException("Dataset '" + mName
				      + "': plain and LaTeX summary label lists differ in length");

    if (mData.getNumRows() == 0)
      throw InvalidParameterException("Dataset '" + mName + "' has no observations");

    if (mData.getNumColumns() != mOutputs.size() * mSummaryNames.size())
      throw ArgumentMismatchException("Dataset '" + mName + "': expected "
				      + std::to_string(mOutputs.size() * mSummaryNames.size())
				      + " columns (" + std::to_string(mOutputs.size())
				      + " outputs x " + std::to_string(mSummaryNames.size())
				      + " summaries), got " + std::to_string(mData.getNumColumns()));
  }

  std::size_t GatheredDataset::getColumnIndex(std::size_t output, std::size_t summary) const
  {
    if (output >= getNumOutputs() || summary >= getNumSummaries())
      throw IndexOutOfRangeException("Dataset '" + mName + "': focal measure ("
				     + std::to_string(output) + ", " + std::to_string(summary)
				     + ") does not exist");

    return output * getNumSummaries() + summary;
  }

  std::vector<double> GatheredDataset::getFocalMeasure(std::size_t output, std::size_t summary) const
  {
    return mData.getColumn(getColumnIndex(output, summary));
  }

  NumericMatrix GatheredDataset::getSummaryBlock(std::size_t observation) const
  {
    return NumericMatrix::fromColumnMajor(mData.getRow(observation),
					  getNumSummaries(), getNumOutputs());
  }
}
