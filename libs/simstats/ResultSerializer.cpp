// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ResultSerializer.h"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace simcompare
{
  namespace
  {
    Value number(double x)
    {
      Value v;
      if (std::isfinite(x))
	v.SetDouble(x);
      return v;
    }

    Value stringValue(const std::string& s, Document::AllocatorType& allocator)
    {
      return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    Value stringArray(const std::vector<std::string>& names, Document::AllocatorType& allocator)
    {
      Value arr(kArrayType);
      for (const auto& name : names)
	arr.PushBack(stringValue(name, allocator), allocator);
      return arr;
    }

    Value matrixValue(const NumericMatrix& m, Document::AllocatorType& allocator)
    {
      Value rows(kArrayType);
      for (std::size_t r = 0; r < m.getNumRows(); ++r)
	{
	  Value row(kArrayType);
	  for (std::size_t c = 0; c < m.getNumColumns(); ++c)
	    row.PushBack(number(m(r, c)), allocator);
	  rows.PushBack(row, allocator);
	}
      return rows;
    }

    Value intervalValue(const ConfidenceInterval& ci, Document::AllocatorType& allocator)
    {
      Value v(kArrayType);
      v.PushBack(number(ci.lower), allocator);
      v.PushBack(number(ci.upper), allocator);
      return v;
    }

    Value serializeDataset(const GatheredDataset& dataset, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("name", stringValue(dataset.getName(), allocator), allocator);
      obj.AddMember("outputs", stringArray(dataset.getOutputs().getNames(), allocator), allocator);
      obj.AddMember("summaries", stringArray(dataset.getSummaryNames().text, allocator), allocator);
      obj.AddMember("observations", static_cast<uint64_t>(dataset.getNumObservations()), allocator);
      obj.AddMember("data", matrixValue(dataset.getData(), allocator), allocator);
      return obj;
    }

    Value serializeAnalysis(const AnalysisResult& analysis, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("name", stringValue(analysis.getName(), allocator), allocator);
      obj.AddMember("alpha", analysis.getAlpha(), allocator);
      obj.AddMember("numOutputs", static_cast<uint64_t>(analysis.getNumOutputs()), allocator);
      obj.AddMember("numSummaries", static_cast<uint64_t>(analysis.getNumSummaries()), allocator);

      Value measures(kArrayType);
      for (std::size_t o = 0; o < analysis.getNumOutputs(); ++o)
	for (std::size_t s = 0; s < analysis.getNumSummaries(); ++s)
	  {
	    const FocalMeasureAnalysis& fm = analysis.get(o, s);
	    Value m(kObjectType);
	    m.AddMember("output", static_cast<uint64_t>(o), allocator);
	    m.AddMember("summary", static_cast<uint64_t>(s), allocator);
	    m.AddMember("n", static_cast<uint64_t>(fm.numObservations), allocator);
	    m.AddMember("mean", number(fm.mean), allocator);
	    m.AddMember("variance", number(fm.variance), allocator);
	    m.AddMember("tInterval", intervalValue(fm.tInterval, allocator), allocator);
	    m.AddMember("willinkInterval", intervalValue(fm.willinkInterval, allocator), allocator);
	    m.AddMember("normalityPValue", number(fm.normalityPValue), allocator);
	    m.AddMember("skewness", number(fm.skewness), allocator);
	    measures.PushBack(m, allocator);
	  }
      obj.AddMember("focalMeasures", measures, allocator);
      return obj;
    }

    Value serializeComparison(const ComparisonResult& comparison, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("datasets", stringArray(comparison.getDatasetNames(), allocator), allocator);
      obj.AddMember("family",
		    Value(comparison.getTestFamily() == TestFamily::TwoSample ? "two-sample" : "multi-sample"),
		    allocator);
      obj.AddMember("alpha", comparison.getAlpha(), allocator);
      obj.AddMember("pValues", matrixValue(comparison.getPValues(), allocator), allocator);
      obj.AddMember("failCount", static_cast<uint64_t>(comparison.getFailCount()), allocator);
      return obj;
    }

    Value serializeConflicts(const ConflictMatrix& conflicts, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("datasets", stringArray(conflicts.getDatasetNames(), allocator), allocator);

      Value counts(kArrayType);
      for (std::size_t i = 0; i < conflicts.size(); ++i)
	{
	  Value row(kArrayType);
	  for (std::size_t j = 0; j < conflicts.size(); ++j)
	    row.PushBack(static_cast<uint64_t>(conflicts(i, j)), allocator);
	  counts.PushBack(row, allocator);
	}
      obj.AddMember("counts", counts, allocator);
      return obj;
    }

    std::string write(const Value& root)
    {
      StringBuffer buffer;
      PrettyWriter<StringBuffer> writer(buffer);
      root.Accept(writer);
      return buffer.GetString();
    }

    template <typename T, typename Fn>
    std::string single(const T& item, Fn serialize)
    {
      Document doc;
      const Value v = serialize(item, doc.GetAllocator());
      return write(v);
    }
  }

  std::string ResultSerializer::toJson(const RunResults& results)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value datasets(kArrayType);
    for (const auto& d : results.datasets)
      datasets.PushBack(serializeDataset(d, allocator), allocator);
    doc.AddMember("datasets", datasets, allocator);

    if (!results.analyses.empty())
      {
	Value analyses(kArrayType);
	for (const auto& a : results.analyses)
	  analyses.PushBack(serializeAnalysis(a, allocator), allocator);
	doc.AddMember("analyses", analyses, allocator);
      }

    if (results.comparison)
      doc.AddMember("comparison", serializeComparison(*results.comparison, allocator), allocator);

    if (results.conflicts)
      doc.AddMember("pairwiseConflicts", serializeConflicts(*results.conflicts, allocator), allocator);

    return write(doc);
  }

  std::string ResultSerializer::toJson(const GatheredDataset& dataset)
  {
    return single(dataset, serializeDataset);
  }

  std::string ResultSerializer::toJson(const AnalysisResult& analysis)
  {
    return single(analysis, serializeAnalysis);
  }

  std::string ResultSerializer::toJson(const ComparisonResult& comparison)
  {
    return single(comparison, serializeComparison);
  }

  std::string ResultSerializer::toJson(const ConflictMatrix& conflicts)
  {
    return single(conflicts, serializeConflicts);
  }

  void ResultSerializer::saveToFile(const RunResults& results, const std::string& filePath)
  {
    std::ofstream file(filePath);
    if (!file.is_open())
      throw std::runtime_error("Cannot open file for writing: " + filePath);

    file << toJson(results);
    if (!file)
      throw std::runtime_error("Error writing results to " + filePath);
  }
}
