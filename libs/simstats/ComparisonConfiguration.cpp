// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ComparisonConfiguration.h"
#include "SimStatsException.h"
#include <fstream>
#include <iterator>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

using namespace rapidjson;

namespace simcompare
{
  namespace
  {
    class MemberReader
    {
    public:
      explicit MemberReader(const std::string& sourceName)
	: mSource(sourceName)
      {}

      [[noreturn]] void fail(const std::string& what) const
      {
	throw ConfigurationException(mSource + ": " + what);
      }

      const Value& require(const Value& obj, const char* member) const
      {
	if (!obj.IsObject() || !obj.HasMember(member))
	  fail(std::string("missing required member '") + member + "'");
	return obj[member];
      }

      std::string getString(const Value& obj, const char* member) const
      {
	const Value& v = require(obj, member);
	if (!v.IsString())
	  fail(std::string("'") + member + "' must be a string");
	return v.GetString();
      }

      std::size_t toCount(const Value& v, const char* member) const
      {
	if (!v.IsUint64())
	  fail(std::string("'") + member + "' must be a non-negative integer");
	return static_cast<std::size_t>(v.GetUint64());
      }

    private:
      std::string mSource;
    };

    ImplementationSet readImplementations(const Value& doc, const MemberReader& reader)
    {
      const Value& impls = reader.require(doc, "implementations");
      if (!impls.IsArray() || impls.Empty())
	reader.fail("'implementations' must be a non-empty array");

      ImplementationSet set;
      for (SizeType i = 0; i < impls.Size(); ++i)
	{
	  const Value& impl = impls[i];
	  if (!impl.IsObject())
	    reader.fail("implementation " + std::to_string(i + 1) + " is not an object");

	  set.add(ModelImplementation{reader.getString(impl, "name"),
				     FileSelection{reader.getString(impl, "folder"),
						   reader.getString(impl, "files")}});
	}
      return set;
    }

    OutputNames readOutputs(const Value& doc, const MemberReader& reader)
    {
      const Value& outputs = reader.require(doc, "outputs");
      try
	{
	  if (outputs.IsArray())
	    {
	      std::vector<std::string> names;
	      for (const auto& v : outputs.GetArray())
		{
		  if (!v.IsString())
		    reader.fail("'outputs' array must contain only strings");
		  names.push_back(v.GetString());
		}
	      return OutputNames::fromList(names);
	    }

	  return OutputNames::fromCount(reader.toCount(outputs, "outputs"));
	}
      catch (const InvalidParameterException& e)
	{
	  reader.fail(e.what());
	}
    }

    ExtractorSettings readExtractor(const Value& doc, const MemberReader& reader)
    {
      const Value& ex = reader.require(doc, "extractor");
      if (!ex.IsObject())
	reader.fail("'extractor' must be an object");

      ExtractorSettings settings;
      settings.kind = SummaryExtractorFactory::parseKind(reader.getString(ex, "type"));

      if (settings.kind == ExtractorSettings::Kind::SteadyState)
	{
	  settings.steadyStateStart = reader.toCount(reader.require(ex, "steadyStateStart"),
						     "steadyStateStart");
	}
      else
	{
	  const Value& iters = reader.require(ex, "iterations");
	  if (!iters.IsArray())
	    reader.fail("'iterations' must be an array of integers");
	  for (const auto& v : iters.GetArray())
	    settings.iterations.push_back(reader.toCount(v, "iterations"));
	}

      return settings;
    }

    TestSelector readTests(const Value& doc, const MemberReader& reader)
    {
      TestSelector tests;
      if (!doc.HasMember("tests"))
	return tests;

      const Value& arr = doc["tests"];
      if (!arr.IsArray())
	reader.fail("'tests' must be an array of \"p\" / \"np\"");

      for (const auto& v : arr.GetArray())
	{
	  if (!v.IsString())
	    reader.fail("'tests' must be an array of \"p\" / \"np\"");
	  tests.push_back(parseTestKind(v.GetString()));
	}
      return tests;
    }
  }

  ComparisonConfiguration::ComparisonConfiguration(ImplementationSet implementations,
						   OutputNames outputs,
						   ExtractorSettings extractor,
						   double alpha,
						   TestSelector tests,
						   std::size_t threads)
    : mImplementations(std::move(implementations)),
      mOutputs(std::move(outputs)),
      mExtractor(std::move(extractor)),
      mAlpha(alpha),
      mTests(std::move(tests)),
      mThreads(threads)
  {
    if (!(mAlpha > 0.0 && mAlpha < 1.0))
      throw InvalidParameterException("Significance level alpha must lie in (0, 1), got "
				      + std::to_string(mAlpha));
  }

  ComparisonConfiguration ComparisonConfiguration::fromJson(const std::string& json,
							    const std::string& sourceName)
  {
    MemberReader reader(sourceName);

    Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError())
      reader.fail(std::string("JSON parse error at offset ")
		  + std::to_string(doc.GetErrorOffset()) + ": "
		  + GetParseError_En(doc.GetParseError()));
    if (!doc.IsObject())
      reader.fail("top-level value must be an object");

    double alpha = 0.05;
    if (doc.HasMember("alpha"))
      {
	if (!doc["alpha"].IsNumber())
	  reader.fail("'alpha' must be a number");
	alpha = doc["alpha"].GetDouble();
	if (!(alpha > 0.0 && alpha < 1.0))
	  reader.fail("'alpha' must lie in (0, 1)");
      }

    std::size_t threads = 1;
    if (doc.HasMember("threads"))
      threads = reader.toCount(doc["threads"], "threads");

    try
      {
	return ComparisonConfiguration(readImplementations(doc, reader),
				       readOutputs(doc, reader),
				       readExtractor(doc, reader),
				       alpha,
				       readTests(doc, reader),
				       threads);
      }
    catch (const ConfigurationException&)
      {
	throw;
      }
    catch (const SimStatsException& e)
      {
	reader.fail(e.what());
      }
  }

  ComparisonConfiguration ComparisonConfiguration::loadFromFile(const std::string& filePath)
  {
    std::ifstream file(filePath);
    if (!file.is_open())
      throw ConfigurationException("Cannot open configuration file: " + filePath);

    std::string json((std::istreambuf_iterator<char>(file)),
		     std::istreambuf_iterator<char>());
    return fromJson(json, filePath);
  }

  TestSelector ComparisonConfiguration::getTestSelector(std::size_t numSummaries) const
  {
    if (mTests.empty())
      return uniformSelector(numSummaries, TestKind::Parametric);
    return mTests;
  }
}
