// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "NumericTableReader.h"
#include "SimStatsException.h"
#include <fstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace simcompare
{
  NumericMatrix NumericTableReader::read(const std::string& fileName)
  {
    std::ifstream fin(fileName);
    if (!fin.is_open())
      throw TableReadException("Cannot open file: " + fileName);

    return read(fin, fileName);
  }

  NumericMatrix NumericTableReader::read(std::istream& input, const std::string& sourceName)
  {
    std::vector<std::vector<double>> rows;
    std::vector<std::string> fields;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(input, line))
      {
	++lineNumber;
	boost::algorithm::trim(line);
	if (line.empty())
	  continue;

	boost::algorithm::split(fields, line, boost::algorithm::is_any_of(" \t,"),
				boost::algorithm::token_compress_on);

	std::vector<double> row;
	row.reserve(fields.size());
	for (const auto& field : fields)
	  {
	    // leading or trailing delimiter
	    if (field.empty())
	      continue;

	    try
	      {
		row.push_back(boost::lexical_cast<double>(field));
	      }
	    catch (const boost::bad_lexical_cast&)
	      {
		throw TableReadException(sourceName + ":" + std::to_string(lineNumber)
					 + ": non-numeric field '" + field + "'");
	      }
	  }

	if (!rows.empty() && row.size() != rows.front().size())
	  throw TableReadException(sourceName + ":" + std::to_string(lineNumber)
				   + ": expected " + std::to_string(rows.front().size())
				   + " fields, found " + std::to_string(row.size()));

	rows.push_back(std::move(row));
      }

    if (rows.empty())
      throw TableReadException(sourceName + ": table contains no data rows");

    return NumericMatrix::fromRows(rows);
  }
}
