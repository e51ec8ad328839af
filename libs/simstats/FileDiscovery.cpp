// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FileDiscovery.h"
#include <algorithm>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace simcompare
{
  bool FileDiscovery::matches(const std::string& pattern, const std::string& fileName)
  {
    const char* wild = pattern.c_str();
    const char* str = fileName.c_str();
    const char* cp = nullptr;
    const char* mp = nullptr;

    while ((*str) && (*wild != '*'))
      {
	if ((*wild != *str) && (*wild != '?'))
	  return false;
	wild++;
	str++;
      }

    while (*str)
      {
	if (*wild == '*')
	  {
	    if (!*++wild)
	      return true;
	    mp = wild;
	    cp = str + 1;
	  }
	else if ((*wild == *str) || (*wild == '?'))
	  {
	    wild++;
	    str++;
	  }
	else
	  {
	    wild = mp;
	    str = cp++;
	  }
      }

    while (*wild == '*')
      wild++;

    return !*wild;
  }

  std::vector<std::string> FileDiscovery::listFiles(const FileSelection& selection)
  {
    std::vector<std::string> files;

    fs::path folder(selection.folder.empty() ? "." : selection.folder);
    if (!fs::exists(folder) || !fs::is_directory(folder))
      return files;

    for (fs::directory_iterator it(folder); it != fs::directory_iterator(); ++it)
      {
	if (!fs::is_regular_file(it->status()))
	  continue;

	if (matches(selection.pattern, it->path().filename().string()))
	  files.push_back(it->path().string());
      }

    std::sort(files.begin(), files.end());
    return files;
  }
}
