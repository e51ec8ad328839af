// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __FILE_DISCOVERY_H
#define __FILE_DISCOVERY_H 1

#include <string>
#include <vector>

namespace simcompare
{
  /**
   * @brief A folder plus a glob pattern naming the replication files in it.
   */
  struct FileSelection
  {
    std::string folder;
    std::string pattern;
  };

  class FileDiscovery
  {
  public:
    /**
     * @brief List regular files in selection.folder whose names match selection.pattern.
     *
     * The pattern supports '*' and '?'. The search is not recursive. Full
     * paths are returned sorted lexicographically so that the row order of a
     * gathered dataset does not depend on the platform's directory order.
     * A missing folder yields an empty list.
     */
    static std::vector<std::string> listFiles(const FileSelection& selection);

    // Glob match of a whole file name against a '*' / '?' pattern.
    static bool matches(const std::string& pattern, const std::string& fileName);

  private:
    FileDiscovery() = delete;
  };
}

#endif // __FILE_DISCOVERY_H
