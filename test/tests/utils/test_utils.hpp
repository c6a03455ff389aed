#pragma once

#include <string>
#include <vector>

class TestUtils {
public:
    static std::string readLogFile(const std::string &filename);
    static std::vector<std::string> readLines(const std::string &filename);

    /// Fresh, empty directory under the working directory, named after the test.
    static std::string makeScratchDirectory(const std::string &name);
    static void removeDirectory(const std::string &path);

    static bool fileExists(const std::string &filename);

    /// Split CSV text into records of fields, honoring quoted fields that
    /// contain commas, quotes and line breaks.  Accepts CRLF or LF rows.
    static std::vector<std::vector<std::string> > parseCsv(const std::string &content);
};
