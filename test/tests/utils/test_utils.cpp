#include "test_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>

namespace fs = std::filesystem;

std::string TestUtils::readLogFile(const std::string &filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> TestUtils::readLines(const std::string &filename) {
    std::string content = readLogFile(filename);
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string TestUtils::makeScratchDirectory(const std::string &name) {
    std::string path = "tally_test_" + name;
    fs::remove_all(path);
    return path;
}

void TestUtils::removeDirectory(const std::string &path) {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(path, ec);
}

bool TestUtils::fileExists(const std::string &filename) {
    return fs::exists(filename);
}

std::vector<std::vector<std::string> > TestUtils::parseCsv(const std::string &content) {
    std::vector<std::vector<std::string> > rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            rowHasData = true;
        } else if (c == ',') {
            row.push_back(field);
            field.clear();
            rowHasData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            if (rowHasData || !field.empty()) {
                row.push_back(field);
                rows.push_back(row);
            }
            row.clear();
            field.clear();
            rowHasData = false;
        } else {
            field += c;
            rowHasData = true;
        }
    }
    if (rowHasData || !field.empty()) {
        row.push_back(field);
        rows.push_back(row);
    }
    return rows;
}
