#pragma once
#include <string>
#include <vector>

namespace eol_lib {

// Binary whole-file I/O. Both throw std::system_error on failure.
class FileReader {
public:
    static std::vector<char> readAll(const std::string& path);
};

class FileWriter {
public:
    static void writeAll(const std::string& path, const std::vector<char>& data);
};

} // namespace eol_lib
