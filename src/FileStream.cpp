#include "eol_lib/FileStream.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace eol_lib {

static std::system_error ioError(const char* what)
{
    const int code = errno ? errno : EIO;
    return std::system_error(code, std::generic_category(), what);
}

std::vector<char> FileReader::readAll(const std::string& path)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ioError("cannot open for reading");

    std::vector<char> data((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    if (in.bad()) throw ioError("read failed");
    return data;
}

void FileWriter::writeAll(const std::string& path, const std::vector<char>& data)
{
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw ioError("cannot open for writing");

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) throw ioError("write failed");
    out.close();
    if (!out) throw ioError("close failed");
}

} // namespace eol_lib
