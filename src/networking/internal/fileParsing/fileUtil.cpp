#include "networking/internal/fileParsing/fileUtil.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace csw {

ssize_t bytesInFile(const std::filesystem::path& f_path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(f_path, ec);
    if (ec)
        return -1;
    return static_cast<ssize_t>(size);
}

std::optional<ssize_t> readFile(const std::filesystem::path& f_path,
                                const size_t                 read_size,
                                const size_t                 offset,
                                      std::vector<uint8_t>&  buff) {
    //need space to write the data, otherwise read on .data() is undefined
    buff.resize(read_size);

    std::ifstream file(f_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    file.seekg(offset);
    if (!file)
        return std::nullopt;

    file.read(reinterpret_cast<char*>(buff.data()), read_size);
    if (file.bad())
        return std::nullopt;

    buff.resize(static_cast<size_t>(file.gcount()));
    return file.gcount(); //file closed when stack frame is popped
}

std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& f_path) {
    ssize_t f_size = bytesInFile(f_path);
    if (f_size < 0)
        return std::nullopt;

    std::vector<uint8_t> buff;
    if (f_size == 0)
        return buff;

    auto read_bytes = readFile(f_path, static_cast<size_t>(f_size), 0, buff);
    if (!read_bytes || read_bytes.value() != f_size)
        return std::nullopt;
    return buff;
}

int writeFile(const std::filesystem::path& f_path,
              const uint8_t*               data,
              const size_t                 len) {
    int fd = ::open(f_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        std::cerr << "[writeFile] Could not open " << f_path << ": "
                  << std::strerror(errno) << std::endl;
        return EXIT_FAILURE;
    }

    size_t written = 0;
    while (written < len) {
        ssize_t res = ::write(fd, data+written, len-written);
        if (res < 0 && errno == EINTR)
            continue;
        if (res <= 0) {
            std::cerr << "[writeFile] Write to " << f_path << " failed: "
                      << std::strerror(errno) << std::endl;
            ::close(fd);
            return EXIT_FAILURE;
        }
        written += static_cast<size_t>(res);
    }

    if (::fsync(fd) < 0) {
        std::cerr << "[writeFile] fsync on " << f_path << " failed: "
                  << std::strerror(errno) << std::endl;
        ::close(fd);
        return EXIT_FAILURE;
    }

    if (::close(fd) < 0)
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

} //csw
