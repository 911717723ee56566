#include "beacon/core/text_file.hpp"
#include "beacon/core/format.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
namespace beacon::node {

Result<std::string, BeaconFailure> ReadTextFile(
    const std::filesystem::path& path,
    const size_t max_size) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("Is a directory"));
    }
    errno = 0;
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream) {
        const int saved = errno;
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::InvalidInput(
                saved != 0 ? std::string(std::strerror(saved)) : std::string("unable to open file")));
    }
    std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::InvalidInput("I/O error while reading file"));
    }
    if (content.size() > max_size) {
        return Result<std::string, BeaconFailure>::Err(
            BeaconFailure::InvalidInput(
                compat::format("file is larger than {} bytes", max_size)));
    }
    return Result<std::string, BeaconFailure>::Ok(std::move(content));
}

std::string TrimWhitespace(const std::string& text) {
    constexpr const char* whitespace = " \t\r\n\f\v";
    const size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

}
