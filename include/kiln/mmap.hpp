#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace kiln {

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * Empty files are not mapped and yield an empty view. The mapping is released on destruction.
 */
class MappedFile {
public:
    /**
     * @brief Opens and maps the specified file.
     * @return The mapping, or a File error naming the path and the failing call.
     */
    static Result<std::unique_ptr<MappedFile>> open(const std::filesystem::path &path);

    ~MappedFile();

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    MappedFile() = default;

    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace kiln
