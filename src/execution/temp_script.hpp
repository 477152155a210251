#pragma once

#include <filesystem>
#include <string>

namespace execbox::execution {

// Program text written to the system temp directory, removed on destruction.
class TempScript {
public:
    TempScript(const std::string& contents, const std::string& extension);
    ~TempScript();

    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace execbox::execution
