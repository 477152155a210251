#include "execution/temp_script.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace execbox::execution {
namespace {

std::string UniqueStamp() {
    static std::atomic<unsigned long> counter{0};
    return std::to_string(::getpid()) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
           std::to_string(counter.fetch_add(1));
}

}  // namespace

TempScript::TempScript(const std::string& contents, const std::string& extension)
    : path_(std::filesystem::temp_directory_path() / ("execbox_" + UniqueStamp() + extension)) {
    std::ofstream output(path_, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot create script file " + path_.string());
    }
    output << contents;
    output.close();
    if (!output) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        throw std::runtime_error("cannot write script file " + path_.string());
    }
}

TempScript::~TempScript() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

}  // namespace execbox::execution
