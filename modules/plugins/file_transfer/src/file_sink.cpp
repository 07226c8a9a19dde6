#include "file_sink.h"
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

DirectoryFileSink::DirectoryFileSink(std::string directory)
    : m_directory(std::move(directory)) {}

bool DirectoryFileSink::isSafeName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return false;
    }
    return name.find('\0') == std::string::npos;
}

bool DirectoryFileSink::deliver(const ReceivedFile& file, std::string* error) {
    if (!isSafeName(file.name)) {
        if (error) *error = "refusing unsafe file name '" + file.name + "'";
        LOG_WARN("FT: Refusing unsafe file name '" + file.name + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        if (error) *error = "cannot create " + m_directory + ": " + ec.message();
        return false;
    }

    const fs::path original(file.name);
    fs::path target = fs::path(m_directory) / original;
    for (int n = 1; fs::exists(target, ec); ++n) {
        const std::string candidate = original.stem().string() + " (" + std::to_string(n) + ")" +
                                      original.extension().string();
        target = fs::path(m_directory) / candidate;
    }

    std::ofstream out(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        if (error) *error = "cannot open " + target.string() + " for writing";
        return false;
    }
    out.write(file.bytes.data(), static_cast<std::streamsize>(file.bytes.size()));
    out.close();
    if (!out) {
        if (error) *error = "write failed for " + target.string();
        return false;
    }

    LOG_INFO("FT: Saved " + target.string() + " (" + std::to_string(file.bytes.size()) + " bytes)");
    return true;
}
