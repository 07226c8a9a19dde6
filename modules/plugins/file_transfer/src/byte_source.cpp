#include "byte_source.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

bool MemoryByteSource::read(uint64_t offset, size_t length, std::string* out) {
    if (offset > m_data.size()) {
        return false;
    }
    const size_t n = static_cast<size_t>(std::min<uint64_t>(length, m_data.size() - offset));
    out->assign(m_data, static_cast<size_t>(offset), n);
    return true;
}

bool FileByteSource::open(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (error) *error = "not a regular file: " + path;
        LOG_WARN("FT: Cannot share " + path + ": not a regular file");
        return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        if (error) *error = "cannot stat " + path + ": " + ec.message();
        LOG_WARN("FT: Cannot stat " + path + ": " + ec.message());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_io_mutex);
    m_in.open(path, std::ios::in | std::ios::binary);
    if (!m_in.is_open()) {
        if (error) *error = "cannot open " + path;
        LOG_WARN("FT: Cannot open " + path);
        return false;
    }
    m_path = path;
    m_size = static_cast<uint64_t>(size);
    return true;
}

bool FileByteSource::read(uint64_t offset, size_t length, std::string* out) {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (!m_in.is_open() || offset > m_size) {
        return false;
    }
    const size_t n = static_cast<size_t>(std::min<uint64_t>(length, m_size - offset));
    out->resize(n);
    m_in.clear();
    m_in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (n > 0 && !m_in.read(&(*out)[0], static_cast<std::streamsize>(n))) {
        LOG_WARN("FT: Short read from " + m_path + " at offset " + std::to_string(offset));
        return false;
    }
    return true;
}
