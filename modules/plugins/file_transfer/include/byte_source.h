#ifndef BYTE_SOURCE_H
#define BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

// Random-access bytes of one outbound file.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual uint64_t size() const = 0;
    // Reads up to length bytes at offset into *out. False on I/O error.
    virtual bool read(uint64_t offset, size_t length, std::string* out) = 0;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string data) : m_data(std::move(data)) {}

    uint64_t size() const override { return m_data.size(); }
    bool read(uint64_t offset, size_t length, std::string* out) override;

private:
    std::string m_data;
};

class FileByteSource : public ByteSource {
public:
    // Returns false (and logs) when the path is not a readable regular file.
    bool open(const std::string& path, std::string* error = nullptr);

    uint64_t size() const override { return m_size; }
    bool read(uint64_t offset, size_t length, std::string* out) override;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    uint64_t m_size = 0;
    std::mutex m_io_mutex;
    std::ifstream m_in;
};

#endif // BYTE_SOURCE_H
