#ifndef FILE_SINK_H
#define FILE_SINK_H

#include "transfer_types.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

/**
 * A fully reassembled download, handed to a FileSink once the completion
 * marker arrives.
 */
struct ReceivedFile {
    TransferKey key;
    std::string name;
    std::string mime_type;
    uint64_t declared_size = 0;
    std::string bytes;
    std::chrono::milliseconds elapsed{0};
};

/**
 * Final destination of received files (disk, memory, UI layer).
 */
class FileSink {
public:
    virtual ~FileSink() = default;
    virtual bool deliver(const ReceivedFile& file, std::string* error) = 0;
};

/**
 * Writes each file into one download directory. Names carrying a path
 * separator or a parent reference are refused; an existing file is never
 * overwritten, the new one gets a " (n)" suffix instead.
 */
class DirectoryFileSink : public FileSink {
public:
    explicit DirectoryFileSink(std::string directory);

    bool deliver(const ReceivedFile& file, std::string* error) override;

    const std::string& directory() const { return m_directory; }

    static bool isSafeName(const std::string& name);

private:
    std::string m_directory;
    std::mutex m_mutex;
};

#endif // FILE_SINK_H
