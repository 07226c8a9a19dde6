#pragma once

#include "room_types.h"
#include "session_agent.h"
#include "transfer_types.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class SignalingTransport;
class TcpChannelNegotiator;
class TransferScheduler;
class TransferReceiver;
class FileSink;
struct ReceivedFile;

/**
 * @brief One droproom peer: signaling transport, channel negotiator,
 * scheduler, receiver and session agent, wired from ConfigManager.
 *
 * The CLI only calls into this class; every callback below may run on a
 * transport, negotiator or scheduler thread.
 */
class PeerNode {
public:
    struct Options {
        std::string peer_id;            // generated when empty
        std::string transport;          // "poll" | "push"; config when empty
        std::string server_url;         // config when empty
        std::string download_dir = "downloads";
    };

    PeerNode();
    ~PeerNode();

    bool start(const Options& options, std::string* error = nullptr);
    void stop();

    // Host: roomId empty -> ask the coordinator for a fresh code.
    bool hostRoom(const std::string& roomId, std::string* roomIdOut, std::string* error = nullptr);
    bool shareFiles(const std::vector<std::string>& paths, std::string* error = nullptr);

    // Client
    bool joinRoom(const std::string& roomId, std::string* error = nullptr);
    bool requestFile(const std::string& fileId, std::string* error = nullptr);

    void leave();

    bool isRunning() const { return running_; }
    std::string getPeerId() const { return peer_id_; }
    std::vector<FileDescriptor> getFiles() const;
    std::string getStatusSummary() const;

    void setFilesUpdatedCallback(std::function<void(const std::vector<FileDescriptor>&)> cb);
    void setDownloadCallbacks(
        std::function<void(const TransferKey& key, double percent)> on_progress,
        std::function<void(const ReceivedFile& file)> on_complete,
        std::function<void(const TransferKey& key, const std::string& reason)> on_failed);
    void setUploadCallbacks(
        std::function<void(const TransferKey& key, const TransferStats& stats)> on_complete,
        std::function<void(const TransferKey& key, const std::string& reason)> on_failed);
    void setSessionEndedCallback(std::function<void(SessionEndReason reason)> cb);
    void clearEventCallbacks();

    // Best-effort media type from the file extension.
    static std::string guessMimeType(const std::string& path);

private:
    bool running_;
    std::string peer_id_;
    std::string download_dir_;

    std::unique_ptr<SignalingTransport> transport_;
    std::unique_ptr<TcpChannelNegotiator> negotiator_;
    std::unique_ptr<TransferScheduler> scheduler_;
    std::shared_ptr<FileSink> sink_;
    std::unique_ptr<TransferReceiver> receiver_;
    std::unique_ptr<SessionAgent> agent_;

    mutable std::mutex callbacks_mutex_;
    std::function<void(const std::vector<FileDescriptor>&)> on_files_updated_cb_;
    std::function<void(const TransferKey&, double)> on_download_progress_cb_;
    std::function<void(const ReceivedFile&)> on_download_complete_cb_;
    std::function<void(const TransferKey&, const std::string&)> on_download_failed_cb_;
    std::function<void(const TransferKey&, const TransferStats&)> on_upload_complete_cb_;
    std::function<void(const TransferKey&, const std::string&)> on_upload_failed_cb_;
    std::function<void(SessionEndReason)> on_session_ended_cb_;
};
