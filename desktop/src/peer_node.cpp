#include "peer_node.h"
#include "byte_source.h"
#include "config_manager.h"
#include "file_sink.h"
#include "http_poll_transport.h"
#include "id_utils.h"
#include "logger.h"
#include "server_endpoint.h"
#include "tcp_channel_negotiator.h"
#include "transfer_receiver.h"
#include "transfer_scheduler.h"
#include "ws_push_transport.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

PeerNode::PeerNode() : running_(false), peer_id_("") {}

PeerNode::~PeerNode() {
    if (running_) {
        stop();
    }
}

bool PeerNode::start(const Options& options, std::string* error) {
    if (running_) {
        if (error) *error = "node already running";
        LOG_ERROR("PEER: Already running");
        return false;
    }

    const ConfigManager& cfg = ConfigManager::getInstance();
    peer_id_ = options.peer_id.empty() ? generate_peer_id() : options.peer_id;
    download_dir_ = options.download_dir;
    set_log_tag(peer_id_);

    const std::string url = options.server_url.empty() ? cfg.getServerUrl() : options.server_url;
    ServerEndpoint endpoint;
    if (!parse_server_url(url, &endpoint, error)) {
        LOG_ERROR("PEER: Bad server url: " + url);
        return false;
    }

    std::string mode = options.transport.empty() ? cfg.getSignalingTransport() : options.transport;
    std::transform(mode.begin(), mode.end(), mode.begin(), ::tolower);
    const std::chrono::milliseconds timeout(cfg.getRequestTimeoutMs());
    if (mode == "push" || mode == "ws" || mode == "websocket") {
        transport_ = std::make_unique<WsPushTransport>(endpoint, timeout);
    } else if (mode == "poll" || mode == "http") {
        transport_ = std::make_unique<HttpPollTransport>(endpoint, timeout);
    } else {
        if (error) *error = "unknown transport '" + mode + "' (poll|push)";
        return false;
    }

    LOG_INFO("PEER: Starting droproom peer " + peer_id_ + " (" + mode + " via " + endpoint.host + ":" + endpoint.port + ")");

    if (!transport_->connect(peer_id_, error)) {
        LOG_ERROR("PEER: Cannot reach coordinator at " + url);
        transport_.reset();
        return false;
    }

    negotiator_ = std::make_unique<TcpChannelNegotiator>(ChannelConfig::fromConfigManager());
    if (!negotiator_->start(error)) {
        LOG_ERROR("PEER: Channel listener failed to start");
        transport_->disconnect();
        transport_.reset();
        negotiator_.reset();
        return false;
    }

    scheduler_ = std::make_unique<TransferScheduler>(SchedulerConfig::fromConfigManager());
    sink_ = std::make_shared<DirectoryFileSink>(download_dir_);
    receiver_ = std::make_unique<TransferReceiver>(ReceiverConfig::fromConfigManager(), sink_);

    receiver_->setProgressCallback([this](const TransferKey& key, uint64_t, uint64_t, double percent) {
        std::function<void(const TransferKey&, double)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_download_progress_cb_;
        }
        if (cb) cb(key, percent);
    });
    receiver_->setCompleteCallback([this](const ReceivedFile& file) {
        std::function<void(const ReceivedFile&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_download_complete_cb_;
        }
        if (cb) cb(file);
    });
    receiver_->setFailedCallback([this](const TransferKey& key, TransferError err, const std::string& message) {
        std::function<void(const TransferKey&, const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_download_failed_cb_;
        }
        if (cb) cb(key, std::string(transfer_error_to_string(err)) + ": " + message);
    });

    agent_ = std::make_unique<SessionAgent>(AgentConfig::fromConfigManager(), peer_id_, *transport_,
                                            *negotiator_, *scheduler_, *receiver_);
    agent_->setFilesUpdatedCallback([this](const std::vector<FileDescriptor>& files) {
        std::function<void(const std::vector<FileDescriptor>&)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_files_updated_cb_;
        }
        if (cb) cb(files);
    });
    agent_->setUploadCallbacks(
        [this](const TransferKey& key, const TransferStats& stats) {
            std::function<void(const TransferKey&, const TransferStats&)> cb;
            {
                std::lock_guard<std::mutex> lock(callbacks_mutex_);
                cb = on_upload_complete_cb_;
            }
            if (cb) cb(key, stats);
        },
        [this](const TransferKey& key, TransferError err, const std::string& message) {
            std::function<void(const TransferKey&, const std::string&)> cb;
            {
                std::lock_guard<std::mutex> lock(callbacks_mutex_);
                cb = on_upload_failed_cb_;
            }
            if (cb) cb(key, std::string(transfer_error_to_string(err)) + ": " + message);
        });
    agent_->setSessionEndedCallback([this](SessionEndReason reason) {
        std::function<void(SessionEndReason)> cb;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            cb = on_session_ended_cb_;
        }
        if (cb) cb(reason);
    });

    running_ = true;
    LOG_INFO("PEER: Started");
    return true;
}

void PeerNode::stop() {
    if (!running_) {
        return;
    }
    LOG_INFO("PEER: Stopping");

    // The agent references every other component; it goes first.
    agent_.reset();
    if (scheduler_) scheduler_->cleanup();
    if (negotiator_) negotiator_->stop();
    if (transport_) transport_->disconnect();

    receiver_.reset();
    sink_.reset();
    scheduler_.reset();
    negotiator_.reset();
    transport_.reset();

    running_ = false;
    LOG_INFO("PEER: Stopped");
}

bool PeerNode::hostRoom(const std::string& roomId, std::string* roomIdOut, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }
    if (roomId.empty()) {
        return agent_->createRoom(roomIdOut, error);
    }
    if (!agent_->hostRoom(roomId, error)) {
        return false;
    }
    if (roomIdOut) *roomIdOut = roomId;
    return true;
}

bool PeerNode::shareFiles(const std::vector<std::string>& paths, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }

    std::vector<HostedFile> hosted;
    for (const std::string& path : paths) {
        auto source = std::make_shared<FileByteSource>();
        if (!source->open(path, error)) {
            return false;
        }
        HostedFile file;
        file.descriptor.id = generate_file_id();
        file.descriptor.name = std::filesystem::path(path).filename().string();
        file.descriptor.size = source->size();
        file.descriptor.mime_type = guessMimeType(path);
        file.source = source;
        hosted.push_back(std::move(file));
    }
    return agent_->offerFiles(std::move(hosted), error);
}

bool PeerNode::joinRoom(const std::string& roomId, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }
    return agent_->joinRoom(roomId, error);
}

bool PeerNode::requestFile(const std::string& fileId, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }
    // Accept a unique id prefix, the way the CLI shows ids.
    std::string resolved;
    size_t matches = 0;
    for (const FileDescriptor& file : agent_->files()) {
        if (file.id == fileId) {
            resolved = file.id;
            matches = 1;
            break;
        }
        if (file.id.compare(0, fileId.size(), fileId) == 0) {
            resolved = file.id;
            ++matches;
        }
    }
    if (matches != 1) {
        if (error) *error = matches == 0 ? "no file matches " + fileId : "ambiguous file id " + fileId;
        return false;
    }
    return agent_->requestFile(resolved, error);
}

void PeerNode::leave() {
    if (agent_) agent_->leave();
}

std::vector<FileDescriptor> PeerNode::getFiles() const {
    if (!agent_) return {};
    return agent_->files();
}

std::string PeerNode::getStatusSummary() const {
    std::ostringstream out;
    out << "peer " << peer_id_;
    if (!running_ || !agent_) {
        out << " (stopped)";
        return out.str();
    }
    if (!agent_->isActive()) {
        out << " (not in a room)";
        return out.str();
    }
    if (agent_->role() == SessionRole::HOST) {
        out << " hosting " << agent_->roomId() << ", " << agent_->clientCount() << " client(s), "
            << scheduler_->activeCount() << " upload(s)";
        for (const auto& kv : agent_->peerCounts()) {
            out << "\n  " << kv.first << ": " << kv.second << " downloading";
        }
    } else {
        out << " in room " << agent_->roomId() << " (host " << agent_->hostId() << "), "
            << receiver_->activeCount() << " download(s)";
    }
    return out.str();
}

void PeerNode::setFilesUpdatedCallback(std::function<void(const std::vector<FileDescriptor>&)> cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_files_updated_cb_ = std::move(cb);
}

void PeerNode::setDownloadCallbacks(
    std::function<void(const TransferKey& key, double percent)> on_progress,
    std::function<void(const ReceivedFile& file)> on_complete,
    std::function<void(const TransferKey& key, const std::string& reason)> on_failed) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_download_progress_cb_ = std::move(on_progress);
    on_download_complete_cb_ = std::move(on_complete);
    on_download_failed_cb_ = std::move(on_failed);
}

void PeerNode::setUploadCallbacks(
    std::function<void(const TransferKey& key, const TransferStats& stats)> on_complete,
    std::function<void(const TransferKey& key, const std::string& reason)> on_failed) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_upload_complete_cb_ = std::move(on_complete);
    on_upload_failed_cb_ = std::move(on_failed);
}

void PeerNode::setSessionEndedCallback(std::function<void(SessionEndReason reason)> cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_session_ended_cb_ = std::move(cb);
}

void PeerNode::clearEventCallbacks() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_files_updated_cb_ = nullptr;
    on_download_progress_cb_ = nullptr;
    on_download_complete_cb_ = nullptr;
    on_download_failed_cb_ = nullptr;
    on_upload_complete_cb_ = nullptr;
    on_upload_failed_cb_ = nullptr;
    on_session_ended_cb_ = nullptr;
}

std::string PeerNode::guessMimeType(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    if (ext == ".txt" || ext == ".log" || ext == ".md") return "text/plain";
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".css") return "text/css";
    if (ext == ".csv") return "text/csv";
    if (ext == ".json") return "application/json";
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".zip") return "application/zip";
    if (ext == ".gz" || ext == ".tgz") return "application/gzip";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".mp4") return "video/mp4";
    return "application/octet-stream";
}
