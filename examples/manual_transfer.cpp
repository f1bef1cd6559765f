/**
 * @file manual_transfer.cpp
 * @brief Copy-paste file transfer between two terminals
 *
 * Demonstrates the full peerdrop flow:
 *   - Starting a session as the offering or answering side
 *   - Exchanging connection blobs by hand (copy one line, paste it in the other terminal)
 *   - Sending files over the direct connection and watching progress
 *
 * Usage:
 *   manual_transfer offer|answer [--send <file>] [--config <config.json>]
 *
 * Examples:
 *   # Terminal A: create an offer and send a file once connected
 *   manual_transfer offer --send ./photo.jpg
 *
 *   # Terminal B: paste the offer, then paste the printed answer back into A
 *   manual_transfer answer
 *
 * Once connected, type "send <path>" to send another file, "cancel" to stop
 * the running transfer and "quit" to exit.
 */

#include "peerdrop.h"

#include <atomic>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace peerdrop;

static std::mutex g_output_mutex;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " offer|answer [--send <file>] [--config <config.json>]\n"
              << "\n"
              << "  offer           Create the connection offer\n"
              << "  answer          Answer an offer pasted from the peer\n"
              << "  --send <file>   Send this file as soon as the connection opens\n"
              << "  --config <file> JSON transfer configuration\n";
}

static std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

static void print_event(const TransferEvent& event) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    switch (event.type) {
        case TransferEventType::LOCAL_DESCRIPTION:
            std::cout << "\nCopy this line to your peer:\n\n" << event.message << "\n\n";
            break;
        case TransferEventType::STATE_CHANGED:
            std::cout << "[state] " << session_state_to_string(event.previous_state)
                      << " -> " << session_state_to_string(event.state);
            if (!event.message.empty()) {
                std::cout << " (" << event.message << ")";
            }
            std::cout << "\n";
            if (event.has_progress && event.state == SessionState::COMPLETED &&
                event.progress.direction == TransferDirection::RECEIVE) {
                std::cout << "[saved] " << event.progress.saved_path << "\n";
            }
            if (event.has_error) {
                std::cout << "[error] " << transfer_error_code_to_string(event.error_code) << "\n";
            }
            break;
        case TransferEventType::PROGRESS: {
            const TransferProgress& progress = event.progress;
            std::cout << "[" << transfer_direction_to_string(progress.direction) << "] "
                      << progress.file_name << " "
                      << std::fixed << std::setprecision(1) << progress.percentage << "% ("
                      << progress.bytes_transferred << "/" << progress.file_size << " bytes, "
                      << std::setprecision(0) << progress.speed / 1024.0 << " KiB/s)\n";
            break;
        }
    }
}

static void try_send(FileTransferSession& session, const std::string& path) {
    try {
        session.begin_send(path);
    } catch (const TransferError& e) {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        std::cerr << "Cannot send " << path << ": " << e.what()
                  << " (" << transfer_error_code_to_string(e.code()) << ")\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    PeerRole role;
    if (std::strcmp(argv[1], "offer") == 0) {
        role = PeerRole::INITIATOR;
    } else if (std::strcmp(argv[1], "answer") == 0) {
        role = PeerRole::RESPONDER;
    } else {
        print_usage(argv[0]);
        return 1;
    }

    std::string initial_file;
    std::string config_path;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--send") == 0 && i + 1 < argc) {
            initial_file = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    TransferConfig config;
    if (!config_path.empty() && !load_transfer_config(config_path, config)) {
        std::cerr << "Warning: using default configuration\n";
    }
    apply_logging_config(config);

    version::print_header();

    if (!init_socket_library()) {
        std::cerr << "Error: failed to initialize sockets\n";
        return 1;
    }

    // ── Create the session ───────────────────────────────────────────────────
    auto transport = std::make_shared<TcpPeerTransport>(config);
    auto chunk_io = std::make_shared<DiskChunkIO>(config.download_directory);
    FileTransferSession session(transport, chunk_io, config);

    std::atomic<bool> initial_sent{false};
    session.events().subscribe([&](const TransferEvent& event) {
        print_event(event);
        // The offer is on screen now
        if (event.type == TransferEventType::LOCAL_DESCRIPTION &&
            event.state == SessionState::AWAITING_LOCAL_DESCRIPTION) {
            try {
                session.apply_local_description(event.message);
            } catch (const TransferError& e) {
                std::lock_guard<std::mutex> lock(g_output_mutex);
                std::cerr << "Error: " << e.what() << "\n";
            }
        }
        if (event.type == TransferEventType::STATE_CHANGED &&
            event.state == SessionState::CHANNEL_OPEN &&
            !initial_file.empty() && !initial_sent.exchange(true)) {
            try_send(session, initial_file);
        }
    });

    try {
        session.start(role);
    } catch (const TransferError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        cleanup_socket_library();
        return 1;
    }

    if (role == PeerRole::RESPONDER) {
        std::cout << "Paste the offer from your peer:\n";
    } else {
        std::cout << "Paste the answer from your peer:\n";
    }

    // ── Main loop: blobs and commands from stdin ─────────────────────────────
    std::string line;
    while (std::getline(std::cin, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line == "quit") {
            break;
        }
        if (line == "cancel") {
            session.cancel();
            continue;
        }
        if (line.compare(0, 5, "send ") == 0) {
            try_send(session, trim(line.substr(5)));
            continue;
        }

        try {
            session.apply_remote_description(line);
        } catch (const TransferError& e) {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cerr << "Rejected: " << e.what() << "\n";
        }
    }

    // ── Cleanup ──────────────────────────────────────────────────────────────
    std::cout << "\nShutting down...\n";
    session.close();
    cleanup_socket_library();

    return 0;
}
